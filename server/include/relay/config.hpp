/*
 * 설명: 릴레이 서버 환경설정 로딩과 기본값, 정책 열거형을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

// 이미 점유된 ClientID로 다시 등록 요청이 들어왔을 때의 처리 방식.
enum class ConflictPolicy {
  kTakeover,
  kReject,
  kEvict,
};

// 조회에 성공한 수신자 연결이 이미 끊어져 있을 때의 처리 방식.
enum class SendFailurePolicy {
  kFailSender,
  kEvictRecipient,
};

struct AppConfig {
  std::string host{"0.0.0.0"};
  unsigned short port{6789};
  std::size_t worker_threads{1};
  std::string log_level{"info"};
  ConflictPolicy conflict_policy{ConflictPolicy::kTakeover};
  SendFailurePolicy send_failure_policy{SendFailurePolicy::kFailSender};
};

std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view value);
std::optional<SendFailurePolicy> ParseSendFailurePolicy(std::string_view value);
std::string_view ToString(ConflictPolicy policy);
std::string_view ToString(SendFailurePolicy policy);

// 위치 인자(host, port)와 RELAY_* 환경변수를 읽는다. 잘못된 값은 std::invalid_argument.
AppConfig LoadConfig(const std::vector<std::string>& args);
AppConfig LoadConfig(int argc, char** argv);

}  // namespace relay
