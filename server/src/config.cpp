/*
 * 설명: 위치 인자와 환경변수에서 릴레이 서버 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "relay/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <thread>

#include "relay/observability.hpp"

namespace relay {
namespace {
std::string GetEnv(const char* key, const std::string& def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : def;
}

unsigned long ParseUnsigned(const std::string& value, const char* what) {
  try {
    // stoul은 앞쪽 공백과 부호를 허용하므로 첫 글자가 숫자인지 먼저 확인한다.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
      throw std::invalid_argument(value);
    }
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(std::string(what) + " 값이 올바르지 않습니다: " + value);
  }
}
}  // namespace

std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view value) {
  if (value == "takeover") {
    return ConflictPolicy::kTakeover;
  }
  if (value == "reject") {
    return ConflictPolicy::kReject;
  }
  if (value == "evict") {
    return ConflictPolicy::kEvict;
  }
  return std::nullopt;
}

std::optional<SendFailurePolicy> ParseSendFailurePolicy(std::string_view value) {
  if (value == "fail_sender") {
    return SendFailurePolicy::kFailSender;
  }
  if (value == "evict_recipient") {
    return SendFailurePolicy::kEvictRecipient;
  }
  return std::nullopt;
}

std::string_view ToString(ConflictPolicy policy) {
  switch (policy) {
    case ConflictPolicy::kTakeover:
      return "takeover";
    case ConflictPolicy::kReject:
      return "reject";
    case ConflictPolicy::kEvict:
      return "evict";
  }
  return "takeover";
}

std::string_view ToString(SendFailurePolicy policy) {
  switch (policy) {
    case SendFailurePolicy::kFailSender:
      return "fail_sender";
    case SendFailurePolicy::kEvictRecipient:
      return "evict_recipient";
  }
  return "fail_sender";
}

AppConfig LoadConfig(const std::vector<std::string>& args) {
  AppConfig cfg;
  if (args.size() > 2) {
    throw std::invalid_argument("사용법: relay_server [host] [port]");
  }
  if (!args.empty()) {
    cfg.host = args[0];
  }
  if (args.size() > 1) {
    auto port = ParseUnsigned(args[1], "port");
    if (port > std::numeric_limits<unsigned short>::max()) {
      throw std::invalid_argument("port 값이 범위를 벗어났습니다: " + args[1]);
    }
    cfg.port = static_cast<unsigned short>(port);
  }

  const auto default_threads = std::to_string(std::max(1u, std::thread::hardware_concurrency()));
  cfg.worker_threads = ParseUnsigned(GetEnv("RELAY_WORKER_THREADS", default_threads), "RELAY_WORKER_THREADS");
  if (cfg.worker_threads == 0) {
    throw std::invalid_argument("RELAY_WORKER_THREADS는 1 이상이어야 합니다");
  }

  cfg.log_level = GetEnv("RELAY_LOG_LEVEL", "info");
  if (!ParseLogLevel(cfg.log_level)) {
    throw std::invalid_argument("RELAY_LOG_LEVEL 값이 올바르지 않습니다: " + cfg.log_level);
  }

  auto conflict = GetEnv("RELAY_CONFLICT_POLICY", "takeover");
  auto conflict_policy = ParseConflictPolicy(conflict);
  if (!conflict_policy) {
    throw std::invalid_argument("RELAY_CONFLICT_POLICY 값이 올바르지 않습니다: " + conflict);
  }
  cfg.conflict_policy = *conflict_policy;

  auto send_failure = GetEnv("RELAY_SEND_FAILURE_POLICY", "fail_sender");
  auto send_failure_policy = ParseSendFailurePolicy(send_failure);
  if (!send_failure_policy) {
    throw std::invalid_argument("RELAY_SEND_FAILURE_POLICY 값이 올바르지 않습니다: " + send_failure);
  }
  cfg.send_failure_policy = *send_failure_policy;
  return cfg;
}

AppConfig LoadConfig(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return LoadConfig(args);
}

}  // namespace relay
