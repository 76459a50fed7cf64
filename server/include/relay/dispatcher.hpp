/*
 * 설명: 수신 프레임을 해석해 등록 또는 중계로 분기하고 결과를 반환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "relay/config.hpp"
#include "relay/connection.hpp"
#include "relay/registry.hpp"
#include "relay/session_state.hpp"

namespace relay {

enum class DispatchStatus {
  kRegistered,
  kRegistrationRejected,
  kRelayed,
  kUnknownRecipient,
  kRecipientEvicted,
  kStaleRecipient,
  kIgnored,
  kProtocolViolation,
};

std::string_view ToString(DispatchStatus status);

struct DispatchResult {
  DispatchStatus status;
  std::string detail;
  std::optional<std::string> client_id;
  std::optional<std::string> target;

  // true이면 세션을 종료해야 한다.
  bool IsFatal() const {
    return status == DispatchStatus::kProtocolViolation || status == DispatchStatus::kStaleRecipient;
  }
};

class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<ClientRegistry> registry, SendFailurePolicy send_failure_policy);

  DispatchResult Dispatch(SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                          const std::string& frame);
  // 세션 종료 시 보유한 ClientID 항목을 제거한다. Identified가 아니면 아무 일도 없다.
  bool Release(const SessionIdentity& identity, const Connection* self);

  SendFailurePolicy GetSendFailurePolicy() const { return send_failure_policy_; }

 private:
  DispatchResult HandleRegister(SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                                const nlohmann::json& message);
  DispatchResult HandleRelay(const SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                             const std::string& target, const std::string& frame);

  std::shared_ptr<ClientRegistry> registry_;
  SendFailurePolicy send_failure_policy_;
};

}  // namespace relay
