/*
 * 설명: 수신 프레임을 JSON으로 해석해 등록/중계/무시를 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#include "relay/dispatcher.hpp"

namespace relay {
namespace {
constexpr const char* kRegisterType = "register";

DispatchResult Violation(std::string detail) {
  return DispatchResult{DispatchStatus::kProtocolViolation, std::move(detail), std::nullopt, std::nullopt};
}
}  // namespace

std::string_view ToString(DispatchStatus status) {
  switch (status) {
    case DispatchStatus::kRegistered:
      return "registered";
    case DispatchStatus::kRegistrationRejected:
      return "registration_rejected";
    case DispatchStatus::kRelayed:
      return "relayed";
    case DispatchStatus::kUnknownRecipient:
      return "unknown_recipient";
    case DispatchStatus::kRecipientEvicted:
      return "recipient_evicted";
    case DispatchStatus::kStaleRecipient:
      return "stale_recipient";
    case DispatchStatus::kIgnored:
      return "ignored";
    case DispatchStatus::kProtocolViolation:
      return "protocol_violation";
  }
  return "unknown";
}

Dispatcher::Dispatcher(std::shared_ptr<ClientRegistry> registry, SendFailurePolicy send_failure_policy)
    : registry_(std::move(registry)), send_failure_policy_(send_failure_policy) {}

DispatchResult Dispatcher::Dispatch(SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                                    const std::string& frame) {
  auto message = nlohmann::json::parse(frame, nullptr, false);
  if (message.is_discarded()) {
    return Violation("JSON 파싱 오류");
  }
  if (!message.is_object()) {
    return Violation("JSON 객체가 아닙니다");
  }
  auto type_it = message.find("type");
  if (type_it == message.end()) {
    return Violation("type 필드가 없습니다");
  }
  if (type_it->is_string() && type_it->get_ref<const std::string&>() == kRegisterType) {
    return HandleRegister(identity, self, message);
  }

  auto to_it = message.find("to");
  if (!identity.IsIdentified() || to_it == message.end()) {
    std::string detail = identity.IsIdentified() ? "to 필드 없음" : "등록 전 프레임";
    return DispatchResult{DispatchStatus::kIgnored, std::move(detail),
                          identity.IsIdentified() ? std::optional<std::string>{identity.ClientId()} : std::nullopt,
                          std::nullopt};
  }
  if (!to_it->is_string()) {
    return Violation("to 필드는 문자열이어야 합니다");
  }
  return HandleRelay(identity, self, to_it->get<std::string>(), frame);
}

DispatchResult Dispatcher::HandleRegister(SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                                          const nlohmann::json& message) {
  auto id_it = message.find("id");
  if (id_it == message.end()) {
    return Violation("register 메시지에 id가 없습니다");
  }
  if (!id_it->is_string()) {
    return Violation("id 필드는 문자열이어야 합니다");
  }
  auto client_id = id_it->get<std::string>();

  auto result = registry_->Register(client_id, self);
  if (!result.Accepted()) {
    return DispatchResult{DispatchStatus::kRegistrationRejected, "이미 사용 중인 id", client_id, std::nullopt};
  }
  if (result.outcome == RegisterOutcome::kEvicted && result.displaced) {
    result.displaced->Close(CloseReason::kSuperseded);
  }

  std::string detail;
  if (result.outcome == RegisterOutcome::kReplaced && result.displaced) {
    detail = "기존 연결 " + result.displaced->Id() + " 대체";
  } else if (result.outcome == RegisterOutcome::kEvicted && result.displaced) {
    detail = "기존 연결 " + result.displaced->Id() + " 강제 종료";
  }

  // 한 연결은 레지스트리에서 최대 하나의 항목만 가진다.
  if (identity.IsIdentified() && identity.ClientId() != client_id) {
    registry_->Unregister(identity.ClientId(), self.get());
  }
  identity.Identify(client_id);
  return DispatchResult{DispatchStatus::kRegistered, std::move(detail), std::move(client_id), std::nullopt};
}

DispatchResult Dispatcher::HandleRelay(const SessionIdentity& identity, const std::shared_ptr<Connection>& self,
                                       const std::string& target, const std::string& frame) {
  auto recipient = registry_->Lookup(target);
  if (!recipient) {
    return DispatchResult{DispatchStatus::kUnknownRecipient, "", identity.ClientId(), target};
  }
  if (recipient.get() == self.get()) {
    return DispatchResult{DispatchStatus::kIgnored, "자기 자신에게 보낸 프레임", identity.ClientId(), target};
  }
  if (recipient->Send(frame)) {
    return DispatchResult{DispatchStatus::kRelayed, "", identity.ClientId(), target};
  }

  if (send_failure_policy_ == SendFailurePolicy::kEvictRecipient) {
    registry_->Unregister(target, recipient.get());
    return DispatchResult{DispatchStatus::kRecipientEvicted, "끊어진 수신자 " + recipient->Id() + " 제거",
                          identity.ClientId(), target};
  }
  return DispatchResult{DispatchStatus::kStaleRecipient, "수신자 " + recipient->Id() + " 연결이 끊어졌습니다",
                        identity.ClientId(), target};
}

bool Dispatcher::Release(const SessionIdentity& identity, const Connection* self) {
  if (!identity.IsIdentified()) {
    return false;
  }
  return registry_->Unregister(identity.ClientId(), self);
}

}  // namespace relay
