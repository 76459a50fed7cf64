/*
 * 설명: ClientID별 연결 등록/해제/조회를 하나의 뮤텍스로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp
 */
#include "relay/registry.hpp"

namespace relay {

RegisterResult ClientRegistry::Register(const std::string& client_id, const std::shared_ptr<Connection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(client_id);
  if (it == entries_.end()) {
    entries_.emplace(client_id, Entry{connection, connection.get()});
    PublishSizeLocked();
    return RegisterResult{RegisterOutcome::kInserted, nullptr};
  }
  if (it->second.raw == connection.get()) {
    return RegisterResult{RegisterOutcome::kRefreshed, nullptr};
  }

  auto previous = it->second.connection.lock();
  // 이전 보유자가 이미 소멸했다면 충돌로 보지 않는다.
  if (!previous) {
    it->second = Entry{connection, connection.get()};
    return RegisterResult{RegisterOutcome::kReplaced, nullptr};
  }

  switch (policy_) {
    case ConflictPolicy::kReject:
      return RegisterResult{RegisterOutcome::kRejected, nullptr};
    case ConflictPolicy::kEvict:
      it->second = Entry{connection, connection.get()};
      return RegisterResult{RegisterOutcome::kEvicted, std::move(previous)};
    case ConflictPolicy::kTakeover:
      break;
  }
  it->second = Entry{connection, connection.get()};
  return RegisterResult{RegisterOutcome::kReplaced, std::move(previous)};
}

bool ClientRegistry::Unregister(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(client_id) == 0) {
    return false;
  }
  PublishSizeLocked();
  return true;
}

bool ClientRegistry::Unregister(const std::string& client_id, const Connection* owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(client_id);
  if (it == entries_.end() || it->second.raw != owner) {
    return false;
  }
  entries_.erase(it);
  PublishSizeLocked();
  return true;
}

std::shared_ptr<Connection> ClientRegistry::Lookup(const std::string& client_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(client_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second.connection.lock();
}

bool ClientRegistry::Contains(const std::string& client_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(client_id) > 0;
}

std::size_t ClientRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ClientRegistry::PublishSizeLocked() {
  if (observability_) {
    observability_->SetRegisteredClients(entries_.size());
  }
}

}  // namespace relay
