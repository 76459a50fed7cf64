/*
 * 설명: ClientID별 활성 연결을 보관하고 등록/해제/조회를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "relay/config.hpp"
#include "relay/connection.hpp"
#include "relay/observability.hpp"

namespace relay {

enum class RegisterOutcome {
  kInserted,
  kRefreshed,
  kReplaced,
  kEvicted,
  kRejected,
};

struct RegisterResult {
  RegisterOutcome outcome;
  // kReplaced/kEvicted 일 때 밀려난 이전 연결. 이미 소멸했으면 nullptr.
  std::shared_ptr<Connection> displaced;

  bool Accepted() const { return outcome != RegisterOutcome::kRejected; }
};

class ClientRegistry {
 public:
  explicit ClientRegistry(ConflictPolicy policy = ConflictPolicy::kTakeover) : policy_(policy) {}

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  ConflictPolicy Policy() const { return policy_; }

  RegisterResult Register(const std::string& client_id, const std::shared_ptr<Connection>& connection);
  // 항목이 없으면 아무 일도 하지 않는다.
  bool Unregister(const std::string& client_id);
  // owner가 현재 보유자일 때만 제거한다.
  bool Unregister(const std::string& client_id, const Connection* owner);
  std::shared_ptr<Connection> Lookup(const std::string& client_id) const;
  bool Contains(const std::string& client_id) const;
  std::size_t Size() const;

 private:
  struct Entry {
    std::weak_ptr<Connection> connection;
    const Connection* raw{nullptr};
  };

  void PublishSizeLocked();

  ConflictPolicy policy_;
  std::unordered_map<std::string, Entry> entries_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
