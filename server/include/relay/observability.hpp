/*
 * 설명: 구조화 로그와 릴레이 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

std::optional<LogLevel> ParseLogLevel(std::string_view value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string connection_id;
  std::optional<std::string> client_id;
  std::optional<std::string> target;
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t connections_accepted{0};
  std::uint64_t connections_active{0};
  std::uint64_t registered_clients{0};
  std::uint64_t frames_received{0};
  std::uint64_t registrations{0};
  std::uint64_t registrations_rejected{0};
  std::uint64_t relayed{0};
  std::uint64_t unknown_recipient{0};
  std::uint64_t ignored{0};
  std::uint64_t protocol_violations{0};
  std::uint64_t stale_recipients{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();

  void ConnectionOpened();
  void ConnectionClosed();
  void FrameReceived() { frames_received_.fetch_add(1); }
  void IncrementRegistration() { registrations_.fetch_add(1); }
  void IncrementRejectedRegistration() { registrations_rejected_.fetch_add(1); }
  void IncrementRelayed() { relayed_.fetch_add(1); }
  void IncrementUnknownRecipient() { unknown_recipient_.fetch_add(1); }
  void IncrementIgnored() { ignored_.fetch_add(1); }
  void IncrementProtocolViolation() { protocol_violations_.fetch_add(1); }
  void IncrementStaleRecipient() { stale_recipients_.fetch_add(1); }
  void SetRegisteredClients(std::uint64_t count) { registered_clients_.store(count); }

  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> connections_active_{0};
  std::atomic<std::uint64_t> registered_clients_{0};
  std::atomic<std::uint64_t> frames_received_{0};
  std::atomic<std::uint64_t> registrations_{0};
  std::atomic<std::uint64_t> registrations_rejected_{0};
  std::atomic<std::uint64_t> relayed_{0};
  std::atomic<std::uint64_t> unknown_recipient_{0};
  std::atomic<std::uint64_t> ignored_{0};
  std::atomic<std::uint64_t> protocol_violations_{0};
  std::atomic<std::uint64_t> stale_recipients_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace relay
