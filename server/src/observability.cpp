/*
 * 설명: 구조화 로그 출력과 릴레이 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "relay/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace relay {
namespace {
std::string NowIsoString() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return {{"connections", {{"accepted", snapshot.connections_accepted}, {"active", snapshot.connections_active}}},
          {"registry", {{"clients", snapshot.registered_clients}}},
          {"frames",
           {{"received", snapshot.frames_received},
            {"registrations", snapshot.registrations},
            {"registrationsRejected", snapshot.registrations_rejected},
            {"relayed", snapshot.relayed},
            {"unknownRecipient", snapshot.unknown_recipient},
            {"ignored", snapshot.ignored},
            {"protocolViolations", snapshot.protocol_violations},
            {"staleRecipients", snapshot.stale_recipients}}}};
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::ConnectionOpened() {
  connections_accepted_.fetch_add(1);
  connections_active_.fetch_add(1);
}

void Observability::ConnectionClosed() { connections_active_.fetch_sub(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.connections_accepted = connections_accepted_.load();
  snapshot.connections_active = connections_active_.load();
  snapshot.registered_clients = registered_clients_.load();
  snapshot.frames_received = frames_received_.load();
  snapshot.registrations = registrations_.load();
  snapshot.registrations_rejected = registrations_rejected_.load();
  snapshot.relayed = relayed_.load();
  snapshot.unknown_recipient = unknown_recipient_.load();
  snapshot.ignored = ignored_.load();
  snapshot.protocol_violations = protocol_violations_.load();
  snapshot.stale_recipients = stale_recipients_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = NowIsoString();
  log_json["level"] = LevelName(ctx.level);
  log_json["event"] = ctx.name;
  if (!ctx.connection_id.empty()) {
    log_json["connectionId"] = ctx.connection_id;
  }
  if (ctx.client_id) {
    log_json["clientId"] = *ctx.client_id;
  }
  if (ctx.target) {
    log_json["target"] = *ctx.target;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // ClientID는 임의 바이트일 수 있으므로 잘못된 UTF-8은 치환해서 출력한다.
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

}  // namespace relay
