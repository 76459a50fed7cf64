/*
 * 설명: 상태/메트릭 HTTP 엔드포인트의 JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "relay/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace relay {
namespace {
constexpr const char* kServerVersion = "v1.0.0";

std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

const char* ErrorMessage(HttpErrorCode code) {
  switch (code) {
    case HttpErrorCode::kNotFound:
      return "WebSocket 업그레이드 요청이 아닙니다";
    case HttpErrorCode::kMethodNotAllowed:
      return "GET만 허용됩니다";
  }
  return "";
}
}  // namespace

std::string_view ToString(HttpErrorCode code) {
  switch (code) {
    case HttpErrorCode::kNotFound:
      return "not_found";
    case HttpErrorCode::kMethodNotAllowed:
      return "method_not_allowed";
  }
  return "not_found";
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}, {"version", kServerVersion}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(HttpErrorCode code, std::string_view method, std::string_view path) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", ToString(code)},
                       {"message", ErrorMessage(code)},
                       {"detail", {{"method", method}, {"path", path}}}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}, {"version", kServerVersion}};
  return envelope;
}

nlohmann::json MakeHealthEnvelope(const MetricsSnapshot& snapshot) {
  return MakeSuccessEnvelope({{"status", "ok"},
                              {"activeConnections", snapshot.connections_active},
                              {"registeredClients", snapshot.registered_clients}});
}

nlohmann::json MakeMetricsEnvelope(const MetricsSnapshot& snapshot) { return MakeSuccessEnvelope(ToJson(snapshot)); }

}  // namespace relay
