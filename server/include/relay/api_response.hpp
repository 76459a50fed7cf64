/*
 * 설명: 상태/메트릭 HTTP 엔드포인트의 JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string_view>

#include <nlohmann/json.hpp>

#include "relay/observability.hpp"

namespace relay {

enum class HttpErrorCode {
  kNotFound,
  kMethodNotAllowed,
};

std::string_view ToString(HttpErrorCode code);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail에는 요청 메서드와 경로가 들어간다.
nlohmann::json MakeErrorEnvelope(HttpErrorCode code, std::string_view method, std::string_view path);
nlohmann::json MakeHealthEnvelope(const MetricsSnapshot& snapshot);
nlohmann::json MakeMetricsEnvelope(const MetricsSnapshot& snapshot);

}  // namespace relay
