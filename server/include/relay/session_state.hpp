/*
 * 설명: 세션의 식별 상태(Unidentified / Identified)를 표현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <string>
#include <utility>

namespace relay {

class SessionIdentity {
 public:
  enum class State {
    kUnidentified,
    kIdentified,
  };

  State GetState() const { return state_; }
  bool IsIdentified() const { return state_ == State::kIdentified; }
  // IsIdentified()가 false이면 빈 문자열.
  const std::string& ClientId() const { return client_id_; }

  void Identify(std::string client_id) {
    client_id_ = std::move(client_id);
    state_ = State::kIdentified;
  }

 private:
  State state_{State::kUnidentified};
  std::string client_id_;
};

}  // namespace relay
