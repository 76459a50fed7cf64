/*
 * 설명: 레지스트리와 디스패처가 다루는 양방향 연결 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp, server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <string>

namespace relay {

enum class CloseReason {
  kProtocolViolation,
  kStaleRecipient,
  kSuperseded,
};

class Connection {
 public:
  virtual ~Connection() = default;

  // 프레임을 그대로 송신 큐에 넣는다. 연결이 이미 끊어졌으면 false를 반환한다.
  // 다른 세션의 스레드에서 호출될 수 있다.
  virtual bool Send(std::string frame) = 0;
  virtual void Close(CloseReason reason) = 0;
  virtual const std::string& Id() const = 0;
};

}  // namespace relay
