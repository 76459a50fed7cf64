/*
 * 설명: WebSocket 연결 하나의 수명주기를 소유하고 프레임을 순서대로 디스패처에 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/connection.hpp"
#include "relay/dispatcher.hpp"
#include "relay/observability.hpp"
#include "relay/session_state.hpp"

namespace relay {

// 핸드셰이크에만 타임아웃을 두고, 이후에는 유휴 종료나 keep-alive ping을 하지 않는다.
boost::beast::websocket::stream_base::timeout ServerTimeoutOptions();

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<Observability> observability,
                   std::string connection_id);
  ~WebSocketSession() override;
  void Run();

  bool Send(std::string frame) override;
  void Close(CloseReason reason) override;
  const std::string& Id() const override { return connection_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(const std::string& frame);
  void LogDispatch(const DispatchResult& result);
  // 모든 종료 경로가 이 함수를 거친다. 두 번째 호출부터는 아무 일도 하지 않는다.
  void Terminate(std::string_view reason);
  void SendClose(CloseReason reason);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  std::string connection_id_;
  SessionIdentity identity_;
  std::deque<std::string> send_queue_;
  bool writing_{false};
  bool closing_{false};
  bool terminated_{false};
  std::atomic<bool> open_{true};
};

}  // namespace relay
