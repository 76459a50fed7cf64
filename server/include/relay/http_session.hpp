/*
 * 설명: HTTP 연결을 받아 WS 업그레이드를 수행하고 상태/메트릭 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/dispatcher.hpp"
#include "relay/observability.hpp"

namespace relay {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Dispatcher> dispatcher,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res);
  void HandleWebSocket();
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
