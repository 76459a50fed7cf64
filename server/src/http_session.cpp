/*
 * 설명: HTTP 요청을 읽어 WS 업그레이드 또는 상태/메트릭 응답으로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/http_session.hpp"

#include <chrono>
#include <exception>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "relay/api_response.hpp"
#include "relay/websocket_session.hpp"

namespace relay {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Dispatcher> dispatcher,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), dispatcher_(std::move(dispatcher)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    observability_->Log(LogContext{LogLevel::kDebug, "http_read_failed", "", std::nullopt, std::nullopt,
                                   ec.message()});
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<http::response<http::string_body>>();
  res->version(req_.version());
  res->keep_alive(false);
  res->set(http::field::server, "relay-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));
  std::string method = std::string(req_.method_string());

  const bool known_path = path == "/api/health" || path == "/metrics";
  std::string body;
  if (known_path && req_.method() != http::verb::get) {
    res->result(http::status::method_not_allowed);
    res->set(http::field::allow, "GET");
    body = MakeErrorEnvelope(HttpErrorCode::kMethodNotAllowed, method, path).dump();
  } else if (path == "/api/health") {
    res->result(http::status::ok);
    body = MakeHealthEnvelope(observability_->Snapshot()).dump();
  } else if (path == "/metrics") {
    res->result(http::status::ok);
    body = MakeMetricsEnvelope(observability_->Snapshot()).dump();
  } else {
    res->result(http::status::not_found);
    body = MakeErrorEnvelope(HttpErrorCode::kNotFound, method, path).dump();
  }
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  auto remote_ip = RemoteIp();
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(ServerTimeoutOptions());
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "relay-server");
  }));
  try {
    ws.accept(req_);
    auto connection_id = observability_->NextTraceId();
    observability_->Log(LogContext{LogLevel::kDebug, "websocket_upgraded", connection_id, std::nullopt, std::nullopt,
                                   remote_ip});
    std::make_shared<WebSocketSession>(std::move(ws), dispatcher_, observability_, std::move(connection_id))->Run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kWarn, "websocket_handshake_failed", "", std::nullopt, std::nullopt,
                                   ex.what()});
    boost::beast::error_code ec;
    boost::beast::get_lowest_layer(ws).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace relay
