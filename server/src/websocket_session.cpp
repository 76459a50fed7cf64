/*
 * 설명: WebSocket 프레임을 순서대로 읽어 디스패처에 넘기고, 종료 시 레지스트리 정리를 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/websocket_session.hpp"

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace relay {
namespace {
boost::beast::websocket::close_reason ToCloseReason(CloseReason reason) {
  switch (reason) {
    case CloseReason::kProtocolViolation: {
      boost::beast::websocket::close_reason cr{boost::beast::websocket::close_code::protocol_error};
      cr.reason = "protocol_violation";
      return cr;
    }
    case CloseReason::kStaleRecipient: {
      boost::beast::websocket::close_reason cr{boost::beast::websocket::close_code::internal_error};
      cr.reason = "stale_recipient";
      return cr;
    }
    case CloseReason::kSuperseded:
      break;
  }
  boost::beast::websocket::close_reason cr{boost::beast::websocket::close_code::policy_error};
  cr.reason = "superseded";
  return cr;
}
}  // namespace

boost::beast::websocket::stream_base::timeout ServerTimeoutOptions() {
  auto opt = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  opt.idle_timeout = boost::beast::websocket::stream_base::none();
  opt.keep_alive_pings = false;
  return opt;
}

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<Dispatcher> dispatcher,
                                   std::shared_ptr<Observability> observability, std::string connection_id)
    : ws_(std::move(ws)), dispatcher_(std::move(dispatcher)), observability_(std::move(observability)),
      connection_id_(std::move(connection_id)) {}

WebSocketSession::~WebSocketSession() { Terminate("destroyed"); }

void WebSocketSession::Run() {
  observability_->ConnectionOpened();
  observability_->Log(LogContext{LogLevel::kInfo, "connection_opened", connection_id_, std::nullopt, std::nullopt, ""});
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return Terminate("peer_closed");
  }
  if (ec) {
    return Terminate(ec.message());
  }
  if (closing_) {
    buffer_.consume(buffer_.size());
    return Terminate("closed_by_server");
  }

  auto frame = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    HandleFrame(frame);
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "session_error", connection_id_,
                                   identity_.IsIdentified() ? std::optional<std::string>{identity_.ClientId()}
                                                            : std::nullopt,
                                   std::nullopt, ex.what()});
    Terminate("session_error");
    SendClose(CloseReason::kProtocolViolation);
    return;
  }

  DoRead();
}

void WebSocketSession::HandleFrame(const std::string& frame) {
  observability_->FrameReceived();
  auto result = dispatcher_->Dispatch(identity_, shared_from_this(), frame);
  LogDispatch(result);
  if (!result.IsFatal()) {
    return;
  }
  Terminate(ToString(result.status));
  SendClose(result.status == DispatchStatus::kProtocolViolation ? CloseReason::kProtocolViolation
                                                                : CloseReason::kStaleRecipient);
}

void WebSocketSession::LogDispatch(const DispatchResult& result) {
  LogLevel level = LogLevel::kInfo;
  switch (result.status) {
    case DispatchStatus::kRegistered:
      observability_->IncrementRegistration();
      break;
    case DispatchStatus::kRegistrationRejected:
      observability_->IncrementRejectedRegistration();
      level = LogLevel::kWarn;
      break;
    case DispatchStatus::kRelayed:
      observability_->IncrementRelayed();
      level = LogLevel::kDebug;
      break;
    case DispatchStatus::kUnknownRecipient:
      observability_->IncrementUnknownRecipient();
      break;
    case DispatchStatus::kRecipientEvicted:
    case DispatchStatus::kStaleRecipient:
      observability_->IncrementStaleRecipient();
      level = LogLevel::kWarn;
      break;
    case DispatchStatus::kIgnored:
      observability_->IncrementIgnored();
      level = LogLevel::kDebug;
      break;
    case DispatchStatus::kProtocolViolation:
      observability_->IncrementProtocolViolation();
      level = LogLevel::kWarn;
      break;
  }
  if (!observability_->Enabled(level)) {
    return;
  }
  observability_->Log(LogContext{level, std::string(ToString(result.status)), connection_id_, result.client_id,
                                 result.target, result.detail});
}

void WebSocketSession::Terminate(std::string_view reason) {
  if (terminated_) {
    return;
  }
  terminated_ = true;
  closing_ = true;
  open_.store(false);

  if (identity_.IsIdentified()) {
    try {
      bool removed = dispatcher_->Release(identity_, this);
      observability_->Log(LogContext{LogLevel::kInfo, removed ? "unregistered" : "unregister_skipped",
                                     connection_id_, identity_.ClientId(), std::nullopt,
                                     removed ? "" : "다른 연결이 id를 보유 중"});
    } catch (const std::exception& ex) {
      observability_->Log(LogContext{LogLevel::kError, "teardown_error", connection_id_, identity_.ClientId(),
                                     std::nullopt, ex.what()});
    }
  }
  observability_->ConnectionClosed();
  observability_->Log(
      LogContext{LogLevel::kInfo, "connection_closed", connection_id_, std::nullopt, std::nullopt, std::string(reason)});
}

void WebSocketSession::SendClose(CloseReason reason) {
  if (!ws_.is_open()) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_close(ToCloseReason(reason), [self](boost::beast::error_code ec) {
    if (ec) {
      boost::beast::error_code ignored;
      boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
    }
  });
}

bool WebSocketSession::Send(std::string frame) {
  if (!open_.load()) {
    return false;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
  return true;
}

void WebSocketSession::Close(CloseReason reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason]() {
    if (self->closing_) {
      return;
    }
    // 대기 중인 async_read가 closed로 끝나면서 Terminate가 호출된다.
    self->closing_ = true;
    self->open_.store(false);
    self->SendClose(reason);
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  send_queue_.push_back(std::move(message));
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  if (!send_queue_.empty()) {
    send_queue_.pop_front();
  }
  if (ec) {
    Terminate("write_failed: " + ec.message());
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

}  // namespace relay
