/*
 * 설명: 레지스트리/디스패처를 생성해 주입하고, 리스너와 워커 스레드의 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/app.hpp"

#include <csignal>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/http_session.hpp"

namespace relay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), dispatcher_(std::move(dispatcher)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    auto local = acceptor_.local_endpoint(ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = local.port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short LocalPort() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->dispatcher_, self->observability_)->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Log(
                LogContext{LogLevel::kWarn, "accept_failed", "", std::nullopt, std::nullopt, ec.message()});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
  unsigned short port_{0};
};

boost::asio::ip::tcp::endpoint ResolveBindEndpoint(boost::asio::io_context& ioc, const std::string& host,
                                                   unsigned short port) {
  boost::asio::ip::tcp::resolver resolver{ioc};
  // 실패 시 boost::system::system_error를 던진다.
  auto results = resolver.resolve(host, std::to_string(port), boost::asio::ip::tcp::resolver::passive);
  if (results.empty()) {
    throw boost::beast::system_error{boost::asio::error::host_not_found};
  }
  return results.begin()->endpoint();
}

RelayApp::RelayApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(config.worker_threads)), work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  registry_ = std::make_shared<ClientRegistry>(config.conflict_policy);
  registry_->SetObservability(observability_);
  dispatcher_ = std::make_shared<Dispatcher>(registry_, config.send_failure_policy);
}

RelayApp::~RelayApp() { Stop(); }

void RelayApp::Start() {
  if (running_) {
    return;
  }
  listener_ = std::make_shared<Listener>(ioc_, ResolveBindEndpoint(ioc_, config_.host, config_.port), dispatcher_,
                                         observability_);
  listener_->Run();
  running_ = true;

  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.async_wait([this](boost::beast::error_code ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogContext{LogLevel::kInfo, "signal_received", "", std::nullopt, std::nullopt,
                                   std::to_string(signal_number)});
    ioc_.stop();
  });

  observability_->Log(LogContext{LogLevel::kInfo, "server_started", "", std::nullopt, std::nullopt,
                                 "ws://" + config_.host + ":" + std::to_string(BoundPort()) + " threads=" +
                                     std::to_string(config_.worker_threads) + " conflict=" +
                                     std::string(ToString(config_.conflict_policy)) + " send_failure=" +
                                     std::string(ToString(config_.send_failure_policy))});
  RunWorkers();
}

void RelayApp::Run() {
  Start();
  JoinWorkers();
}

void RelayApp::RunWorkers() {
  for (std::size_t i = 0; i < config_.worker_threads; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void RelayApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void RelayApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::beast::error_code ignored;
  signals_.cancel(ignored);
  ioc_.stop();
  JoinWorkers();
}

unsigned short RelayApp::BoundPort() const { return listener_ ? listener_->LocalPort() : 0; }

}  // namespace relay
