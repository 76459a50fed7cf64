/*
 * 설명: 릴레이 서버 전체 수명주기(레지스트리 생성, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "relay/config.hpp"
#include "relay/dispatcher.hpp"
#include "relay/observability.hpp"
#include "relay/registry.hpp"

namespace relay {

class Listener;

// host는 IP 리터럴 또는 호스트 이름. 해석 결과의 첫 번째 엔드포인트를 사용한다.
boost::asio::ip::tcp::endpoint ResolveBindEndpoint(boost::asio::io_context& ioc, const std::string& host,
                                                   unsigned short port);

class RelayApp {
 public:
  explicit RelayApp(const AppConfig& config);
  ~RelayApp();

  // 바인드 후 워커 스레드를 띄우고 곧바로 반환한다. 바인드 실패 시 예외를 던진다.
  void Start();
  // Start() 후 이벤트 루프가 멈출 때까지 블록한다.
  void Run();
  void Stop();

  unsigned short BoundPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ClientRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ClientRegistry> registry_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace relay
