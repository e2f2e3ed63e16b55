#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

#include "framelink/handler-chain.hpp"
#include "framelink/http-server.hpp"
#include "framelink/server-config.hpp"

namespace framelink::test {

// RAII test server harness.
//  * Constructs the HttpServer (binds and listens immediately, so clients can connect right away)
//  * Runs its event loop in a background jthread using runUntil(stopFlag)
//  * Stops and joins on destruction
struct TestServer {
  explicit TestServer(ServerConfig cfg, HandlerChain handlers,
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod)), std::move(handlers)),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  void stop() {
    stopFlag.store(true);
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  HttpServer server;
  std::atomic<bool> stopFlag{false};
  std::jthread loopThread;
};

}  // namespace framelink::test
