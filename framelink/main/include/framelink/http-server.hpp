#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>

#include "framelink/base-fd.hpp"
#include "framelink/event-loop.hpp"
#include "framelink/event.hpp"
#include "framelink/handler-chain.hpp"
#include "framelink/http1-connection.hpp"
#include "framelink/server-config.hpp"
#include "framelink/socket.hpp"
#include "framelink/transport.hpp"

namespace framelink {

// Single threaded HTTP/1.x server: one listening socket and one epoll loop multiplexing all client
// connections, each driven by its own Http1Connection.
//
// Thread safety:
//  - run() / runUntil() must be called from a single thread at a time.
//  - stop() and isRunning() can be called from any thread.
class HttpServer {
 public:
  // Validates the config, binds and starts listening. If config.port is 0, an ephemeral port is chosen,
  // retrievable with port().
  // Throws std::invalid_argument for an invalid config and std::system_error if the socket setup fails.
  HttpServer(ServerConfig config, HandlerChain handlers);

  // Connections keep references to the config and handlers owned by the server.
  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Run the event loop until stop() is called. Blocking for the caller thread.
  // The maximum blocking interval of a single poll is ServerConfig::pollInterval.
  void run();

  // Like run(), but also exits when 'predicate' returns true (checked once per loop iteration).
  void runUntil(const std::function<bool()>& predicate);

  // Requests the termination of the event loop. Safe to invoke from another thread, the loop exits
  // within one poll interval. Open connections are closed when the loop exits.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  // Actual listening port.
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  // Number of open client connections. Only meaningful from the thread running the loop.
  [[nodiscard]] std::size_t nbConnections() const noexcept { return _connections.size(); }

 private:
  struct ConnectionEntry {
    ConnectionEntry(BaseFd fd, const ServerConfig& config, const HandlerChain& handlers)
        : baseFd(std::move(fd)), transport(baseFd.fd()), connection(transport, config, handlers) {}

    BaseFd baseFd;
    PlainTransport transport;
    Http1Connection connection;
    EventBmp interest{EventIn};
  };

  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionEntry>>;

  void eventLoop();

  void acceptNewConnections();

  void handleConnectionEvent(int fd);

  ConnectionMap::iterator closeConnection(ConnectionMap::iterator cnxIt);

  void closeAllConnections();

  ServerConfig _config;
  HandlerChain _handlers;
  Socket _listenSocket;
  EventLoop _eventLoop;
  ConnectionMap _connections;
  std::atomic<bool> _running{false};
  std::atomic<bool> _stopRequested{false};
};

}  // namespace framelink
