#include "framelink/http-server.hpp"

#include <functional>
#include <memory>
#include <utility>

#include "framelink/base-fd.hpp"
#include "framelink/errno-throw.hpp"
#include "framelink/event-loop.hpp"
#include "framelink/event.hpp"
#include "framelink/handler-chain.hpp"
#include "framelink/http1-connection.hpp"
#include "framelink/log.hpp"
#include "framelink/server-config.hpp"
#include "framelink/socket.hpp"

namespace framelink {

namespace {

EventBmp InterestFor(Http1Connection::Action action) {
  switch (action) {
    case Http1Connection::Action::WaitWritable:
      return EventOut;
    case Http1Connection::Action::WaitReadWrite:
      return EventIn | EventOut;
    default:
      return EventIn;
  }
}

ServerConfig Validated(ServerConfig config) {
  config.validate();
  return config;
}

}  // namespace

HttpServer::HttpServer(ServerConfig config, HandlerChain handlers)
    : _config(Validated(std::move(config))),
      _handlers(std::move(handlers)),
      _listenSocket(Socket::CreateNonBlocking()),
      _eventLoop(_config.pollInterval) {
  _listenSocket.bindAndListen(_config.reusePort, _config.port);
  if (!_eventLoop.add(EventLoop::EventFd{_listenSocket.fd(), EventIn})) {
    throw_errno("Unable to register the listening socket");
  }
}

HttpServer::~HttpServer() {
  stop();
  closeAllConnections();
}

void HttpServer::run() {
  runUntil([] { return false; });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  _stopRequested.store(false, std::memory_order_release);
  _running.store(true, std::memory_order_release);
  log::info("Server running on port {}", _config.port);
  while (!_stopRequested.load(std::memory_order_acquire) && !predicate()) {
    eventLoop();
  }
  closeAllConnections();
  _running.store(false, std::memory_order_release);
  log::info("Server stopped");
}

void HttpServer::stop() noexcept {
  if (_running.load(std::memory_order_acquire)) {
    log::debug("Stopping server");
    _stopRequested.store(true, std::memory_order_release);
  }
}

void HttpServer::eventLoop() {
  for (const auto& event : _eventLoop.poll()) {
    if (event.fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else {
      handleConnectionEvent(event.fd);
    }
  }
}

void HttpServer::acceptNewConnections() {
  while (true) {
    BaseFd cnxFd = _listenSocket.acceptNonBlocking();
    if (!cnxFd) {
      // no more waiting connections
      break;
    }
    const int fd = cnxFd.fd();
    if (!_eventLoop.add(EventLoop::EventFd{fd, EventIn})) {
      continue;
    }
    _connections.emplace(fd, std::make_unique<ConnectionEntry>(std::move(cnxFd), _config, _handlers));
    log::debug("Connection fd # {} accepted ({} open)", fd, _connections.size());
  }
}

void HttpServer::handleConnectionEvent(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionEntry& entry = *cnxIt->second;
  const auto action = entry.connection.process();
  if (action == Http1Connection::Action::Close) {
    closeConnection(cnxIt);
    return;
  }
  const EventBmp interest = InterestFor(action);
  if (interest != entry.interest) {
    if (!_eventLoop.mod(EventLoop::EventFd{fd, interest})) {
      closeConnection(cnxIt);
      return;
    }
    entry.interest = interest;
  }
}

HttpServer::ConnectionMap::iterator HttpServer::closeConnection(ConnectionMap::iterator cnxIt) {
  const int fd = cnxIt->first;
  _eventLoop.del(fd);
  log::debug("Connection fd # {} closed after {} requests", fd, cnxIt->second->connection.nbRequests());
  return _connections.erase(cnxIt);
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

}  // namespace framelink
