#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "framelink/handler-chain.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-exchange.hpp"
#include "framelink/http-server.hpp"
#include "framelink/http-version.hpp"
#include "framelink/log.hpp"
#include "framelink/middleware.hpp"
#include "framelink/server-config.hpp"

using namespace framelink;

namespace {

volatile std::sig_atomic_t gStopRequested = 0;

void OnSignal(int /*signal*/) { gStopRequested = 1; }

}  // namespace

int main(int argc, char **argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Graceful shutdown on Ctrl+C
  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  log::set_level(log::level::info);

  try {
    // Echoes the request body back. Responses without Content-Length are streamed: chunked for HTTP/1.1
    // clients, delimited by the connection close for HTTP/1.0 ones.
    HandlerChain handlers(
        [](http::HttpExchange &exchange) {
          exchange.responseHeaders().add(http::ContentType, "text/plain");
          std::string line("You requested ");
          line.append(exchange.method());
          line.push_back(' ');
          line.append(exchange.target());
          line.append(" over ");
          line.append(http::VersionToStr(exchange.version()));
          line.push_back('\n');
          exchange.write(line);

          std::string body;
          const auto status = exchange.readAvailableBody(body);
          if (!body.empty()) {
            exchange.write("Body: ");
            exchange.write(body);
            exchange.write("\n");
          }
          if (status == http::BodyReadStatus::WouldBlock) {
            exchange.write("(body delimited by connection close, only the received part is echoed)\n");
          }
        },
        {[](http::HttpExchange &exchange) {
          log::info("{} {}", exchange.method(), exchange.target());
          return MiddlewareResult::Continue;
        }});

    HttpServer server(ServerConfig{}.withPort(port), std::move(handlers));
    std::cout << "Listening on port " << server.port() << '\n';
    server.runUntil([] { return gStopRequested != 0; });
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
