#include "framelink/handler-chain.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "framelink/http-exchange.hpp"
#include "framelink/log.hpp"
#include "framelink/middleware.hpp"

namespace framelink {

HandlerChain::HandlerChain(RequestHandler handler, std::vector<RequestMiddleware> middlewares)
    : _middlewares(std::move(middlewares)), _handler(std::move(handler)) {
  if (!_handler) {
    throw std::invalid_argument("Request handler cannot be empty");
  }
  for (const auto& middleware : _middlewares) {
    if (!middleware) {
      throw std::invalid_argument("Request middleware cannot be empty");
    }
  }
}

void HandlerChain::dispatch(http::HttpExchange& exchange) const {
  for (const auto& middleware : _middlewares) {
    if (middleware(exchange) == MiddlewareResult::ShortCircuit) {
      log::debug("{} {} short-circuited by middleware", exchange.method(), exchange.target());
      return;
    }
  }
  _handler(exchange);
}

}  // namespace framelink
