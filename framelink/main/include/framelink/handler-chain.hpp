#pragma once

#include <cstddef>
#include <vector>

#include "framelink/http-exchange.hpp"
#include "framelink/middleware.hpp"

namespace framelink {

// Ordered middlewares followed by the request handler, shared by all connections of a server.
// It is immutable once built, so it can be used by several connections without synchronization.
class HandlerChain {
 public:
  // Throws std::invalid_argument if the handler or one of the middlewares is empty.
  explicit HandlerChain(RequestHandler handler, std::vector<RequestMiddleware> middlewares = {});

  // Run the middlewares in order, then the handler unless a middleware short-circuited.
  // Exceptions thrown by middlewares and by the handler are propagated to the caller.
  void dispatch(http::HttpExchange& exchange) const;

  [[nodiscard]] std::size_t nbMiddlewares() const noexcept { return _middlewares.size(); }

 private:
  std::vector<RequestMiddleware> _middlewares;
  RequestHandler _handler;
};

}  // namespace framelink
