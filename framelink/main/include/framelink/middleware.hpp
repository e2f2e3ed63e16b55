#pragma once

#include <cstdint>
#include <functional>

#include "framelink/http-exchange.hpp"

namespace framelink {

// Result of running a middleware stage.
enum class MiddlewareResult : std::uint8_t {
  Continue,     // run the next middleware, then the handler
  ShortCircuit  // the middleware produced the response itself, skip the rest of the chain
};

// Middleware invoked before the request handler executes. It may inspect the request, amend the response
// headers, or write the whole response through the exchange and return MiddlewareResult::ShortCircuit.
using RequestMiddleware = std::function<MiddlewareResult(http::HttpExchange&)>;

// Request handler. It reads the request body and writes the response through the exchange.
// The response does not need to be ended explicitly: the connection finishes it when the handler returns.
using RequestHandler = std::function<void(http::HttpExchange&)>;

}  // namespace framelink
