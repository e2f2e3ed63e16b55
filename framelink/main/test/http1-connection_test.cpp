#include "framelink/http1-connection.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "framelink/body-reader.hpp"
#include "framelink/handler-chain.hpp"
#include "framelink/http-exchange.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/middleware.hpp"
#include "framelink/scripted-transport.hpp"
#include "framelink/server-config.hpp"

namespace framelink {

using Action = Http1Connection::Action;

class Http1ConnectionTest : public ::testing::Test {
 protected:
  void start(RequestHandler handler, std::vector<RequestMiddleware> middlewares = {}) {
    chain = std::make_unique<HandlerChain>(std::move(handler), std::move(middlewares));
    connection = std::make_unique<Http1Connection>(transport, config, *chain);
  }

  // Replies with the request target as a fixed-length body.
  void startEchoTarget() {
    start([this](http::HttpExchange& exchange) {
      targets.emplace_back(exchange.target());
      exchange.contentLength(exchange.target().size());
      exchange.end(exchange.target());
    });
  }

  static std::string OkResponse(std::string_view body, std::string_view extraHeaders = {}) {
    std::string ret("HTTP/1.1 200 OK\r\nContent-Length: ");
    ret.append(std::to_string(body.size()));
    ret.append("\r\n");
    ret.append(extraHeaders);
    ret.append("\r\n");
    ret.append(body);
    return ret;
  }

  test::ScriptedTransport transport;
  ServerConfig config;
  std::unique_ptr<HandlerChain> chain;
  std::unique_ptr<Http1Connection> connection;
  std::vector<std::string> targets;
};

TEST_F(Http1ConnectionTest, SingleRequestKeepsConnectionOpen) {
  startEchoTarget();
  transport.feed("GET /hello HTTP/1.1\r\nHost: localhost\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(transport.written(), OkResponse("/hello"));
  EXPECT_EQ(connection->nbRequests(), 1U);
  EXPECT_FALSE(connection->closed());
}

TEST_F(Http1ConnectionTest, PartialHeadWaitsForMoreBytes) {
  startEchoTarget();
  transport.feed("GET /split HT");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(targets.empty());
  transport.feed("TP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/split"}));
}

TEST_F(Http1ConnectionTest, PipelinedRequestsAreServedInOrder) {
  startEchoTarget();
  transport.feed("GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\nGET /c HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/a", "/b", "/c"}));
  EXPECT_EQ(transport.written(), OkResponse("/a") + OkResponse("/b") + OkResponse("/c"));
}

TEST_F(Http1ConnectionTest, BodyArrivingAfterHeadReachesHandler) {
  std::string received;
  start([&](http::HttpExchange& exchange) {
    EXPECT_EQ(exchange.readAvailableBody(received), http::BodyReadStatus::End);
    exchange.contentLength(received.size());
    exchange.end(received);
  });

  transport.feed("POST /u HTTP/1.1\r\nContent-Length: 5\r\n\r\n");
  transport.feedWouldBlock();
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(received.empty());
  EXPECT_TRUE(transport.written().empty());

  transport.feed("hel");
  transport.feedWouldBlock();
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(transport.written().empty());

  transport.feed("lo");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(received, "hello");
  EXPECT_EQ(transport.written(), OkResponse("hello"));
}

TEST_F(Http1ConnectionTest, ChunkedBodyArrivingAfterHeadReachesHandler) {
  std::string received;
  start([&](http::HttpExchange& exchange) {
    targets.emplace_back(exchange.target());
    exchange.readAvailableBody(received);
    exchange.contentLength(received.size());
    exchange.end(received);
  });

  transport.feed("POST /chunks HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nwi");
  transport.feedWouldBlock();
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(targets.empty());

  transport.feed("ki\r\n5\r\npedia\r\n0\r\n\r\nGET /next HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/chunks", "/next"}));
  EXPECT_EQ(transport.written(), OkResponse("wikipedia") + OkResponse(""));
}

TEST_F(Http1ConnectionTest, PartiallyReadBodyDoesNotLeakIntoNextRequest) {
  std::string received;
  start([&](http::HttpExchange& exchange) {
    targets.emplace_back(exchange.target());
    if (exchange.target() == "/upload") {
      std::array<char, 50> buf;
      const auto res = exchange.readBody(buf);
      EXPECT_EQ(res.status, http::BodyReadStatus::Data);
      received.assign(buf.data(), res.nbBytes);
    }
    exchange.end();
  });

  transport.feed("POST /upload HTTP/1.1\r\nContent-Length: 100\r\n\r\n");
  transport.feed(std::string(60, 'x'));
  transport.feedWouldBlock();
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(targets.empty());

  transport.feed(std::string(40, 'x'));
  transport.feed("GET /next HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(received, std::string(50, 'x'));
  EXPECT_EQ(targets, (std::vector<std::string>{"/upload", "/next"}));
  static constexpr std::string_view kEmptyChunked = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n";
  EXPECT_EQ(transport.written(), std::string(kEmptyChunked) + std::string(kEmptyChunked));
}

TEST_F(Http1ConnectionTest, OversizedBodyIsRejectedAndDrainedBeforeNextRequest) {
  config.withMaxBodyBytes(32);
  startEchoTarget();

  transport.feed("POST /upload HTTP/1.1\r\nContent-Length: 100\r\n\r\n");
  transport.feed(std::string(60, 'x'));
  transport.feedWouldBlock();
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(targets.empty());
  // The response is sent while the rest of the body is still expected.
  EXPECT_EQ(transport.takeWritten(), "HTTP/1.1 413 Payload Too Large\r\nContent-Length: 0\r\n\r\n");

  transport.feed(std::string(40, 'x'));
  transport.feed("GET /next HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/next"}));
  EXPECT_EQ(transport.takeWritten(), OkResponse("/next"));
}

TEST_F(Http1ConnectionTest, OversizedChunkedBodyIsRejected) {
  config.withMaxBodyBytes(4);
  startEchoTarget();
  transport.feed(
      "POST /chunked HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
      "4\r\nwiki\r\n5\r\npedia\r\n0\r\n\r\n"
      "GET /after HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/after"}));
  EXPECT_EQ(transport.written(),
            "HTTP/1.1 413 Payload Too Large\r\nContent-Length: 0\r\n\r\n" + OkResponse("/after"));
}

TEST_F(Http1ConnectionTest, MalformedChunkedBodyGetsBadRequest) {
  startEchoTarget();
  transport.feed("POST /bad HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nwiki\r\n0\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
  EXPECT_EQ(transport.written(), "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

TEST_F(Http1ConnectionTest, UnreadChunkedBodyIsDiscarded) {
  startEchoTarget();
  transport.feed(
      "POST /chunked HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
      "4\r\nwiki\r\n5\r\npedia\r\n0\r\nX-Trailer: 1\r\n\r\n"
      "GET /after HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/chunked", "/after"}));
}

TEST_F(Http1ConnectionTest, HandlerReadsChunkedBody) {
  std::string body;
  start([&](http::HttpExchange& exchange) {
    EXPECT_EQ(exchange.readAvailableBody(body), http::BodyReadStatus::End);
    EXPECT_TRUE(exchange.requestTerminated());
    exchange.contentLength(body.size());
    exchange.end(body);
  });
  transport.feed("POST /echo HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nwiki\r\n5\r\npedia\r\n0\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(body, "wikipedia");
  EXPECT_EQ(transport.written(), OkResponse("wikipedia"));
}

TEST_F(Http1ConnectionTest, PrematureEndOfBodyClosesWithoutDispatch) {
  startEchoTarget();
  transport.feed("POST /short HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
  transport.feedEof();
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
  EXPECT_TRUE(transport.written().empty());
  EXPECT_TRUE(connection->closed());
}

TEST_F(Http1ConnectionTest, PrematureEndDuringDrainClosesConnection) {
  config.withMaxBodyBytes(4);
  startEchoTarget();
  transport.feed("POST /short HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
  transport.feedEof();
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), "HTTP/1.1 413 Payload Too Large\r\nContent-Length: 0\r\n\r\n");
  EXPECT_TRUE(connection->closed());
}

TEST_F(Http1ConnectionTest, Http10WithoutKeepAliveCloses) {
  startEchoTarget();
  transport.feed("GET /old HTTP/1.0\r\n\r\nGET /ignored HTTP/1.0\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), "HTTP/1.0 200 OK\r\nContent-Length: 4\r\n\r\n/old");
  EXPECT_EQ(targets, (std::vector<std::string>{"/old"}));
}

TEST_F(Http1ConnectionTest, Http10KeepAliveIsHonored) {
  startEchoTarget();
  transport.feed("GET /old HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(transport.written(), "HTTP/1.0 200 OK\r\nContent-Length: 4\r\nConnection: keep-alive\r\n\r\n/old");
}

TEST_F(Http1ConnectionTest, Http10IdentityResponseEndsWithConnection) {
  start([](http::HttpExchange& exchange) { exchange.end("abc"); });
  transport.feed("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), "HTTP/1.0 200 OK\r\n\r\nabc");
}

TEST_F(Http1ConnectionTest, ConnectionCloseRequestIsHonored) {
  startEchoTarget();
  transport.feed("GET /bye HTTP/1.1\r\nConnection: close\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), OkResponse("/bye", "Connection: close\r\n"));
}

TEST_F(Http1ConnectionTest, KeepAliveDisabledByConfig) {
  config.withKeepAliveMode(false);
  startEchoTarget();
  transport.feed("GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), OkResponse("/a", "Connection: close\r\n"));
}

TEST_F(Http1ConnectionTest, MaxRequestsPerConnection) {
  config.withMaxRequestsPerConnection(2);
  startEchoTarget();
  transport.feed("GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\nGET /c HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(targets, (std::vector<std::string>{"/a", "/b"}));
  EXPECT_EQ(transport.written(), OkResponse("/a") + OkResponse("/b", "Connection: close\r\n"));
}

TEST_F(Http1ConnectionTest, MalformedContentLengthDropsConnection) {
  startEchoTarget();
  transport.feed("POST /bad HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
  EXPECT_TRUE(transport.written().empty());
}

TEST_F(Http1ConnectionTest, InvalidRequestLineGetsBadRequest) {
  startEchoTarget();
  transport.feed("GARBAGE\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
  EXPECT_EQ(transport.written(), "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

TEST_F(Http1ConnectionTest, UnsupportedVersion) {
  startEchoTarget();
  transport.feed("GET / HTTP/2.0\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(),
            "HTTP/1.1 505 HTTP Version Not Supported\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

TEST_F(Http1ConnectionTest, OversizedHead) {
  config.withMaxHeaderBytes(64);
  startEchoTarget();
  transport.feed("GET / HTTP/1.1\r\nX-Filler: ");
  transport.feed(std::string(128, 'f'));
  transport.feed("\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
  EXPECT_EQ(transport.written(),
            "HTTP/1.1 431 Request Header Fields Too Large\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

TEST_F(Http1ConnectionTest, HandlerExceptionGivesInternalServerError) {
  start([](http::HttpExchange& exchange) {
    exchange.responseHeaders().add("X-Partial", "1");
    throw std::runtime_error("handler failure");
  });
  transport.feed("GET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(),
            "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
}

TEST_F(Http1ConnectionTest, HandlerExceptionAfterHeadDropsConnectionWithoutTerminatingBody) {
  start([](http::HttpExchange& exchange) {
    exchange.write("partial");
    throw std::runtime_error("handler failure");
  });
  transport.feed("GET / HTTP/1.1\r\n\r\nGET /next HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written().find("0\r\n\r\n"), std::string::npos);
  EXPECT_EQ(connection->nbRequests(), 1U);
  EXPECT_TRUE(connection->closed());
}

TEST_F(Http1ConnectionTest, IncompleteFixedLengthResponseDropsConnection) {
  start([](http::HttpExchange& exchange) {
    exchange.contentLength(10);
    exchange.write("abc");
  });
  transport.feed("GET / HTTP/1.1\r\n\r\nGET /next HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(transport.written().empty());
  EXPECT_EQ(connection->nbRequests(), 1U);
}

TEST_F(Http1ConnectionTest, HeadResponseHasNoBody) {
  startEchoTarget();
  transport.feed("HEAD /head HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(transport.written(), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n");
}

TEST_F(Http1ConnectionTest, ChunkedResponseWithoutLength) {
  start([](http::HttpExchange& exchange) {
    exchange.write("abc");
    exchange.write("defgh");
  });
  transport.feed("GET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(transport.written(),
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n5\r\ndefgh\r\n0\r\n\r\n");
}

TEST_F(Http1ConnectionTest, MiddlewareShortCircuit) {
  start(
      [this](http::HttpExchange& exchange) {
        targets.emplace_back(exchange.target());
        exchange.end();
      },
      {[](http::HttpExchange& exchange) {
        exchange.status(http::StatusCodeNotFound);
        exchange.contentLength(0);
        exchange.end();
        return MiddlewareResult::ShortCircuit;
      }});
  transport.feed("GET /hidden HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_TRUE(targets.empty());
  EXPECT_EQ(transport.written(), "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
}

TEST_F(Http1ConnectionTest, WriteBackpressure) {
  startEchoTarget();
  transport.setWriteBudget(10);
  transport.feed("GET /slow HTTP/1.1\r\n\r\nGET /after HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::WaitWritable);
  EXPECT_EQ(transport.written().size(), 10U);
  // The next pipelined request waits for the response to be flushed.
  EXPECT_EQ(targets, (std::vector<std::string>{"/slow"}));

  transport.setWriteBudget(std::numeric_limits<std::size_t>::max());
  EXPECT_EQ(connection->process(), Action::WaitReadable);
  EXPECT_EQ(targets, (std::vector<std::string>{"/slow", "/after"}));
  EXPECT_EQ(transport.written(), OkResponse("/slow") + OkResponse("/after"));
}

TEST_F(Http1ConnectionTest, WriteErrorCloses) {
  startEchoTarget();
  transport.failWrites();
  transport.feed("GET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(connection->process(), Action::Close);
}

TEST_F(Http1ConnectionTest, PeerCloseBetweenRequests) {
  startEchoTarget();
  transport.feed("GET /last HTTP/1.1\r\n\r\n");
  transport.feedEof();
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_EQ(transport.written(), OkResponse("/last"));
}

TEST_F(Http1ConnectionTest, ReadErrorCloses) {
  startEchoTarget();
  transport.feedError();
  EXPECT_EQ(connection->process(), Action::Close);
  EXPECT_TRUE(targets.empty());
}

}  // namespace framelink
