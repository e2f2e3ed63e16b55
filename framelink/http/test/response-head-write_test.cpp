#include "framelink/response-head-write.hpp"

#include <gtest/gtest.h>

#include "framelink/buffered-sink.hpp"
#include "framelink/header-map.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/http-version.hpp"
#include "framelink/scripted-transport.hpp"

namespace framelink::http {

TEST(ResponseHeadWrite, StatusLineAndHeaders) {
  test::ScriptedTransport transport;
  BufferedSink sink(transport);
  HeaderMap headers;
  headers.add("Content-Length", "5");
  headers.add("X-Custom", "a b");

  WriteResponseHead(sink, Version::Http11, StatusCodeOK, headers);
  ASSERT_EQ(sink.flush(), BufferedSink::FlushStatus::Done);
  EXPECT_EQ(transport.written(), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Custom: a b\r\n\r\n");
}

TEST(ResponseHeadWrite, Http10AndNoHeaders) {
  test::ScriptedTransport transport;
  BufferedSink sink(transport);
  WriteResponseHead(sink, Version::Http10, StatusCodeNotFound, HeaderMap{});
  ASSERT_EQ(sink.flush(), BufferedSink::FlushStatus::Done);
  EXPECT_EQ(transport.written(), "HTTP/1.0 404 Not Found\r\n\r\n");
}

TEST(ResponseHeadWrite, UnknownReasonPhrase) {
  test::ScriptedTransport transport;
  BufferedSink sink(transport);
  WriteResponseHead(sink, Version::Other, 299, HeaderMap{});
  ASSERT_EQ(sink.flush(), BufferedSink::FlushStatus::Done);
  EXPECT_EQ(transport.written(), "HTTP/1.1 299 \r\n\r\n");
}

}  // namespace framelink::http
