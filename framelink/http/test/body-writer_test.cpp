#include "framelink/body-writer.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "framelink/body-reader.hpp"
#include "framelink/buffered-sink.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/request-framing.hpp"
#include "framelink/scripted-transport.hpp"

namespace framelink::http {

class BodyWriterTest : public ::testing::Test {
 protected:
  BodyWriter makeWriter(const FramingDecision& decision) {
    return {decision, [this] { ++nbEndCalls; }};
  }

  std::string flushed() {
    EXPECT_EQ(sink.flush(), BufferedSink::FlushStatus::Done);
    return transport.takeWritten();
  }

  test::ScriptedTransport transport;
  BufferedSink sink{transport};
  int nbEndCalls{0};
};

TEST_F(BodyWriterTest, EmptyDiscardsPayload) {
  auto writer = makeWriter(EmptyFraming{});
  EXPECT_EQ(writer.write(sink, "payload of the equivalent GET"), BodyWriteStatus::Ok);
  EXPECT_TRUE(sink.empty());
  EXPECT_EQ(nbEndCalls, 0);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_TRUE(sink.empty());
  EXPECT_EQ(nbEndCalls, 1);
}

TEST_F(BodyWriterTest, FixedLengthEndsWhenDeclaredLengthIsWritten) {
  auto writer = makeWriter(FixedLengthFraming{10});
  EXPECT_EQ(writer.write(sink, "01234"), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.remaining(), 5U);
  EXPECT_EQ(nbEndCalls, 0);
  EXPECT_EQ(writer.write(sink, "56789"), BodyWriteStatus::Ok);
  EXPECT_TRUE(writer.ended());
  EXPECT_FALSE(writer.closed());
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_EQ(flushed(), "0123456789");
}

TEST_F(BodyWriterTest, FixedLengthRefusesOverflow) {
  auto writer = makeWriter(FixedLengthFraming{4});
  EXPECT_EQ(writer.write(sink, "abc"), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, "de"), BodyWriteStatus::Overflow);
  EXPECT_EQ(writer.remaining(), 1U);
  EXPECT_EQ(writer.write(sink, "d"), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, "e"), BodyWriteStatus::Overflow);
  EXPECT_EQ(flushed(), "abcd");
}

TEST_F(BodyWriterTest, FixedLengthShortWrite) {
  auto writer = makeWriter(FixedLengthFraming{4});
  EXPECT_EQ(writer.write(sink, "ab"), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::ShortWrite);
  EXPECT_TRUE(writer.closed());
  EXPECT_EQ(nbEndCalls, 1);
}

TEST_F(BodyWriterTest, FixedLengthZero) {
  auto writer = makeWriter(FixedLengthFraming{0});
  EXPECT_EQ(writer.write(sink, "x"), BodyWriteStatus::Overflow);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_TRUE(sink.empty());
}

TEST_F(BodyWriterTest, ChunkedEncoding) {
  auto writer = makeWriter(ChunkedFraming{});
  EXPECT_EQ(writer.write(sink, "wiki"), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, ""), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, std::string(26, 'x')), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 0);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_EQ(writer.bytesWritten(), 30U);
  EXPECT_EQ(flushed(), "4\r\nwiki\r\n1a\r\n" + std::string(26, 'x') + "\r\n0\r\n\r\n");
}

TEST_F(BodyWriterTest, IdentityPassesThrough) {
  auto writer = makeWriter(IdentityFraming{});
  EXPECT_EQ(writer.write(sink, "raw "), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, "bytes"), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 0);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_EQ(flushed(), "raw bytes");
}

TEST_F(BodyWriterTest, WriteAfterClose) {
  auto writer = makeWriter(ChunkedFraming{});
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  EXPECT_EQ(writer.write(sink, "late"), BodyWriteStatus::AlreadyClosed);
  EXPECT_EQ(writer.close(sink), BodyWriteStatus::AlreadyClosed);
  EXPECT_EQ(nbEndCalls, 1);
  EXPECT_EQ(flushed(), "0\r\n\r\n");
}

class ChunkedRoundTripTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(ChunkedRoundTripTest, DecodeReproducesEncodedPayload) {
  static constexpr std::size_t kReadChunkBytes = 64;

  std::string payload(GetParam(), '\0');
  for (std::size_t pos = 0; pos < payload.size(); ++pos) {
    payload[pos] = static_cast<char>('a' + (pos % 26));
  }

  test::ScriptedTransport wire;
  BufferedSink sink(wire);
  BodyWriter writer(ChunkedFraming{}, {});
  // several chunks of uneven sizes
  for (std::size_t pos = 0; pos < payload.size(); pos += 37) {
    ASSERT_EQ(writer.write(sink, std::string_view(payload).substr(pos, 37)), BodyWriteStatus::Ok);
  }
  ASSERT_EQ(writer.close(sink), BodyWriteStatus::Ok);
  ASSERT_EQ(sink.flush(), BufferedSink::FlushStatus::Done);

  test::ScriptedTransport peer;
  peer.feed(wire.written());
  BufferedSource source(peer, kReadChunkBytes);
  RequestFraming framing;
  framing.decision = ChunkedFraming{};
  framing.installWrapper = true;
  int nbEndCalls = 0;
  BodyReader reader(framing, 64, [&nbEndCalls] { ++nbEndCalls; });

  std::string decoded;
  char buf[kReadChunkBytes / 2];
  BodyReadStatus status = BodyReadStatus::Data;
  while (status == BodyReadStatus::Data) {
    const auto res = reader.read(source, buf);
    decoded.append(buf, res.nbBytes);
    status = res.status;
  }
  EXPECT_EQ(status, BodyReadStatus::End);
  EXPECT_EQ(decoded, payload);
  EXPECT_EQ(nbEndCalls, 1);
}

INSTANTIATE_TEST_SUITE_P(PayloadSizes, ChunkedRoundTripTest, ::testing::Values(0U, 1U, 1000U));

}  // namespace framelink::http
