#include "framelink/body-reader.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include "framelink/buffered-source.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/hex-digit.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/log.hpp"
#include "framelink/request-framing.hpp"

namespace framelink::http {

namespace {

// Parse the size field of a chunk-size line (without its CRLF).
std::optional<std::size_t> ParseChunkSize(std::string_view line) {
  line = line.substr(0, line.find(';'));  // ignore chunk extensions per RFC 7230 section 4.1.1
  while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  if (line.empty()) {
    return std::nullopt;
  }
  std::size_t chunkSize = 0;
  for (char ch : line) {
    const int digit = from_hex_digit(ch);
    if (digit < 0 || chunkSize > (std::numeric_limits<std::size_t>::max() >> 4)) {
      return std::nullopt;
    }
    chunkSize = (chunkSize << 4) | static_cast<std::size_t>(digit);
  }
  return chunkSize;
}

// Ask the transport for more bytes. Returns std::nullopt if new bytes have been buffered.
std::optional<BodyReadStatus> PullMore(BufferedSource& source) {
  switch (source.fill()) {
    case BufferedSource::FillStatus::Data:
      return std::nullopt;
    case BufferedSource::FillStatus::WouldBlock:
      return BodyReadStatus::WouldBlock;
    case BufferedSource::FillStatus::Eof:
      return BodyReadStatus::PrematureEnd;
    default:
      return BodyReadStatus::IoError;
  }
}

}  // namespace

std::string_view BodyReadStatusName(BodyReadStatus status) noexcept {
  switch (status) {
    case BodyReadStatus::Data:
      return "data";
    case BodyReadStatus::End:
      return "end";
    case BodyReadStatus::WouldBlock:
      return "would-block";
    case BodyReadStatus::Malformed:
      return "malformed";
    case BodyReadStatus::PrematureEnd:
      return "premature-end";
    default:
      return "io-error";
  }
}

BodyReader::BodyReader(const RequestFraming& framing, std::size_t maxChunkSizeLineBytes, CompletionCallback onEnd)
    : _onEnd(std::move(onEnd)), _maxLineBytes(maxChunkSizeLineBytes), _ended(false) {
  if (!framing.decision) {
    _state = PassThroughState{};
  } else if (std::holds_alternative<EmptyFraming>(*framing.decision)) {
    _ended = true;
  } else if (const auto* pFixedLength = std::get_if<FixedLengthFraming>(&*framing.decision)) {
    if (framing.installWrapper) {
      _state = FixedLengthState{pFixedLength->length};
      _ended = pFixedLength->length == 0;
    } else {
      _state = PassThroughState{};
    }
  } else if (std::holds_alternative<ChunkedFraming>(*framing.decision)) {
    _state = ChunkedState{};
  } else {
    _state = PassThroughState{};
  }
}

BodyReadResult BodyReader::read(BufferedSource& source, std::span<char> out) {
  if (_failure) {
    return {0, *_failure};
  }
  if (_ended) {
    return {0, BodyReadStatus::End};
  }
  if (auto* pFixedLength = std::get_if<FixedLengthState>(&_state)) {
    return readFixedLength(*pFixedLength, source, out);
  }
  if (auto* pChunked = std::get_if<ChunkedState>(&_state)) {
    return readChunked(*pChunked, source, out);
  }
  return readPassThrough(source, out);
}

std::optional<std::size_t> BodyReader::remaining() const noexcept {
  if (const auto* pFixedLength = std::get_if<FixedLengthState>(&_state)) {
    return pFixedLength->remaining;
  }
  return std::nullopt;
}

std::string_view BodyReader::framingName() const noexcept {
  switch (_state.index()) {
    case 0:
      return "empty";
    case 1:
      return "fixed-length";
    case 2:
      return "chunked";
    default:
      return "pass-through";
  }
}

BodyReadResult BodyReader::readFixedLength(FixedLengthState& state, BufferedSource& source, std::span<char> out) {
  if (source.empty()) {
    if (const auto status = PullMore(source)) {
      if (*status == BodyReadStatus::WouldBlock) {
        return {0, BodyReadStatus::WouldBlock};
      }
      return fail(0, *status);
    }
  }
  const std::size_t nbBytes = std::min({out.size(), state.remaining, source.size()});
  std::memcpy(out.data(), source.buffered().data(), nbBytes);
  source.consume(nbBytes);
  state.remaining -= nbBytes;
  _bytesRead += nbBytes;
  log::trace("Fixed length body: read {} bytes, {} remaining", nbBytes, state.remaining);
  if (state.remaining == 0) {
    return end(nbBytes);
  }
  return {nbBytes, BodyReadStatus::Data};
}

BodyReadResult BodyReader::readChunked(ChunkedState& state, BufferedSource& source, std::span<char> out) {
  std::size_t produced = 0;
  while (true) {
    const std::string_view buffered = source.buffered();
    switch (state.phase) {
      case ChunkedState::Phase::SizeLine: {
        const auto lineEnd = buffered.find(CRLF);
        if (lineEnd == std::string_view::npos) {
          if (buffered.size() > _maxLineBytes) {
            log::warn("Chunk size line exceeds {} bytes", _maxLineBytes);
            return fail(produced, BodyReadStatus::Malformed);
          }
          break;
        }
        const auto chunkSize = lineEnd <= _maxLineBytes ? ParseChunkSize(buffered.substr(0, lineEnd))
                                                             : std::optional<std::size_t>{};
        if (!chunkSize) {
          log::warn("Invalid chunk size line '{}'", buffered.substr(0, std::min(lineEnd, _maxLineBytes)));
          return fail(produced, BodyReadStatus::Malformed);
        }
        source.consume(lineEnd + CRLF.size());
        log::trace("Chunk of {} bytes", *chunkSize);
        if (*chunkSize == 0) {
          state.phase = ChunkedState::Phase::Trailers;
        } else {
          state.phase = ChunkedState::Phase::Payload;
          state.chunkRemaining = *chunkSize;
        }
        continue;
      }
      case ChunkedState::Phase::Payload: {
        if (produced == out.size()) {
          return {produced, BodyReadStatus::Data};
        }
        if (buffered.empty()) {
          break;
        }
        const std::size_t nbBytes = std::min({out.size() - produced, state.chunkRemaining, buffered.size()});
        std::memcpy(out.data() + produced, buffered.data(), nbBytes);
        source.consume(nbBytes);
        produced += nbBytes;
        _bytesRead += nbBytes;
        state.chunkRemaining -= nbBytes;
        if (state.chunkRemaining == 0) {
          state.phase = ChunkedState::Phase::PayloadCRLF;
        }
        continue;
      }
      case ChunkedState::Phase::PayloadCRLF:
        if (buffered.size() < CRLF.size()) {
          break;
        }
        if (!buffered.starts_with(CRLF)) {
          log::warn("Missing CRLF after chunk payload");
          return fail(produced, BodyReadStatus::Malformed);
        }
        source.consume(CRLF.size());
        state.phase = ChunkedState::Phase::SizeLine;
        continue;
      default: {
        // trailer fields are discarded, an empty line ends the body
        const auto lineEnd = buffered.find(CRLF);
        if (lineEnd == std::string_view::npos) {
          if (buffered.size() > _maxLineBytes) {
            log::warn("Trailer line exceeds {} bytes", _maxLineBytes);
            return fail(produced, BodyReadStatus::Malformed);
          }
          break;
        }
        source.consume(lineEnd + CRLF.size());
        if (lineEnd == 0) {
          return end(produced);
        }
        continue;
      }
    }

    // Current phase needs more bytes than buffered.
    if (produced != 0) {
      return {produced, BodyReadStatus::Data};
    }
    if (const auto status = PullMore(source)) {
      if (*status == BodyReadStatus::WouldBlock) {
        return {0, BodyReadStatus::WouldBlock};
      }
      return fail(0, *status);
    }
  }
}

BodyReadResult BodyReader::readPassThrough(BufferedSource& source, std::span<char> out) {
  if (source.empty()) {
    switch (source.fill()) {
      case BufferedSource::FillStatus::Data:
        break;
      case BufferedSource::FillStatus::WouldBlock:
        return {0, BodyReadStatus::WouldBlock};
      case BufferedSource::FillStatus::Eof:
        return end(0);
      default:
        return fail(0, BodyReadStatus::IoError);
    }
  }
  const std::size_t nbBytes = std::min(out.size(), source.size());
  std::memcpy(out.data(), source.buffered().data(), nbBytes);
  source.consume(nbBytes);
  _bytesRead += nbBytes;
  return {nbBytes, BodyReadStatus::Data};
}

BodyReadResult BodyReader::end(std::size_t nbBytes) {
  _ended = true;
  log::debug("End of {} request body after {} bytes", framingName(), _bytesRead);
  if (auto onEnd = std::exchange(_onEnd, nullptr)) {
    onEnd();
  }
  return {nbBytes, BodyReadStatus::End};
}

BodyReadResult BodyReader::fail(std::size_t nbBytes, BodyReadStatus status) {
  _failure = status;
  log::warn("Reading {} request body failed: {}", framingName(), BodyReadStatusName(status));
  if (nbBytes != 0) {
    // bytes already produced are delivered first, the failure is reported by the next read
    return {nbBytes, BodyReadStatus::Data};
  }
  return {0, status};
}

}  // namespace framelink::http
