#include "framelink/body-writer.hpp"

#include <cassert>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include "framelink/buffered-sink.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/log.hpp"

namespace framelink::http {

std::string_view BodyWriteStatusName(BodyWriteStatus status) noexcept {
  switch (status) {
    case BodyWriteStatus::Ok:
      return "ok";
    case BodyWriteStatus::Overflow:
      return "overflow";
    case BodyWriteStatus::ShortWrite:
      return "short-write";
    case BodyWriteStatus::AlreadyClosed:
      return "already-closed";
    default:
      return "malformed-length";
  }
}

BodyWriter::BodyWriter(const FramingDecision& decision, CompletionCallback onEnd) : _onEnd(std::move(onEnd)) {
  if (const auto* pFixedLength = std::get_if<FixedLengthFraming>(&decision)) {
    _state = FixedLengthState{pFixedLength->length};
  } else if (std::holds_alternative<ChunkedFraming>(decision)) {
    _state = ChunkedState{};
  } else if (std::holds_alternative<IdentityFraming>(decision)) {
    _state = IdentityState{};
  }
}

BodyWriteStatus BodyWriter::write(BufferedSink& sink, std::string_view data) {
  if (_closed) {
    log::warn("Write of {} bytes on a closed {} response body", data.size(), framingName());
    return BodyWriteStatus::AlreadyClosed;
  }
  if (data.empty()) {
    return BodyWriteStatus::Ok;
  }
  switch (_state.index()) {
    case 0:
      // bodyless response, handler payload is dropped
      log::trace("Discarding {} body bytes of a bodyless response", data.size());
      return BodyWriteStatus::Ok;
    case 1: {
      auto& state = std::get<FixedLengthState>(_state);
      if (data.size() > state.remaining) {
        log::warn("Refusing to write {} bytes, only {} remaining for fixed length body", data.size(), state.remaining);
        return BodyWriteStatus::Overflow;
      }
      sink.append(data);
      state.remaining -= data.size();
      _bytesWritten += data.size();
      if (state.remaining == 0) {
        end();
      }
      return BodyWriteStatus::Ok;
    }
    case 2: {
      // enough for 64-bit length in hex
      static constexpr std::size_t kMaxHexLen = 2UL * sizeof(uint64_t);
      char sizeLine[kMaxHexLen];
      const auto res = std::to_chars(sizeLine, sizeLine + kMaxHexLen, static_cast<uint64_t>(data.size()), 16);
      assert(res.ec == std::errc());
      sink.append(std::string_view(sizeLine, res.ptr));
      sink.append(CRLF);
      sink.append(data);
      sink.append(CRLF);
      _bytesWritten += data.size();
      log::trace("Emitted chunk of {} bytes", data.size());
      return BodyWriteStatus::Ok;
    }
    default:
      sink.append(data);
      _bytesWritten += data.size();
      return BodyWriteStatus::Ok;
  }
}

BodyWriteStatus BodyWriter::close(BufferedSink& sink) {
  if (_closed) {
    return BodyWriteStatus::AlreadyClosed;
  }
  _closed = true;
  auto status = BodyWriteStatus::Ok;
  if (const auto* pFixedLength = std::get_if<FixedLengthState>(&_state)) {
    if (pFixedLength->remaining != 0) {
      log::warn("Fixed length response body closed with {} bytes missing", pFixedLength->remaining);
      status = BodyWriteStatus::ShortWrite;
    }
  } else if (std::holds_alternative<ChunkedState>(_state)) {
    sink.append(kLastChunk);
  }
  end();
  return status;
}

std::optional<std::size_t> BodyWriter::remaining() const noexcept {
  if (const auto* pFixedLength = std::get_if<FixedLengthState>(&_state)) {
    return pFixedLength->remaining;
  }
  return std::nullopt;
}

std::string_view BodyWriter::framingName() const noexcept {
  switch (_state.index()) {
    case 0:
      return "empty";
    case 1:
      return "fixed-length";
    case 2:
      return "chunked";
    default:
      return "identity";
  }
}

void BodyWriter::end() {
  if (_ended) {
    return;
  }
  _ended = true;
  log::debug("End of {} response body after {} bytes", framingName(), _bytesWritten);
  if (auto onEnd = std::exchange(_onEnd, nullptr)) {
    onEnd();
  }
}

}  // namespace framelink::http
