#include "framelink/http-exchange.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "framelink/body-reader.hpp"
#include "framelink/body-writer.hpp"
#include "framelink/buffered-sink.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/framing-decision.hpp"
#include "framelink/http-constants.hpp"
#include "framelink/http-status-code.hpp"
#include "framelink/log.hpp"
#include "framelink/request-framing.hpp"
#include "framelink/request-head-parser.hpp"
#include "framelink/response-framing.hpp"
#include "framelink/response-head-write.hpp"

namespace framelink::http {

namespace {
constexpr std::size_t kReadAvailableChunkSize = 4096;
}  // namespace

HttpExchange::HttpExchange(RequestHead head, BufferedSource& source, BufferedSink& sink)
    : _head(std::move(head)), _pSource(&source), _pSink(&sink) {}

FramingStatus HttpExchange::negotiateRequest(bool persistent, std::size_t maxChunkSizeLineBytes) {
  _requestFraming = NegotiateRequestFraming(_head.headers, persistent);
  _persistent = _requestFraming.persistent;
  if (_requestFraming.status != FramingStatus::Ok) {
    return _requestFraming.status;
  }
  if (_requestFraming.decision) {
    log::debug("{} {} request framing {}", _head.method, _head.target, FramingName(*_requestFraming.decision));
  }
  _bodyReader = BodyReader(_requestFraming, maxChunkSizeLineBytes, [this] { terminateRequest(); });
  if (_requestFraming.terminateImmediately) {
    terminateRequest();
  }
  return FramingStatus::Ok;
}

BodyBufferStatus HttpExchange::bufferBody(std::size_t maxBodyBytes) {
  while (true) {
    const auto remaining = _bodyReader.remaining();
    if (_body.size() > maxBodyBytes || (remaining && *remaining > maxBodyBytes - _body.size())) {
      return BodyBufferStatus::TooLarge;
    }
    const std::size_t oldSize = _body.size();
    _body.resize(oldSize + kReadAvailableChunkSize);
    const auto [nbBytes, status] = readFromSource(std::span<char>(_body.data() + oldSize, kReadAvailableChunkSize));
    _body.resize(oldSize + nbBytes);
    switch (status) {
      case BodyReadStatus::Data:
        break;
      case BodyReadStatus::End:
        if (_body.size() > maxBodyBytes) {
          return BodyBufferStatus::TooLarge;
        }
        _bodyBuffered = true;
        return BodyBufferStatus::Ready;
      case BodyReadStatus::WouldBlock:
        return BodyBufferStatus::NeedMore;
      case BodyReadStatus::Malformed:
        return BodyBufferStatus::Malformed;
      default:
        return BodyBufferStatus::Error;
    }
  }
}

BodyReadResult HttpExchange::readBody(std::span<char> out) {
  if (_bodyBuffered) {
    const std::size_t nbBytes = std::min(out.size(), _body.size() - _bodyPos);
    std::copy_n(_body.data() + _bodyPos, nbBytes, out.data());
    _bodyPos += nbBytes;
    return {nbBytes, _bodyPos == _body.size() ? BodyReadStatus::End : BodyReadStatus::Data};
  }
  return readFromSource(out);
}

BodyReadResult HttpExchange::readFromSource(std::span<char> out) {
  const auto res = _bodyReader.read(*_pSource, out);
  switch (res.status) {
    case BodyReadStatus::Malformed:
      [[fallthrough]];
    case BodyReadStatus::PrematureEnd:
      [[fallthrough]];
    case BodyReadStatus::IoError:
      _persistent = false;
      break;
    default:
      break;
  }
  return res;
}

BodyReadStatus HttpExchange::readAvailableBody(std::string& out) {
  while (true) {
    const std::size_t oldSize = out.size();
    out.resize(oldSize + kReadAvailableChunkSize);
    const auto [nbBytes, status] = readBody(std::span<char>(out.data() + oldSize, kReadAvailableChunkSize));
    out.resize(oldSize + nbBytes);
    if (status != BodyReadStatus::Data) {
      return status;
    }
  }
}

void HttpExchange::status(StatusCode statusCode) {
  if (headSent()) {
    log::warn("Cannot set status {} after response head was written", statusCode);
    return;
  }
  _status = statusCode;
}

void HttpExchange::contentLength(std::size_t length) {
  char buf[24];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), length);
  if (errc == std::errc()) {
    _responseHeaders.set(ContentLength, std::string_view(buf, ptr));
  }
}

BodyWriteStatus HttpExchange::commitHead() {
  if (_broken) {
    return BodyWriteStatus::MalformedLength;
  }
  if (headSent()) {
    return BodyWriteStatus::Ok;
  }
  auto framing = NegotiateResponseFraming(_head.version, _head.method, _status, _responseHeaders, _persistent);
  _persistent = framing.persistent;
  if (framing.status != FramingStatus::Ok) {
    _broken = true;
    return BodyWriteStatus::MalformedLength;
  }
  WriteResponseHead(*_pSink, _head.version, _status, _responseHeaders);
  _bodyWriter = BodyWriter(framing.decision, [this] { terminateResponse(); });
  _responseFraming = std::move(framing);
  return BodyWriteStatus::Ok;
}

BodyWriteStatus HttpExchange::write(std::string_view data) {
  const auto status = commitHead();
  if (status != BodyWriteStatus::Ok) {
    return status;
  }
  return _bodyWriter.write(*_pSink, data);
}

BodyWriteStatus HttpExchange::end(std::string_view data) {
  auto status = write(data);
  if (status == BodyWriteStatus::MalformedLength) {
    return status;
  }
  const auto closeStatus = _bodyWriter.close(*_pSink);
  if (closeStatus == BodyWriteStatus::ShortWrite) {
    _persistent = false;
    _broken = true;
  }
  if (status == BodyWriteStatus::Ok) {
    status = closeStatus;
  }
  return status;
}

void HttpExchange::terminateRequest() {
  if (_requestTerminated) {
    return;
  }
  _requestTerminated = true;
  log::debug("{} {} request terminated after {} body bytes", _head.method, _head.target, _bodyReader.bytesRead());
}

void HttpExchange::terminateResponse() {
  if (_responseTerminated) {
    return;
  }
  _responseTerminated = true;
  log::debug("{} {} response terminated with status {}", _head.method, _head.target, _status);
}

}  // namespace framelink::http
