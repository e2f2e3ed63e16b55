#include "framelink/buffered-source.hpp"

#include <algorithm>
#include <cstddef>

#include "framelink/log.hpp"
#include "framelink/transport.hpp"

namespace framelink {

BufferedSource::BufferedSource(ITransport& transport, std::size_t readChunkBytes)
    : _pTransport(&transport), _readChunkBytes(std::max<std::size_t>(readChunkBytes, 1)) {}

void BufferedSource::consume(std::size_t nbBytes) noexcept {
  _readPos += std::min(nbBytes, size());
  if (_readPos == _buffer.size()) {
    _buffer.clear();
    _readPos = 0;
  }
}

BufferedSource::FillStatus BufferedSource::fill() {
  if (_failed) {
    return FillStatus::Error;
  }
  if (_eof) {
    return FillStatus::Eof;
  }
  // Compact consumed prefix before growing.
  if (_readPos != 0) {
    _buffer.erase(0, _readPos);
    _readPos = 0;
  }
  const std::size_t oldSize = _buffer.size();
  _buffer.resize(oldSize + _readChunkBytes);
  const auto [nbRead, want] = _pTransport->read(_buffer.data() + oldSize, _readChunkBytes);
  _buffer.resize(oldSize + nbRead);
  _totalBytesRead += nbRead;

  if (nbRead != 0) {
    log::trace("BufferedSource: read {} bytes, {} buffered", nbRead, size());
    return FillStatus::Data;
  }
  switch (want) {
    case TransportHint::None:
      _eof = true;
      log::debug("BufferedSource: peer closed, {} bytes still buffered", size());
      return FillStatus::Eof;
    case TransportHint::ReadReady:
      [[fallthrough]];
    case TransportHint::WriteReady:
      return FillStatus::WouldBlock;
    default:
      _failed = true;
      log::warn("BufferedSource: transport read error");
      return FillStatus::Error;
  }
}

}  // namespace framelink
