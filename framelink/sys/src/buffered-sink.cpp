#include "framelink/buffered-sink.hpp"

#include <string_view>

#include "framelink/log.hpp"
#include "framelink/transport.hpp"

namespace framelink {

BufferedSink::FlushStatus BufferedSink::flush() {
  if (_failed) {
    return FlushStatus::Error;
  }
  while (!empty()) {
    const std::string_view remaining(_pending.data() + _writePos, _pending.size() - _writePos);
    const auto [nbWritten, want] = _pTransport->write(remaining);
    _writePos += nbWritten;
    _totalBytesWritten += nbWritten;
    if (want == TransportHint::Error) {
      _failed = true;
      log::warn("BufferedSink: transport write error after {} bytes", _totalBytesWritten);
      return FlushStatus::Error;
    }
    if (nbWritten < remaining.size()) {
      if (want == TransportHint::None && nbWritten == 0) {
        // no progress without a hint: treat like a would-block to avoid spinning
        log::debug("BufferedSink: transport made no progress, {} bytes pending", pendingBytes());
      }
      return FlushStatus::WouldBlock;
    }
  }
  _pending.clear();
  _writePos = 0;
  return FlushStatus::Done;
}

}  // namespace framelink
