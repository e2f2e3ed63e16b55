#include "framelink/drain-coordinator.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "framelink/body-reader.hpp"
#include "framelink/buffered-source.hpp"
#include "framelink/log.hpp"

namespace framelink::http {

std::string_view DrainStatusName(DrainStatus status) noexcept {
  switch (status) {
    case DrainStatus::Completed:
      return "completed";
    case DrainStatus::Pending:
      return "pending";
    default:
      return "failed";
  }
}

DrainCoordinator::DrainCoordinator(std::size_t scratchBytes) : _scratch(std::max<std::size_t>(scratchBytes, 1)) {}

DrainStatus DrainCoordinator::begin(BodyReader& reader, BufferedSource& source) {
  _drainedBytes = 0;
  if (reader.failed()) {
    return DrainStatus::Failed;
  }
  if (reader.atEnd()) {
    return DrainStatus::Completed;
  }
  log::debug("Draining unread {} request body", reader.framingName());
  _pReader = &reader;
  return run(source);
}

DrainStatus DrainCoordinator::resume(BufferedSource& source) {
  if (_pReader == nullptr) {
    return DrainStatus::Completed;
  }
  return run(source);
}

DrainStatus DrainCoordinator::run(BufferedSource& source) {
  while (true) {
    const auto [nbBytes, status] = _pReader->read(source, _scratch);
    _drainedBytes += nbBytes;
    switch (status) {
      case BodyReadStatus::Data:
        break;
      case BodyReadStatus::End:
        log::debug("Drain completed, {} bytes discarded", _drainedBytes);
        _pReader = nullptr;
        return DrainStatus::Completed;
      case BodyReadStatus::WouldBlock:
        log::trace("Drain pending, {} bytes discarded so far", _drainedBytes);
        return DrainStatus::Pending;
      default:
        log::warn("Drain aborted after {} bytes: {}", _drainedBytes, BodyReadStatusName(status));
        _pReader = nullptr;
        return DrainStatus::Failed;
    }
  }
}

}  // namespace framelink::http
