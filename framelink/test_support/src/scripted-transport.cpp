#include "framelink/scripted-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace framelink::test {

void ScriptedTransport::feed(std::string_view data) {
  if (data.empty()) {
    return;
  }
  if (!_script.empty() && _script.back().kind == Kind::Data) {
    _script.back().data.append(data);
  } else {
    _script.push_back(Step{Kind::Data, std::string(data)});
  }
}

void ScriptedTransport::feedWouldBlock() { _script.push_back(Step{Kind::WouldBlock, {}}); }

void ScriptedTransport::feedEof() { _script.push_back(Step{Kind::Eof, {}}); }

void ScriptedTransport::feedError() { _script.push_back(Step{Kind::Error, {}}); }

ITransport::TransportResult ScriptedTransport::read(char* buf, std::size_t len) {
  ++_nbReadCalls;
  if (_script.empty()) {
    return {0, TransportHint::ReadReady};
  }
  Step& step = _script.front();
  switch (step.kind) {
    case Kind::Data: {
      const std::size_t nbBytes = std::min(len, step.data.size());
      std::memcpy(buf, step.data.data(), nbBytes);
      if (nbBytes == step.data.size()) {
        _script.pop_front();
      } else {
        step.data.erase(0, nbBytes);
      }
      return {nbBytes, TransportHint::None};
    }
    case Kind::WouldBlock:
      _script.pop_front();
      return {0, TransportHint::ReadReady};
    case Kind::Eof:
      return {0, TransportHint::None};
    default:
      return {0, TransportHint::Error};
  }
}

ITransport::TransportResult ScriptedTransport::write(std::string_view data) {
  if (_writeError) {
    return {0, TransportHint::Error};
  }
  const std::size_t nbBytes = std::min(data.size(), _writeBudget);
  _written.append(data.substr(0, nbBytes));
  _writeBudget -= nbBytes;
  return {nbBytes, nbBytes == data.size() ? TransportHint::None : TransportHint::WriteReady};
}

std::string ScriptedTransport::takeWritten() { return std::exchange(_written, std::string()); }

std::size_t ScriptedTransport::pendingReadBytes() const noexcept {
  std::size_t total = 0;
  for (const Step& step : _script) {
    total += step.data.size();
  }
  return total;
}

}  // namespace framelink::test
