#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <string>
#include <string_view>

#include "framelink/transport.hpp"

namespace framelink::test {

// In-memory ITransport replaying a script of read results and capturing writes.
// Reads with an exhausted script behave like a non-blocking socket without pending data (would block).
class ScriptedTransport : public ITransport {
 public:
  // Make 'data' available to subsequent reads. Consecutive feeds may be returned by a single read.
  void feed(std::string_view data);

  // Next read (once buffered data before it is consumed) reports would-block.
  void feedWouldBlock();

  // Reads reaching this point report an orderly close, forever.
  void feedEof();

  // Reads reaching this point report a fatal error, forever.
  void feedError();

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  // Limit the number of bytes accepted by writes until the budget is raised again.
  void setWriteBudget(std::size_t budget) noexcept { _writeBudget = budget; }

  // All subsequent writes report a fatal error.
  void failWrites() noexcept { _writeError = true; }

  [[nodiscard]] const std::string& written() const noexcept { return _written; }

  // Returns written bytes and clears them.
  std::string takeWritten();

  // Number of scripted bytes not yet delivered by read().
  [[nodiscard]] std::size_t pendingReadBytes() const noexcept;

  [[nodiscard]] std::size_t nbReadCalls() const noexcept { return _nbReadCalls; }

 private:
  enum class Kind : std::uint8_t { Data, WouldBlock, Eof, Error };

  struct Step {
    Kind kind;
    std::string data;
  };

  std::deque<Step> _script;
  std::string _written;
  std::size_t _writeBudget{std::numeric_limits<std::size_t>::max()};
  std::size_t _nbReadCalls{0};
  bool _writeError{false};
};

}  // namespace framelink::test
