#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace framelink {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // the effective port can be retrieved via HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT allowing several independent servers to bind the same port.
  bool reusePort{false};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // Whether persistent connections are enabled at all. When false, every connection is treated as
  // non persistent whatever the client asks for, and responses advertise it. Default: true.
  bool enableKeepAlive{true};

  // Maximum number of requests served over a single persistent connection before forcing close.
  // The response of the last allowed request is sent as non persistent. 0 means unlimited.
  uint32_t maxRequestsPerConnection{100};

  // ============================
  // Request parsing & framing limits
  // ============================
  // Maximum allowed size (in bytes) of the request head (request line + headers + CRLFCRLF).
  // If exceeded, the server replies 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Longest accepted chunk-size line or trailer line of a chunked request body.
  // Longer lines are treated as malformed framing. Default: 4 KiB.
  std::size_t maxChunkSizeLineBytes{4096};

  // Maximum size of a request body with a known end (fixed-length or chunked), which is fully buffered
  // before the request is handed to the handlers. Larger bodies get a 413 response and are drained.
  // Default: 1 MiB.
  std::size_t maxBodyBytes{1 << 20};

  // Buffer sizing hint: number of bytes requested from the transport on each read, and size of the
  // scratch buffer used to discard unread request bodies. Default: 4 KiB.
  std::size_t readChunkBytes{4096};

  // ===========================================
  // Event loop polling / responsiveness tuning
  // ===========================================
  // Maximum duration the event loop blocks waiting for I/O before checking for stop requests.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Set explicit listening port (0 = ephemeral)
  ServerConfig& withPort(uint16_t port);

  // Enable/disable SO_REUSEPORT
  ServerConfig& withReusePort(bool on = true);

  // Toggle persistent connections
  ServerConfig& withKeepAliveMode(bool on = true);

  // Adjust request-per-connection cap
  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  // Adjust header size ceiling
  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  // Adjust chunk-size line ceiling
  ServerConfig& withMaxChunkSizeLineBytes(std::size_t maxLineBytes);

  // Adjust body size limit
  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Adjust transport read size
  ServerConfig& withReadChunkBytes(std::size_t readChunkBytes);

  // Adjust event loop max idle wait
  ServerConfig& withPollInterval(std::chrono::milliseconds interval);
};

}  // namespace framelink
