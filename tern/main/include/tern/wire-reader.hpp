#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tern/error-kind.hpp"
#include "tern/request-parser.hpp"
#include "tern/vector.hpp"

namespace tern {

class HttpRequest;

enum class IoStatus : uint8_t { Ok, WouldBlock, PeerClosed, Error };

struct FillResult {
  IoStatus status{IoStatus::Ok};
  std::size_t nbBytes{};
};

struct FrameResult {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  [[nodiscard]] static constexpr FrameResult NeedMore() noexcept { return {}; }
  [[nodiscard]] static constexpr FrameResult Complete() noexcept { return {Status::Complete}; }
  [[nodiscard]] static constexpr FrameResult Error(http::ErrorKind kind) noexcept { return {Status::Error, kind}; }

  Status status{Status::NeedMore};
  http::ErrorKind error{http::ErrorKind::None};
};

// Accumulates the bytes received on a connection and cuts them into requests.
// A request is framed by its head (up to the first CRLFCRLF) followed by exactly Content-Length body bytes.
// Bytes following a complete request stay buffered for the next call to next().
class WireReader {
 public:
  static constexpr std::size_t kReadChunkSize = 16UL * 1024UL;

  WireReader(const ParserLimits& limits, std::size_t maxBodyBytes)
      : _parser(limits), _maxBodyBytes(maxBodyBytes) {}

  // Read all the bytes available on the non-blocking fd.
  // Reading stops at EAGAIN, at peer shutdown, or when maxHeaderBytes + maxBodyBytes bytes are buffered.
  // Bytes read before a peer shutdown or an error are kept and counted in nbBytes.
  FillResult fill(int fd);

  // Append raw bytes, as if they were received from the network.
  void append(std::string_view data);

  // Try to frame the next request from the buffered bytes.
  //  - NeedMore: the request is not complete yet.
  //  - Complete: 'request' holds the next request, its bytes are removed from the buffer.
  //  - Error:    the buffered bytes cannot be framed into a request. For UnknownMethod, the request and its body
  //              were consumed and the connection can be kept. The other kinds leave the buffer in an unspecified
  //              state: the connection must be closed after answering.
  // A declared Content-Length above maxBodyBytes is reported as BodyTooLarge as soon as the head is complete,
  // without waiting for the body.
  FrameResult next(HttpRequest& request);

  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _buffer.size(); }

  // Tells whether a head was fully received for a request whose body is still incomplete.
  [[nodiscard]] bool waitingForBody() const noexcept { return _headLength != 0; }

  void discardBuffered() noexcept;

 private:
  [[nodiscard]] std::size_t maxBufferedBytes() const noexcept {
    return _parser.limits().maxHeaderBytes + _maxBodyBytes;
  }

  RequestParser _parser;
  std::size_t _maxBodyBytes;
  vector<char> _buffer;
  std::size_t _scannedBytes{};
  std::size_t _headLength{};
  http::ErrorKind _pendingError{http::ErrorKind::None};
};

}  // namespace tern
