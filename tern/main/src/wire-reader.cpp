#include "tern/wire-reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

#include "tern/error-kind.hpp"
#include "tern/http-request.hpp"
#include "tern/log.hpp"
#include "tern/request-parser.hpp"
#include "tern/socket-ops.hpp"

namespace tern {

FillResult WireReader::fill(int fd) {
  FillResult result;
  while (_buffer.size() < maxBufferedBytes()) {
    const std::size_t oldSize = _buffer.size();
    const std::size_t chunkSize = std::min(kReadChunkSize, maxBufferedBytes() - oldSize);
    _buffer.resize(oldSize + chunkSize);
    const int64_t nbRead = SafeRecv(fd, _buffer.data() + oldSize, chunkSize);
    if (nbRead <= 0) {
      const int err = errno;
      _buffer.resize(oldSize);
      if (nbRead == 0) {
        result.status = IoStatus::PeerClosed;
      } else if (err == EAGAIN || err == EWOULDBLOCK) {
        result.status = result.nbBytes == 0 ? IoStatus::WouldBlock : IoStatus::Ok;
      } else {
        log::debug("recv on fd # {} failed: {}", fd, std::strerror(err));
        result.status = IoStatus::Error;
      }
      return result;
    }
    _buffer.resize(oldSize + static_cast<std::size_t>(nbRead));
    result.nbBytes += static_cast<std::size_t>(nbRead);
    if (static_cast<std::size_t>(nbRead) < chunkSize) {
      // Short read, socket drained.
      break;
    }
  }
  return result;
}

void WireReader::append(std::string_view data) { _buffer.insert(_buffer.end(), data.begin(), data.end()); }

FrameResult WireReader::next(HttpRequest& request) {
  const std::string_view data(_buffer.data(), _buffer.size());
  if (_headLength == 0) {
    const HeadScan scan = _parser.scanHead(data, _scannedBytes);
    switch (scan.status) {
      case HeadScan::Status::NeedMore:
        _scannedBytes = data.size();
        return FrameResult::NeedMore();
      case HeadScan::Status::Error:
        return FrameResult::Error(scan.error);
      default:
        break;
    }

    const http::ErrorKind err = _parser.parseHead(data.substr(0, scan.headLength), request);
    if (err != http::ErrorKind::None && err != http::ErrorKind::UnknownMethod) {
      return FrameResult::Error(err);
    }
    if (request.contentLength() > _maxBodyBytes) {
      return FrameResult::Error(http::ErrorKind::BodyTooLarge);
    }
    _headLength = scan.headLength;
    _pendingError = err;
  }

  const std::size_t frameLength = _headLength + request.contentLength();
  if (data.size() < frameLength) {
    return FrameResult::NeedMore();
  }

  request._body.assign(data.data() + _headLength, request.contentLength());
  _buffer.erase(_buffer.begin(), _buffer.begin() + static_cast<std::ptrdiff_t>(frameLength));
  _scannedBytes = 0;
  _headLength = 0;

  const http::ErrorKind err = _pendingError;
  _pendingError = http::ErrorKind::None;
  if (err != http::ErrorKind::None) {
    return FrameResult::Error(err);
  }
  return FrameResult::Complete();
}

void WireReader::discardBuffered() noexcept {
  _buffer.clear();
  _scannedBytes = 0;
  _headLength = 0;
  _pendingError = http::ErrorKind::None;
}

}  // namespace tern
