#include "LineFramer.h"

#include <algorithm>

namespace mc {
namespace network {

LineFramer::LineFramer(size_t capacity) : capacity_(capacity) {
  buffer_.reserve(capacity_);
}

size_t LineFramer::writableBytes() const {
  return buffer_.size() >= capacity_ ? 0 : capacity_ - buffer_.size();
}

LineFramer::Roe<void> LineFramer::append(const char *data, size_t size,
                                         const LineHandler &onLine) {
  size_t offset = 0;
  while (offset < size) {
    size_t chunk = std::min(size - offset, writableBytes());
    if (chunk == 0) {
      return Error(E_OVERFLOW, "Message exceeds " + std::to_string(capacity_) +
                                   " bytes without a newline");
    }

    size_t scanFrom = buffer_.size();
    buffer_.append(data + offset, chunk);
    offset += chunk;

    size_t start = 0;
    size_t newline = buffer_.find('\n', scanFrom);
    while (newline != std::string::npos) {
      size_t end = newline;
      if (end > start && buffer_[end - 1] == '\r') {
        --end;
      }
      if (end > start) {
        onLine(buffer_.substr(start, end - start));
      }
      start = newline + 1;
      newline = buffer_.find('\n', start);
    }
    buffer_.erase(0, start);

    if (buffer_.size() >= capacity_) {
      return Error(E_OVERFLOW, "Message exceeds " + std::to_string(capacity_) +
                                   " bytes without a newline");
    }
  }
  return {};
}

} // namespace network
} // namespace mc
