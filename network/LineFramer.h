#ifndef MINICHAIN_LINE_FRAMER_H
#define MINICHAIN_LINE_FRAMER_H

#include "ResultOrError.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace mc {
namespace network {

/**
 * Splits a byte stream into newline-terminated messages.
 *
 * Incoming bytes accumulate in a buffer of fixed capacity. Every complete
 * line is handed to the callback without its terminator (a trailing '\r' is
 * dropped too) and empty lines are skipped. A partial line is kept for the
 * next append(). Filling the whole buffer without a newline is an error; the
 * framer is then unusable until reset().
 */
class LineFramer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_OVERFLOW = 1;
  static constexpr size_t DEFAULT_CAPACITY = 4096;

  using LineHandler = std::function<void(const std::string &)>;

  explicit LineFramer(size_t capacity = DEFAULT_CAPACITY);

  // Bytes a caller may append without overflowing
  size_t writableBytes() const;

  Roe<void> append(const char *data, size_t size, const LineHandler &onLine);

  size_t buffered() const { return buffer_.size(); }
  size_t capacity() const { return capacity_; }

  void reset() { buffer_.clear(); }

private:
  size_t capacity_;
  std::string buffer_;
};

} // namespace network
} // namespace mc

#endif // MINICHAIN_LINE_FRAMER_H
