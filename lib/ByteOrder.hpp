#ifndef MINICHAIN_BYTE_ORDER_HPP
#define MINICHAIN_BYTE_ORDER_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace mc {
namespace utl {

/**
 * Canonical byte encoding used for hash input.
 * Unsigned 32/64-bit integers are little-endian regardless of the host.
 * Any other trivially copyable value is taken as its in-memory bytes.
 */
inline std::array<uint8_t, 4> toBytes(uint32_t value) {
  return { static_cast<uint8_t>(value), static_cast<uint8_t>(value >> 8),
           static_cast<uint8_t>(value >> 16),
           static_cast<uint8_t>(value >> 24) };
}

inline std::array<uint8_t, 8> toBytes(uint64_t value) {
  std::array<uint8_t, 8> out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return out;
}

template <typename T>
std::array<uint8_t, sizeof(T)> toBytes(const T &value) {
  static_assert(std::is_trivially_copyable<T>::value,
                "toBytes requires a trivially copyable type");
  std::array<uint8_t, sizeof(T)> out{};
  std::memcpy(out.data(), &value, sizeof(T));
  return out;
}

} // namespace utl
} // namespace mc

#endif // MINICHAIN_BYTE_ORDER_HPP
