#ifndef MINICHAIN_SHA256_H
#define MINICHAIN_SHA256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

struct evp_md_ctx_st;

namespace mc {

/**
 * Incremental SHA-256 over OpenSSL's EVP digest interface.
 * finalize() returns the digest and resets the context for reuse.
 */
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(const void *data, size_t size);
  void update(const std::string &data) { update(data.data(), data.size()); }

  Digest finalize();

private:
  void reset();

  evp_md_ctx_st *ctx_{ nullptr };
};

} // namespace mc

#endif // MINICHAIN_SHA256_H
