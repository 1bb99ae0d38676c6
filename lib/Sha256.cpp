#include "Sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace mc {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  reset();
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

void Sha256::reset() {
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void Sha256::update(const void *data, size_t size) {
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

Sha256::Digest Sha256::finalize() {
  Digest digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx_, digest.data(), &length) != 1 ||
      length != DIGEST_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  reset();
  return digest;
}

} // namespace mc
