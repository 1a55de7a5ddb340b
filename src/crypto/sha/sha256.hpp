#ifndef QSTORE_CRYPTO_SHA256_HPP
#define QSTORE_CRYPTO_SHA256_HPP

#include <string_view>

#include <gsl/span>
#include "base/blob.hpp"

namespace qstore::crypto {
  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  base::Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  base::Hash256 sha256(gsl::span<const uint8_t> input);
}  // namespace qstore::crypto

#endif  // QSTORE_CRYPTO_SHA256_HPP
