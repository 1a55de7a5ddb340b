#ifndef QSTORE_CRYPTO_ED25519_PROVIDER_HPP
#define QSTORE_CRYPTO_ED25519_PROVIDER_HPP

#include <gsl/span>
#include "crypto/ed25519_types.hpp"
#include "outcome/outcome.hpp"

namespace qstore::crypto {

  enum class ED25519ProviderError {
    KEY_GENERATION_FAILED = 1,
    SIGN_FAILED,
    VERIFICATION_FAILED,
  };

  class ED25519Provider {
   public:
    virtual ~ED25519Provider() = default;

    /**
     * Derive the keypair of a secret seed
     */
    virtual outcome::result<ED25519Keypair> generateKeypair(
        const ED25519Seed &seed) const = 0;

    /**
     * Sign message with keypair
     * @return signature or error
     */
    virtual outcome::result<ED25519Signature> sign(
        const ED25519Keypair &keypair,
        gsl::span<const uint8_t> message) const = 0;

    /**
     * Verify signature of message by public key
     * @return true if the signature is valid
     */
    virtual outcome::result<bool> verify(
        const ED25519Signature &signature,
        gsl::span<const uint8_t> message,
        const ED25519PublicKey &public_key) const = 0;
  };

}  // namespace qstore::crypto

OUTCOME_HPP_DECLARE_ERROR_2(qstore::crypto, ED25519ProviderError);

#endif  // QSTORE_CRYPTO_ED25519_PROVIDER_HPP
