#ifndef QSTORE_CRYPTO_ED25519_ED25519_PROVIDER_IMPL_HPP
#define QSTORE_CRYPTO_ED25519_ED25519_PROVIDER_IMPL_HPP

#include "crypto/ed25519_provider.hpp"

namespace qstore::crypto {

  /**
   * Ed25519 over the OpenSSL EVP interface
   */
  class ED25519ProviderImpl : public ED25519Provider {
   public:
    ~ED25519ProviderImpl() override = default;

    outcome::result<ED25519Keypair> generateKeypair(
        const ED25519Seed &seed) const override;

    outcome::result<ED25519Signature> sign(
        const ED25519Keypair &keypair,
        gsl::span<const uint8_t> message) const override;

    outcome::result<bool> verify(
        const ED25519Signature &signature,
        gsl::span<const uint8_t> message,
        const ED25519PublicKey &public_key) const override;
  };

}  // namespace qstore::crypto

#endif  // QSTORE_CRYPTO_ED25519_ED25519_PROVIDER_IMPL_HPP
