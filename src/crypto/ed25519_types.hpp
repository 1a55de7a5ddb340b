#ifndef QSTORE_CRYPTO_ED25519_TYPES_HPP
#define QSTORE_CRYPTO_ED25519_TYPES_HPP

#include "base/blob.hpp"

namespace qstore::crypto {

  namespace constants::ed25519 {
    enum {
      PRIVKEY_SIZE = 32,
      PUBKEY_SIZE = 32,
      SIGNATURE_SIZE = 64,
      SEED_SIZE = PRIVKEY_SIZE,
    };
  }

  using ED25519PrivateKey = base::Blob<constants::ed25519::PRIVKEY_SIZE>;
  using ED25519PublicKey = base::Blob<constants::ed25519::PUBKEY_SIZE>;
  using ED25519Seed = base::Blob<constants::ed25519::SEED_SIZE>;
  using ED25519Signature = base::Blob<constants::ed25519::SIGNATURE_SIZE>;

  struct ED25519Keypair {
    ED25519PrivateKey private_key;
    ED25519PublicKey public_key;
  };

}  // namespace qstore::crypto

#endif  // QSTORE_CRYPTO_ED25519_TYPES_HPP
