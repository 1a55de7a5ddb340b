#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <memory>

#include <openssl/evp.h>

OUTCOME_CPP_DEFINE_CATEGORY_3(qstore::crypto, ED25519ProviderError, e) {
  using E = qstore::crypto::ED25519ProviderError;
  switch (e) {
    case E::KEY_GENERATION_FAILED:
      return "failed to derive ed25519 keypair";
    case E::SIGN_FAILED:
      return "failed to sign message";
    case E::VERIFICATION_FAILED:
      return "failed to verify signature";
  }
  return "unknown ED25519ProviderError";
}

namespace qstore::crypto {

  namespace {
    using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    PKeyPtr privateKey(const ED25519PrivateKey &key) {
      return PKeyPtr(EVP_PKEY_new_raw_private_key(
                         EVP_PKEY_ED25519, nullptr, key.data(), key.size()),
                     &EVP_PKEY_free);
    }
  }  // namespace

  outcome::result<ED25519Keypair> ED25519ProviderImpl::generateKeypair(
      const ED25519Seed &seed) const {
    ED25519Keypair keypair;
    std::copy(seed.begin(), seed.end(), keypair.private_key.begin());
    auto pkey = privateKey(keypair.private_key);
    if (!pkey) {
      return ED25519ProviderError::KEY_GENERATION_FAILED;
    }
    size_t len = keypair.public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(), &len)
            != 1
        || len != keypair.public_key.size()) {
      return ED25519ProviderError::KEY_GENERATION_FAILED;
    }
    return keypair;
  }

  outcome::result<ED25519Signature> ED25519ProviderImpl::sign(
      const ED25519Keypair &keypair, gsl::span<const uint8_t> message) const {
    auto pkey = privateKey(keypair.private_key);
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!pkey || !ctx
        || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get())
               != 1) {
      return ED25519ProviderError::SIGN_FAILED;
    }
    ED25519Signature signature;
    size_t len = signature.size();
    if (EVP_DigestSign(
            ctx.get(), signature.data(), &len, message.data(), message.size())
            != 1
        || len != signature.size()) {
      return ED25519ProviderError::SIGN_FAILED;
    }
    return signature;
  }

  outcome::result<bool> ED25519ProviderImpl::verify(
      const ED25519Signature &signature,
      gsl::span<const uint8_t> message,
      const ED25519PublicKey &public_key) const {
    PKeyPtr pkey(
        EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()),
        &EVP_PKEY_free);
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!pkey || !ctx
        || EVP_DigestVerifyInit(
               ctx.get(), nullptr, nullptr, nullptr, pkey.get())
               != 1) {
      return ED25519ProviderError::VERIFICATION_FAILED;
    }
    return EVP_DigestVerify(ctx.get(),
                            signature.data(),
                            signature.size(),
                            message.data(),
                            message.size())
           == 1;
  }

}  // namespace qstore::crypto
