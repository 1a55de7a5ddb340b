#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace qstore::crypto;

class ED25519ProviderTest : public ::testing::Test {
 protected:
  // first test vector of RFC 8032
  ED25519Seed seed_ = ED25519Seed::fromHex(
                          "9d61b19deffd5a60ba844af492ec2cc4"
                          "4449c5697b326919703bac031cae7f60")
                          .value();
  ED25519ProviderImpl provider_;
};

/**
 * @given the seed of a published test vector
 * @when its keypair is derived and the empty message signed
 * @then public key and signature match the vector
 */
TEST_F(ED25519ProviderTest, MatchesTestVector) {
  EXPECT_OUTCOME_TRUE(keypair, provider_.generateKeypair(seed_));
  EXPECT_EQ(keypair.public_key.toHex(),
            "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

  EXPECT_OUTCOME_TRUE(signature, provider_.sign(keypair, {}));
  EXPECT_EQ(signature.toHex(),
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
            "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

/**
 * @given a signed message
 * @when it is verified as is and after a change
 * @then only the original message verifies
 */
TEST_F(ED25519ProviderTest, VerifyDetectsChanges) {
  EXPECT_OUTCOME_TRUE(keypair, provider_.generateKeypair(seed_));
  auto message = "010203"_unhex;
  EXPECT_OUTCOME_TRUE(signature, provider_.sign(keypair, message));

  EXPECT_OUTCOME_TRUE(valid,
                      provider_.verify(signature, message, keypair.public_key));
  EXPECT_TRUE(valid);

  message[0] = 0xff;
  EXPECT_OUTCOME_TRUE(tampered,
                      provider_.verify(signature, message, keypair.public_key));
  EXPECT_FALSE(tampered);
}

/**
 * @given two different seeds
 * @when keypairs are derived
 * @then they differ
 */
TEST_F(ED25519ProviderTest, SeedsGiveDistinctKeys) {
  ED25519Seed other = seed_;
  other[0] ^= 0x01;
  EXPECT_OUTCOME_TRUE(first, provider_.generateKeypair(seed_));
  EXPECT_OUTCOME_TRUE(second, provider_.generateKeypair(other));
  EXPECT_NE(first, second);
}
