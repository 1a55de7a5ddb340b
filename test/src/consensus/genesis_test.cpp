#include "consensus/genesis.hpp"

#include <gtest/gtest.h>
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "primitives/codec.hpp"
#include "testutil/consensus/execution_log.hpp"
#include "testutil/outcome.hpp"

using namespace qstore;
using consensus::makeGenesis;

class GenesisTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (char c : {'a', 'b', 'c'}) {
      EXPECT_OUTCOME_TRUE(seed,
                          crypto::ED25519Seed::fromHex(std::string(64, c)));
      EXPECT_OUTCOME_TRUE(keypair, provider_.generateKeypair(seed));
      keys_.push_back(keypair);
    }
    payload_.batch_number = 3;
    payload_.timestamp = 1700000007;
    payload_.transactions = test::makeTransactions(7, 3);
  }

  crypto::ED25519ProviderImpl provider_;
  std::vector<crypto::ED25519Keypair> keys_;
  primitives::Payload payload_;
};

/**
 * @given three validator keys
 * @when the genesis certificate of block 7 is built
 * @then it attests the payload hash and carries a valid signature of every
 * validator over the encoded header
 */
TEST_F(GenesisTest, SignedByEveryValidator) {
  EXPECT_OUTCOME_TRUE(qc, makeGenesis(provider_, keys_, payload_, 7));
  EXPECT_EQ(qc.number(), 7u);
  EXPECT_EQ(qc.header.payload_hash,
            crypto::sha256(primitives::encodePayload(payload_).toVector()));

  auto message = primitives::encodeHeader(qc.header);
  ASSERT_EQ(qc.signatures.size(), keys_.size());
  for (size_t i = 0; i < keys_.size(); ++i) {
    EXPECT_EQ(qc.signatures[i].public_key, keys_[i].public_key);
    EXPECT_OUTCOME_TRUE(valid,
                        provider_.verify(qc.signatures[i].signature,
                                         message.toVector(),
                                         keys_[i].public_key));
    EXPECT_TRUE(valid);
  }
}

/**
 * @given a genesis certificate
 * @when a signature is checked against another block number
 * @then verification fails
 */
TEST_F(GenesisTest, SignatureBindsBlockNumber) {
  EXPECT_OUTCOME_TRUE(qc, makeGenesis(provider_, keys_, payload_, 7));
  auto header = qc.header;
  header.number = 8;
  EXPECT_OUTCOME_TRUE(valid,
                      provider_.verify(qc.signatures[0].signature,
                                       primitives::encodeHeader(header).toVector(),
                                       keys_[0].public_key));
  EXPECT_FALSE(valid);
}

/**
 * @given no validator keys
 * @when genesis is built
 * @then the certificate holds the header only
 */
TEST_F(GenesisTest, NoValidators) {
  EXPECT_OUTCOME_TRUE(qc, makeGenesis(provider_, {}, payload_, 0));
  EXPECT_TRUE(qc.signatures.empty());
  EXPECT_EQ(qc.number(), 0u);
}
