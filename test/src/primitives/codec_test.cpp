#include "primitives/codec.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace qstore::primitives;
using qstore::base::Buffer;
using qstore::base::Hash256;

class CodecTest : public ::testing::Test {
 protected:
  void SetUp() override {
    payload_.hash = "block hash"_hash256;
    payload_.batch_number = 7;
    payload_.last_in_batch = true;
    payload_.protocol_version = 24;
    payload_.timestamp = 1700000000;
    payload_.l1_gas_price = 1000;
    payload_.l2_fair_gas_price = 100;
    payload_.virtual_blocks = 1;
    payload_.operator_address[19] = 0x42;
    payload_.transactions.push_back({"tx one"_buf, "tx one"_hash256});
    payload_.transactions.push_back({"tx two"_buf, "tx two"_hash256});
  }

  Payload payload_;
};

/**
 * @given a payload with every field set
 * @when it is encoded and decoded
 * @then the decoded payload equals the original one
 */
TEST_F(CodecTest, PayloadSurvivesEncoding) {
  auto bytes = encodePayload(payload_);
  EXPECT_OUTCOME_TRUE(decoded, decodePayload(bytes));
  EXPECT_EQ(decoded, payload_);
}

/**
 * @given payloads differing in one field
 * @when they are encoded
 * @then the encodings differ
 */
TEST_F(CodecTest, EncodingCoversEveryField) {
  auto reference = encodePayload(payload_);
  auto changed = payload_;
  changed.transactions.pop_back();
  EXPECT_NE(encodePayload(changed), reference);

  changed = payload_;
  changed.operator_address[0] = 1;
  EXPECT_NE(encodePayload(changed), reference);
}

/**
 * @given bytes which are not a protobuf message
 * @when they are decoded
 * @then DECODE_FAILED is returned
 */
TEST_F(CodecTest, GarbageFailsToDecode) {
  auto garbage = "ffffffffffffffffff"_hex2buf;
  EXPECT_OUTCOME_ERROR(decodePayload(garbage), PrimitivesError::DECODE_FAILED);
  EXPECT_OUTCOME_ERROR(decodeCommitQC(garbage), PrimitivesError::DECODE_FAILED);
}

/**
 * @given an encoded certificate whose header is missing
 * @when it is decoded
 * @then DECODE_FAILED is returned
 */
TEST_F(CodecTest, CertificateWithoutHeaderIsRejected) {
  EXPECT_OUTCOME_ERROR(decodeCommitQC(Buffer{}),
                       PrimitivesError::DECODE_FAILED);
}

/**
 * @given a certificate with two signatures
 * @when it is encoded and decoded
 * @then header and signatures are kept in order
 */
TEST_F(CodecTest, CommitQCSurvivesEncoding) {
  CommitQC qc;
  qc.header.number = 12;
  qc.header.payload_hash = "payload"_hash256;
  ValidatorSignature first;
  first.public_key[0] = 1;
  first.signature[63] = 2;
  ValidatorSignature second;
  second.public_key[0] = 3;
  qc.signatures = {first, second};

  EXPECT_OUTCOME_TRUE(decoded, decodeCommitQC(encodeCommitQC(qc)));
  EXPECT_EQ(decoded, qc);
  EXPECT_EQ(decoded.number(), 12u);

  EXPECT_OUTCOME_TRUE(header, decodeHeader(encodeHeader(qc.header)));
  EXPECT_EQ(header, qc.header);
}

/**
 * @given consensus block numbers around the execution range limit
 * @when they are narrowed
 * @then numbers past the limit are rejected
 */
TEST(CommonTest, ExecBlockNumberRange) {
  EXPECT_OUTCOME_TRUE(fits, toExecBlockNumber(0xffffffffull));
  EXPECT_EQ(fits, 0xffffffffu);
  EXPECT_OUTCOME_ERROR(toExecBlockNumber(0x100000000ull),
                       PrimitivesError::BLOCK_NUMBER_OVERFLOW);
}
