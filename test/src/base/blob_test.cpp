#include "base/blob.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using namespace qstore::base;

/**
 * @given hex string of exactly 32 bytes
 * @when a Hash256 is created from it
 * @then it converts back to the same hex
 */
TEST(BlobTest, FromHexRestoresHex) {
  std::string hex(64, 'a');
  EXPECT_OUTCOME_TRUE(hash, Hash256::fromHex(hex));
  EXPECT_EQ(hash.toHex(), hex);

  EXPECT_OUTCOME_TRUE(prefixed, Hash256::fromHexWithPrefix("0x" + hex));
  EXPECT_EQ(prefixed, hash);
}

/**
 * @given byte strings shorter and longer than the blob
 * @when a blob is created from them
 * @then INCORRECT_LENGTH is returned
 */
TEST(BlobTest, WrongLengthIsRejected) {
  EXPECT_OUTCOME_ERROR(Blob<20>::fromHex("00ff"), BlobError::INCORRECT_LENGTH);
  EXPECT_OUTCOME_ERROR(Blob<20>::fromString(std::string(21, 'x')),
                       BlobError::INCORRECT_LENGTH);
}

/**
 * @given blob with raw bytes
 * @when it is turned into a string and back
 * @then the bytes survive, so protobuf bytes fields can carry blobs
 */
TEST(BlobTest, StringCarriesRawBytes) {
  Blob<20> address;
  address[0] = 0x00;
  address[19] = 0xfe;
  auto raw = address.toString();
  ASSERT_EQ(raw.size(), 20u);
  EXPECT_OUTCOME_TRUE(restored, Blob<20>::fromString(raw));
  EXPECT_EQ(restored, address);
}
