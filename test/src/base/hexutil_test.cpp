
#include "base/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace qstore::base;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_Hex) {
  auto bin = "00010204081020FF"_unhex;
  auto hexed = hex_lower(bin);
  ASSERT_EQ(hexed, "00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020fF"));
  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_OUTCOME_ERROR(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_OUTCOME_ERROR(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hex string with and without 0x prefix
 * @when unhexWith0x
 * @then only the prefixed one is accepted
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(bytes, unhexWith0x("0x0aff"));
  ASSERT_EQ(bytes, (std::vector<uint8_t>{0x0a, 0xff}));
  EXPECT_OUTCOME_ERROR(unhexWith0x("0aff"), UnhexError::MISSING_0X_PREFIX);
}
