#ifndef QSTORE_BASE_HEXUTIL_HPP
#define QSTORE_BASE_HEXUTIL_HPP

#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace qstore::base {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes input bytes
   * @return hexstring
   */
  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string of even length, upper or lower case
   * @return result containing array of bytes
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed bytes
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace qstore::base

OUTCOME_HPP_DECLARE_ERROR_2(qstore::base, UnhexError);

#endif  // QSTORE_BASE_HEXUTIL_HPP
