#ifndef QSTORE_BASE_BUFFER_HPP
#define QSTORE_BASE_BUFFER_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace qstore::base {

  /**
   * @brief Growable byte string. Used as key and value type of the log
   * database and as the carrier of opaque encoded blobs.
   */
  class Buffer {
   public:
    using iterator = std::vector<uint8_t>::iterator;
    using const_iterator = std::vector<uint8_t>::const_iterator;
    using value_type = uint8_t;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(std::vector<uint8_t> v);

    explicit Buffer(gsl::span<const uint8_t> s);

    Buffer(std::initializer_list<uint8_t> b);

    Buffer(const_iterator begin, const_iterator end);

    /**
     * @brief Construct buffer from the bytes of a fixed-size container such
     * as base::Blob
     */
    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &arr)
        : data_(arr.begin(), arr.end()) {}

    Buffer(const Buffer &) = default;
    Buffer(Buffer &&) noexcept = default;
    Buffer &operator=(const Buffer &) = default;
    Buffer &operator=(Buffer &&) noexcept = default;

    uint8_t operator[](size_t index) const;
    uint8_t &operator[](size_t index);

    bool operator==(const Buffer &b) const noexcept;
    bool operator!=(const Buffer &b) const noexcept;
    bool operator<(const Buffer &b) const noexcept;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] const uint8_t *data() const;

    iterator begin();
    iterator end();
    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    Buffer &reserve(size_t size);
    Buffer &putUint8(uint8_t n);

    /// Put a 32-bit number in big-endian order, so that keys sort numerically
    Buffer &putUint32(uint32_t n);

    /// Put a 64-bit number in big-endian order, so that keys sort numerically
    Buffer &putUint64(uint64_t n);

    Buffer &put(std::string_view str);
    Buffer &put(gsl::span<const uint8_t> s);
    Buffer &put(const std::vector<uint8_t> &v);

    [[nodiscard]] bool startsWith(const Buffer &prefix) const;

    [[nodiscard]] const std::vector<uint8_t> &toVector() const;

    /// Raw bytes as a string, e.g. to fill a protobuf bytes field
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] std::string toHex() const;

    static outcome::result<Buffer> fromHex(std::string_view hex);

    /// Wrap bytes held in a string, e.g. a protobuf bytes field
    static Buffer fromString(std::string_view str);

   private:
    std::vector<uint8_t> data_;
  };

  std::ostream &operator<<(std::ostream &os, const Buffer &buffer);

}  // namespace qstore::base

#endif  // QSTORE_BASE_BUFFER_HPP
