#include "base/buffer.hpp"

#include "base/hexutil.hpp"

namespace qstore::base {

  Buffer::Buffer(std::vector<uint8_t> v) : data_(std::move(v)) {}

  Buffer::Buffer(gsl::span<const uint8_t> s) : data_(s.begin(), s.end()) {}

  Buffer::Buffer(std::initializer_list<uint8_t> b) : data_(b) {}

  Buffer::Buffer(const_iterator begin, const_iterator end)
      : data_(begin, end) {}

  uint8_t Buffer::operator[](size_t index) const {
    return data_[index];
  }

  uint8_t &Buffer::operator[](size_t index) {
    return data_[index];
  }

  bool Buffer::operator==(const Buffer &b) const noexcept {
    return data_ == b.data_;
  }

  bool Buffer::operator!=(const Buffer &b) const noexcept {
    return data_ != b.data_;
  }

  bool Buffer::operator<(const Buffer &b) const noexcept {
    return data_ < b.data_;
  }

  size_t Buffer::size() const {
    return data_.size();
  }

  bool Buffer::empty() const {
    return data_.empty();
  }

  const uint8_t *Buffer::data() const {
    return data_.data();
  }

  Buffer::iterator Buffer::begin() {
    return data_.begin();
  }

  Buffer::iterator Buffer::end() {
    return data_.end();
  }

  Buffer::const_iterator Buffer::begin() const {
    return data_.begin();
  }

  Buffer::const_iterator Buffer::end() const {
    return data_.end();
  }

  Buffer &Buffer::reserve(size_t size) {
    data_.reserve(size);
    return *this;
  }

  Buffer &Buffer::putUint8(uint8_t n) {
    data_.push_back(n);
    return *this;
  }

  Buffer &Buffer::putUint32(uint32_t n) {
    for (int shift = 24; shift >= 0; shift -= 8) {
      data_.push_back(static_cast<uint8_t>((n >> shift) & 0xffu));
    }
    return *this;
  }

  Buffer &Buffer::putUint64(uint64_t n) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      data_.push_back(static_cast<uint8_t>((n >> shift) & 0xffu));
    }
    return *this;
  }

  Buffer &Buffer::put(std::string_view str) {
    data_.insert(data_.end(), str.begin(), str.end());
    return *this;
  }

  Buffer &Buffer::put(gsl::span<const uint8_t> s) {
    data_.insert(data_.end(), s.begin(), s.end());
    return *this;
  }

  Buffer &Buffer::put(const std::vector<uint8_t> &v) {
    data_.insert(data_.end(), v.begin(), v.end());
    return *this;
  }

  bool Buffer::startsWith(const Buffer &prefix) const {
    return prefix.size() <= size()
           && std::equal(prefix.begin(), prefix.end(), begin());
  }

  const std::vector<uint8_t> &Buffer::toVector() const {
    return data_;
  }

  std::string Buffer::toString() const {
    return std::string{data_.begin(), data_.end()};
  }

  std::string Buffer::toHex() const {
    return hex_lower(data_);
  }

  outcome::result<Buffer> Buffer::fromHex(std::string_view hex) {
    OUTCOME_TRY((auto &&, bytes), unhex(hex));
    return Buffer{std::move(bytes)};
  }

  Buffer Buffer::fromString(std::string_view str) {
    return Buffer{}.put(str);
  }

  std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.toHex();
  }

}  // namespace qstore::base
