#pragma once

#include <openssl/bn.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/hex.hpp"

namespace mintgate::util {

/*
  Unsigned token / wei amount of arbitrary width (uint256 on the wire).

  Backed by an OpenSSL BIGNUM; never negative.
*/
class Amount {
 public:
  Amount();
  explicit Amount(std::uint64_t value);

  Amount(const Amount& other);
  Amount& operator=(const Amount& other);
  Amount(Amount&&) noexcept            = default;
  Amount& operator=(Amount&&) noexcept = default;

  // Throw std::invalid_argument on malformed input.
  static Amount FromDecimal(std::string_view decimal);
  static Amount FromQuantity(std::string_view hex_quantity);
  static Amount FromBigEndian(const std::uint8_t* data, std::size_t size);

  Amount& operator+=(const Amount& other);

  int  Compare(const Amount& other) const;
  bool IsZero() const;

  // Throws std::overflow_error when the value does not fit.
  std::uint64_t ToUint64() const;

  std::string ToDecimal() const;

  // Minimal big-endian encoding; zero encodes as an empty byte string.
  Bytes ToMinimalBigEndian() const;

  // Left-padded big-endian encoding. Throws std::overflow_error if wider than width.
  Bytes ToBigEndian(std::size_t width) const;

  friend bool operator==(const Amount& a, const Amount& b) {
    return a.Compare(b) == 0;
  }
  friend bool operator<(const Amount& a, const Amount& b) {
    return a.Compare(b) < 0;
  }
  friend bool operator>(const Amount& a, const Amount& b) {
    return a.Compare(b) > 0;
  }
  friend bool operator<=(const Amount& a, const Amount& b) {
    return a.Compare(b) <= 0;
  }
  friend bool operator>=(const Amount& a, const Amount& b) {
    return a.Compare(b) >= 0;
  }

 private:
  struct BnDeleter {
    void operator()(BIGNUM* bn) const {
      BN_free(bn);
    }
  };

  // Tagged so integer literals never compete with the uint64_t constructor.
  struct Adopt {};
  Amount(Adopt, BIGNUM* bn);

  std::unique_ptr<BIGNUM, BnDeleter> bn_;
};

} // namespace mintgate::util
