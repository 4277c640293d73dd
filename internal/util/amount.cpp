#include "amount.hpp"

#include <openssl/crypto.h>

#include <cctype>
#include <stdexcept>

namespace mintgate::util {

namespace {

BIGNUM* NewOrThrow() {
  BIGNUM* bn = BN_new();
  if (!bn) {
    throw std::bad_alloc();
  }
  return bn;
}

} // namespace

Amount::Amount() : bn_(NewOrThrow()) {
  BN_zero(bn_.get());
}

Amount::Amount(std::uint64_t value) : bn_(NewOrThrow()) {
  if (BN_set_word(bn_.get(), static_cast<BN_ULONG>(value)) != 1) {
    throw std::runtime_error("BN_set_word failed");
  }
}

Amount::Amount(Adopt, BIGNUM* bn) : bn_(bn) {
}

Amount::Amount(const Amount& other) : bn_(BN_dup(other.bn_.get())) {
  if (!bn_) {
    throw std::bad_alloc();
  }
}

Amount& Amount::operator=(const Amount& other) {
  if (this == &other) {
    return *this;
  }
  if (!bn_) {
    bn_.reset(BN_dup(other.bn_.get()));
    if (!bn_) {
      throw std::bad_alloc();
    }
  } else if (!BN_copy(bn_.get(), other.bn_.get())) {
    throw std::bad_alloc();
  }
  return *this;
}

Amount Amount::FromDecimal(std::string_view decimal) {
  if (decimal.empty() || decimal.size() > 78) {
    throw std::invalid_argument("invalid decimal amount: '" + std::string(decimal) + "'");
  }
  for (char c : decimal) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("invalid decimal amount: '" + std::string(decimal) + "'");
    }
  }

  const std::string digits(decimal);
  BIGNUM*           bn = nullptr;
  if (BN_dec2bn(&bn, digits.c_str()) == 0 || !bn) {
    throw std::invalid_argument("invalid decimal amount: '" + digits + "'");
  }
  return Amount(Adopt{}, bn);
}

Amount Amount::FromQuantity(std::string_view hex_quantity) {
  auto digits = hex_quantity;
  if (digits.size() < 3 || digits[0] != '0' || (digits[1] != 'x' && digits[1] != 'X')) {
    throw std::invalid_argument("invalid hex quantity: '" + std::string(hex_quantity) + "'");
  }
  digits.remove_prefix(2);
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("invalid hex quantity: '" + std::string(hex_quantity) + "'");
    }
  }

  const std::string hex(digits);
  BIGNUM*           bn = nullptr;
  if (BN_hex2bn(&bn, hex.c_str()) == 0 || !bn) {
    throw std::invalid_argument("invalid hex quantity: '" + std::string(hex_quantity) + "'");
  }
  return Amount(Adopt{}, bn);
}

Amount Amount::FromBigEndian(const std::uint8_t* data, std::size_t size) {
  BIGNUM* bn = BN_bin2bn(data, static_cast<int>(size), nullptr);
  if (!bn) {
    throw std::bad_alloc();
  }
  return Amount(Adopt{}, bn);
}

Amount& Amount::operator+=(const Amount& other) {
  if (BN_add(bn_.get(), bn_.get(), other.bn_.get()) != 1) {
    throw std::runtime_error("BN_add failed");
  }
  return *this;
}

int Amount::Compare(const Amount& other) const {
  return BN_cmp(bn_.get(), other.bn_.get());
}

bool Amount::IsZero() const {
  return BN_is_zero(bn_.get());
}

std::uint64_t Amount::ToUint64() const {
  if (BN_num_bytes(bn_.get()) > 8) {
    throw std::overflow_error("amount does not fit in 64 bits: " + ToDecimal());
  }
  const auto    bytes = ToBigEndian(8);
  std::uint64_t value = 0;
  for (auto b : bytes) {
    value = (value << 8) | b;
  }
  return value;
}

std::string Amount::ToDecimal() const {
  char* raw = BN_bn2dec(bn_.get());
  if (!raw) {
    throw std::bad_alloc();
  }
  std::string out(raw);
  OPENSSL_free(raw);
  return out;
}

Bytes Amount::ToMinimalBigEndian() const {
  Bytes out(static_cast<std::size_t>(BN_num_bytes(bn_.get())));
  if (!out.empty()) {
    BN_bn2bin(bn_.get(), out.data());
  }
  return out;
}

Bytes Amount::ToBigEndian(std::size_t width) const {
  Bytes out(width);
  if (BN_bn2binpad(bn_.get(), out.data(), static_cast<int>(width)) < 0) {
    throw std::overflow_error("amount wider than " + std::to_string(width) + " bytes: " + ToDecimal());
  }
  return out;
}

} // namespace mintgate::util
