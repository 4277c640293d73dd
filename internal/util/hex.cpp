#include "hex.hpp"

#include <cctype>
#include <stdexcept>

namespace mintgate::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string_view StripPrefix(std::string_view value) {
  if (value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
    value.remove_prefix(2);
  }
  return value;
}

} // namespace

std::string ToHex(const std::uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(2 + size * 2);
  out += "0x";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

std::string ToHex(const Bytes& bytes) {
  return ToHex(bytes.data(), bytes.size());
}

std::optional<Bytes> FromHex(std::string_view hex) {
  hex = StripPrefix(hex);
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

bool IsPrefixedHex(std::string_view value, std::size_t byte_count) {
  if (value.size() != 2 + byte_count * 2 || value[0] != '0' || (value[1] != 'x' && value[1] != 'X')) {
    return false;
  }
  for (std::size_t i = 2; i < value.size(); ++i) {
    if (HexNibble(value[i]) < 0) {
      return false;
    }
  }
  return true;
}

std::uint64_t ParseQuantity(std::string_view quantity) {
  const auto digits = StripPrefix(quantity);
  if (digits.empty() || digits.size() > 16 || digits.size() == quantity.size()) {
    throw std::invalid_argument("invalid quantity: '" + std::string(quantity) + "'");
  }

  std::uint64_t value = 0;
  for (char c : digits) {
    const int nibble = HexNibble(c);
    if (nibble < 0) {
      throw std::invalid_argument("invalid quantity: '" + std::string(quantity) + "'");
    }
    value = (value << 4) | static_cast<std::uint64_t>(nibble);
  }
  return value;
}

std::string ToQuantity(std::uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  if (value == 0) {
    return "0x0";
  }
  std::string digits;
  while (value != 0) {
    digits.insert(digits.begin(), kHex[value & 0x0F]);
    value >>= 4;
  }
  return "0x" + digits;
}

std::string ToLower(std::string_view value) {
  std::string out(value);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace mintgate::util
