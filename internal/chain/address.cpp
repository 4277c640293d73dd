#include "address.hpp"

#include <cctype>

#include "internal/chain/keccak.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain {

namespace {

bool HasMixedCase(std::string_view hex_digits) {
  bool upper = false;
  bool lower = false;
  for (char c : hex_digits) {
    if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    if (std::islower(static_cast<unsigned char>(c))) lower = true;
  }
  return upper && lower;
}

} // namespace

std::optional<std::string> ParseAddress(std::string_view value) {
  if (!util::IsPrefixedHex(value, 20)) {
    return std::nullopt;
  }

  auto normalized = util::ToLower(value);
  normalized[1]   = 'x';
  if (HasMixedCase(value.substr(2)) && ToChecksumAddress(normalized) != std::string("0x") + std::string(value.substr(2))) {
    return std::nullopt;
  }
  return normalized;
}

std::optional<std::string> ParseTxHash(std::string_view value) {
  if (!util::IsPrefixedHex(value, 32)) {
    return std::nullopt;
  }
  auto normalized = util::ToLower(value);
  normalized[1]   = 'x';
  return normalized;
}

std::string ToChecksumAddress(std::string_view address) {
  auto lower = util::ToLower(address.substr(2));
  auto hash  = Keccak256(lower);

  std::string out = "0x";
  out.reserve(42);
  for (std::size_t i = 0; i < lower.size(); ++i) {
    const char c      = lower[i];
    const int  nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
    out.push_back((std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
  }
  return out;
}

bool SameAddress(std::string_view a, std::string_view b) {
  return util::ToLower(a) == util::ToLower(b);
}

std::string AddressToTopic(std::string_view address) {
  return "0x" + std::string(24, '0') + util::ToLower(address.substr(2));
}

std::optional<std::string> TopicToAddress(std::string_view topic) {
  if (!util::IsPrefixedHex(topic, 32)) {
    return std::nullopt;
  }
  for (std::size_t i = 2; i < 26; ++i) {
    if (topic[i] != '0') {
      return std::nullopt;
    }
  }
  return "0x" + util::ToLower(topic.substr(26));
}

} // namespace mintgate::chain
