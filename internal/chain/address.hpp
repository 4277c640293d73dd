#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mintgate::chain {

/*
  Address and transaction-hash helpers.

  Internally every address and hash is kept as lowercase "0x"-prefixed hex;
  EIP-55 checksum casing is applied only when rendering addresses to callers.
*/

// Accepts lowercase, uppercase or valid EIP-55 mixed case. Mixed case with a bad checksum is rejected.
std::optional<std::string> ParseAddress(std::string_view value);

std::optional<std::string> ParseTxHash(std::string_view value);

std::string ToChecksumAddress(std::string_view address);

bool SameAddress(std::string_view a, std::string_view b);

// 32-byte indexed-topic form of an address (left-padded with zeros).
std::string AddressToTopic(std::string_view address);

// Inverse of AddressToTopic; nullopt if the upper 12 bytes are not zero.
std::optional<std::string> TopicToAddress(std::string_view topic);

} // namespace mintgate::chain
