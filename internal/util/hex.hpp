#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mintgate::util {

using Bytes = std::vector<std::uint8_t>;

std::string ToHex(const std::uint8_t* data, std::size_t size);
std::string ToHex(const Bytes& bytes);

// Accepts an optional "0x" prefix. Returns nullopt on odd length or non-hex input.
std::optional<Bytes> FromHex(std::string_view hex);

// True for "0x" followed by exactly 2 * byte_count hex digits.
bool IsPrefixedHex(std::string_view value, std::size_t byte_count);

// Parses a JSON-RPC quantity ("0x1a"). Throws std::invalid_argument.
std::uint64_t ParseQuantity(std::string_view quantity);
std::string   ToQuantity(std::uint64_t value);

std::string ToLower(std::string_view value);

} // namespace mintgate::util
