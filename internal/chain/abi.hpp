#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/amount.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain::abi {

/*
  Minimal Solidity ABI codec: static head words only (address, uint256, bool),
  which covers every call and event mintgate touches.
*/

constexpr std::size_t kWordSize = 32;

std::array<std::uint8_t, 4> Selector(std::string_view signature);

// keccak256 of an event signature, as a 0x-prefixed topic.
std::string EventTopic(std::string_view signature);

util::Bytes EncodeAddress(std::string_view address);
util::Bytes EncodeUint(const util::Amount& value);
util::Bytes EncodeUint(std::uint64_t value);

util::Bytes EncodeCall(std::string_view signature, const std::vector<util::Bytes>& words = {});

// Decoders take the word index into the return data. Throw std::invalid_argument on short data.
std::string  DecodeAddress(const util::Bytes& data, std::size_t index = 0);
util::Amount DecodeUint(const util::Bytes& data, std::size_t index = 0);
bool         DecodeBool(const util::Bytes& data, std::size_t index = 0);

} // namespace mintgate::chain::abi
