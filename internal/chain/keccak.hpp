#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/util/hex.hpp"

namespace mintgate::chain {

using Hash256 = std::array<std::uint8_t, 32>;

/*
  Keccak-256 as used by Ethereum (original Keccak padding 0x01, not the
  FIPS-202 SHA3 padding 0x06).
*/
Hash256 Keccak256(const std::uint8_t* data, std::size_t size);
Hash256 Keccak256(const util::Bytes& data);
Hash256 Keccak256(std::string_view text);

} // namespace mintgate::chain
