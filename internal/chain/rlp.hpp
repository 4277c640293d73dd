#pragma once

#include <cstdint>
#include <vector>

#include "internal/util/amount.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain::rlp {

/*
  Recursive Length Prefix encoding (Ethereum yellow paper, appendix B).
  Integers are encoded big-endian without leading zeros; zero is the empty string.
*/

util::Bytes EncodeBytes(const util::Bytes& value);
util::Bytes EncodeUint(std::uint64_t value);
util::Bytes EncodeUint(const util::Amount& value);

// Items must already be RLP-encoded.
util::Bytes EncodeList(const std::vector<util::Bytes>& items);

} // namespace mintgate::chain::rlp
