#pragma once

#include <optional>
#include <string>

#include "internal/chain/types.hpp"
#include "internal/util/amount.hpp"

namespace mintgate::chain::erc20 {

struct Transfer {
  std::string  token;
  std::string  from;
  std::string  to;
  util::Amount value;
};

const std::string& TransferTopic();

// nullopt for anything that is not a well-formed ERC-20 Transfer log.
std::optional<Transfer> DecodeTransfer(const LogEvent& event);

} // namespace mintgate::chain::erc20
