#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/util/amount.hpp"

namespace mintgate::mint {

struct SupplyState {
  bool         mint_enabled = false;
  util::Amount total_minted;
  util::Amount max_supply;
};

// Invoked with the mint transaction hash after signing and before broadcast.
// Throwing from the hook aborts the mint before anything is sent.
using BroadcastHook = std::function<void(const std::string& mint_tx_hash)>;

/*
  The NFT contract as seen by the operator key.

  Reads reflect the latest block. SubmitMint does not wait for inclusion.
*/
class TokenContract {
 public:
  virtual ~TokenContract() = default;

  virtual const std::string& ContractAddress() const = 0;

  // Lowercase address of the key that signs mints.
  virtual const std::string& OperatorAddress() const = 0;

  // Lowercase address the contract currently records as owner().
  virtual std::string Owner() = 0;

  virtual SupplyState Supply() = 0;

  virtual std::string SubmitMint(const std::string& recipient, std::uint64_t quantity, const BroadcastHook& before_send) = 0;
};

} // namespace mintgate::mint
