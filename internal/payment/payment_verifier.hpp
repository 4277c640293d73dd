#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/chain/chain_reader.hpp"
#include "internal/payment/mint_requirement.hpp"

namespace mintgate::payment {

// Derived per verification; never persisted.
struct PaymentRecord {
  std::string   tx_hash;
  std::string   payer;  // EIP-55
  util::Amount  paid;
  std::string   asset;
  std::uint64_t block_number = 0;
};

/*
  Decides whether one transaction pays the treasury enough.

  Qualifying transfers are ERC-20 Transfer events emitted by the configured
  asset whose destination is the treasury. Their values are summed; the payer
  is the sender of the first one in log order. Read-only.
*/
class PaymentVerifier {
 public:
  PaymentVerifier(std::shared_ptr<chain::ChainReader> reader, MintRequirement requirement);

  PaymentRecord Verify(const std::string& tx_hash);

 private:
  std::shared_ptr<chain::ChainReader> reader_;
  MintRequirement                     requirement_;
};

} // namespace mintgate::payment
