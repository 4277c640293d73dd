#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/chain/chain_reader.hpp"

namespace mintgate::payment {

struct DiscoveryWindow {
  std::uint64_t lookback_blocks     = 50'000;
  std::uint64_t max_blocks_per_scan = 10'000;
};

/*
  Fallback for callers that know the payer but not the transaction.

  Searches [max(0, head - lookback), head] for Transfer(payer -> treasury)
  on the asset and returns the newest match. The window bounds cost; it does
  not promise completeness.
*/
class PaymentDiscovery {
 public:
  PaymentDiscovery(std::shared_ptr<chain::ChainReader> reader, std::string asset, std::string treasury, DiscoveryWindow window);

  std::string FindLatestPayment(const std::string& payer);

 private:
  std::shared_ptr<chain::ChainReader> reader_;
  std::string                         asset_;
  std::string                         treasury_;
  DiscoveryWindow                     window_;
};

} // namespace mintgate::payment
