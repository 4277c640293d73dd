#include "payment_discovery.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace mintgate::payment {

PaymentDiscovery::PaymentDiscovery(std::shared_ptr<chain::ChainReader> reader, std::string asset, std::string treasury, DiscoveryWindow window)
    : reader_(std::move(reader)), asset_(std::move(asset)), treasury_(std::move(treasury)), window_(window) {
  if (!reader_) {
    throw std::invalid_argument("payment discovery requires a chain reader");
  }
  if (window_.max_blocks_per_scan == 0) {
    window_.max_blocks_per_scan = window_.lookback_blocks + 1;
  }
}

std::string PaymentDiscovery::FindLatestPayment(const std::string& payer) {
  const auto head   = reader_->GetCurrentHeight();
  const auto oldest = head > window_.lookback_blocks ? head - window_.lookback_blocks : 0;

  chain::TransferFilter filter;
  filter.from = payer;
  filter.to   = treasury_;

  // Walk chunks newest-first; the first non-empty chunk holds the latest payment.
  std::uint64_t to = head;
  while (true) {
    const auto span = std::min(window_.max_blocks_per_scan - 1, to - oldest);
    const auto from = to - span;

    const auto events = reader_->ScanEvents(asset_, from, to, filter);
    if (!events.empty()) {
      return events.back().transaction_hash;
    }

    if (from == oldest) break;
    to = from - 1;
  }

  throw util::NoRecentPayment("No recent USDC payment from payer to treasury");
}

} // namespace mintgate::payment
