#include "payment_verifier.hpp"

#include <stdexcept>

#include "internal/chain/address.hpp"
#include "internal/chain/erc20.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::payment {

PaymentVerifier::PaymentVerifier(std::shared_ptr<chain::ChainReader> reader, MintRequirement requirement)
    : reader_(std::move(reader)), requirement_(std::move(requirement)) {
  if (!reader_) {
    throw std::invalid_argument("payment verifier requires a chain reader");
  }
}

PaymentRecord PaymentVerifier::Verify(const std::string& tx_hash) {
  const auto outcome = reader_->GetTransactionOutcome(tx_hash);
  if (!outcome.finalized) {
    throw util::TransactionFailed("Transaction not yet finalized");
  }
  if (!outcome.success) {
    throw util::TransactionFailed("Transaction failed");
  }

  PaymentRecord record;
  record.tx_hash      = tx_hash;
  record.asset        = requirement_.asset;
  record.block_number = outcome.block_number;

  std::string payer;
  for (const auto& event : outcome.events) {
    if (!chain::SameAddress(event.address, requirement_.asset)) continue;

    const auto transfer = chain::erc20::DecodeTransfer(event);
    if (!transfer || !chain::SameAddress(transfer->to, requirement_.treasury)) continue;

    if (payer.empty()) {
      payer = transfer->from;
    } else if (requirement_.reject_multiple_senders && !chain::SameAddress(payer, transfer->from)) {
      throw util::NoQualifyingTransfer("Transaction pays the treasury from more than one sender");
    }
    record.paid += transfer->value;
  }

  if (payer.empty()) {
    throw util::NoQualifyingTransfer("No USDC Transfer to TREASURY found in tx");
  }
  if (record.paid < requirement_.min_amount) {
    throw util::InsufficientAmount("Insufficient amount: paid=" + record.paid.ToDecimal() + " required=" + requirement_.min_amount.ToDecimal(),
                                   {{"paid", record.paid.ToDecimal()}, {"required", requirement_.min_amount.ToDecimal()}});
  }

  record.payer = chain::ToChecksumAddress(payer);
  return record;
}

} // namespace mintgate::payment
