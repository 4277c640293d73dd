#pragma once

#include <memory>
#include <string>

#include "internal/ledger/idempotency_ledger.hpp"
#include "internal/mint/mint_dispatcher.hpp"
#include "internal/payment/payment_discovery.hpp"
#include "internal/payment/payment_verifier.hpp"

namespace mintgate::core {

struct ConfirmResult {
  enum class Kind { Minted, AlreadyProcessed };

  Kind        kind = Kind::Minted;
  std::string tx_hash;       // payment proof, lowercase
  std::string minted_to;     // EIP-55
  std::string mint_tx_hash;
};

/*
  MintOrchestrator

  Turns one payment proof into at most one mint.

  For a given proof the whole lookup-verify-dispatch-record sequence runs
  under the ledger's per-proof lock. The in-flight marker is committed
  before the mint is broadcast, and the processed marker before success is
  reported, so a crash or timeout never leads to a second dispatch.
*/
class MintOrchestrator {
 public:
  MintOrchestrator(std::shared_ptr<payment::PaymentVerifier> verifier, std::shared_ptr<payment::PaymentDiscovery> discovery,
                   std::shared_ptr<ledger::IdempotencyLedger> ledger, std::shared_ptr<mint::MintDispatcher> dispatcher);

  ConfirmResult ConfirmTransaction(const std::string& tx_hash);

  // Discovery path: find the payer's latest payment, then confirm it.
  ConfirmResult ConfirmLatestPayment(const std::string& payer);

 private:
  ConfirmResult Confirm(const std::string& proof);

  std::shared_ptr<payment::PaymentVerifier>  verifier_;
  std::shared_ptr<payment::PaymentDiscovery> discovery_;
  std::shared_ptr<ledger::IdempotencyLedger> ledger_;
  std::shared_ptr<mint::MintDispatcher>      dispatcher_;
};

} // namespace mintgate::core
