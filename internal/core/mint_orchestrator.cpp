#include "mint_orchestrator.hpp"

#include <stdexcept>

#include "internal/chain/address.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::core {

using db::model::ProofState;
using observability::StringField;

namespace {

ConfirmResult AlreadyProcessed(const std::string& proof) {
  ConfirmResult result;
  result.kind    = ConfirmResult::Kind::AlreadyProcessed;
  result.tx_hash = proof;
  return result;
}

ConfirmResult Minted(const std::string& proof, const std::string& recipient, const std::string& mint_tx_hash) {
  ConfirmResult result;
  result.kind         = ConfirmResult::Kind::Minted;
  result.tx_hash      = proof;
  result.minted_to    = chain::ToChecksumAddress(recipient);
  result.mint_tx_hash = mint_tx_hash;
  return result;
}

} // namespace

MintOrchestrator::MintOrchestrator(std::shared_ptr<payment::PaymentVerifier> verifier, std::shared_ptr<payment::PaymentDiscovery> discovery,
                                   std::shared_ptr<ledger::IdempotencyLedger> ledger, std::shared_ptr<mint::MintDispatcher> dispatcher)
    : verifier_(std::move(verifier)), discovery_(std::move(discovery)), ledger_(std::move(ledger)), dispatcher_(std::move(dispatcher)) {
  if (!verifier_ || !discovery_ || !ledger_ || !dispatcher_) {
    throw std::invalid_argument("mint orchestrator requires verifier, discovery, ledger and dispatcher");
  }
}

ConfirmResult MintOrchestrator::ConfirmTransaction(const std::string& tx_hash) {
  auto proof = chain::ParseTxHash(tx_hash);
  if (!proof) {
    throw util::InvalidRequest("txHash must be 0x followed by 64 hex digits");
  }
  return Confirm(*proof);
}

ConfirmResult MintOrchestrator::ConfirmLatestPayment(const std::string& payer) {
  auto address = chain::ParseAddress(payer);
  if (!address) {
    throw util::InvalidRequest("payer must be a 20-byte hex address");
  }

  const auto proof = discovery_->FindLatestPayment(*address);
  MINTGATE_LOG_INFO("Discovered payment", {StringField("payer", chain::ToChecksumAddress(*address)), StringField("proof", proof)});
  return Confirm(proof);
}

ConfirmResult MintOrchestrator::Confirm(const std::string& proof) {
  auto lock = ledger_->Acquire(proof);

  if (auto record = ledger_->Lookup(proof)) {
    if (record->state == ProofState::Processed) {
      return AlreadyProcessed(proof);
    }

    // An earlier attempt broadcast a mint whose outcome was never recorded.
    const auto minted = dispatcher_->MintSucceeded(record->mint_tx_hash);
    if (!minted) {
      throw util::MintIndeterminate("Earlier mint for this payment is still unconfirmed", record->mint_tx_hash);
    }
    if (*minted) {
      ledger_->MarkProcessed(proof, record->recipient, record->mint_tx_hash);
      MINTGATE_LOG_INFO("Recovered earlier mint", {StringField("proof", proof), StringField("mint_tx", record->mint_tx_hash)});
      return Minted(proof, record->recipient, record->mint_tx_hash);
    }
    ledger_->ClearInFlight(proof);
  }

  const auto payment = verifier_->Verify(proof);

  bool              marked = false;
  mint::MintOutcome outcome;
  try {
    outcome = dispatcher_->Dispatch(payment.payer, 1, [&](const std::string& mint_tx_hash) {
      ledger_->MarkInFlight(proof, payment.payer, mint_tx_hash);
      marked = true;
    });
  } catch (const util::MintIndeterminate&) {
    // Leave the marker: the next request re-checks the recorded mint.
    throw;
  } catch (const std::exception&) {
    // Faults that reach here prove no mint happened.
    if (marked) {
      ledger_->ClearInFlight(proof);
    }
    throw;
  }

  ledger_->MarkProcessed(proof, outcome.recipient, outcome.mint_tx_hash);
  MINTGATE_LOG_INFO("Minted after payment",
                    {StringField("proof", proof), StringField("recipient", payment.payer), StringField("paid", payment.paid.ToDecimal()),
                     StringField("mint_tx", outcome.mint_tx_hash)});
  return Minted(proof, outcome.recipient, outcome.mint_tx_hash);
}

} // namespace mintgate::core
