#include "mint_dispatcher.hpp"

#include <stdexcept>
#include <thread>

#include "internal/chain/address.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::mint {

using observability::StringField;

MintDispatcher::MintDispatcher(std::shared_ptr<TokenContract> contract, std::shared_ptr<chain::ChainReader> reader, DispatcherOptions options)
    : contract_(std::move(contract)), reader_(std::move(reader)), options_(options) {
  if (!contract_ || !reader_) {
    throw std::invalid_argument("mint dispatcher requires a token contract and a chain reader");
  }
}

void MintDispatcher::CheckAuthority() {
  // Read fresh on every dispatch; ownership can change between deployments.
  const auto actual   = contract_->Owner();
  const auto expected = contract_->OperatorAddress();
  if (!chain::SameAddress(actual, expected)) {
    throw util::AuthorityMismatch("Misconfiguration: signer is not contract owner", {{"expected", chain::ToChecksumAddress(expected)},
                                                                                     {"actual", chain::ToChecksumAddress(actual)},
                                                                                     {"contract", chain::ToChecksumAddress(contract_->ContractAddress())}});
  }
}

void MintDispatcher::CheckSupply(std::uint64_t quantity) {
  const auto supply = contract_->Supply();

  if (!supply.mint_enabled) {
    throw util::MintReverted("Minting is disabled", {{"reason", "MintDisabled"}});
  }
  if (quantity == 0) {
    throw util::MintReverted("Quantity must be positive", {{"reason", "QuantityZero"}});
  }
  if (supply.total_minted >= supply.max_supply) {
    throw util::MintReverted("Collection is sold out", {{"reason", "SoldOut"}, {"maxSupply", supply.max_supply.ToDecimal()}});
  }

  auto after = supply.total_minted;
  after += util::Amount(quantity);
  if (after > supply.max_supply) {
    throw util::MintReverted("Mint would exceed max supply",
                             {{"reason", "MaxSupplyExceeded"}, {"totalMinted", supply.total_minted.ToDecimal()}, {"maxSupply", supply.max_supply.ToDecimal()}});
  }
}

MintOutcome MintDispatcher::Dispatch(const std::string& recipient, std::uint64_t quantity, const BroadcastHook& on_broadcast) {
  const auto deadline = std::chrono::steady_clock::now() + options_.timeout;

  CheckAuthority();
  CheckSupply(quantity);

  if (std::chrono::steady_clock::now() >= deadline) {
    throw util::MintTimeout("Mint deadline passed before broadcast");
  }

  std::string mint_tx_hash;
  bool        armed = false;

  try {
    mint_tx_hash = contract_->SubmitMint(recipient, quantity, [&](const std::string& hash) {
      mint_tx_hash = hash;
      if (on_broadcast) {
        on_broadcast(hash);
      }
      armed = true;
      MINTGATE_LOG_INFO("Broadcasting mint", {StringField("recipient", recipient), StringField("mint_tx", hash)});
    });
  } catch (const util::LedgerRejected& e) {
    if (!armed) {
      throw;
    }
    // An error object alone does not prove the mint was dropped ("already known").
    if (!NodeHoldsTransaction(mint_tx_hash)) {
      MINTGATE_LOG_WARN("Mint broadcast rejected", {StringField("mint_tx", mint_tx_hash), StringField("error", e.what())});
      throw;
    }
    MINTGATE_LOG_WARN("Mint broadcast returned an error but the node holds the transaction",
                      {StringField("mint_tx", mint_tx_hash), StringField("error", e.what())});
  } catch (const std::exception& e) {
    if (!armed) {
      throw;
    }
    MINTGATE_LOG_ERROR("Mint broadcast outcome unknown", {StringField("mint_tx", mint_tx_hash), StringField("error", e.what())});
    throw util::MintIndeterminate("Mint broadcast failed in transit; outcome unknown", mint_tx_hash);
  }

  MINTGATE_LOG_INFO("Mint broadcast", {StringField("recipient", recipient), StringField("mint_tx", mint_tx_hash)});
  AwaitReceipt(mint_tx_hash, deadline);

  MintOutcome outcome;
  outcome.recipient    = recipient;
  outcome.quantity     = quantity;
  outcome.mint_tx_hash = mint_tx_hash;
  return outcome;
}

bool MintDispatcher::NodeHoldsTransaction(const std::string& mint_tx_hash) {
  try {
    return reader_->IsKnownTransaction(mint_tx_hash);
  } catch (const std::exception& e) {
    MINTGATE_LOG_ERROR("Mint lookup after rejected broadcast failed", {StringField("mint_tx", mint_tx_hash), StringField("error", e.what())});
    throw util::MintIndeterminate("Mint broadcast rejected and its status could not be checked", mint_tx_hash);
  }
}

void MintDispatcher::AwaitReceipt(const std::string& mint_tx_hash, std::chrono::steady_clock::time_point deadline) {
  while (true) {
    try {
      const auto receipt = reader_->GetTransactionOutcome(mint_tx_hash);
      if (receipt.finalized) {
        if (!receipt.success) {
          throw util::MintReverted("Mint transaction reverted", {{"nftTxHash", mint_tx_hash}});
        }
        return;
      }
    } catch (const util::TransactionNotFound&) {
      // not mined yet
    } catch (const util::LedgerUnavailable& e) {
      MINTGATE_LOG_WARN("Receipt poll failed", {StringField("mint_tx", mint_tx_hash), StringField("error", e.what())});
    }

    if (std::chrono::steady_clock::now() + options_.poll_interval >= deadline) {
      throw util::MintIndeterminate("Mint not confirmed before deadline", mint_tx_hash);
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

std::optional<bool> MintDispatcher::MintSucceeded(const std::string& mint_tx_hash) {
  try {
    const auto receipt = reader_->GetTransactionOutcome(mint_tx_hash);
    if (!receipt.finalized) {
      return std::nullopt;
    }
    return receipt.success;
  } catch (const util::TransactionNotFound&) {
    return std::nullopt;
  }
}

} // namespace mintgate::mint
