#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/chain/chain_reader.hpp"
#include "internal/mint/token_contract.hpp"

namespace mintgate::mint {

struct MintOutcome {
  std::string   recipient;
  std::uint64_t quantity = 0;
  std::string   mint_tx_hash;
};

struct DispatcherOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(600)};
  std::chrono::milliseconds poll_interval{std::chrono::seconds(2)};
};

/*
  Issues privileged mints and waits for them.

  Dispatch is NOT idempotent: every successful call mints. Callers gate it
  with the idempotency ledger.

  Failure modes:
    AuthorityMismatch  - signer is not owner(); nothing sent
    MintReverted       - supply pre-check or on-chain revert
    MintTimeout        - deadline passed before broadcast
    MintIndeterminate  - broadcast may have happened, no receipt yet
    LedgerRejected     - node refused the transaction and does not hold it
*/
class MintDispatcher {
 public:
  MintDispatcher(std::shared_ptr<TokenContract> contract, std::shared_ptr<chain::ChainReader> reader, DispatcherOptions options);

  MintOutcome Dispatch(const std::string& recipient, std::uint64_t quantity = 1, const BroadcastHook& on_broadcast = {});

  // Looks up an earlier mint: true/false once a receipt exists, nullopt while unknown.
  std::optional<bool> MintSucceeded(const std::string& mint_tx_hash);

 private:
  void CheckAuthority();
  void CheckSupply(std::uint64_t quantity);
  bool NodeHoldsTransaction(const std::string& mint_tx_hash);
  void AwaitReceipt(const std::string& mint_tx_hash, std::chrono::steady_clock::time_point deadline);

  std::shared_ptr<TokenContract>      contract_;
  std::shared_ptr<chain::ChainReader> reader_;
  DispatcherOptions                   options_;
};

} // namespace mintgate::mint
