#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/chain/types.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain {

/*
  Read-only ledger access.

  - Never retries; callers own the retry policy.
  - GetTransactionOutcome throws util::TransactionNotFound while the ledger
    has no receipt (which may only mean "not yet included"). A receipt
    without a block yet comes back with finalized == false.
  - Transport failures throw util::LedgerUnavailable.
*/
class ChainReader {
 public:
  virtual ~ChainReader() = default;

  virtual TransactionOutcome GetTransactionOutcome(const std::string& tx_hash) = 0;

  virtual std::uint64_t GetCurrentHeight() = 0;

  // Transfer events emitted by `asset` in [from_height, to_height], ascending by (block, log index).
  virtual std::vector<LogEvent> ScanEvents(const std::string& asset, std::uint64_t from_height, std::uint64_t to_height,
                                           const TransferFilter& filter) = 0;

  // eth_call against the latest block.
  virtual util::Bytes Call(const std::string& contract, const util::Bytes& calldata) = 0;

  // True while the node holds the transaction, pending or mined.
  virtual bool IsKnownTransaction(const std::string& tx_hash) = 0;
};

/*
  State-changing ledger access used by the mint path only.
*/
class TransactionSubmitter {
 public:
  virtual ~TransactionSubmitter() = default;

  virtual std::uint64_t GetPendingNonce(const std::string& address) = 0;
  virtual util::Amount  GetGasPrice()                               = 0;

  // Returns the transaction hash reported by the node.
  virtual std::string SendRawTransaction(const util::Bytes& raw_transaction) = 0;
};

} // namespace mintgate::chain
