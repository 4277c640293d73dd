#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/chain/chain_reader.hpp"
#include "internal/chain/json_rpc_client.hpp"

namespace mintgate::chain {

/*
  Ethereum JSON-RPC implementation of the ledger interfaces.

  A receipt counts as final once it has min_confirmations blocks on top of
  (and including) its own block. Node answers that do not parse are reported
  as util::LedgerUnavailable.
*/
class RpcLedger final : public ChainReader, public TransactionSubmitter {
 public:
  RpcLedger(std::shared_ptr<JsonRpcClient> rpc, std::uint64_t min_confirmations);

  TransactionOutcome GetTransactionOutcome(const std::string& tx_hash) override;
  std::uint64_t      GetCurrentHeight() override;
  std::vector<LogEvent> ScanEvents(const std::string& asset, std::uint64_t from_height, std::uint64_t to_height,
                                   const TransferFilter& filter) override;
  util::Bytes Call(const std::string& contract, const util::Bytes& calldata) override;
  bool        IsKnownTransaction(const std::string& tx_hash) override;

  std::uint64_t GetPendingNonce(const std::string& address) override;
  util::Amount  GetGasPrice() override;
  std::string   SendRawTransaction(const util::Bytes& raw_transaction) override;

 private:
  std::shared_ptr<JsonRpcClient> rpc_;
  std::uint64_t                  min_confirmations_;
};

} // namespace mintgate::chain
