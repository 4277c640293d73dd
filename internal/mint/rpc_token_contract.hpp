#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/chain/chain_reader.hpp"
#include "internal/chain/signer.hpp"
#include "internal/mint/token_contract.hpp"

namespace mintgate::mint {

struct RpcTokenContractOptions {
  std::string                 contract_address;
  std::uint64_t               chain_id  = 0;
  std::uint64_t               gas_limit = 300'000;
  std::optional<util::Amount> gas_price;  // nullopt: ask the node
};

/*
  TokenContract over JSON-RPC.

  Mints call mintAfterPayment(address,uint256) as EIP-155 legacy
  transactions. Nonce assignment and broadcast are serialized so
  concurrent mints for different proofs never share a nonce.
*/
class RpcTokenContract final : public TokenContract {
 public:
  RpcTokenContract(std::shared_ptr<chain::ChainReader> reader, std::shared_ptr<chain::TransactionSubmitter> submitter,
                   std::shared_ptr<chain::Signer> signer, RpcTokenContractOptions options);

  const std::string& ContractAddress() const override;
  const std::string& OperatorAddress() const override;
  std::string        Owner() override;
  SupplyState        Supply() override;
  std::string        SubmitMint(const std::string& recipient, std::uint64_t quantity, const BroadcastHook& before_send) override;

 private:
  util::Bytes Read(const char* signature);

  std::shared_ptr<chain::ChainReader>          reader_;
  std::shared_ptr<chain::TransactionSubmitter> submitter_;
  std::shared_ptr<chain::Signer>               signer_;
  RpcTokenContractOptions                      options_;
  std::mutex                                   submit_mutex_;
};

} // namespace mintgate::mint
