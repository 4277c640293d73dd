#include "rpc_token_contract.hpp"

#include <stdexcept>

#include "internal/chain/abi.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::mint {

namespace {

constexpr const char* kMintSignature = "mintAfterPayment(address,uint256)";

} // namespace

RpcTokenContract::RpcTokenContract(std::shared_ptr<chain::ChainReader> reader, std::shared_ptr<chain::TransactionSubmitter> submitter,
                                   std::shared_ptr<chain::Signer> signer, RpcTokenContractOptions options)
    : reader_(std::move(reader)), submitter_(std::move(submitter)), signer_(std::move(signer)), options_(std::move(options)) {
  if (!reader_ || !submitter_ || !signer_) {
    throw std::invalid_argument("token contract requires a reader, a submitter and a signer");
  }
}

const std::string& RpcTokenContract::ContractAddress() const {
  return options_.contract_address;
}

const std::string& RpcTokenContract::OperatorAddress() const {
  return signer_->Address();
}

util::Bytes RpcTokenContract::Read(const char* signature) {
  return reader_->Call(options_.contract_address, chain::abi::EncodeCall(signature));
}

std::string RpcTokenContract::Owner() {
  try {
    return chain::abi::DecodeAddress(Read("owner()"));
  } catch (const std::invalid_argument&) {
    throw util::LedgerUnavailable("owner(): contract returned malformed data");
  }
}

SupplyState RpcTokenContract::Supply() {
  try {
    SupplyState state;
    state.mint_enabled = chain::abi::DecodeBool(Read("mintEnabled()"));
    state.total_minted = chain::abi::DecodeUint(Read("totalMinted()"));
    state.max_supply   = chain::abi::DecodeUint(Read("maxSupply()"));
    return state;
  } catch (const std::invalid_argument&) {
    throw util::LedgerUnavailable("supply read: contract returned malformed data");
  }
}

std::string RpcTokenContract::SubmitMint(const std::string& recipient, std::uint64_t quantity, const BroadcastHook& before_send) {
  std::lock_guard<std::mutex> lock(submit_mutex_);

  chain::LegacyTransaction tx;
  tx.nonce     = submitter_->GetPendingNonce(signer_->Address());
  tx.gas_price = options_.gas_price ? *options_.gas_price : submitter_->GetGasPrice();
  tx.gas_limit = options_.gas_limit;
  tx.to        = options_.contract_address;
  tx.data      = chain::abi::EncodeCall(kMintSignature, {chain::abi::EncodeAddress(recipient), chain::abi::EncodeUint(quantity)});

  const auto signed_tx = signer_->SignLegacy(tx, options_.chain_id);
  if (before_send) {
    before_send(signed_tx.hash);
  }

  const auto reported = submitter_->SendRawTransaction(signed_tx.raw);
  if (reported != signed_tx.hash) {
    MINTGATE_LOG_WARN("Node reported a different mint hash",
                      {observability::StringField("expected", signed_tx.hash), observability::StringField("reported", reported)});
  }
  return signed_tx.hash;
}

} // namespace mintgate::mint
