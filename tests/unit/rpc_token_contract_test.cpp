#include "internal/mint/rpc_token_contract.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/chain/keccak.hpp"
#include "internal/chain/rpc_ledger.hpp"
#include "support/fakes.hpp"

using namespace mintgate;
using namespace mintgate::testing;

namespace {

const std::string kKeyOne = "0x0000000000000000000000000000000000000000000000000000000000000001";

std::string Word(std::uint64_t value) {
  return util::ToHex(chain::abi::EncodeUint(value));
}

struct Fixture {
  std::shared_ptr<ScriptedJsonRpcClient> rpc    = std::make_shared<ScriptedJsonRpcClient>();
  std::shared_ptr<chain::RpcLedger>      ledger = std::make_shared<chain::RpcLedger>(rpc, 1);
  std::shared_ptr<chain::Signer>         signer = std::make_shared<chain::Signer>(kKeyOne);

  Fixture() {
    rpc->On("eth_call", [](const google::protobuf::ListValue& params) {
      const auto& call = params.values(0).struct_value().fields();
      assert(call.at("to").string_value() == kContract);
      const auto selector = call.at("data").string_value();
      if (selector == "0x8da5cb5b") return StringValue("0x" + std::string(24, '0') + kOperator.substr(2));  // owner()
      if (selector == "0xd1239730") return StringValue(Word(1));                                              // mintEnabled()
      if (selector == "0xa2309ff8") return StringValue(Word(42));                                             // totalMinted()
      if (selector == "0xd5abeb01") return StringValue(Word(10'000));                                         // maxSupply()
      throw util::LedgerRejected("execution reverted", 3);
    });
    rpc->On("eth_getTransactionCount", [](const google::protobuf::ListValue&) { return StringValue("0x5"); });
    rpc->On("eth_gasPrice", [](const google::protobuf::ListValue&) { return StringValue("0x3b9aca00"); });
  }

  mint::RpcTokenContract Contract(std::optional<util::Amount> gas_price = std::nullopt) {
    mint::RpcTokenContractOptions options;
    options.contract_address = kContract;
    options.chain_id         = 8453;
    options.gas_price        = std::move(gas_price);
    return mint::RpcTokenContract(ledger, ledger, signer, std::move(options));
  }
};

void TestReads() {
  Fixture f;
  auto    contract = f.Contract();

  assert(contract.ContractAddress() == kContract);
  assert(contract.OperatorAddress() == kOperator);
  assert(contract.Owner() == kOperator);

  const auto supply = contract.Supply();
  assert(supply.mint_enabled);
  assert(supply.total_minted == util::Amount(42));
  assert(supply.max_supply == util::Amount(10'000));
}

void TestMalformedReturnDataIsUnavailable() {
  Fixture f;
  f.rpc->On("eth_call", [](const google::protobuf::ListValue&) { return StringValue("0x"); });
  auto contract = f.Contract();
  (void)ExpectFault<util::LedgerUnavailable>([&] { (void)contract.Owner(); });
  (void)ExpectFault<util::LedgerUnavailable>([&] { (void)contract.Supply(); });
}

void TestSubmitMintSignsAndBroadcasts() {
  Fixture     f;
  std::string sent_raw;
  f.rpc->On("eth_sendRawTransaction", [&](const google::protobuf::ListValue& params) {
    sent_raw        = params.values(0).string_value();
    const auto raw  = util::FromHex(sent_raw);
    const auto hash = chain::Keccak256(*raw);
    return StringValue(util::ToHex(hash.data(), hash.size()));
  });

  auto        contract = f.Contract();
  std::string announced;
  const auto  hash = contract.SubmitMint(kPayer, 1, [&](const std::string& h) {
    assert(f.rpc->CallsTo("eth_sendRawTransaction") == 0);
    announced = h;
  });

  assert(hash == announced);
  assert(!sent_raw.empty());
  assert(f.rpc->CallsTo("eth_getTransactionCount") == 1);
  assert(f.rpc->CallsTo("eth_gasPrice") == 1);

  // Calldata for mintAfterPayment(payer, 1) is embedded in the raw transaction.
  const auto calldata = util::ToHex(chain::abi::EncodeCall("mintAfterPayment(address,uint256)",
                                                           {chain::abi::EncodeAddress(kPayer), chain::abi::EncodeUint(1)}));
  assert(sent_raw.find(calldata.substr(2)) != std::string::npos);
  assert(sent_raw.find(kContract.substr(2)) != std::string::npos);
}

void TestConfiguredGasPriceSkipsNode() {
  Fixture f;
  f.rpc->On("eth_sendRawTransaction", [](const google::protobuf::ListValue&) { return StringValue("0x" + std::string(64, '1')); });

  auto contract = f.Contract(util::Amount(2'000'000'000));
  (void)contract.SubmitMint(kPayer, 1, {});
  assert(f.rpc->CallsTo("eth_gasPrice") == 0);
}

void TestHookFailureSendsNothing() {
  Fixture f;
  f.rpc->On("eth_sendRawTransaction", [](const google::protobuf::ListValue&) -> google::protobuf::Value {
    assert(false && "must not broadcast");
    return {};
  });

  auto contract = f.Contract();
  bool threw    = false;
  try {
    (void)contract.SubmitMint(kPayer, 1, [](const std::string&) { throw std::runtime_error("ledger down"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReads();
  TestMalformedReturnDataIsUnavailable();
  TestSubmitMintSignsAndBroadcasts();
  TestConfiguredGasPriceSkipsNode();
  TestHookFailureSendsNothing();

  std::cout << "mintgate_unit_rpc_token_contract: pass\n";
  return 0;
}
