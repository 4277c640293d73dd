#include "internal/service/payment_service.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>

#include "support/harness.hpp"

using namespace mintgate;
using namespace mintgate::testing;

namespace {

const std::string kPaymentTx = "0x" + std::string(64, 'a');

v1::ConfirmPaymentRequest Request(const std::string& resource, const std::string& tx_hash, const std::string& payer = {}) {
  v1::ConfirmPaymentRequest req;
  req.set_resource(resource);
  req.set_tx_hash(tx_hash);
  req.set_payer(payer);
  return req;
}

void TestDescribe() {
  MintHarness h;
  auto        service = h.Service();

  const auto document = service->Describe("");
  assert(document.accepts(0).max_amount_required() == "10000000");
  assert(document.payer().empty());
  assert(service->Describe(kPayer).payer() == kPayer);

  // Describing never needs the mint path.
  assert(h.Service(false)->Describe("").accepts_size() == 1);
  assert(h.reader->TotalCalls() == 0);
}

void TestConfirmMintsThenReportsAlreadyProcessed() {
  MintHarness h;
  h.Pay(kPaymentTx, kPayer, 10'000'000);
  auto service = h.Service();

  const auto minted = service->Confirm(Request(kResource, kPaymentTx));
  assert(minted.ok());
  assert(minted.minted_to() == chain::ToChecksumAddress(kPayer));
  assert(!minted.nft_tx_hash().empty());
  assert(minted.note() == "Minted automatically after USDC payment confirmation.");

  const auto repeat = service->Confirm(Request(kResource, kPaymentTx));
  assert(repeat.ok());
  assert(repeat.note() == "Already processed");
  assert(repeat.tx_hash() == kPaymentTx);
  assert(repeat.nft_tx_hash().empty());
}

void TestResourceMismatchTouchesNothing() {
  MintHarness h;
  h.Pay(kPaymentTx, kPayer, 10'000'000);
  auto service = h.Service();

  const auto fault = ExpectFault<util::InvalidResource>([&] { (void)service->Confirm(Request("mint:other:9", kPaymentTx)); });
  assert(std::string(fault.what()) == "Invalid resource");
  assert(fault.Details().at(0) == std::make_pair(std::string("expected"), kResource));
  assert(fault.Details().at(1) == std::make_pair(std::string("received"), std::string("mint:other:9")));

  assert(h.reader->TotalCalls() == 0);
  assert(h.contract->owner_calls == 0);
  assert(!h.ledger->Lookup(kPaymentTx));

  // An absent resource is a mismatch too.
  (void)ExpectFault<util::InvalidResource>([&] { (void)service->Confirm(Request("", kPaymentTx)); });
  assert(h.reader->TotalCalls() == 0);
}

void TestMisconfiguredServer() {
  MintHarness h;
  auto        service = h.Service(false);

  const auto fault = ExpectFault<util::ServerMisconfigured>([&] { (void)service->Confirm(Request(kResource, kPaymentTx)); });
  assert(std::string(fault.what()) == "Server misconfigured: missing OWNER_PRIVATE_KEY or NFT_CONTRACT_ADDRESS");
  assert(h.reader->TotalCalls() == 0);
}

void TestMissingProofAndPayer() {
  MintHarness h;
  auto        service = h.Service();

  const auto fault = ExpectFault<util::InvalidRequest>([&] { (void)service->Confirm(Request(kResource, "")); });
  assert(std::string(fault.what()) == "Missing txHash and payer; cannot infer payment");
}

void TestTxHashWinsOverPayer() {
  MintHarness h;
  h.Pay(TxHash(1), kPayer, 10'000'000, 300);
  h.Pay(TxHash(2), kOther, 10'000'000, 450);
  auto service = h.Service();

  const auto resp = service->Confirm(Request(kResource, TxHash(1), kOther));
  assert(resp.minted_to() == chain::ToChecksumAddress(kPayer));
}

void TestPayerDiscovery() {
  MintHarness h;
  h.Pay(TxHash(7), kPayer, 10'000'000, 450);
  auto service = h.Service();

  const auto resp = service->Confirm(Request(kResource, "", chain::ToChecksumAddress(kPayer)));
  assert(resp.minted_to() == chain::ToChecksumAddress(kPayer));
  assert(h.ledger->IsProcessed(TxHash(7)));
}

} // namespace

int main() {
  TestDescribe();
  TestConfirmMintsThenReportsAlreadyProcessed();
  TestResourceMismatchTouchesNothing();
  TestMisconfiguredServer();
  TestMissingProofAndPayer();
  TestTxHashWinsOverPayer();
  TestPayerDiscovery();

  std::cout << "mintgate_unit_payment_service: pass\n";
  return 0;
}
