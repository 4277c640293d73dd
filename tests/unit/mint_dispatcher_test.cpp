#include "internal/mint/mint_dispatcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "support/fakes.hpp"

using namespace mintgate;
using namespace mintgate::testing;
using namespace std::chrono_literals;

namespace {

struct Fixture {
  std::shared_ptr<FakeChainReader>   reader   = std::make_shared<FakeChainReader>();
  std::shared_ptr<FakeTokenContract> contract = std::make_shared<FakeTokenContract>(reader);

  mint::MintDispatcher Dispatcher(std::chrono::milliseconds timeout = 1s) {
    mint::DispatcherOptions options;
    options.timeout       = timeout;
    options.poll_interval = 1ms;
    return mint::MintDispatcher(contract, reader, options);
  }
};

void TestSuccessfulMint() {
  Fixture     f;
  std::string announced;
  const auto  outcome = f.Dispatcher().Dispatch(kPayer, 1, [&](const std::string& hash) {
    assert(f.contract->submit_calls == 0 && "hook runs before the transaction is sent");
    announced = hash;
  });

  assert(outcome.recipient == kPayer);
  assert(outcome.quantity == 1);
  assert(outcome.mint_tx_hash == announced);
  assert(f.contract->submit_calls == 1);
  assert(f.contract->recipients.front() == kPayer);
}

void TestAuthorityMismatchSendsNothing() {
  Fixture f;
  f.contract->SetOwner(kOther);

  bool hook_called = false;
  const auto fault = ExpectFault<util::AuthorityMismatch>([&] { (void)f.Dispatcher().Dispatch(kPayer, 1, [&](const std::string&) { hook_called = true; }); });

  assert(std::string(fault.what()) == "Misconfiguration: signer is not contract owner");
  assert(fault.Details().size() == 3);
  assert(fault.Details()[0].first == "expected" && fault.Details()[0].second == chain::ToChecksumAddress(kOperator));
  assert(fault.Details()[1].first == "actual" && fault.Details()[1].second == chain::ToChecksumAddress(kOther));
  assert(fault.Details()[2].first == "contract");
  assert(!hook_called);
  assert(f.contract->submit_calls == 0);
}

void TestAuthorityIsReadOnEveryDispatch() {
  Fixture f;
  auto    dispatcher = f.Dispatcher();
  (void)dispatcher.Dispatch(kPayer);
  (void)dispatcher.Dispatch(kPayer);
  assert(f.contract->owner_calls == 2);

  f.contract->SetOwner(kOther);
  (void)ExpectFault<util::AuthorityMismatch>([&] { (void)dispatcher.Dispatch(kPayer); });
}

void TestSupplyPrechecks() {
  Fixture f;

  f.contract->SetSupply(false, 0, 100);
  auto disabled = ExpectFault<util::MintReverted>([&] { (void)f.Dispatcher().Dispatch(kPayer); });
  assert(disabled.Details().at(0).second == "MintDisabled");

  f.contract->SetSupply(true, 100, 100);
  auto sold_out = ExpectFault<util::MintReverted>([&] { (void)f.Dispatcher().Dispatch(kPayer); });
  assert(sold_out.Details().at(0).second == "SoldOut");

  f.contract->SetSupply(true, 99, 100);
  auto exceeded = ExpectFault<util::MintReverted>([&] { (void)f.Dispatcher().Dispatch(kPayer, 2); });
  assert(exceeded.Details().at(0).second == "MaxSupplyExceeded");

  auto zero = ExpectFault<util::MintReverted>([&] { (void)f.Dispatcher().Dispatch(kPayer, 0); });
  assert(zero.Details().at(0).second == "QuantityZero");

  assert(f.contract->submit_calls == 0);

  // The last token is still mintable.
  (void)f.Dispatcher().Dispatch(kPayer, 1);
  assert(f.contract->submit_calls == 1);
}

void TestOnChainRevert() {
  Fixture f;
  f.contract->receipt = FakeTokenContract::Receipt::Reverted;

  const auto fault = ExpectFault<util::MintReverted>([&] { (void)f.Dispatcher().Dispatch(kPayer); });
  assert(fault.Details().at(0).first == "nftTxHash");
}

void TestNoReceiptBeforeDeadlineIsIndeterminate() {
  Fixture f;
  f.contract->receipt = FakeTokenContract::Receipt::Never;

  std::string announced;
  const auto  fault = ExpectFault<util::MintIndeterminate>([&] {
    (void)f.Dispatcher(30ms).Dispatch(kPayer, 1, [&](const std::string& hash) { announced = hash; });
  });
  assert(fault.MintTxHash() == announced);
  assert(f.reader->OutcomeCalls() >= 1);
}

void TestTransientPollFailuresAreRetried() {
  Fixture f;
  f.reader->FailNextReads(2);
  (void)f.Dispatcher().Dispatch(kPayer);
  assert(f.reader->OutcomeCalls() == 3);
}

void TestBroadcastFailures() {
  Fixture f;

  f.contract->send_failure = FakeTokenContract::SendFailure::Rejected;
  const auto rejected      = ExpectFault<util::LedgerRejected>([&] { (void)f.Dispatcher().Dispatch(kPayer); });
  assert(rejected.Code() == -32000);

  f.contract->send_failure = FakeTokenContract::SendFailure::LostInTransit;
  const auto lost          = ExpectFault<util::MintIndeterminate>([&] { (void)f.Dispatcher().Dispatch(kPayer); });
  assert(!lost.MintTxHash().empty());
}

void TestErrorReplyForHeldTransactionIsAwaited() {
  Fixture f;
  f.contract->send_failure = FakeTokenContract::SendFailure::AlreadyKnown;

  std::string announced;
  const auto  outcome = f.Dispatcher().Dispatch(kPayer, 1, [&](const std::string& hash) { announced = hash; });
  assert(outcome.mint_tx_hash == announced);
  assert(f.contract->submit_calls == 1);

  // Still in the mempool when the deadline passes.
  Fixture pending;
  pending.contract->send_failure = FakeTokenContract::SendFailure::AlreadyKnown;
  pending.contract->receipt      = FakeTokenContract::Receipt::Never;
  const auto fault               = ExpectFault<util::MintIndeterminate>([&] {
    (void)pending.Dispatcher(30ms).Dispatch(kPayer, 1, [&](const std::string& hash) { announced = hash; });
  });
  assert(fault.MintTxHash() == announced);
}

void TestRejectionWithUnknownStatusIsIndeterminate() {
  Fixture f;
  f.contract->send_failure = FakeTokenContract::SendFailure::Rejected;
  f.reader->FailNextReads(1);

  std::string announced;
  const auto  fault = ExpectFault<util::MintIndeterminate>([&] {
    (void)f.Dispatcher().Dispatch(kPayer, 1, [&](const std::string& hash) { announced = hash; });
  });
  assert(fault.MintTxHash() == announced);
}

void TestHookFailureAbortsBeforeSend() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.Dispatcher().Dispatch(kPayer, 1, [](const std::string&) { throw std::runtime_error("ledger write failed"); });
  } catch (const util::MintIndeterminate&) {
    assert(false && "nothing was sent; the outcome is known");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "ledger write failed";
  }
  assert(threw);
  assert(f.contract->submit_calls == 0);
}

void TestMintSucceeded() {
  Fixture f;
  auto    dispatcher = f.Dispatcher();
  assert(!dispatcher.MintSucceeded(TxHash(1)).has_value());

  f.reader->SetOutcome(TxHash(1), SuccessfulOutcome({}));
  assert(dispatcher.MintSucceeded(TxHash(1)) == std::optional<bool>(true));

  auto reverted    = SuccessfulOutcome({});
  reverted.success = false;
  f.reader->SetOutcome(TxHash(2), reverted);
  assert(dispatcher.MintSucceeded(TxHash(2)) == std::optional<bool>(false));

  auto pending      = SuccessfulOutcome({});
  pending.finalized = false;
  f.reader->SetOutcome(TxHash(3), pending);
  assert(!dispatcher.MintSucceeded(TxHash(3)).has_value());
}

} // namespace

int main() {
  TestSuccessfulMint();
  TestAuthorityMismatchSendsNothing();
  TestAuthorityIsReadOnEveryDispatch();
  TestSupplyPrechecks();
  TestOnChainRevert();
  TestNoReceiptBeforeDeadlineIsIndeterminate();
  TestTransientPollFailuresAreRetried();
  TestBroadcastFailures();
  TestErrorReplyForHeldTransactionIsAwaited();
  TestRejectionWithUnknownStatusIsIndeterminate();
  TestHookFailureAbortsBeforeSend();
  TestMintSucceeded();

  std::cout << "mintgate_unit_mint_dispatcher: pass\n";
  return 0;
}
