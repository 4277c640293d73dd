#include <cassert>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/proof_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/ledger/idempotency_ledger.hpp"
#include "internal/util/time.hpp"

namespace {

using mintgate::db::ErrorCode;
using mintgate::db::ProofRepository;
using mintgate::db::memory::MemoryRepository;
using mintgate::db::model::ProofRecord;
using mintgate::db::model::ProofState;
using mintgate::ledger::IdempotencyLedger;
using mintgate::util::NowMs;

std::string Hash(char c) {
  return "0x" + std::string(64, c);
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<ProofRepository>()> make_repository;
  bool                                              durable = false;
  std::function<void()>                             cleanup;
};

void VerifyInsertReadUpdateDelete(ProofRepository& repo) {
  auto tx = repo.Begin();

  ProofRecord record;
  record.proof_id      = Hash('1');
  record.state         = ProofState::InFlight;
  record.recipient     = "0x2222222222222222222222222222222222222222";
  record.mint_tx_hash  = Hash('a');
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;

  assert(repo.InsertProof(*tx, record));
  assert(repo.InsertProof(*tx, record).code == ErrorCode::AlreadyExists);

  auto read = repo.GetProof(*tx, record.proof_id);
  assert(read.has_value());
  assert(read->state == ProofState::InFlight);
  assert(read->recipient == record.recipient);
  assert(read->mint_tx_hash == record.mint_tx_hash);

  assert(repo.ListProofs(*tx, ProofState::InFlight).size() == 1);
  assert(repo.ListProofs(*tx, ProofState::Processed).empty());

  // An in-flight marker may be withdrawn.
  assert(repo.DeleteProof(*tx, record.proof_id));
  assert(!repo.GetProof(*tx, record.proof_id).has_value());
  assert(repo.DeleteProof(*tx, record.proof_id).code == ErrorCode::NotFound);

  ProofRecord missing = record;
  missing.proof_id    = Hash('2');
  assert(repo.UpdateProof(*tx, missing).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyProcessedIsPermanent(ProofRepository& repo) {
  {
    auto        tx = repo.Begin();
    ProofRecord record;
    record.proof_id     = Hash('3');
    record.state        = ProofState::Processed;
    record.recipient    = "0x2222222222222222222222222222222222222222";
    record.mint_tx_hash = Hash('b');
    assert(repo.InsertProof(*tx, record));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteProof(*tx, Hash('3')).code == ErrorCode::Conflict);
  assert(repo.GetProof(*tx, Hash('3'))->state == ProofState::Processed);
  tx->Commit();
}

void VerifyRollbackBehavior(ProofRepository& repo) {
  {
    auto        tx = repo.Begin();
    ProofRecord record;
    record.proof_id = Hash('4');
    assert(repo.InsertProof(*tx, record));
    tx->Rollback();
  }

  {
    // Dropped without Commit.
    auto        tx = repo.Begin();
    ProofRecord record;
    record.proof_id = Hash('5');
    assert(repo.InsertProof(*tx, record));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetProof(*check_tx, Hash('4')).has_value());
  assert(!repo.GetProof(*check_tx, Hash('5')).has_value());
  check_tx->Commit();
}

void VerifyLedgerLifecycle(const std::shared_ptr<ProofRepository>& repo) {
  IdempotencyLedger ledger(repo);

  const auto proof = "0x" + std::string(64, 'C');
  assert(!ledger.IsProcessed(proof));

  ledger.MarkInFlight(proof, "0x2222222222222222222222222222222222222222", Hash('d'));
  assert(ledger.InFlight().size() == 1);
  assert(!ledger.IsProcessed(proof));

  ledger.ClearInFlight(proof);
  assert(!ledger.Lookup(proof).has_value());
  ledger.ClearInFlight(proof);

  ledger.MarkInFlight(proof, "0x2222222222222222222222222222222222222222", Hash('e'));
  ledger.MarkProcessed(proof, "0x2222222222222222222222222222222222222222", Hash('e'));

  // Keys are case-insensitive.
  assert(ledger.IsProcessed(Hash('c')));
  assert(ledger.Lookup(Hash('c'))->mint_tx_hash == Hash('e'));
  assert(ledger.InFlight().empty());

  bool threw = false;
  try {
    ledger.MarkInFlight(proof, "0x2222222222222222222222222222222222222222", Hash('f'));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void VerifyConcurrentMarks(const std::shared_ptr<ProofRepository>& repo) {
  IdempotencyLedger ledger(repo);

  std::vector<std::thread> workers;
  for (char c : std::string("0123456789")) {
    workers.emplace_back([&ledger, c] {
      const auto proof = "0x" + std::string(63, '7') + c;
      auto       lock  = ledger.Acquire(proof);
      ledger.MarkInFlight(proof, "0x2222222222222222222222222222222222222222", Hash('a'));
      ledger.MarkProcessed(proof, "0x2222222222222222222222222222222222222222", Hash('a'));
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  auto tx = repo->Begin();
  assert(repo->ListProofs(*tx, ProofState::Processed).size() >= 10);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.durable) {
    return;
  }

  {
    IdempotencyLedger ledger(backend.make_repository());
    ledger.MarkProcessed(Hash('8'), "0x2222222222222222222222222222222222222222", Hash('a'));
    ledger.MarkInFlight(Hash('9'), "0x2222222222222222222222222222222222222222", Hash('b'));
  }

  IdempotencyLedger reopened(backend.make_repository());
  assert(reopened.IsProcessed(Hash('8')));

  const auto pending = reopened.InFlight();
  bool       found   = false;
  for (const auto& record : pending) {
    found = found || (record.proof_id == Hash('9') && record.mint_tx_hash == Hash('b'));
  }
  assert(found);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<MemoryRepository>(); },
      .durable         = false,
      .cleanup         = []() {},
  };
}

#if MINTGATE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("mintgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  mintgate::runtime::config::DatabaseConfig config;
  config.mutable_sqlite()->set_path(db_path);
  config.mutable_sqlite()->set_wal_mode(true);

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = [config]() { return mintgate::factory::BuildRepository(config); },
      .durable         = true,
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  {
    auto repo = backend.make_repository();
    VerifyInsertReadUpdateDelete(*repo);
    VerifyProcessedIsPermanent(*repo);
    VerifyRollbackBehavior(*repo);
  }
  VerifyLedgerLifecycle(backend.make_repository());
  VerifyConcurrentMarks(backend.make_repository());
  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if MINTGATE_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "mintgate_integration_repository_parity: pass\n";
  return 0;
}
