#include "idempotency_ledger.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::ledger {

using db::model::ProofRecord;
using db::model::ProofState;

namespace {

void ThrowIfFailed(const db::Result& result, const char* operation) {
  if (!result) {
    throw std::runtime_error(std::string("idempotency ledger: ") + operation + " failed: " + result.message);
  }
}

} // namespace

IdempotencyLedger::ProofLock::ProofLock(IdempotencyLedger& owner, std::string key, std::shared_ptr<std::mutex> mutex)
    : owner_(owner), key_(std::move(key)), mutex_(std::move(mutex)), lock_(*mutex_) {
}

IdempotencyLedger::ProofLock::~ProofLock() {
  lock_.unlock();
  owner_.Release(key_, std::move(mutex_));
}

IdempotencyLedger::IdempotencyLedger(std::shared_ptr<db::ProofRepository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("idempotency ledger requires a repository");
  }
}

IdempotencyLedger::ProofLock IdempotencyLedger::Acquire(const std::string& proof_id) {
  auto                        key = util::ToLower(proof_id);
  std::shared_ptr<std::mutex> mutex;
  {
    std::lock_guard<std::mutex> guard(proof_mutexes_guard_);
    auto&                       slot = proof_mutexes_[key];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    mutex = slot;
  }
  return ProofLock(*this, std::move(key), std::move(mutex));
}

void IdempotencyLedger::Release(const std::string& key, std::shared_ptr<std::mutex> mutex) {
  std::lock_guard<std::mutex> guard(proof_mutexes_guard_);
  mutex.reset();
  // Copies are only handed out under the guard, so a count of one means no waiter.
  auto it = proof_mutexes_.find(key);
  if (it != proof_mutexes_.end() && it->second.use_count() == 1) {
    proof_mutexes_.erase(it);
  }
}

bool IdempotencyLedger::IsProcessed(const std::string& proof_id) {
  const auto record = Lookup(proof_id);
  return record && record->state == ProofState::Processed;
}

std::optional<ProofRecord> IdempotencyLedger::Lookup(const std::string& proof_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        tx     = repository_->Begin();
  auto                        record = repository_->GetProof(*tx, util::ToLower(proof_id));
  tx->Commit();
  return record;
}

void IdempotencyLedger::MarkInFlight(const std::string& proof_id, const std::string& recipient, const std::string& mint_tx_hash) {
  const auto key = util::ToLower(proof_id);

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        tx       = repository_->Begin();
  auto                        existing = repository_->GetProof(*tx, key);
  if (existing && existing->state == ProofState::Processed) {
    throw std::logic_error("idempotency ledger: proof already processed: " + key);
  }

  ProofRecord record;
  record.proof_id     = key;
  record.state        = ProofState::InFlight;
  record.recipient    = util::ToLower(recipient);
  record.mint_tx_hash = util::ToLower(mint_tx_hash);

  ThrowIfFailed(existing ? repository_->UpdateProof(*tx, record) : repository_->InsertProof(*tx, record), "mark in-flight");
  tx->Commit();

  MINTGATE_LOG_INFO("Proof marked in-flight", {observability::StringField("proof", key), observability::StringField("mint_tx", record.mint_tx_hash)});
}

void IdempotencyLedger::MarkProcessed(const std::string& proof_id, const std::string& recipient, const std::string& mint_tx_hash) {
  const auto key = util::ToLower(proof_id);

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        tx       = repository_->Begin();
  auto                        existing = repository_->GetProof(*tx, key);

  ProofRecord record;
  record.proof_id     = key;
  record.state        = ProofState::Processed;
  record.recipient    = util::ToLower(recipient);
  record.mint_tx_hash = util::ToLower(mint_tx_hash);

  ThrowIfFailed(existing ? repository_->UpdateProof(*tx, record) : repository_->InsertProof(*tx, record), "mark processed");
  tx->Commit();

  MINTGATE_LOG_INFO("Proof marked processed", {observability::StringField("proof", key), observability::StringField("mint_tx", record.mint_tx_hash)});
}

void IdempotencyLedger::ClearInFlight(const std::string& proof_id) {
  const auto key = util::ToLower(proof_id);

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        tx     = repository_->Begin();
  const auto                  result = repository_->DeleteProof(*tx, key);
  if (result.code == db::ErrorCode::NotFound) {
    return;
  }
  ThrowIfFailed(result, "clear in-flight");
  tx->Commit();

  MINTGATE_LOG_WARN("In-flight marker cleared", {observability::StringField("proof", key)});
}

std::vector<ProofRecord> IdempotencyLedger::InFlight() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        tx      = repository_->Begin();
  auto                        records = repository_->ListProofs(*tx, ProofState::InFlight);
  tx->Commit();
  return records;
}

} // namespace mintgate::ledger
