#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/proof_repository.hpp"

namespace mintgate::ledger {

/*
  Exactly-once consumption of payment proofs.

  Keys are lowercase transaction hashes. A proof moves
  (absent) -> IN_FLIGHT -> PROCESSED, and back to absent only through
  ClearInFlight when the recorded mint is known not to have happened.
  Every write is committed before the call returns.

  Callers hold Acquire(proof) across the whole check-verify-dispatch
  sequence; the ledger itself does not enforce that ordering.
*/
class IdempotencyLedger {
 public:
  class ProofLock {
   public:
    ~ProofLock();

    ProofLock(const ProofLock&)            = delete;
    ProofLock& operator=(const ProofLock&) = delete;

   private:
    friend class IdempotencyLedger;
    ProofLock(IdempotencyLedger& owner, std::string key, std::shared_ptr<std::mutex> mutex);

    IdempotencyLedger&           owner_;
    std::string                  key_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  explicit IdempotencyLedger(std::shared_ptr<db::ProofRepository> repository);

  // Blocks until no other holder of the same proof remains.
  ProofLock Acquire(const std::string& proof_id);

  bool                                  IsProcessed(const std::string& proof_id);
  std::optional<db::model::ProofRecord> Lookup(const std::string& proof_id);

  void MarkInFlight(const std::string& proof_id, const std::string& recipient, const std::string& mint_tx_hash);
  void MarkProcessed(const std::string& proof_id, const std::string& recipient, const std::string& mint_tx_hash);
  void ClearInFlight(const std::string& proof_id);

  std::vector<db::model::ProofRecord> InFlight();

 private:
  void Release(const std::string& key, std::shared_ptr<std::mutex> mutex);

  std::shared_ptr<db::ProofRepository> repository_;

  // Serializes repository transactions; they are short and the memory
  // backend rejects overlapping commits.
  std::mutex write_mutex_;

  std::mutex                                                   proof_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> proof_mutexes_;
};

} // namespace mintgate::ledger
