#include "memory_tx.hpp"

#include <stdexcept>

namespace mintgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("proof ledger commit after rollback");
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    // The ledger serializes its transactions; a conflict means a writer bypassed it.
    throw std::runtime_error("proof ledger commit conflict: records changed since this transaction began");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.proofs.clear();
  rolled_back_ = true;
}

} // namespace mintgate::db::memory
