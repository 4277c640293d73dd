#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/proof_repository.hpp"

namespace mintgate::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::ProofRepository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertProof(Transaction&, const model::ProofRecord&) override;
  std::optional<model::ProofRecord> GetProof(Transaction&, const std::string&) override;
  Result                            UpdateProof(Transaction&, const model::ProofRecord&) override;
  Result                            DeleteProof(Transaction&, const std::string&) override;
  std::vector<model::ProofRecord>   ListProofs(Transaction&, model::ProofState) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ProofRecord> proofs;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace mintgate::db::memory
