#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace mintgate::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertProof(Transaction& t, const model::ProofRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.proofs.contains(r.proof_id)) return Result::Err(ErrorCode::AlreadyExists, "proof already recorded: " + r.proof_id);

  auto record = r;
  if (record.created_at_ms == 0) record.created_at_ms = util::NowMs();
  if (record.updated_at_ms == 0) record.updated_at_ms = record.created_at_ms;
  s.proofs[r.proof_id] = std::move(record);
  return Result::Ok();
}

std::optional<model::ProofRecord> MemoryRepository::GetProof(Transaction& t, const std::string& proof_id) {
  const auto& s  = TX(t).View();
  auto        it = s.proofs.find(proof_id);
  if (it == s.proofs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateProof(Transaction& t, const model::ProofRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.proofs.find(r.proof_id);
  if (it == s.proofs.end()) return Result::Err(ErrorCode::NotFound, "proof not recorded: " + r.proof_id);

  const auto created_at    = it->second.created_at_ms;
  it->second               = r;
  it->second.created_at_ms = created_at;
  it->second.updated_at_ms = util::NowMs();
  return Result::Ok();
}

Result MemoryRepository::DeleteProof(Transaction& t, const std::string& proof_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.proofs.find(proof_id);
  if (it == s.proofs.end()) return Result::Err(ErrorCode::NotFound, "proof not recorded: " + proof_id);
  if (it->second.state == model::ProofState::Processed) {
    return Result::Err(ErrorCode::Conflict, "processed proofs are permanent: " + proof_id);
  }
  s.proofs.erase(it);
  return Result::Ok();
}

std::vector<model::ProofRecord> MemoryRepository::ListProofs(Transaction& t, model::ProofState state) {
  std::vector<model::ProofRecord> out;
  for (const auto& [_, record] : TX(t).View().proofs) {
    if (record.state == state) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.proof_id < b.proof_id; });
  return out;
}

} // namespace mintgate::db::memory
