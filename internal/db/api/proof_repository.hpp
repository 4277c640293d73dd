#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/proof_record.hpp"

namespace mintgate::db {

/*
  Repository abstraction for consumed payment proofs.

  GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its own writes
  - A committed PROCESSED row is never removed

  The DB is the source of truth for which payments have minted.
*/

class ProofRepository {
 public:
  virtual ~ProofRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertProof(Transaction&, const model::ProofRecord&) = 0;

  virtual std::optional<model::ProofRecord> GetProof(Transaction&, const std::string& proof_id) = 0;

  virtual Result UpdateProof(Transaction&, const model::ProofRecord&) = 0;

  virtual Result DeleteProof(Transaction&, const std::string& proof_id) = 0;

  virtual std::vector<model::ProofRecord> ListProofs(Transaction&, model::ProofState state) = 0;
};

} // namespace mintgate::db
