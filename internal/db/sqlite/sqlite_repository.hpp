#pragma once

#include <memory>

#include "internal/db/api/proof_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mintgate::db::sqlite {

class SqliteRepository final : public db::ProofRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertProof(Transaction&, const model::ProofRecord&) override;
  std::optional<model::ProofRecord> GetProof(Transaction&, const std::string&) override;
  Result                            UpdateProof(Transaction&, const model::ProofRecord&) override;
  Result                            DeleteProof(Transaction&, const std::string&) override;
  std::vector<model::ProofRecord>   ListProofs(Transaction&, model::ProofState) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace mintgate::db::sqlite
