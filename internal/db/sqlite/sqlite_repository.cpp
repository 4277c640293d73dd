#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace mintgate::db::sqlite {

using mintgate::db::ErrorCode;
using mintgate::db::Result;

namespace {

// Finalizes on scope exit so early returns cannot leak statements.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

model::ProofRecord ReadRow(sqlite3_stmt* st) {
  model::ProofRecord r;
  r.proof_id      = ColText(st, 0);
  r.state         = static_cast<model::ProofState>(sqlite3_column_int(st, 1));
  r.recipient     = ColText(st, 2);
  r.mint_tx_hash  = ColText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::InsertProof(Transaction& t, const model::ProofRecord& r) {
  auto* db = TX(t).Handle();

  if (GetProof(t, r.proof_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "proof already recorded: " + r.proof_id);
  }

  Statement st(db, "INSERT INTO processed_proof(proof_id,state,recipient,mint_tx_hash,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const auto created_at = r.created_at_ms ? r.created_at_ms : util::NowMs();
  BindText(st.get(), 1, r.proof_id);
  BindI32(st.get(), 2, static_cast<int>(r.state));
  BindText(st.get(), 3, r.recipient);
  BindText(st.get(), 4, r.mint_tx_hash);
  BindU64(st.get(), 5, created_at);
  BindU64(st.get(), 6, r.updated_at_ms ? r.updated_at_ms : created_at);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProofRecord> SqliteRepository::GetProof(Transaction& t, const std::string& proof_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT proof_id,state,recipient,mint_tx_hash,created_at_ms,updated_at_ms FROM processed_proof WHERE proof_id=?;");
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }

  BindText(st.get(), 1, proof_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite read proof: ") + sqlite3_errmsg(db));
  }
  return ReadRow(st.get());
}

Result SqliteRepository::UpdateProof(Transaction& t, const model::ProofRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE processed_proof SET state=?,recipient=?,mint_tx_hash=?,updated_at_ms=? WHERE proof_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.state));
  BindText(st.get(), 2, r.recipient);
  BindText(st.get(), 3, r.mint_tx_hash);
  BindU64(st.get(), 4, util::NowMs());
  BindText(st.get(), 5, r.proof_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "proof not recorded: " + r.proof_id);
  return Result::Ok();
}

Result SqliteRepository::DeleteProof(Transaction& t, const std::string& proof_id) {
  auto* db = TX(t).Handle();

  auto existing = GetProof(t, proof_id);
  if (!existing) return Result::Err(ErrorCode::NotFound, "proof not recorded: " + proof_id);
  if (existing->state == model::ProofState::Processed) {
    return Result::Err(ErrorCode::Conflict, "processed proofs are permanent: " + proof_id);
  }

  Statement st(db, "DELETE FROM processed_proof WHERE proof_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, proof_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ProofRecord> SqliteRepository::ListProofs(Transaction& t, model::ProofState state) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT proof_id,state,recipient,mint_tx_hash,created_at_ms,updated_at_ms FROM processed_proof WHERE state=? ORDER BY proof_id;");
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }

  BindI32(st.get(), 1, static_cast<int>(state));

  std::vector<model::ProofRecord> out;
  int                             rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRow(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite list proofs: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace mintgate::db::sqlite
