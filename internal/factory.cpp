#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/address.hpp"
#include "internal/chain/json_rpc_client.hpp"
#include "internal/chain/rpc_ledger.hpp"
#include "internal/chain/signer.hpp"
#include "internal/core/mint_orchestrator.hpp"
#include "internal/db/api/proof_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/http/payment_handler.hpp"
#include "internal/ledger/idempotency_ledger.hpp"
#include "internal/mint/mint_dispatcher.hpp"
#include "internal/mint/rpc_token_contract.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payment/mint_requirement.hpp"
#include "internal/payment/payment_discovery.hpp"
#include "internal/payment/payment_verifier.hpp"
#include "internal/payment/requirement_builder.hpp"
#include "internal/service/payment_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/amount.hpp"
#if MINTGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace mintgate::factory {

using mintgate::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

#if MINTGATE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS processed_proof (proof_id TEXT PRIMARY KEY, state INTEGER NOT NULL, recipient TEXT NOT NULL, mint_tx_hash TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS processed_proof_state ON processed_proof(state);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT proof_id,state,recipient,mint_tx_hash,created_at_ms,updated_at_ms FROM processed_proof LIMIT 1;");
}
#endif

std::shared_ptr<core::MintOrchestrator> BuildOrchestrator(const RuntimeConfig& config, const std::shared_ptr<ledger::IdempotencyLedger>& ledger) {
  const auto& mint_config = config.mint();
  if (mint_config.owner_private_key().empty() || mint_config.contract_address().empty()) {
    MINTGATE_LOG_WARN("Minting disabled: owner key or NFT contract address not configured");
    return nullptr;
  }

  auto contract_address = chain::ParseAddress(mint_config.contract_address());
  if (!contract_address) {
    throw std::invalid_argument("mint.contract_address is not a valid address");
  }

  std::shared_ptr<chain::Signer> signer;
  try {
    signer = std::make_shared<chain::Signer>(mint_config.owner_private_key());
  } catch (const std::invalid_argument&) {
    // Never echo key material.
    throw std::invalid_argument("mint.owner_private_key is not a valid secp256k1 key");
  }

  const auto requirement = payment::BuildMintRequirement(config.payment());

  auto rpc        = std::make_shared<chain::CurlJsonRpcClient>(config.ledger().rpc_url(), std::chrono::milliseconds(config.ledger().request_timeout_ms()));
  auto rpc_ledger = std::make_shared<chain::RpcLedger>(std::move(rpc), config.ledger().min_confirmations());

  mint::RpcTokenContractOptions contract_options;
  contract_options.contract_address = *contract_address;
  contract_options.chain_id         = config.ledger().chain_id();
  contract_options.gas_limit        = mint_config.gas_limit();
  if (!mint_config.gas_price_wei().empty()) {
    contract_options.gas_price = util::Amount::FromDecimal(mint_config.gas_price_wei());
  }
  auto contract = std::make_shared<mint::RpcTokenContract>(rpc_ledger, rpc_ledger, signer, std::move(contract_options));

  mint::DispatcherOptions dispatcher_options;
  dispatcher_options.timeout       = std::chrono::seconds(mint_config.confirmation_timeout_seconds());
  dispatcher_options.poll_interval = std::chrono::milliseconds(mint_config.receipt_poll_interval_ms());
  auto dispatcher                  = std::make_shared<mint::MintDispatcher>(contract, rpc_ledger, dispatcher_options);

  payment::DiscoveryWindow window;
  window.lookback_blocks     = config.ledger().lookback_blocks();
  window.max_blocks_per_scan = config.ledger().max_blocks_per_scan();

  auto verifier  = std::make_shared<payment::PaymentVerifier>(rpc_ledger, requirement);
  auto discovery = std::make_shared<payment::PaymentDiscovery>(rpc_ledger, requirement.asset, requirement.treasury, window);

  MINTGATE_LOG_INFO("Minting enabled", {StringField("contract", chain::ToChecksumAddress(*contract_address)),
                                        StringField("operator", chain::ToChecksumAddress(signer->Address()))});
  return std::make_shared<core::MintOrchestrator>(std::move(verifier), std::move(discovery), ledger, std::move(dispatcher));
}

} // namespace

std::shared_ptr<db::ProofRepository> BuildRepository(const mintgate::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if MINTGATE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    MINTGATE_LOG_INFO("Using sqlite proof repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  MINTGATE_LOG_WARN("Using in-memory proof repository; consumed payments are forgotten on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.ledger = std::make_shared<ledger::IdempotencyLedger>(BuildRepository(config.database()));
  for (const auto& pending : app.ledger->InFlight()) {
    MINTGATE_LOG_WARN("Unresolved mint from a previous run; it is re-checked on the next request for this payment",
                      {StringField("proof", pending.proof_id), StringField("mint_tx", pending.mint_tx_hash)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.requirements = std::make_shared<payment::RequirementBuilder>(config.payment());
  ctx.orchestrator = BuildOrchestrator(config, app.ledger);
  ctx.resource     = config.payment().resource();

  app.payment_service = std::make_shared<service::PaymentService>(ctx);

  // ------------------------------------------------------------------
  // HTTP endpoints
  // ------------------------------------------------------------------
  http::PaymentHandlerOptions handler_options;
  handler_options.path                = config.server().payment_path();
  handler_options.requirements_status = static_cast<int>(config.server().requirements_status());
  handler_options.x402_version        = config.payment().x402_version();
  app.endpoints.push_back(std::make_unique<http::PaymentHandler>(app.payment_service, handler_options));

  return app;
}

} // namespace mintgate::factory
