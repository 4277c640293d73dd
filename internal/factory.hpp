#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/http/endpoint.hpp"

namespace mintgate::db {
class ProofRepository;
}
namespace mintgate::ledger {
class IdempotencyLedger;
}
namespace mintgate::service {
class PaymentService;
}

namespace mintgate::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<http::Endpoint>> endpoints;

  std::shared_ptr<service::PaymentService>   payment_service;
  std::shared_ptr<ledger::IdempotencyLedger> ledger;
};

// sqlite when configured (schema created on open), memory otherwise.
std::shared_ptr<db::ProofRepository> BuildRepository(const mintgate::runtime::config::DatabaseConfig& database);

/*
  Build

  Composition root: the only place that knows concrete ledger, contract and
  repository types. Throws on invalid configuration.
*/
Application Build(const mintgate::runtime::config::RuntimeConfig& config);

} // namespace mintgate::factory
