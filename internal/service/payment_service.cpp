#include "payment_service.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "internal/core/mint_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payment/requirement_builder.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::service {

using namespace mintgate::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    MINTGATE_LOG_INFO("RPC ok", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
    return result;
  } catch (const util::Fault& fault) {
    MINTGATE_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("fault", fault.Name()),
                                     observability::StringField("error", fault.what()), observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  } catch (const std::exception& ex) {
    MINTGATE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

PaymentService::PaymentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PaymentRequirements PaymentService::Describe(const std::string& payer_hint) {
  return ObserveRpc("PaymentService.Describe", [&] { return ctx_.requirements->Build(payer_hint); });
}

ConfirmPaymentResponse PaymentService::Confirm(const ConfirmPaymentRequest& req) {
  return ObserveRpc("PaymentService.Confirm", [&] {
    if (!ctx_.orchestrator) {
      throw util::ServerMisconfigured("Server misconfigured: missing OWNER_PRIVATE_KEY or NFT_CONTRACT_ADDRESS");
    }

    // Checked before any ledger access.
    if (req.resource() != ctx_.resource) {
      throw util::InvalidResource("Invalid resource", {{"expected", ctx_.resource}, {"received", req.resource()}});
    }

    core::ConfirmResult result;
    if (!req.tx_hash().empty()) {
      result = ctx_.orchestrator->ConfirmTransaction(req.tx_hash());
    } else if (!req.payer().empty()) {
      result = ctx_.orchestrator->ConfirmLatestPayment(req.payer());
    } else {
      throw util::InvalidRequest("Missing txHash and payer; cannot infer payment");
    }

    ConfirmPaymentResponse resp;
    resp.set_ok(true);
    if (result.kind == core::ConfirmResult::Kind::AlreadyProcessed) {
      resp.set_note("Already processed");
      resp.set_tx_hash(result.tx_hash);
      return resp;
    }
    resp.set_minted_to(result.minted_to);
    resp.set_nft_tx_hash(result.mint_tx_hash);
    resp.set_note("Minted automatically after USDC payment confirmation.");
    return resp;
  });
}

} // namespace mintgate::service
