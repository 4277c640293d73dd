#pragma once

#include <string>

#include "internal/service/service_context.hpp"
#include "mintgate/v1.hpp"

namespace mintgate::service {

class PaymentService {
 public:
  explicit PaymentService(ServiceContext ctx);

  mintgate::v1::PaymentRequirements Describe(const std::string& payer_hint);

  // Throws util::Fault subclasses; see internal/http/http_error.hpp for the status mapping.
  mintgate::v1::ConfirmPaymentResponse Confirm(const mintgate::v1::ConfirmPaymentRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace mintgate::service
