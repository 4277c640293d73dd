#pragma once

#include <string>

#include "mintgate/v1.hpp"

namespace mintgate::payment {

/*
  Builds the x402 payment-requirement document served on GET.
  No chain access; the document is a pure function of configuration
  (plus the optional payer echo).
*/
class RequirementBuilder {
 public:
  explicit RequirementBuilder(const mintgate::runtime::config::PaymentConfig& config);

  mintgate::v1::PaymentRequirements Build(const std::string& payer = {}) const;

 private:
  mintgate::v1::PaymentRequirements document_;
};

} // namespace mintgate::payment
