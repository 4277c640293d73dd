#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/util/amount.hpp"

namespace mintgate::payment {

/*
  What a payment must look like to authorize one mint.
  Built once at startup; addresses are lowercase.
*/
struct MintRequirement {
  std::string  asset;
  std::string  treasury;
  util::Amount min_amount;
  std::string  resource;
  bool         reject_multiple_senders = false;
};

// Throws std::invalid_argument naming the offending field.
MintRequirement BuildMintRequirement(const mintgate::runtime::config::PaymentConfig& config);

} // namespace mintgate::payment
