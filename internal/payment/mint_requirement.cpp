#include "mint_requirement.hpp"

#include <stdexcept>

#include "internal/chain/address.hpp"

namespace mintgate::payment {

MintRequirement BuildMintRequirement(const mintgate::runtime::config::PaymentConfig& config) {
  MintRequirement requirement;

  auto asset = chain::ParseAddress(config.asset_address());
  if (!asset) {
    throw std::invalid_argument("payment.asset_address is not a valid address");
  }
  auto treasury = chain::ParseAddress(config.treasury_address());
  if (!treasury) {
    throw std::invalid_argument("payment.treasury_address is not a valid address");
  }

  try {
    requirement.min_amount = util::Amount::FromDecimal(config.min_amount());
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument("payment.min_amount must be a decimal integer");
  }

  requirement.asset                   = *asset;
  requirement.treasury                = *treasury;
  requirement.resource                = config.resource();
  requirement.reject_multiple_senders = config.reject_multiple_senders();
  return requirement;
}

} // namespace mintgate::payment
