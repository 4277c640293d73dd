#include "http_error.hpp"

#include "internal/util/errors.hpp"

namespace mintgate::http {

int ToHttpStatus(const std::exception& e) {
  using namespace mintgate::util;

  if (dynamic_cast<const TransactionNotFound*>(&e) || dynamic_cast<const NoRecentPayment*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const InvalidRequest*>(&e) || dynamic_cast<const InvalidResource*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const TransactionFailed*>(&e) || dynamic_cast<const NoQualifyingTransfer*>(&e) ||
      dynamic_cast<const InsufficientAmount*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const AuthorityMismatch*>(&e) || dynamic_cast<const MintReverted*>(&e)) {
    return 400;
  }

  // ServerMisconfigured, LedgerUnavailable, MintTimeout, MintIndeterminate and anything unexpected.
  return 500;
}

mintgate::v1::ErrorResponse ToErrorResponse(const std::exception& e, int x402_version) {
  mintgate::v1::ErrorResponse body;
  body.set_x402_version(x402_version);
  body.set_error(e.what());

  if (const auto* fault = dynamic_cast<const util::Fault*>(&e)) {
    body.set_fault(fault->Name());
    for (const auto& [key, value] : fault->Details()) {
      (*body.mutable_details())[key] = value;
    }
  } else {
    body.set_fault("InternalError");
  }
  return body;
}

} // namespace mintgate::http
