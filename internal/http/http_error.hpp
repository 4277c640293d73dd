#pragma once

#include <exception>

#include "mintgate/v1.hpp"

namespace mintgate::http {

// 400 caller faults, 404 proof/payment not found, 500 everything downstream or unknown.
int ToHttpStatus(const std::exception& e);

mintgate::v1::ErrorResponse ToErrorResponse(const std::exception& e, int x402_version);

} // namespace mintgate::http
