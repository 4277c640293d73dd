#pragma once

#include "config/config.pb.h"
#include "mintgate/x402/v1/payment.pb.h"

namespace mintgate::v1 {
using namespace ::mintgate::x402::v1;
}
