#pragma once

#include <chrono>
#include <cstdint>

namespace mintgate::util {

// Wall-clock milliseconds since the Unix epoch; used for ledger row timestamps.
std::uint64_t NowMs();

std::uint64_t ToUnixMillis(std::chrono::system_clock::time_point tp);

} // namespace mintgate::util
