#include "time.hpp"

namespace mintgate::util {

std::uint64_t ToUnixMillis(std::chrono::system_clock::time_point tp) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

std::uint64_t NowMs() {
  return ToUnixMillis(std::chrono::system_clock::now());
}

} // namespace mintgate::util
