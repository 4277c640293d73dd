#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mintgate::chain {

// One emitted log, as reported in a receipt or by eth_getLogs. Hex fields are lowercase.
struct LogEvent {
  std::string              address;
  std::vector<std::string> topics;
  std::string              data;
  std::uint64_t            block_number = 0;
  std::string              transaction_hash;
  std::uint64_t            log_index = 0;
};

struct TransactionOutcome {
  bool                  finalized    = false;
  bool                  success      = false;
  std::uint64_t         block_number = 0;
  std::vector<LogEvent> events;
};

// Matches the indexed parameters of Transfer(address indexed from, address indexed to, uint256).
struct TransferFilter {
  std::optional<std::string> from;
  std::optional<std::string> to;
};

} // namespace mintgate::chain
