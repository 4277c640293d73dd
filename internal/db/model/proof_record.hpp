#pragma once

#include <cstdint>
#include <string>

namespace mintgate::db::model {

enum class ProofState : int {
  InFlight  = 1,
  Processed = 2,
};

/*
  One consumed (or being consumed) payment proof.

  proof_id is the lowercase payment transaction hash. mint_tx_hash is known
  before broadcast, so an IN_FLIGHT row always names the mint to look for.
*/
struct ProofRecord {
  std::string proof_id;
  ProofState  state = ProofState::InFlight;

  std::string recipient;
  std::string mint_tx_hash;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

inline const char* ToString(ProofState state) {
  switch (state) {
    case ProofState::InFlight:
      return "IN_FLIGHT";
    case ProofState::Processed:
      return "PROCESSED";
  }
  return "UNKNOWN";
}

} // namespace mintgate::db::model
