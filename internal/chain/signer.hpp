#pragma once

#include <openssl/ec.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/util/amount.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain {

struct LegacyTransaction {
  std::uint64_t nonce = 0;
  util::Amount  gas_price;
  std::uint64_t gas_limit = 0;
  std::string   to;
  util::Amount  value;
  util::Bytes   data;
};

struct SignedTransaction {
  util::Bytes   raw;
  std::string   hash;
  std::uint64_t v = 0;
};

/*
  secp256k1 transaction signer for the operator key.

  Produces EIP-155 replay-protected legacy transactions with low-S signatures.
  The private key never leaves this object and is never logged.
*/
class Signer {
 public:
  // Throws std::invalid_argument when the key is not 32 bytes of hex in [1, n).
  explicit Signer(std::string_view private_key_hex);

  Signer(const Signer&)            = delete;
  Signer& operator=(const Signer&) = delete;

  // Lowercase 0x-prefixed address derived from the public key.
  const std::string& Address() const {
    return address_;
  }

  SignedTransaction SignLegacy(const LegacyTransaction& tx, std::uint64_t chain_id) const;

 private:
  struct EcKeyDeleter {
    void operator()(EC_KEY* key) const {
      EC_KEY_free(key);
    }
  };

  std::unique_ptr<EC_KEY, EcKeyDeleter> key_;
  std::string                           address_;
};

} // namespace mintgate::chain
