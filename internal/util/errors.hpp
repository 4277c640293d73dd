#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mintgate::util {

/*
  Central fault types.

  Every fault carries a stable name (reported to callers as "fault") and
  optional key/value details. They get translated to HTTP status codes at
  the transport boundary (see internal/http/http_error.hpp).
*/

using FaultDetails = std::vector<std::pair<std::string, std::string>>;

class Fault : public std::runtime_error {
 public:
  Fault(std::string name, const std::string& msg, FaultDetails details = {})
      : std::runtime_error(msg), name_(std::move(name)), details_(std::move(details)) {
  }

  const std::string& Name() const {
    return name_;
  }

  const FaultDetails& Details() const {
    return details_;
  }

 private:
  std::string  name_;
  FaultDetails details_;
};

// ------------------------------------------------------------
// Caller input
// ------------------------------------------------------------

class InvalidRequest : public Fault {
 public:
  explicit InvalidRequest(const std::string& msg) : Fault("InvalidRequest", msg) {
  }
};

class InvalidResource : public Fault {
 public:
  InvalidResource(const std::string& msg, FaultDetails details) : Fault("InvalidResource", msg, std::move(details)) {
  }
};

// ------------------------------------------------------------
// Payment validation
// ------------------------------------------------------------

class TransactionNotFound : public Fault {
 public:
  explicit TransactionNotFound(const std::string& msg) : Fault("TransactionNotFound", msg) {
  }
};

class TransactionFailed : public Fault {
 public:
  explicit TransactionFailed(const std::string& msg) : Fault("TransactionFailed", msg) {
  }
};

class NoQualifyingTransfer : public Fault {
 public:
  explicit NoQualifyingTransfer(const std::string& msg) : Fault("NoQualifyingTransfer", msg) {
  }
};

class InsufficientAmount : public Fault {
 public:
  InsufficientAmount(const std::string& msg, FaultDetails details) : Fault("InsufficientAmount", msg, std::move(details)) {
  }
};

class NoRecentPayment : public Fault {
 public:
  explicit NoRecentPayment(const std::string& msg) : Fault("NoRecentPayment", msg) {
  }
};

// ------------------------------------------------------------
// Authority / contract
// ------------------------------------------------------------

class AuthorityMismatch : public Fault {
 public:
  AuthorityMismatch(const std::string& msg, FaultDetails details) : Fault("AuthorityMismatch", msg, std::move(details)) {
  }
};

class MintReverted : public Fault {
 public:
  MintReverted(const std::string& msg, FaultDetails details = {}) : Fault("MintReverted", msg, std::move(details)) {
  }
};

// ------------------------------------------------------------
// Downstream / operator
// ------------------------------------------------------------

class ServerMisconfigured : public Fault {
 public:
  explicit ServerMisconfigured(const std::string& msg) : Fault("ServerMisconfigured", msg) {
  }
};

class LedgerUnavailable : public Fault {
 public:
  explicit LedgerUnavailable(const std::string& msg) : Fault("LedgerUnavailable", msg) {
  }

 protected:
  LedgerUnavailable(std::string name, const std::string& msg, FaultDetails details) : Fault(std::move(name), msg, std::move(details)) {
  }
};

// The node answered with a JSON-RPC error object: the request reached it and was refused.
class LedgerRejected : public LedgerUnavailable {
 public:
  LedgerRejected(const std::string& msg, long code) : LedgerUnavailable("LedgerRejected", msg, {{"code", std::to_string(code)}}), code_(code) {
  }

  long Code() const {
    return code_;
  }

 private:
  long code_;
};

class MintTimeout : public Fault {
 public:
  explicit MintTimeout(const std::string& msg) : Fault("MintTimeout", msg) {
  }
};

// The mint transaction may have been broadcast; only the ledger can tell.
class MintIndeterminate : public Fault {
 public:
  MintIndeterminate(const std::string& msg, std::string mint_tx_hash)
      : Fault("MintIndeterminate", msg, {{"nftTxHash", mint_tx_hash}}), mint_tx_hash_(std::move(mint_tx_hash)) {
  }

  const std::string& MintTxHash() const {
    return mint_tx_hash_;
  }

 private:
  std::string mint_tx_hash_;
};

} // namespace mintgate::util
