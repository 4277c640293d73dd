#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mintgate/v1.hpp"

namespace httplib {
class Client;
}

namespace mintgate::client {

/*
  Typed HTTP client for the payment endpoint.

  Transport failures throw std::runtime_error. Any HTTP status is returned
  to the caller; error bodies are decoded into `error`.
*/
class MintgateClient {
 public:
  template <typename T>
  struct Reply {
    int                                        status = 0;
    std::optional<T>                           body;
    std::optional<mintgate::v1::ErrorResponse> error;
  };

  // base_url: "http://host:port"
  MintgateClient(const std::string& base_url, std::string path = "/api/402");
  ~MintgateClient();

  Reply<mintgate::v1::PaymentRequirements> Describe(const std::string& payer = {}) const;

  // payer_header, when set, is sent as X-402-Payer.
  Reply<mintgate::v1::ConfirmPaymentResponse> Confirm(const mintgate::v1::ConfirmPaymentRequest& request,
                                                      const std::string&                         payer_header = {}) const;

 private:
  std::unique_ptr<httplib::Client> http_;
  std::string                      path_;
};

} // namespace mintgate::client
