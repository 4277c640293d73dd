#include "client/cpp/mintgate_client.h"

#include <httplib.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/http/json_codec.hpp"

namespace mintgate::client {

namespace {

constexpr const char* kJson = "application/json";

template <typename T>
MintgateClient::Reply<T> Decode(const httplib::Result& result, std::string_view action, bool accept_402) {
  if (!result) {
    throw std::runtime_error(std::string(action) + " failed: " + httplib::to_string(result.error()));
  }

  MintgateClient::Reply<T> reply;
  reply.status = result->status;

  // The requirements document is served with 402 unless configured otherwise.
  if (result->status == 200 || (accept_402 && result->status == 402)) {
    T body;
    http::FromJson(result->body, &body);
    reply.body = std::move(body);
  } else {
    mintgate::v1::ErrorResponse error;
    http::FromJson(result->body.empty() ? std::string("{}") : result->body, &error);
    reply.error = std::move(error);
  }
  return reply;
}

} // namespace

MintgateClient::MintgateClient(const std::string& base_url, std::string path)
    : http_(std::make_unique<httplib::Client>(base_url)), path_(std::move(path)) {
  if (!http_->is_valid()) {
    throw std::invalid_argument("invalid server url: " + base_url);
  }
  http_->set_connection_timeout(5, 0);
  // Confirmation waits for a mint receipt; allow for the full dispatch deadline.
  http_->set_read_timeout(660, 0);
}

MintgateClient::~MintgateClient() = default;

MintgateClient::Reply<mintgate::v1::PaymentRequirements> MintgateClient::Describe(const std::string& payer) const {
  httplib::Params params;
  if (!payer.empty()) {
    params.emplace("payer", payer);
  }
  return Decode<mintgate::v1::PaymentRequirements>(http_->Get(path_, params, httplib::Headers{}), "describe", true);
}

MintgateClient::Reply<mintgate::v1::ConfirmPaymentResponse> MintgateClient::Confirm(const mintgate::v1::ConfirmPaymentRequest& request,
                                                                                    const std::string& payer_header) const {
  httplib::Headers headers;
  if (!payer_header.empty()) {
    headers.emplace("X-402-Payer", payer_header);
  }
  return Decode<mintgate::v1::ConfirmPaymentResponse>(http_->Post(path_, headers, http::ToJson(request), kJson), "confirm", false);
}

} // namespace mintgate::client
