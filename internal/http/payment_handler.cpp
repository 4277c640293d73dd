#include "payment_handler.hpp"

#include <stdexcept>

#include "internal/http/http_error.hpp"
#include "internal/http/json_codec.hpp"

namespace mintgate::http {

namespace {

constexpr const char* kJson = "application/json";

std::string QueryPayer(const httplib::Request& req) {
  return req.has_param("payer") ? req.get_param_value("payer") : std::string{};
}

} // namespace

PaymentHandler::PaymentHandler(std::shared_ptr<service::PaymentService> service, PaymentHandlerOptions options)
    : service_(std::move(service)), options_(std::move(options)) {
  if (!service_) {
    throw std::invalid_argument("payment handler requires a payment service");
  }
}

void PaymentHandler::Register(httplib::Server& server) {
  const auto& path = options_.path;
  server.Get(path, [this](const httplib::Request& req, httplib::Response& res) { HandleGet(req, res); });
  server.Post(path, [this](const httplib::Request& req, httplib::Response& res) { HandlePost(req, res); });

  const auto unsupported = [this](const httplib::Request& req, httplib::Response& res) { HandleUnsupported(req, res); };
  server.Put(path, unsupported);
  server.Patch(path, unsupported);
  server.Delete(path, unsupported);
  server.Options(path, unsupported);
}

void PaymentHandler::HandleGet(const httplib::Request& req, httplib::Response& res) {
  try {
    const auto document = service_->Describe(QueryPayer(req));
    res.status          = options_.requirements_status;
    res.set_content(ToJson(document), kJson);
  } catch (const std::exception& e) {
    WriteError(e, res);
  }
}

void PaymentHandler::HandlePost(const httplib::Request& req, httplib::Response& res) {
  try {
    mintgate::v1::ConfirmPaymentRequest confirm;
    FromJson(req.body.empty() ? std::string("{}") : req.body, &confirm);

    // Payer hint precedence: body, then X-402-Payer, then ?payer=.
    if (confirm.payer().empty()) {
      if (req.has_header("X-402-Payer")) {
        confirm.set_payer(req.get_header_value("X-402-Payer"));
      } else {
        confirm.set_payer(QueryPayer(req));
      }
    }

    const auto response = service_->Confirm(confirm);
    res.status          = 200;
    res.set_content(ToJson(response), kJson);
  } catch (const std::exception& e) {
    WriteError(e, res);
  }
}

void PaymentHandler::HandleUnsupported(const httplib::Request&, httplib::Response& res) {
  mintgate::v1::ErrorResponse body;
  body.set_error("Method not allowed");

  res.status = 405;
  res.set_header("Allow", "GET, POST");
  res.set_content(ToJson(body), kJson);
}

void PaymentHandler::WriteError(const std::exception& e, httplib::Response& res) {
  res.status = ToHttpStatus(e);
  res.set_content(ToJson(ToErrorResponse(e, options_.x402_version)), kJson);
}

} // namespace mintgate::http
