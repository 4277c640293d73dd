#pragma once

#include <httplib.h>

#include <memory>
#include <string>

#include "internal/http/endpoint.hpp"
#include "internal/service/payment_service.hpp"

namespace mintgate::http {

struct PaymentHandlerOptions {
  std::string path                = "/api/402";
  int         requirements_status = 402;
  int         x402_version        = 1;
};

/*
  The x402 payment endpoint.

    GET   -> payment-requirement document (optional ?payer= echo)
    POST  -> confirm payment and mint
    other -> 405, Allow: GET, POST
*/
class PaymentHandler final : public Endpoint {
 public:
  PaymentHandler(std::shared_ptr<service::PaymentService> service, PaymentHandlerOptions options);

  void Register(httplib::Server& server) override;

  void HandleGet(const httplib::Request& req, httplib::Response& res);
  void HandlePost(const httplib::Request& req, httplib::Response& res);
  void HandleUnsupported(const httplib::Request& req, httplib::Response& res);

 private:
  void WriteError(const std::exception& e, httplib::Response& res);

  std::shared_ptr<service::PaymentService> service_;
  PaymentHandlerOptions                    options_;
};

} // namespace mintgate::http
