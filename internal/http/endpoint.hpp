#pragma once

#include <httplib.h>

namespace mintgate::http {

// A set of routes mounted on the HTTP server.
class Endpoint {
 public:
  virtual ~Endpoint() = default;

  virtual void Register(httplib::Server& server) = 0;
};

} // namespace mintgate::http
