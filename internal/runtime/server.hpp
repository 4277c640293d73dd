#pragma once

#include <httplib.h>

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/http/endpoint.hpp"

namespace mintgate::runtime {

class Server {
 public:
  Server(std::string bind_address, std::size_t worker_threads, std::vector<std::unique_ptr<http::Endpoint>> endpoints);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Binds and starts serving on a background thread. Throws if the port cannot be bound.
  void Start();
  void Wait();
  void Stop();

  int Port() const {
    return port_;
  }

 private:
  std::string                                  bind_address_;
  std::size_t                                  worker_threads_;
  std::vector<std::unique_ptr<http::Endpoint>> endpoints_;
  std::unique_ptr<httplib::Server>             http_server_;
  std::thread                                  listener_;
  int                                          port_ = 0;
};

} // namespace mintgate::runtime
