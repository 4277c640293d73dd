#include "server.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace mintgate::runtime {

namespace {

std::pair<std::string, int> SplitHostPort(const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos || colon + 1 == bind_address.size()) {
    throw std::invalid_argument("server.bind_address must be host:port, got '" + bind_address + "'");
  }

  const auto host = bind_address.substr(0, colon);
  const auto port = std::stoi(bind_address.substr(colon + 1));
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("server.bind_address port out of range: " + bind_address);
  }
  return {host.empty() ? "0.0.0.0" : host, port};
}

} // namespace

Server::Server(std::string bind_address, std::size_t worker_threads, std::vector<std::unique_ptr<http::Endpoint>> endpoints)
    : bind_address_(std::move(bind_address)), worker_threads_(worker_threads ? worker_threads : 8), endpoints_(std::move(endpoints)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  const auto [host, port] = SplitHostPort(bind_address_);

  http_server_         = std::make_unique<httplib::Server>();
  const auto n_workers = worker_threads_;
  http_server_->new_task_queue = [n_workers] { return new httplib::ThreadPool(n_workers); };

  http_server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    MINTGATE_LOG_INFO("HTTP request", {observability::StringField("method", req.method), observability::StringField("path", req.path),
                                       observability::IntField("status", res.status)});
  });

  for (const auto& endpoint : endpoints_) {
    endpoint->Register(*http_server_);
  }

  if (port == 0) {
    port_ = http_server_->bind_to_any_port(host);
  } else if (http_server_->bind_to_port(host, port)) {
    port_ = port;
  } else {
    port_ = -1;
  }
  if (port_ < 0) {
    http_server_.reset();
    throw std::runtime_error("Failed to bind HTTP server on " + bind_address_);
  }

  listener_ = std::thread([this] { http_server_->listen_after_bind(); });
  MINTGATE_LOG_INFO("HTTP server listening", {observability::StringField("host", host), observability::IntField("port", port_)});
}

void Server::Wait() {
  if (listener_.joinable()) listener_.join();
}

void Server::Stop() {
  if (http_server_) {
    http_server_->stop();
  }
  Wait();
  http_server_.reset();
}

} // namespace mintgate::runtime
