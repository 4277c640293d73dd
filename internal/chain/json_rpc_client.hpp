#pragma once

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace mintgate::chain {

/*
  JSON-RPC 2.0 transport.

  Call() returns the "result" member of the response (null_value when the
  node answered null). A response carrying an "error" object throws
  util::LedgerRejected; everything that prevents a well-formed answer
  (connect, timeout, HTTP status, malformed JSON) throws util::LedgerUnavailable.
*/
class JsonRpcClient {
 public:
  virtual ~JsonRpcClient() = default;

  virtual google::protobuf::Value Call(const std::string& method, const google::protobuf::ListValue& params) = 0;
};

// libcurl-backed client. One easy handle per call; safe to share across threads.
class CurlJsonRpcClient final : public JsonRpcClient {
 public:
  CurlJsonRpcClient(std::string url, std::chrono::milliseconds timeout);

  google::protobuf::Value Call(const std::string& method, const google::protobuf::ListValue& params) override;

 private:
  std::string Post(const std::string& body, long* http_status);

  std::string                url_;
  std::chrono::milliseconds  timeout_;
  std::atomic<std::uint64_t> next_id_{1};
};

// Builds a JSON-RPC request envelope; exposed for tests and the CLI.
std::string EncodeRequest(std::uint64_t id, const std::string& method, const google::protobuf::ListValue& params);

// Extracts "result" from a response body using the same error rules as Call().
google::protobuf::Value DecodeResponse(const std::string& method, const std::string& body);

} // namespace mintgate::chain
