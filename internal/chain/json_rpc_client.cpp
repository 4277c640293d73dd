#include "json_rpc_client.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace mintgate::chain {

namespace {

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

std::size_t AppendBody(char* data, std::size_t size, std::size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

struct CurlDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

std::string EncodeRequest(std::uint64_t id, const std::string& method, const google::protobuf::ListValue& params) {
  google::protobuf::Struct request;
  auto&                    fields = *request.mutable_fields();
  fields["jsonrpc"].set_string_value("2.0");
  fields["id"].set_number_value(static_cast<double>(id));
  fields["method"].set_string_value(method);
  *fields["params"].mutable_list_value() = params;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(request, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode json-rpc request: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Value DecodeResponse(const std::string& method, const std::string& body) {
  google::protobuf::Struct                 response;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(body, &response, options);
  if (!status.ok()) {
    throw util::LedgerUnavailable(method + ": malformed response from node");
  }

  const auto& fields = response.fields();
  if (auto error = fields.find("error"); error != fields.end() && error->second.has_struct_value()) {
    const auto& err     = error->second.struct_value().fields();
    long        code    = 0;
    std::string message = "node rejected request";
    if (auto it = err.find("code"); it != err.end() && it->second.kind_case() == google::protobuf::Value::kNumberValue) {
      code = static_cast<long>(it->second.number_value());
    }
    if (auto it = err.find("message"); it != err.end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
      message = it->second.string_value();
    }
    throw util::LedgerRejected(method + ": " + message, code);
  }

  auto result = fields.find("result");
  if (result == fields.end()) {
    throw util::LedgerUnavailable(method + ": response has neither result nor error");
  }
  return result->second;
}

CurlJsonRpcClient::CurlJsonRpcClient(std::string url, std::chrono::milliseconds timeout) : url_(std::move(url)), timeout_(timeout) {
  EnsureCurlInitialized();
}

google::protobuf::Value CurlJsonRpcClient::Call(const std::string& method, const google::protobuf::ListValue& params) {
  const auto body        = EncodeRequest(next_id_.fetch_add(1), method, params);
  long       http_status = 0;
  const auto response    = Post(body, &http_status);

  // Some nodes pair an error object with a 4xx/5xx; prefer the error object when present.
  if (http_status < 200 || http_status >= 300) {
    try {
      (void)DecodeResponse(method, response);
    } catch (const util::LedgerRejected&) {
      throw;
    } catch (const util::LedgerUnavailable&) {
      // fall through to the HTTP status error below
    }
    throw util::LedgerUnavailable(method + ": node returned HTTP " + std::to_string(http_status));
  }

  return DecodeResponse(method, response);
}

std::string CurlJsonRpcClient::Post(const std::string& body, long* http_status) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::LedgerUnavailable("curl_easy_init failed");
  }

  std::unique_ptr<curl_slist, HeaderListDeleter> headers(curl_slist_append(nullptr, "Content-Type: application/json"));

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw util::LedgerUnavailable(std::string("rpc transport: ") + curl_easy_strerror(rc));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, http_status);
  return response;
}

} // namespace mintgate::chain
