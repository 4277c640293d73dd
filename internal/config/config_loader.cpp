#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace mintgate::config {

using mintgate::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars carry the "!" tag and always stay strings.
  if (node.Tag() != "!" && (scalar_value == "true" || scalar_value == "false")) {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // Everything else stays a string: the proto3 JSON mapping accepts quoted
  // integers for integer fields, and addresses like 0x... or amounts wider
  // than a double must not round-trip through a number.
  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  if (yaml.IsNull()) {
    return {};
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:8080");
  if (server->worker_threads() == 0) server->set_worker_threads(8);
  if (server->payment_path().empty()) server->set_payment_path("/api/402");
  if (server->requirements_status() == 0) server->set_requirements_status(402);

  auto* ledger = config->mutable_ledger();
  if (ledger->chain_id() == 0) ledger->set_chain_id(8453);
  if (ledger->request_timeout_ms() == 0) ledger->set_request_timeout_ms(10'000);
  if (ledger->lookback_blocks() == 0) ledger->set_lookback_blocks(50'000);
  if (ledger->max_blocks_per_scan() == 0) ledger->set_max_blocks_per_scan(10'000);
  if (ledger->min_confirmations() == 0) ledger->set_min_confirmations(1);

  auto* payment = config->mutable_payment();
  if (payment->x402_version() == 0) payment->set_x402_version(1);
  if (payment->min_amount().empty()) payment->set_min_amount("10000000"); // 10 USDC, 6 decimals
  if (payment->resource().empty()) payment->set_resource("mint:x402apes:1");
  if (payment->network().empty()) payment->set_network("base");
  if (payment->asset_symbol().empty()) payment->set_asset_symbol("USDC");
  if (payment->description().empty()) payment->set_description("Mint one x402Apes NFT automatically after USDC payment confirmation.");
  if (payment->mime_type().empty()) payment->set_mime_type("application/json");
  if (payment->max_timeout_seconds() == 0) payment->set_max_timeout_seconds(600);
  if (!payment->has_extra()) {
    auto& extra = *payment->mutable_extra()->mutable_fields();
    extra["autoConfirm"].set_bool_value(true);
    extra["onePerPayment"].set_bool_value(true);
    extra["project"].set_string_value("x402Apes");
  }

  auto* mint = config->mutable_mint();
  if (mint->gas_limit() == 0) mint->set_gas_limit(300'000);
  if (mint->receipt_poll_interval_ms() == 0) mint->set_receipt_poll_interval_ms(2'000);
  if (mint->confirmation_timeout_seconds() == 0) mint->set_confirmation_timeout_seconds(payment->max_timeout_seconds());

  if (config->logging().level().empty()) config->mutable_logging()->set_level("info");
}

// ------------------------------------------------------------
// Environment overrides
// ------------------------------------------------------------

namespace {

std::uint64_t ParseUnsigned(const char* name, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error(std::string(name) + " must be an unsigned integer");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error(std::string(name) + " is out of range");
  }
}

template <typename Setter>
void Override(const EnvLookup& env, const char* name, Setter&& set) {
  const char* value = env(name);
  if (value && *value) {
    set(std::string(value));
  }
}

} // namespace

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config, const EnvLookup& env) {
  auto* server  = config->mutable_server();
  auto* ledger  = config->mutable_ledger();
  auto* payment = config->mutable_payment();
  auto* mint    = config->mutable_mint();

  Override(env, "MINTGATE_BIND_ADDRESS", [&](const std::string& v) { server->set_bind_address(v); });
  Override(env, "MINTGATE_RPC_URL", [&](const std::string& v) { ledger->set_rpc_url(v); });
  Override(env, "MINTGATE_CHAIN_ID", [&](const std::string& v) { ledger->set_chain_id(ParseUnsigned("MINTGATE_CHAIN_ID", v)); });
  Override(env, "MINTGATE_USDC_ADDRESS", [&](const std::string& v) { payment->set_asset_address(v); });
  Override(env, "MINTGATE_TREASURY_ADDRESS", [&](const std::string& v) { payment->set_treasury_address(v); });
  Override(env, "MINTGATE_NFT_CONTRACT_ADDRESS", [&](const std::string& v) { mint->set_contract_address(v); });
  Override(env, "MINTGATE_OWNER_PRIVATE_KEY", [&](const std::string& v) { mint->set_owner_private_key(v); });
  Override(env, "MINTGATE_X402_VERSION",
           [&](const std::string& v) { payment->set_x402_version(static_cast<std::int32_t>(ParseUnsigned("MINTGATE_X402_VERSION", v))); });
  Override(env, "MINTGATE_X402_RESOURCE", [&](const std::string& v) { payment->set_resource(v); });
  Override(env, "MINTGATE_X402_PRICE_USDC", [&](const std::string& v) {
    if (v.find_first_not_of("0123456789") != std::string::npos) {
      throw std::runtime_error("MINTGATE_X402_PRICE_USDC must be a decimal integer");
    }
    payment->set_min_amount(v);
  });
  Override(env, "MINTGATE_X402_NETWORK", [&](const std::string& v) { payment->set_network(v); });
  Override(env, "MINTGATE_X402_ASSET", [&](const std::string& v) { payment->set_asset_symbol(v); });
  Override(env, "MINTGATE_X402_MAX_TIMEOUT_SECONDS", [&](const std::string& v) {
    payment->set_max_timeout_seconds(static_cast<std::uint32_t>(ParseUnsigned("MINTGATE_X402_MAX_TIMEOUT_SECONDS", v)));
  });
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto status = config.server().requirements_status();
  if (status != 200 && status != 402) {
    throw std::runtime_error("server.requirements_status must be 200 or 402");
  }
  if (config.server().payment_path().empty() || config.server().payment_path().front() != '/') {
    throw std::runtime_error("server.payment_path must start with '/'");
  }
  if (config.ledger().rpc_url().empty()) {
    throw std::runtime_error("ledger.rpc_url is required (or set MINTGATE_RPC_URL)");
  }
  if (config.ledger().chain_id() == 0) {
    throw std::runtime_error("ledger.chain_id must be positive");
  }
  if (config.payment().asset_address().empty()) {
    throw std::runtime_error("payment.asset_address is required (or set MINTGATE_USDC_ADDRESS)");
  }
  if (config.payment().treasury_address().empty()) {
    throw std::runtime_error("payment.treasury_address is required (or set MINTGATE_TREASURY_ADDRESS)");
  }
  if (config.payment().min_amount().find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("payment.min_amount must be a decimal integer");
  }
  if (config.mint().receipt_poll_interval_ms() == 0 || config.mint().confirmation_timeout_seconds() == 0) {
    throw std::runtime_error("mint timing values must be positive");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path is required");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  return LoadFromYaml(path, [](const char* name) -> const char* { return std::getenv(name); });
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path, const EnvLookup& env) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironment(&config, env);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

} // namespace mintgate::config
