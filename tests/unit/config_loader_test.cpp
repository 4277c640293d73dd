#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace {

using mintgate::config::ConfigLoader;
using mintgate::config::EnvLookup;

constexpr const char* kMinimal = R"(ledger:
  rpc_url: "http://127.0.0.1:8545"
payment:
  asset_address: "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913"
  treasury_address: "0x1111111111111111111111111111111111111111"
)";

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mintgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

EnvLookup NoEnv() {
  return [](const char*) -> const char* { return nullptr; };
}

EnvLookup EnvFrom(const std::map<std::string, std::string>& values) {
  return [values](const char* name) -> const char* {
    auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsMatchTheReferenceDeployment() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("defaults", kMinimal).string(), NoEnv());

  assert(config.server().bind_address() == "0.0.0.0:8080");
  assert(config.server().payment_path() == "/api/402");
  assert(config.server().requirements_status() == 402);
  assert(config.ledger().chain_id() == 8453);
  assert(config.ledger().lookback_blocks() == 50'000);

  const auto& payment = config.payment();
  assert(payment.x402_version() == 1);
  assert(payment.min_amount() == "10000000");
  assert(payment.resource() == "mint:x402apes:1");
  assert(payment.network() == "base");
  assert(payment.asset_symbol() == "USDC");
  assert(payment.description() == "Mint one x402Apes NFT automatically after USDC payment confirmation.");
  assert(payment.mime_type() == "application/json");
  assert(payment.max_timeout_seconds() == 600);
  assert(payment.extra().fields().at("autoConfirm").bool_value());
  assert(payment.extra().fields().at("project").string_value() == "x402Apes");

  assert(config.mint().gas_limit() == 300'000);
  assert(config.mint().confirmation_timeout_seconds() == 600);
  assert(!config.database().has_sqlite());
}

void TestEnvironmentOverridesYaml() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("env", kMinimal).string(),
                                                 EnvFrom({{"MINTGATE_RPC_URL", "https://node.example"},
                                                          {"MINTGATE_OWNER_PRIVATE_KEY", "0x01"},
                                                          {"MINTGATE_X402_PRICE_USDC", "2500000"},
                                                          {"MINTGATE_X402_RESOURCE", "mint:other:2"},
                                                          {"MINTGATE_X402_MAX_TIMEOUT_SECONDS", "120"},
                                                          {"MINTGATE_CHAIN_ID", "84532"}}));

  assert(config.ledger().rpc_url() == "https://node.example");
  assert(config.mint().owner_private_key() == "0x01");
  assert(config.payment().min_amount() == "2500000");
  assert(config.payment().resource() == "mint:other:2");
  assert(config.payment().max_timeout_seconds() == 120);
  assert(config.ledger().chain_id() == 84532);
  // The dispatch deadline follows the advertised timeout unless set explicitly.
  assert(config.mint().confirmation_timeout_seconds() == 120);
}

void TestMalformedEnvironmentIsRejected() {
  const auto path = WriteYaml("bad_env", kMinimal).string();
  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(path, EnvFrom({{"MINTGATE_X402_PRICE_USDC", "10.5"}})); }));
  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(path, EnvFrom({{"MINTGATE_CHAIN_ID", "base"}})); }));
}

void TestAddressesAndAmountsStayStrings() {
  // Unquoted hex and long digit strings must not pass through a double.
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("strings", R"(ledger:
  rpc_url: http://127.0.0.1:8545
payment:
  asset_address: 0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913
  treasury_address: 0x1111111111111111111111111111111111111111
  min_amount: 123456789012345678901234567890
  extra:
    project: "true"
    autoConfirm: false
)")
                                                     .string(),
                                                 NoEnv());

  assert(config.payment().asset_address() == "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
  assert(config.payment().min_amount() == "123456789012345678901234567890");
  assert(config.payment().extra().fields().at("project").string_value() == "true");
  assert(!config.payment().extra().fields().at("autoConfirm").bool_value());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", std::string(kMinimal) + R"(database:
  sqlite:
    path: "C:\\mintgate\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string(), NoEnv());
  assert(config.database().sqlite().path() == "C:\\mintgate\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", std::string(kMinimal) + "unknown_field: 123\n");
  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string(), NoEnv()); }) && "ConfigLoader must reject unknown fields.");
}

void TestValidation() {
  assert(Throws([] { (void)ConfigLoader::LoadFromYaml(WriteYaml("no_rpc", "payment:\n  resource: x\n").string(), NoEnv()); }));
  assert(Throws([] {
    (void)ConfigLoader::LoadFromYaml(WriteYaml("bad_status", std::string(kMinimal) + "server:\n  requirements_status: 403\n").string(), NoEnv());
  }));
  assert(Throws([] {
    (void)ConfigLoader::LoadFromYaml(WriteYaml("bad_path", std::string(kMinimal) + "server:\n  payment_path: api\n").string(), NoEnv());
  }));
  assert(Throws([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/mintgate.yaml", NoEnv()); }));
}

void TestParseYamlWithoutDefaults() {
  const auto config = ConfigLoader::ParseYaml("");
  assert(config.server().bind_address().empty());
  assert(config.payment().x402_version() == 0);
}

} // namespace

int main() {
  TestDefaultsMatchTheReferenceDeployment();
  TestEnvironmentOverridesYaml();
  TestMalformedEnvironmentIsRejected();
  TestAddressesAndAmountsStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestValidation();
  TestParseYamlWithoutDefaults();

  std::cout << "mintgate_unit_config_loader: pass\n";
  return 0;
}
