#include "internal/payment/requirement_builder.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/http/json_codec.hpp"
#include "support/fakes.hpp"

using namespace mintgate;
using namespace mintgate::testing;

namespace {

void TestDocumentMirrorsConfiguration() {
  payment::RequirementBuilder builder(PaymentConfigForTests());
  const auto                  document = builder.Build();

  assert(document.x402_version() == 1);
  assert(document.payer().empty());
  assert(document.accepts_size() == 1);

  const auto& offer = document.accepts(0);
  assert(offer.scheme() == "exact");
  assert(offer.network() == "base");
  assert(offer.max_amount_required() == "10000000");
  assert(offer.resource() == kResource);
  assert(offer.description() == "Mint one x402Apes NFT automatically after USDC payment confirmation.");
  assert(offer.mime_type() == "application/json");
  assert(offer.pay_to() == chain::ToChecksumAddress(kTreasury));
  assert(offer.max_timeout_seconds() == 600);
  assert(offer.asset() == "USDC");

  const auto& input = offer.output_schema().input();
  assert(input.type() == "http");
  assert(input.method() == "POST");
  assert(input.body_type() == "json");
  // No configured input fields: nothing for the client to fill in.
  assert(input.body_fields().empty());

  const auto& output = offer.output_schema().output().fields();
  assert(output.at("ok").bool_value());
  assert(output.at("note").string_value() == "Mint completed.");

  assert(offer.extra().fields().at("onePerPayment").bool_value());
}

void TestWireFormat() {
  payment::RequirementBuilder builder(PaymentConfigForTests());
  const auto                  json = http::ToJson(builder.Build());

  assert(json.find("\"x402Version\":1") != std::string::npos);
  assert(json.find("\"maxAmountRequired\":\"10000000\"") != std::string::npos);
  assert(json.find("\"payTo\":\"") != std::string::npos);
  assert(json.find("\"bodyType\":\"json\"") != std::string::npos);
  assert(json.find("\"outputSchema\"") != std::string::npos);
  assert(json.find("\"payer\"") == std::string::npos);
  assert(json.find("bodyFields") == std::string::npos);
}

void TestPayerIsEchoed() {
  payment::RequirementBuilder builder(PaymentConfigForTests());
  assert(builder.Build("0xAbC").payer() == "0xAbC");
  // The echo never leaks into later documents.
  assert(builder.Build().payer().empty());
}

void TestConfiguredInputFields() {
  auto  config = PaymentConfigForTests();
  auto* field  = config.add_input_fields();
  field->set_name("email");
  field->set_required(true);
  field->set_description("Receipt address");

  payment::RequirementBuilder builder(config);
  const auto                  fields = builder.Build().accepts(0).output_schema().input().body_fields();
  assert(fields.size() == 1);
  assert(fields.at("email").type() == "string");
  assert(fields.at("email").required());
}

void TestLargeMinimumStaysExact() {
  auto config = PaymentConfigForTests();
  config.set_min_amount("123456789012345678901234567890");
  payment::RequirementBuilder builder(config);
  assert(builder.Build().accepts(0).max_amount_required() == "123456789012345678901234567890");
}

} // namespace

int main() {
  TestDocumentMirrorsConfiguration();
  TestWireFormat();
  TestPayerIsEchoed();
  TestConfiguredInputFields();
  TestLargeMinimumStaysExact();

  std::cout << "mintgate_unit_requirement_builder: pass\n";
  return 0;
}
