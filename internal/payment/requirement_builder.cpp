#include "requirement_builder.hpp"

#include "internal/chain/address.hpp"

namespace mintgate::payment {

namespace {

google::protobuf::Struct SuccessShape() {
  google::protobuf::Struct shape;
  auto&                    fields = *shape.mutable_fields();
  fields["ok"].set_bool_value(true);
  fields["mintedTo"].set_string_value("0x...");
  fields["nftTxHash"].set_string_value("0x...");
  fields["note"].set_string_value("Mint completed.");
  return shape;
}

} // namespace

RequirementBuilder::RequirementBuilder(const mintgate::runtime::config::PaymentConfig& config) {
  document_.set_x402_version(config.x402_version());

  auto* offer = document_.add_accepts();
  offer->set_scheme("exact");
  offer->set_network(config.network());
  offer->set_max_amount_required(config.min_amount());
  offer->set_resource(config.resource());
  offer->set_description(config.description());
  offer->set_mime_type(config.mime_type());
  offer->set_max_timeout_seconds(config.max_timeout_seconds());
  offer->set_asset(config.asset_symbol());

  const auto treasury = chain::ParseAddress(config.treasury_address());
  offer->set_pay_to(treasury ? chain::ToChecksumAddress(*treasury) : config.treasury_address());

  auto* input = offer->mutable_output_schema()->mutable_input();
  input->set_type("http");
  input->set_method("POST");
  input->set_body_type("json");
  // Without configured input fields the client UI asks for nothing.
  for (const auto& field : config.input_fields()) {
    auto& body_field = (*input->mutable_body_fields())[field.name()];
    body_field.set_type(field.type().empty() ? "string" : field.type());
    body_field.set_required(field.required());
    body_field.set_description(field.description());
  }
  *offer->mutable_output_schema()->mutable_output() = SuccessShape();

  if (config.has_extra()) {
    *offer->mutable_extra() = config.extra();
  }
}

mintgate::v1::PaymentRequirements RequirementBuilder::Build(const std::string& payer) const {
  auto document = document_;
  if (!payer.empty()) {
    document.set_payer(payer);
  }
  return document;
}

} // namespace mintgate::payment
