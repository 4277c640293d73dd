#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace mintgate::http {

// Proto3 JSON with camelCase names; default-valued fields are omitted.
std::string ToJson(const google::protobuf::Message& message);

// Unknown fields are ignored. Throws util::InvalidRequest on malformed JSON.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace mintgate::http
