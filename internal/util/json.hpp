#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace fleet::util {

/*
  JSON helpers on top of protobuf's json_util.

  Variable values everywhere in fleet are google.protobuf.Value, so any JSON
  object maps onto a google.protobuf.Struct without a second JSON library.
*/

// Parses a JSON object. Returns nullopt (and fills *error) for anything that
// is not a well-formed object.
std::optional<google::protobuf::Struct> ParseJsonObject(std::string_view text, std::string* error = nullptr);

// Throws std::runtime_error if the message cannot be serialized.
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Compact JSON for a single value (strings quoted).
std::string ValueToJson(const google::protobuf::Value& value);

} // namespace fleet::util
