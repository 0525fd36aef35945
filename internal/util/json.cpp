#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace fleet::util {

std::optional<google::protobuf::Struct> ParseJsonObject(std::string_view text, std::string* error) {
  google::protobuf::Struct object;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &object, options);
  if (!status.ok()) {
    if (error) *error = std::string(status.message());
    return std::nullopt;
  }

  return object;
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + std::string(status.message()));
  }

  return json;
}

std::string ValueToJson(const google::protobuf::Value& value) {
  return ToJson(value);
}

} // namespace fleet::util
