#include "args_codec.hpp"

#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::invoke {

namespace {

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

std::string ArgsCodec::Encode(const google::protobuf::Struct& arguments) {
  return util::Base64Encode(util::ToJson(arguments));
}

google::protobuf::Struct ArgsCodec::DecodeStrict(std::string_view payload) {
  const auto trimmed = Trim(payload);
  if (trimmed.empty()) return {};

  std::string error;

  if (trimmed.front() == '{') {
    auto raw = util::ParseJsonObject(trimmed, &error);
    if (!raw) throw util::DecodeError("raw JSON arguments: " + error);
    return *raw;
  }

  auto decoded = util::Base64Decode(trimmed);
  if (!decoded) throw util::DecodeError("arguments are neither JSON nor base64");

  auto object = util::ParseJsonObject(*decoded, &error);
  if (!object) throw util::DecodeError("base64 arguments: " + error);
  return *object;
}

google::protobuf::Struct ArgsCodec::Decode(std::string_view payload) {
  try {
    return DecodeStrict(payload);
  } catch (const util::DecodeError& e) {
    FLEET_LOG_WARN("Ignoring malformed module arguments", {observability::StringField("error", e.what()),
                                                           observability::IntField("payload_bytes", payload.size())});
    return {};
  }
}

google::protobuf::Struct ArgsCodec::FromEnvironment(const std::string& env_var) {
  const char* payload = std::getenv(env_var.c_str());
  if (!payload) return {};
  return Decode(payload);
}

} // namespace fleet::invoke
