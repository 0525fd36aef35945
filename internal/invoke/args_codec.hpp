#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace fleet::invoke {

/*
  Module argument marshalling.

  Arguments travel as base64(JSON object) in a single environment variable.
  Decoding also accepts a raw JSON object, and an empty payload means {}.
*/
class ArgsCodec {
 public:
  static std::string Encode(const google::protobuf::Struct& arguments);

  // Throws util::DecodeError for a payload that is neither base64 JSON nor
  // raw JSON.
  static google::protobuf::Struct DecodeStrict(std::string_view payload);

  // Same as DecodeStrict, but a malformed payload is logged and decodes to {}.
  static google::protobuf::Struct Decode(std::string_view payload);

  // Decode(getenv(env_var)); a missing variable is {}.
  static google::protobuf::Struct FromEnvironment(const std::string& env_var);
};

} // namespace fleet::invoke
