#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fleet::util {

/*
  Standard base64 (RFC 4648, '+' '/' alphabet, '=' padding).
*/

std::string Base64Encode(std::string_view bytes);

// nullopt on characters outside the alphabet or a bad length/padding.
// ASCII whitespace is skipped so wrapped payloads still decode.
std::optional<std::string> Base64Decode(std::string_view text);

} // namespace fleet::util
