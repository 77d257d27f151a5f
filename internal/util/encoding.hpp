#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cirrus::util {

std::string                HexEncode(std::string_view bytes);
std::optional<std::string> HexDecode(std::string_view hex);

// RFC 4648 base64. The URL-safe variant omits padding.
std::string                Base64UrlEncode(std::string_view bytes);
std::optional<std::string> Base64UrlDecode(std::string_view text);
std::optional<std::string> Base64Decode(std::string_view text);

std::string Sha256Hex(std::string_view bytes);

} // namespace cirrus::util
