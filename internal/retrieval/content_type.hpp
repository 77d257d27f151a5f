#pragma once

#include <string>
#include <string_view>

namespace cirrus::retrieval {

inline constexpr std::string_view kDefaultContentType = "application/octet-stream";

// Guessed from the extension of the last path component of the key.
std::string GuessContentType(std::string_view key);

} // namespace cirrus::retrieval
