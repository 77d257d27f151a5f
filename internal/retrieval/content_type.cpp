#include "internal/retrieval/content_type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace cirrus::retrieval {

std::string GuessContentType(std::string_view key) {
  static const std::unordered_map<std::string, std::string> kTypes = {
      {"txt", "text/plain"},        {"html", "text/html"},         {"htm", "text/html"},
      {"css", "text/css"},          {"csv", "text/csv"},           {"xml", "application/xml"},
      {"js", "application/javascript"}, {"json", "application/json"}, {"pdf", "application/pdf"},
      {"zip", "application/zip"},   {"gz", "application/gzip"},    {"tar", "application/x-tar"},
      {"png", "image/png"},         {"jpg", "image/jpeg"},         {"jpeg", "image/jpeg"},
      {"gif", "image/gif"},         {"svg", "image/svg+xml"},      {"mp3", "audio/mpeg"},
      {"wav", "audio/x-wav"},       {"mp4", "video/mp4"},          {"mov", "video/quicktime"},
  };

  const auto slash = key.rfind('/');
  const auto name  = slash == std::string_view::npos ? key : key.substr(slash + 1);
  const auto dot   = name.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
    return std::string(kDefaultContentType);
  }

  std::string extension(name.substr(dot + 1));
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return std::tolower(c); });

  const auto it = kTypes.find(extension);
  return it == kTypes.end() ? std::string(kDefaultContentType) : it->second;
}

} // namespace cirrus::retrieval
