#include "encoding.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <vector>

namespace cirrus::util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// Input must be padded to a multiple of four.
std::optional<std::string> DecodePadded(const std::string& padded) {
  if (padded.size() % 4 != 0) {
    return std::nullopt;
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < padded.size(); ++i) {
    const char c = padded[i];
    if (c == '=') {
      if (i + 2 < padded.size()) {
        return std::nullopt;
      }
      ++padding;
      continue;
    }
    if (padding > 0 || !IsBase64Char(c)) {
      return std::nullopt;
    }
  }

  std::vector<unsigned char> out(padded.size() / 4 * 3 + 1);
  const int                  written =
      EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()), static_cast<int>(padded.size()));
  if (written < 0) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written) - padding);
}

} // namespace

std::string HexEncode(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    result.push_back(kHex[(c >> 4) & 0x0F]);
    result.push_back(kHex[c & 0x0F]);
  }
  return result;
}

std::optional<std::string> HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::string result;
  result.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexValue(hex[i]);
    const int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    result.push_back(static_cast<char>((hi << 4) | lo));
  }
  return result;
}

std::string Base64UrlEncode(std::string_view bytes) {
  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  const int                  written =
      EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));

  std::string result(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
  while (!result.empty() && result.back() == '=') {
    result.pop_back();
  }
  std::replace(result.begin(), result.end(), '+', '-');
  std::replace(result.begin(), result.end(), '/', '_');
  return result;
}

std::optional<std::string> Base64UrlDecode(std::string_view text) {
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string padded;
  padded.reserve(text.size() + 3);
  for (char c : text) {
    if (c == '+' || c == '/' || c == '=') {
      return std::nullopt;
    }
    padded.push_back(c == '-' ? '+' : c == '_' ? '/' : c);
  }
  while (padded.size() % 4 != 0) {
    padded.push_back('=');
  }
  return DecodePadded(padded);
}

std::optional<std::string> Base64Decode(std::string_view text) {
  return DecodePadded(std::string(text));
}

std::string Sha256Hex(std::string_view bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), digest);
  return HexEncode(std::string_view(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

} // namespace cirrus::util
