#include "id_translator.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>
#include <stdexcept>

#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace cirrus::ids {

namespace {

constexpr std::size_t kIvSize         = 16;
constexpr std::size_t kAesKeySize     = 32;
constexpr std::size_t kCipherTextSize = 16; // one padded AES block holds 8 bytes
constexpr std::size_t kDigestSize     = 32;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string ToBytes(UnifiedId id) {
  std::string bytes(8, '\0');
  for (int i = 7; i >= 0; --i) {
    bytes[static_cast<std::size_t>(i)] = static_cast<char>(id & 0xFF);
    id >>= 8;
  }
  return bytes;
}

UnifiedId FromBytes(std::string_view bytes) {
  UnifiedId id = 0;
  for (unsigned char c : bytes) {
    id = (id << 8) | c;
  }
  return id;
}

std::string HmacSha256(const std::string& key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest,
           &digest_len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string RunCipher(bool encrypt, const std::string& key, const std::string& iv, std::string_view input) {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }

  const auto* key_bytes = reinterpret_cast<const unsigned char*>(key.data());
  const auto* iv_bytes  = reinterpret_cast<const unsigned char*>(iv.data());
  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_bytes, iv_bytes, encrypt ? 1 : 0) != 1) {
    throw std::runtime_error("EVP_CipherInit_ex failed");
  }

  std::string out(input.size() + kIvSize, '\0');
  int         written = 0;
  int         final   = 0;
  auto*       out_ptr = reinterpret_cast<unsigned char*>(out.data());
  if (EVP_CipherUpdate(ctx.get(), out_ptr, &written, reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size())) != 1) {
    throw util::InvalidIdentifier("identifier cipher update failed");
  }
  if (EVP_CipherFinal_ex(ctx.get(), out_ptr + written, &final) != 1) {
    throw util::InvalidIdentifier("identifier padding is invalid");
  }
  out.resize(static_cast<std::size_t>(written + final));
  return out;
}

} // namespace

IdTranslator::IdTranslator(TranslatorKeys keys) : keys_(std::move(keys)) {
  if (keys_.aes_key.size() != kAesKeySize) {
    throw std::invalid_argument("identifier translator: AES key must be 32 bytes");
  }
  if (keys_.hmac_key.empty() || keys_.iv_key.empty()) {
    throw std::invalid_argument("identifier translator: HMAC and IV keys must not be empty");
  }
  if (keys_.hmac_size == 0 || keys_.hmac_size > kDigestSize) {
    throw std::invalid_argument("identifier translator: hmac_size must be between 1 and 32");
  }
}

std::string IdTranslator::Iv(UnifiedId id) const {
  return HmacSha256(keys_.iv_key, ToBytes(id)).substr(0, kIvSize);
}

std::string IdTranslator::Mac(std::string_view data) const {
  return HmacSha256(keys_.hmac_key, data).substr(0, keys_.hmac_size);
}

std::string IdTranslator::PublicId(UnifiedId id) const {
  const auto iv          = Iv(id);
  const auto cipher_text = RunCipher(true, keys_.aes_key, iv, ToBytes(id));

  std::string raw = iv + cipher_text;
  raw += Mac(raw);
  return util::Base64UrlEncode(raw);
}

UnifiedId IdTranslator::InternalId(std::string_view public_id) const {
  const auto raw = util::Base64UrlDecode(public_id);
  if (!raw) {
    throw util::InvalidIdentifier("identifier is not valid base64url");
  }
  if (raw->size() != kIvSize + kCipherTextSize + keys_.hmac_size) {
    throw util::InvalidIdentifier("identifier has the wrong length");
  }

  const std::string_view body(raw->data(), kIvSize + kCipherTextSize);
  const auto             expected_mac = Mac(body);
  if (CRYPTO_memcmp(expected_mac.data(), raw->data() + body.size(), keys_.hmac_size) != 0) {
    throw util::InvalidIdentifier("identifier failed authentication");
  }

  const std::string iv(raw->data(), kIvSize);
  const auto        plain = RunCipher(false, keys_.aes_key, iv, std::string_view(raw->data() + kIvSize, kCipherTextSize));
  if (plain.size() != 8) {
    throw util::InvalidIdentifier("identifier payload has the wrong length");
  }

  const auto id = FromBytes(plain);
  if (Iv(id) != iv) {
    throw util::InvalidIdentifier("identifier was not issued by this cluster");
  }
  return id;
}

} // namespace cirrus::ids
