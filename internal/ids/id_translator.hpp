#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/ids/unified_id_factory.hpp"

namespace cirrus::ids {

struct TranslatorKeys {
  std::string aes_key;  // 32 raw bytes
  std::string hmac_key;
  std::string iv_key;
  std::size_t hmac_size = 16;
};

/*
  Maps internal UnifiedIds to opaque public identifiers and back.

  public = base64url( iv || AES-256-CBC(uid) || HMAC-SHA256(iv || ct)[:hmac_size] )
  iv     = HMAC-SHA256(iv_key, uid)[:16]

  The transform is deterministic per uid, authenticated, and does not
  preserve the ordering of the underlying identifiers. Every call builds its
  own OpenSSL contexts, so one translator is shared freely between threads.
*/
class IdTranslator {
 public:
  explicit IdTranslator(TranslatorKeys keys);

  std::string PublicId(UnifiedId id) const;

  // Throws util::InvalidIdentifier on malformed, truncated or forged input.
  UnifiedId InternalId(std::string_view public_id) const;

 private:
  std::string Iv(UnifiedId id) const;
  std::string Mac(std::string_view data) const;

  TranslatorKeys keys_;
};

} // namespace cirrus::ids
