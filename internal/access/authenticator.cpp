#include "internal/access/authenticator.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/util/deadline.hpp"
#include "internal/util/encoding.hpp"

namespace cirrus::access {

bool PasswordAuthenticator::Verify(const db::model::CollectionRecord& collection, const std::string& credential) {
  if (collection.password_sha256.empty()) {
    throw std::runtime_error("collection " + collection.name + " requires a password but has none configured");
  }

  std::string stored = collection.password_sha256;
  std::transform(stored.begin(), stored.end(), stored.begin(), [](unsigned char c) { return std::tolower(c); });

  const auto presented = util::Sha256Hex(credential);
  if (presented.size() != stored.size()) {
    return false;
  }
  return CRYPTO_memcmp(presented.data(), stored.data(), presented.size()) == 0;
}

BoundedAuthenticator::BoundedAuthenticator(AuthenticatorPtr inner, std::chrono::milliseconds ceiling)
    : inner_(std::move(inner)), ceiling_(ceiling) {
}

bool BoundedAuthenticator::Verify(const db::model::CollectionRecord& collection, const std::string& credential) {
  return util::CallWithDeadline(ceiling_, "authenticate " + collection.name,
                                [inner = inner_, collection, credential] { return inner->Verify(collection, credential); });
}

} // namespace cirrus::access
