#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/model/collection_record.hpp"

namespace cirrus::access {

/*
  Secondary (password) authentication, consulted when an access decision
  requires it. Failing to reach the password store raises
  util::DependencyUnavailable; any other exception is a server error, never
  a refusal.
*/
class Authenticator {
 public:
  virtual ~Authenticator() = default;

  // True when credential is the collection's password.
  virtual bool Verify(const db::model::CollectionRecord& collection, const std::string& credential) = 0;
};

using AuthenticatorPtr = std::shared_ptr<Authenticator>;

// Compares the SHA-256 of the credential with the digest stored on the
// collection row. A collection without a stored digest cannot be verified.
class PasswordAuthenticator final : public Authenticator {
 public:
  bool Verify(const db::model::CollectionRecord& collection, const std::string& credential) override;
};

// Bounds every Verify call on the wrapped authenticator by the dependency
// timeout ceiling; a late answer is DependencyUnavailable.
class BoundedAuthenticator final : public Authenticator {
 public:
  BoundedAuthenticator(AuthenticatorPtr inner, std::chrono::milliseconds ceiling);

  bool Verify(const db::model::CollectionRecord& collection, const std::string& credential) override;

 private:
  AuthenticatorPtr          inner_;
  std::chrono::milliseconds ceiling_;
};

} // namespace cirrus::access
