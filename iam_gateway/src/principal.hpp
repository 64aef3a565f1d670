#pragma once

#include "directory.hpp"
#include "policy.hpp"
#include "sigv4.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace auth {

inline constexpr std::string_view kSecurityTokenHeader = "X-Amz-Security-Token";
inline constexpr std::string_view kLongTermKeyPrefix = "AKIA";
inline constexpr std::string_view kDefaultAccountId = "123456789012";

enum class PrincipalKind { IamUser, AssumedRole };

// The identity behind an access key, built per request from directory reads.
// Holds a reference to the directory view it was resolved from; the view must
// outlive the principal.
class Principal {
public:
  virtual ~Principal() = default;

  virtual PrincipalKind kind() const = 0;
  virtual std::string arn() const = 0;
  virtual Credentials credentials() const = 0;

  // Every policy that applies to this principal. std::nullopt if any lookup
  // failed; *err then names the failure.
  virtual std::optional<std::vector<iam::PolicySource>> attached_policies(std::string* err) const = 0;
};

class IamUser final : public Principal {
public:
  IamUser(const directory::IdentityDirectory& dir,
          std::string account_id,
          directory::User user,
          directory::AccessKey key);

  PrincipalKind kind() const override { return PrincipalKind::IamUser; }
  std::string arn() const override;
  Credentials credentials() const override;
  std::optional<std::vector<iam::PolicySource>> attached_policies(std::string* err) const override;

  const std::string& name() const { return user_.name; }
  const std::vector<directory::AccessKey>& access_keys() const { return user_.access_keys; }

private:
  const directory::IdentityDirectory& dir_;
  std::string account_id_;
  directory::User user_;
  directory::AccessKey key_;
};

class AssumedRole final : public Principal {
public:
  AssumedRole(const directory::IdentityDirectory& dir,
              std::string account_id,
              directory::AssumedRoleSession session);

  PrincipalKind kind() const override { return PrincipalKind::AssumedRole; }
  std::string arn() const override;
  Credentials credentials() const override;
  std::optional<std::vector<iam::PolicySource>> attached_policies(std::string* err) const override;

  const std::string& role_name() const { return role_name_; }
  const std::string& session_name() const { return session_.session_name; }
  const std::string& session_token() const { return session_.session_token; }

private:
  const directory::IdentityDirectory& dir_;
  std::string account_id_;
  directory::AssumedRoleSession session_;
  std::string role_name_;
};

enum class ResolutionError {
  InvalidId,      // no such access key
  InvalidToken,   // session token missing, mismatched, or used with a long-term key
  DirectoryError  // the directory could not be read
};

std::ostream& operator<<(std::ostream& os, ResolutionError e);

struct Resolution {
  std::unique_ptr<Principal> principal;
  ResolutionError error = ResolutionError::InvalidId; // meaningful when principal is null
  std::string detail;

  bool ok() const { return principal != nullptr; }
};

class PrincipalResolver {
public:
  PrincipalResolver(const directory::IdentityDirectory& identities,
                    const directory::SessionDirectory& sessions,
                    std::string account_id = std::string(kDefaultAccountId));

  // Long-term user when the key has the AKIA prefix or no security token is
  // sent; assumed-role session otherwise.
  Resolution resolve(std::string_view access_key_id, const Headers& headers) const;

private:
  Resolution resolve_user(std::string_view access_key_id, const Headers& headers) const;
  Resolution resolve_assumed_role(std::string_view access_key_id, const Headers& headers) const;

  const directory::IdentityDirectory& identities_;
  const directory::SessionDirectory& sessions_;
  std::string account_id_;
};

} // namespace auth
