#pragma once

#include "directory.hpp"

#include <string>
#include <string_view>

namespace directory {

// Applies a JSON seed document to a directory. Top-level keys, all optional:
//   "policies": managed policies {arn, name, versions[{version_id, document, is_default}]}
//   "groups":   {name, path, policies[{name, document}], attached[arn]}
//   "roles":    {name, path, policies[...], attached[...]}
//   "users":    {name, path, access_keys[{id, secret, status}], policies[...],
//                attached[...], groups[name]}
//   "sessions": assumed-role sessions {access_key_id, secret, session_token,
//                role_arn, session_name}
// Policies are written first so that attachments can refer to them. Documents
// may be given as JSON objects or as strings. Stops at the first failure.
bool load_seed(Directory& dir, std::string_view json_text, std::string* err);

bool load_seed_file(Directory& dir, const std::string& path, std::string* err);

} // namespace directory
