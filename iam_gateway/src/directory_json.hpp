#pragma once

#include "directory.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace directory {

// nlohmann::json conversions for directory records. from_json throws
// nlohmann::json::exception on missing or mistyped required fields.
void to_json(nlohmann::json& j, const AccessKey& k);
void from_json(const nlohmann::json& j, AccessKey& k);
void to_json(nlohmann::json& j, const User& u);
void from_json(const nlohmann::json& j, User& u);
void to_json(nlohmann::json& j, const Group& g);
void from_json(const nlohmann::json& j, Group& g);
void to_json(nlohmann::json& j, const Role& r);
void from_json(const nlohmann::json& j, Role& r);
void to_json(nlohmann::json& j, const PolicyVersion& v);
void from_json(const nlohmann::json& j, PolicyVersion& v);
void to_json(nlohmann::json& j, const ManagedPolicy& p);
void from_json(const nlohmann::json& j, ManagedPolicy& p);
void to_json(nlohmann::json& j, const AssumedRoleSession& s);
void from_json(const nlohmann::json& j, AssumedRoleSession& s);

// Parses a stored record; std::nullopt with *err set on malformed input.
template <typename T>
std::optional<T> decode_record(std::string_view text, std::string* err) {
  try {
    return nlohmann::json::parse(text.begin(), text.end()).get<T>();
  } catch (const nlohmann::json::exception& e) {
    if (err) *err = std::string("Corrupt record: ") + e.what();
    return std::nullopt;
  }
}

template <typename T>
std::string encode_record(const T& value) {
  return nlohmann::json(value).dump();
}

// Policy documents are stored as text; a JSON object given in a seed file is
// serialized, a string is taken as-is.
std::string document_text(const nlohmann::json& j);

} // namespace directory
