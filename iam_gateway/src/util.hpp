#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

using Params = std::vector<std::pair<std::string, std::string>>;

// ISO 8601 basic format used by SigV4, e.g. "20240101T120000Z"
std::string amz_timestamp(std::int64_t epoch_seconds);
std::int64_t unix_now_seconds();

std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);
std::vector<std::string> split(std::string_view s, char delim);
std::string_view trim(std::string_view s);

// Percent-decode (URL decoding). Returns std::nullopt on malformed encoding.
// If plus_as_space is set, '+' decodes to ' ' (form bodies).
std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space = false);

// Percent-encode for SigV4 canonicalization.
// If encode_slash is false, '/' is left as-is.
std::string percent_encode(std::string_view in, bool encode_slash);

// Parse query string "a=b&c=d" into vector of (k,v). Decodes percent-encoding.
Params parse_query(std::string_view query, bool plus_as_space = false);

std::optional<std::string> param_get(const Params& params, std::string_view key);

// Build canonical query string for SigV4: sort by key then value; percent-encode.
std::string canonical_query_string(const Params& params);

// Resolve "." and ".." segments of an absolute path (RFC 3986 5.2.4).
std::string remove_dot_segments(std::string_view path);

// Trim and normalize spaces per SigV4 canonical header rules.
std::string trim_and_collapse_ws(std::string_view s);

// Cryptography helpers
std::string sha256_hex(std::string_view data);
std::vector<std::uint8_t> sha256_bin(std::string_view data);

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, std::string_view data);
std::vector<std::uint8_t> hmac_sha256(std::string_view key, std::string_view data);

std::string hex_lower(const std::vector<std::uint8_t>& bytes);

bool constant_time_equal(std::string_view a, std::string_view b);

} // namespace util
