#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <string>

namespace util {

std::int64_t unix_now_seconds() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string amz_timestamp(std::int64_t epoch_seconds) {
  std::time_t t = static_cast<std::time_t>(epoch_seconds);
  std::tm gm{};
#if defined(_WIN32)
  gmtime_s(&gm, &t);
#else
  gmtime_r(&t, &gm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&gm, "%Y%m%dT%H%M%SZ");
  return oss.str();
}

std::string to_lower(std::string_view s) {
  std::string out(s.begin(), s.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> split(std::string_view s, char delim) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t pos = s.find(delim, start);
    if (pos == std::string_view::npos) pos = s.size();
    out.emplace_back(s.substr(start, pos - start));
    if (pos == s.size()) break;
    start = pos + 1;
  }
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '%') {
      if (i + 2 >= in.size()) return std::nullopt;
      int hi = hex_value(in[i + 1]);
      int lo = hex_value(in[i + 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else if (c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static bool is_unreserved(unsigned char c) {
  // RFC 3986 unreserved = ALPHA / DIGIT / "-" / "." / "_" / "~"
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

std::string percent_encode(std::string_view in, bool encode_slash) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (!encode_slash && c == '/') {
      out.push_back('/');
      continue;
    }
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[(c >> 4) & 0xF]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

Params parse_query(std::string_view query, bool plus_as_space) {
  Params out;
  if (query.empty()) return out;
  size_t start = 0;
  while (start <= query.size()) {
    size_t amp = query.find('&', start);
    if (amp == std::string_view::npos) amp = query.size();
    std::string_view part = query.substr(start, amp - start);
    if (!part.empty()) {
      size_t eq = part.find('=');
      std::string_view k = (eq == std::string_view::npos) ? part : part.substr(0, eq);
      std::string_view v = (eq == std::string_view::npos) ? std::string_view{} : part.substr(eq + 1);
      auto kd = percent_decode(k, plus_as_space);
      auto vd = percent_decode(v, plus_as_space);
      if (!kd) kd = std::string(k);
      if (!vd) vd = std::string(v);
      out.emplace_back(std::move(*kd), std::move(*vd));
    }
    if (amp == query.size()) break;
    start = amp + 1;
  }
  return out;
}

std::optional<std::string> param_get(const Params& params, std::string_view key) {
  for (const auto& kv : params) {
    if (kv.first == key) return kv.second;
  }
  return std::nullopt;
}

std::string canonical_query_string(const Params& params) {
  Params p(params);
  std::sort(p.begin(), p.end(), [](auto& a, auto& b) {
    if (a.first < b.first) return true;
    if (a.first > b.first) return false;
    return a.second < b.second;
  });

  std::string out;
  bool first = true;
  for (const auto& kv : p) {
    if (!first) out.push_back('&');
    first = false;
    out += percent_encode(kv.first, true);
    out.push_back('=');
    out += percent_encode(kv.second, true);
  }
  return out;
}

std::string remove_dot_segments(std::string_view path) {
  if (path.empty()) return std::string();
  // Empty segments are dropped too: services reject "//" in signed paths.
  std::vector<std::string> segments;
  for (auto& seg : split(path, '/')) {
    if (seg.empty() || seg == ".") continue;
    if (seg == "..") {
      if (!segments.empty()) segments.pop_back();
      continue;
    }
    segments.push_back(std::move(seg));
  }

  std::string out;
  if (path.front() == '/') out.push_back('/');
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) out.push_back('/');
    out += segments[i];
  }
  if (path.back() == '/' && !segments.empty()) out.push_back('/');
  return out;
}

std::string trim_and_collapse_ws(std::string_view s) {
  s = trim(s);

  std::string out;
  out.reserve(s.size());
  bool in_ws = false;
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) {
      if (!in_ws) {
        out.push_back(' ');
        in_ws = true;
      }
    } else {
      out.push_back(static_cast<char>(c));
      in_ws = false;
    }
  }
  return out;
}

std::vector<std::uint8_t> sha256_bin(std::string_view data) {
  std::vector<std::uint8_t> out;
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) return out;

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    return out;
  }

  unsigned int len = 0;
  out.resize(EVP_MAX_MD_SIZE);
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    out.clear();
    return out;
  }
  out.resize(static_cast<size_t>(len));
  EVP_MD_CTX_free(ctx);
  return out;
}

std::string hex_lower(const std::vector<std::uint8_t>& bytes) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2);
  for (size_t i = 0; i < bytes.size(); ++i) {
    out[2 * i] = hex[(bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[bytes[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view data) {
  return hex_lower(sha256_bin(data));
}

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, std::string_view data) {
  unsigned int len = EVP_MAX_MD_SIZE;
  std::vector<std::uint8_t> out(len);
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(), &len);
  out.resize(len);
  return out;
}

std::vector<std::uint8_t> hmac_sha256(std::string_view key, std::string_view data) {
  return hmac_sha256(std::vector<std::uint8_t>(key.begin(), key.end()), data);
}

bool constant_time_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
  }
  return diff == 0;
}

} // namespace util
