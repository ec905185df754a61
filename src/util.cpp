// Hex, object-id and small string helpers
#include "rebranch/util.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/hash.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace rebranch {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  const std::string hdr = object_header(consts::kTypeBlob, bytes.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + bytes.size());
  const auto hdr_bytes = fs::as_bytes(hdr);
  store.insert(store.end(), hdr_bytes.begin(), hdr_bytes.end());
  store.insert(store.end(), bytes.begin(), bytes.end());
  return to_hex(sha1(store));
}

std::string short_id(std::string_view hex) {
  return std::string(hex.substr(0, consts::kShortIdLen));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string_view trim(std::string_view sv) {
  const auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r'; };
  while (!sv.empty() && blank(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && blank(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

std::vector<std::string_view> split_fields(std::string_view sv) {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (pos < sv.size()) {
    while (pos < sv.size() && (sv[pos] == ' ' || sv[pos] == '\t')) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < sv.size() && sv[pos] != ' ' && sv[pos] != '\t') {
      ++pos;
    }
    if (pos > start) {
      out.push_back(sv.substr(start, pos - start));
    }
  }
  return out;
}

std::string first_line(std::string_view text) {
  const auto nl = text.find('\n');
  return std::string(trim(nl == std::string_view::npos ? text : text.substr(0, nl)));
}

} // namespace strutil

} // namespace rebranch
