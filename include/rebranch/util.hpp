#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Git blob id for raw bytes without writing to the object store.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;

// First kShortIdLen characters of an id.
auto short_id(std::string_view hex) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip spaces, tabs and CR on both ends
  auto trim(std::string_view sv) -> std::string_view;

  // Split on runs of spaces/tabs
  auto split_fields(std::string_view sv) -> std::vector<std::string_view>;

  // Text up to the first newline, trimmed
  auto first_line(std::string_view text) -> std::string;
}

} // namespace rebranch
