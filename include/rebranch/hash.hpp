#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rebranch {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * SHA-1 of arbitrary bytes.
 * Object ids hash the full "<type> <size>\\0" + payload buffer; build the
 * header with object_header(...).
 */
oid sha1(std::span<const std::uint8_t> data);

inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** 40-char lowercase hex of a binary oid. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into a binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/** "<type> <size>\\0" */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 22);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace rebranch
