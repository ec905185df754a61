#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Text conveniences over the byte functions above.
std::string read_text(const std::filesystem::path& p);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Remove a file if present. Returns false if it was not there.
bool remove_file(const std::filesystem::path& p);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace rebranch::fs
