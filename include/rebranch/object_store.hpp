#pragma once
#include "rebranch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

struct Object {
  std::string type;               // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path repo_dir) : repo_dir_(std::move(repo_dir)) {}

  // Read and decompress the object named by 40-hex; returns type and payload.
  [[nodiscard]] Object read(std::string_view hex_oid) const;

  // Write object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  [[nodiscard]] std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path repo_dir_;
};

} // namespace rebranch
