#include "rebranch/object_store.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace rfs = rebranch::fs;

namespace rebranch {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return repo_dir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("bad object id: " + std::string(hex_oid));
  }
  const auto path = path_for_oid(id);
  if (!rfs::exists(path)) {
    throw std::runtime_error("object not found: " + std::string(hex_oid));
  }
  const auto store = rfs::z_decompress(rfs::read_file(path));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw std::runtime_error("invalid object header: " + std::string(hex_oid));
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("invalid object header: " + std::string(hex_oid));
  }
  return Object{.type = std::string(store.begin(), it_space), .data = {it_nul + 1, store.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  const auto hdr_bytes = rfs::as_bytes(hdr);
  store.insert(store.end(), hdr_bytes.begin(), hdr_bytes.end());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid id = sha1(store);
  const auto path = path_for_oid(id);
  if (!rfs::exists(path)) {
    rfs::write_file_atomic(path, rfs::z_compress(store));
  }
  return to_hex(id);
}

} // namespace rebranch
