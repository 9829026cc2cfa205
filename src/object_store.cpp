#include "gitstack/object_store.hpp"

#include "gitstack/consts.hpp"
#include "gitstack/fs.hpp"
#include "gitstack/errors.hpp"

#include <algorithm>

namespace gfs = gitstack::fs;

namespace gitstack {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    return false;
  }
  return gfs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw StorageError("object_store: bad oid hex: " + std::string(hex_oid));
  }
  const auto path = path_for_oid(id);
  if (!gfs::exists(path)) {
    throw StorageError("object_store: missing object " + std::string(hex_oid));
  }
  auto store = gfs::z_decompress(gfs::read_file(path));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw StorageError("object_store: invalid header");
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw StorageError("object_store: invalid header");
  }

  std::string type(store.begin(), it_space);
  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  const std::string size_str(it_space + 1, it_nul);
  if (std::to_string(store.size() - payload_off) != size_str) {
    throw StorageError("object_store: size mismatch in " + std::string(hex_oid));
  }
  return Object{.type = std::move(type),
                .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const std::string hdr = object_header(type, payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());

  const oid store_id = sha1(store);
  const auto path = path_for_oid(store_id);
  if (!gfs::exists(path)) {
    gfs::write_file_atomic(path, gfs::z_compress(store));
  }
  return to_hex(store_id);
}

std::string ObjectStore::write(std::string_view type, std::string_view payload) const {
  return write(type, std::span<const std::uint8_t>(
                         reinterpret_cast<const std::uint8_t *>(payload.data()), payload.size()));
}

} // namespace gitstack
