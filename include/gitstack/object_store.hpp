#pragma once
#include "gitstack/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

struct Object {
  std::string type;               // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data; // payload bytes (no header)
};

// Loose, zlib-compressed, SHA-1 addressed objects fanned out as objects/aa/bbbb...
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir) : objects_dir_(std::move(objects_dir)) {}

  // Read and decompress object identified by 40-hex; returns type and payload.
  [[nodiscard]] Object read(std::string_view hex_oid) const;

  // Write object with given type/payload. Returns 40-hex id. Existing objects are not rewritten.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;
  std::string write(std::string_view type, std::string_view payload) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  [[nodiscard]] std::filesystem::path path_for_oid(const oid &object_id) const;

private:
  std::filesystem::path objects_dir_;
};

} // namespace gitstack
