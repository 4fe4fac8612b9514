#pragma once
#include "prism/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose objects under <repo_dir>/objects/aa/bbbb..., zlib-deflated.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path repo_dir)
    : repo_dir_(std::move(repo_dir)) {}

  // Read and decompress object identified by 40-hex; returns type and payload.
  Object read(std::string_view hex_oid) const;

  // Type and payload of an object, checking that the type matches `expected`.
  std::vector<std::uint8_t> read_typed(std::string_view hex_oid, std::string_view expected) const;

  // Write object with given type/payload. Returns 40-hex id.
  std::string write(std::string_view type, std::span<const std::uint8_t> payload) const;

  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path repo_dir_;
};

} // namespace prism
