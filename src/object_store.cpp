#include "prism/object_store.hpp"

#include "prism/consts.hpp"
#include "prism/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace pfs = prism::fs;

namespace prism {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return repo_dir_ / consts::kObjectsDir / hex.substr(0, 2) / hex.substr(2);
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("object_store: bad oid hex: " + std::string(hex_oid));
  }
  const auto path = path_for_oid(id);
  if (!pfs::exists(path)) {
    throw std::runtime_error("object_store: object not found: " + std::string(hex_oid));
  }
  auto store = pfs::z_decompress(pfs::read_file(path));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }

  std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);
  const std::size_t payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (size_str != std::to_string(store.size() - payload_off)) {
    throw std::runtime_error("object_store: size mismatch for " + std::string(hex_oid));
  }
  return Object{.type = std::move(type),
                .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

std::vector<std::uint8_t> ObjectStore::read_typed(std::string_view hex_oid,
                                                  std::string_view expected) const {
  auto obj = read(hex_oid);
  if (obj.type != expected) {
    throw std::runtime_error("object " + std::string(hex_oid) + " is a " + obj.type + ", not a " +
                             std::string(expected));
  }
  return std::move(obj.data);
}

std::string ObjectStore::write(std::string_view type, std::span<const std::uint8_t> payload) const {
  const oid id = hash_object(type, payload);
  const auto path = path_for_oid(id);
  if (!pfs::exists(path)) {
    const std::string hdr = object_header(type, payload.size());
    std::vector<std::uint8_t> store;
    store.reserve(hdr.size() + payload.size());
    const auto hdr_bytes = pfs::as_bytes(hdr);
    store.insert(store.end(), hdr_bytes.begin(), hdr_bytes.end());
    store.insert(store.end(), payload.begin(), payload.end());
    pfs::write_file_atomic(path, pfs::z_compress(store));
  }
  return to_hex(id);
}

} // namespace prism
