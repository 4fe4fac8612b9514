#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prism::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// Throws std::runtime_error on any failure, including a missing file.
std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// std::nullopt when the path does not exist; other failures still throw.
std::optional<std::vector<std::uint8_t>> read_file_if_exists(const std::filesystem::path& p);

// Write to a fresh hidden sibling ".<name>.prism-<random>" then rename over p.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

inline std::string_view as_text(std::span<const std::uint8_t> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace prism::fs
