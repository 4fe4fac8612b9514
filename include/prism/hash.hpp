#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace prism {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Object id of a payload of the given type: SHA-1 over
 *   "<type> <size>\\0" + payload
 * without materializing the concatenation.
 */
oid hash_object(std::string_view type, std::span<const std::uint8_t> payload);

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

// "<type> <size>\0"
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1);
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

} // namespace prism
