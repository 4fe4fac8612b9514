// Utility helpers for hex and object-id computations
#include "prism/util.hpp"

#include "prism/consts.hpp"
#include "prism/hash.hpp"

#include <algorithm>
#include <cctype>

namespace prism {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string compute_blob_hex_oid(std::span<const std::uint8_t> bytes) {
  return to_hex(hash_object(consts::kTypeBlob, bytes));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    const char c = s.back();
    if (c == consts::kLF || c == consts::kCR) {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string_view trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

} // namespace strutil

} // namespace prism
