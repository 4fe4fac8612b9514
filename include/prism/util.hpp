#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace prism {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Compute the blob object id for raw bytes without writing to the object store.
auto compute_blob_hex_oid(std::span<const std::uint8_t> bytes) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing spaces, tabs and CR/LF
  auto trim(std::string_view sv) -> std::string_view;
}

}
