#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace prism::text {

inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed UTF-8 sequence at `pos`, or 0 when the bytes there
// do not start one. `pos` must be < bytes.size().
auto sequence_length(std::string_view bytes, std::size_t pos) -> std::size_t;

auto is_valid_utf8(std::string_view bytes) -> bool;

// Decode UTF-8, replacing each maximal invalid subpart with U+FFFD.
auto decode_lossy(std::string_view bytes) -> std::string;

// Display text of one diff line: lossy-decoded, without its trailing "\n" or "\r\n".
auto sanitize_line(std::string_view raw) -> std::string;

// Text after the last "@@" of a raw hunk header ("@@ -1,3 +1,4 @@ int main()\n"
// yields "int main()"). std::nullopt for invalid UTF-8, no delimiter or an empty tail.
auto extract_section(std::string_view raw_header) -> std::optional<std::string>;

} // namespace prism::text
