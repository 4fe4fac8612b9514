#include "prism/text.hpp"

#include "prism/consts.hpp"

namespace prism::text {

namespace {

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim_blank(std::string_view sv) {
  while (!sv.empty() && is_blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_blank(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

struct Scan {
  std::size_t len;  // bytes examined
  bool valid;       // true: `len` bytes form one scalar value
};

// Table 3-7 of the Unicode standard: well-formed byte sequences.
Scan scan_sequence(std::string_view s, std::size_t i) {
  const auto b = static_cast<unsigned char>(s[i]);
  if (b < 0x80) {
    return {1, true};
  }
  std::size_t need = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b >= 0xC2 && b <= 0xDF) {
    need = 1;
  } else if (b == 0xE0) {
    need = 2;
    lo = 0xA0;
  } else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
    need = 2;
  } else if (b == 0xED) {
    need = 2;
    hi = 0x9F;
  } else if (b == 0xF0) {
    need = 3;
    lo = 0x90;
  } else if (b >= 0xF1 && b <= 0xF3) {
    need = 3;
  } else if (b == 0xF4) {
    need = 3;
    hi = 0x8F;
  } else {
    return {1, false};
  }

  std::size_t j = 1;
  for (; j <= need; ++j) {
    if (i + j >= s.size()) {
      return {j, false};
    }
    const auto c = static_cast<unsigned char>(s[i + j]);
    const unsigned char min = j == 1 ? lo : 0x80;
    const unsigned char max = j == 1 ? hi : 0xBF;
    if (c < min || c > max) {
      return {j, false};
    }
  }
  return {need + 1, true};
}

} // namespace

std::size_t sequence_length(std::string_view bytes, std::size_t pos) {
  const Scan sc = scan_sequence(bytes, pos);
  return sc.valid ? sc.len : 0;
}

bool is_valid_utf8(std::string_view bytes) {
  for (std::size_t i = 0; i < bytes.size();) {
    const Scan sc = scan_sequence(bytes, i);
    if (!sc.valid)
      return false;
    i += sc.len;
  }
  return true;
}

std::string decode_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (std::size_t i = 0; i < bytes.size();) {
    const Scan sc = scan_sequence(bytes, i);
    if (sc.valid) {
      out.append(bytes.substr(i, sc.len));
    } else {
      out.append(kReplacementChar);
    }
    i += sc.len;
  }
  return out;
}

std::string sanitize_line(std::string_view raw) {
  std::string line = decode_lossy(raw);
  if (!line.empty() && line.back() == consts::kLF) {
    line.pop_back();
    if (!line.empty() && line.back() == consts::kCR) {
      line.pop_back();
    }
  }
  return line;
}

std::optional<std::string> extract_section(std::string_view raw_header) {
  if (!is_valid_utf8(raw_header)) {
    return std::nullopt;
  }
  while (!raw_header.empty() &&
         (raw_header.back() == consts::kLF || raw_header.back() == consts::kCR)) {
    raw_header.remove_suffix(1);
  }
  const auto pos = raw_header.rfind(consts::kHunkDelimiter);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view section =
      trim_blank(raw_header.substr(pos + consts::kHunkDelimiter.size()));
  if (section.empty()) {
    return std::nullopt;
  }
  return std::string(section);
}

} // namespace prism::text
