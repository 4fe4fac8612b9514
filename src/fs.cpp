#include "prism/fs.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>
#include <zlib.h>

namespace prism::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  std::vector<std::uint8_t> buf;
  std::array<char, 16384> chunk{};
  while (ifs.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || ifs.gcount() > 0) {
    buf.insert(buf.end(), chunk.data(), chunk.data() + ifs.gcount());
  }
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + p.string());
  }
  return buf;
}

std::optional<std::vector<std::uint8_t>> read_file_if_exists(const std::filesystem::path &p) {
  std::error_code ec;
  const auto st = std::filesystem::status(p, ec);
  if (st.type() == std::filesystem::file_type::not_found) {
    return std::nullopt;
  }
  if (ec) {
    throw std::runtime_error("stat failed: " + p.string() + ": " + ec.message());
  }
  if (std::filesystem::is_directory(st)) {
    throw std::runtime_error("is a directory: " + p.string());
  }
  return read_file(p);
}

namespace {

// Hidden sibling of `p` created exclusively, so an existing file is never reused.
std::FILE *open_unique_sibling(const std::filesystem::path &p, std::filesystem::path &tmp) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  for (int attempt = 0; attempt < 64; ++attempt) {
    std::array<char, 17> suffix{};
    std::snprintf(suffix.data(), suffix.size(), "%016llx",
                  static_cast<unsigned long long>(rng()));
    tmp = p.parent_path() / ("." + p.filename().string() + ".prism-" + suffix.data());
    if (std::FILE *f = std::fopen(tmp.c_str(), "wbx"))
      return f;
    if (errno != EEXIST)
      throw std::runtime_error("open temp for write failed: " + tmp.string() + ": " +
                               std::strerror(errno));
  }
  throw std::runtime_error("no free temp name beside " + p.string());
}

} // namespace

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  std::filesystem::path tmp;
  std::FILE *f = open_unique_sibling(p, tmp);
  const bool written = data.empty() || std::fwrite(data.data(), 1, data.size(), f) == data.size();
  const bool closed = std::fclose(f) == 0;
  std::error_code ec;
  if (!written || !closed) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("write temp failed: " + tmp.string());
  }
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> chunk{};
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress failed");
    }
    out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib stream truncated");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace prism::fs
