#include "prism/hash.hpp"
#include "prism/consts.hpp"

#include <cstdint>
#include <initializer_list>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace prism {

namespace {

// Feed each chunk into one SHA-1 context.
oid digest_chunks(std::initializer_list<std::span<const std::uint8_t>> chunks) {
  oid out{};

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  for (const auto &chunk : chunks) {
    if (!chunk.empty() && EVP_DigestUpdate(ctx, chunk.data(), chunk.size()) != 1) {
      EVP_MD_CTX_free(ctx);
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);

  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

} // namespace

oid hash_object(std::string_view type, std::span<const std::uint8_t> payload) {
  const std::string hdr = object_header(type, payload.size());
  const std::span<const std::uint8_t> hdr_bytes(
      reinterpret_cast<const std::uint8_t *>(hdr.data()), hdr.size());
  return digest_chunks({hdr_bytes, payload});
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s(consts::kOidHexLen, '0');
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  oid parsed{};
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = parsed;
  return true;
}

} // namespace prism
