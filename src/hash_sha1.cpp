#include "gitstack/hash.hpp"
#include "gitstack/consts.hpp"
#include "gitstack/errors.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <string>
#include <string_view>

namespace gitstack {

namespace {
struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

oid sha1(std::span<const std::uint8_t> data) {
  oid out{};

  const std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw StorageError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw StorageError("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw StorageError("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    throw StorageError("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw StorageError("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s(consts::kOidHexLen, '0');
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4U) & 0xFU];
    s[(2 * i) + 1] = kHex[b & 0xFU];
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
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace gitstack
