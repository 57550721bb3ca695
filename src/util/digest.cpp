#include "util/digest.hpp"

#include <array>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace wfh {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string hex(const unsigned char *bytes, unsigned int len) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(digits[bytes[i] >> 4]);
    out.push_back(digits[bytes[i] & 0x0f]);
  }
  return out;
}

std::string digest_hex(const EVP_MD *md, const std::string &data) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (1 != EVP_DigestInit_ex(ctx.get(), md, nullptr) ||
      1 != EVP_DigestUpdate(ctx.get(), data.data(), data.size()) ||
      1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len)) {
    throw std::runtime_error("Digest computation failed");
  }
  return hex(out.data(), len);
}

} // namespace

std::string sha256_hex(const std::string &data) {
  return digest_hex(EVP_sha256(), data);
}

std::string sha1_hex(const std::string &data) {
  return digest_hex(EVP_sha1(), data);
}

std::string base64_encode(const std::string &data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(),
                            reinterpret_cast<const unsigned char *>(data.data()),
                            static_cast<int>(data.size()));
  if (len < 0) {
    throw std::runtime_error("Base64 encoding failed");
  }
  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<std::size_t>(len));
}

} // namespace wfh
