#include "ledger/digest.hpp"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace neuro_guard::ledger {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* context) const {
    if (context != nullptr) {
      EVP_MD_CTX_free(context);
    }
  }
};

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string sha256_hex(const std::string_view input) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> context(EVP_MD_CTX_new());
  if (context == nullptr) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("sha256: digest computation failed");
  }

  std::string hex;
  hex.reserve(static_cast<std::size_t>(digest_len) * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHexDigits[digest[i] >> 4U]);
    hex.push_back(kHexDigits[digest[i] & 0x0FU]);
  }
  return hex;
}

}  // namespace neuro_guard::ledger
