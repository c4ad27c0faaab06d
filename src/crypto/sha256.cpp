#include <combo/common/critical.hpp>
#include <combo/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace combo::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

combo::schema::hash32_t sha256(const combo::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    combo::common::critical("failed to allocate SHA-256 context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    combo::common::critical("failed to initialize SHA-256 digest");
  }
  if (EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1) {
    combo::common::critical("failed to update SHA-256 digest");
  }

  auto digest = combo::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    combo::common::critical("failed to finalize SHA-256 digest");
  }
  return digest;
}

}  // namespace combo::crypto
