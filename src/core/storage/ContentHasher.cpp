#include "ContentHasher.hpp"
#include <array>
#include <memory>
#include <openssl/evp.h>

#include "core/Errors.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtxPtr newSha256() {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw HashUnavailable("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashUnavailable("EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) throw HashUnavailable("EVP_DigestFinal_ex failed");
  return to_hex(digest, len);
}

} // namespace

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  auto ctx = newSha256();
  if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    throw HashUnavailable("EVP_DigestUpdate failed");
  }
  return finish(ctx.get());
}

std::string ContentHasher::hash(const std::string& path, const CancellationToken& token) const {
  auto in = fs_.openRead(path);
  auto ctx = newSha256();

  std::array<char, kChunkSize> buffer{};
  while (in) {
    token.throwIfCancelled();
    in.read(buffer.data(), buffer.size());
    const std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
      throw HashUnavailable("EVP_DigestUpdate failed for " + path);
    }
  }
  if (in.bad()) throw IoError("read failed: " + path);

  return finish(ctx.get());
}
