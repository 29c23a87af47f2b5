#include "checksum.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/util/arrow_io.hpp"

namespace rfshared::checksum {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

class Hasher {
 public:
  Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }

  void Update(const void* data, size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  std::string HexDigest() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int  out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string           hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; ++i) {
      hex.push_back(kHex[out[i] >> 4]);
      hex.push_back(kHex[out[i] & 0x0F]);
    }
    return hex;
  }

 private:
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx_;
};

} // namespace

std::string Digest(std::string_view data) {
  Hasher hasher;
  hasher.Update(data.data(), data.size());
  return hasher.HexDigest();
}

std::string DigestOfFile(const std::filesystem::path& path) {
  using util::Unwrap;

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()), path);

  Hasher hasher;
  while (true) {
    auto chunk = Unwrap(file->Read(static_cast<int64_t>(kFileChunkBytes)), path);
    if (chunk->size() == 0) break;
    hasher.Update(chunk->data(), static_cast<size_t>(chunk->size()));
  }

  Unwrap(file->Close(), path);
  return hasher.HexDigest();
}

} // namespace rfshared::checksum
