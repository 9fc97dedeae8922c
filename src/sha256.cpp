#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtpack {
namespace {

using sha256_ctx_ptr_t =
    std::unique_ptr<mbedtls_sha256_context, decltype(&mbedtls_sha256_free)>;

void sha256_start(mbedtls_sha256_context &ctx) {
  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }
}

void sha256_update(mbedtls_sha256_context &ctx, unsigned char const *data, size_t len) {
  if (mbedtls_sha256_update(&ctx, data, len)) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }
}

sha256_t sha256_finish(mbedtls_sha256_context &ctx) {
  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return digest;
}

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  sha256_ctx_ptr_t ctx_scope{ &ctx, &mbedtls_sha256_free };
  sha256_start(ctx);

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) { sha256_update(ctx, buffer.data(), read_bytes); }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  return sha256_finish(ctx);
}

sha256_t sha256(std::vector<unsigned char> const &bytes) {
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  sha256_ctx_ptr_t ctx_scope{ &ctx, &mbedtls_sha256_free };

  sha256_start(ctx);
  if (!bytes.empty()) { sha256_update(ctx, bytes.data(), bytes.size()); }
  return sha256_finish(ctx);
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace rtpack
