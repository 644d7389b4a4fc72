#include "integrity_hasher.hpp"

#include "sync_types.hpp"
#include "utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <fstream>

namespace {
constexpr std::size_t kReadBlock = 64 * 1024;
}

void IntegrityHasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

IntegrityHasher::IntegrityHasher() : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_) throw SyncError(ErrorKind::Integrity, "EVP_MD_CTX_new failed");
  reset();
}

IntegrityHasher::~IntegrityHasher() = default;

void IntegrityHasher::reset() {
  if(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw SyncError(ErrorKind::Integrity, "EVP_DigestInit_ex failed");
  }
}

void IntegrityHasher::update(const void* data, std::size_t size) {
  if(size == 0) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw SyncError(ErrorKind::Integrity, "EVP_DigestUpdate failed");
  }
}

Digest IntegrityHasher::finish() {
  Digest out{};
  unsigned int len = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
    throw SyncError(ErrorKind::Integrity, "EVP_DigestFinal_ex failed");
  }
  reset();
  return out;
}

Digest IntegrityHasher::digest(const void* data, std::size_t size) {
  IntegrityHasher hasher;
  hasher.update(data, size);
  return hasher.finish();
}

Digest IntegrityHasher::digest_file(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw SyncError(ErrorKind::InvalidArgument, "not a regular file: " + path.string());
  }
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    throw SyncError(ErrorKind::InvalidArgument, "cannot stat " + path.string() + ": " + ec.message());
  }
  return digest_file_prefix(path, size);
}

Digest IntegrityHasher::digest_file_prefix(const std::filesystem::path& path, uint64_t length) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw SyncError(ErrorKind::InvalidArgument, "cannot open " + path.string());
  }
  IntegrityHasher hasher;
  std::vector<char> buffer(kReadBlock);
  uint64_t remaining = length;
  while(remaining > 0) {
    auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
    in.read(buffer.data(), static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(in.gcount());
    if(got == 0) {
      throw SyncError(ErrorKind::Integrity, "short read while hashing " + path.string());
    }
    hasher.update(buffer.data(), got);
    remaining -= got;
  }
  return hasher.finish();
}

std::string IntegrityHasher::to_hex(const Digest& digest) {
  return hex_from_bytes(digest.data(), digest.size());
}

bool IntegrityHasher::from_hex(const std::string& hex, Digest& out) {
  auto bytes = bytes_from_hex(hex);
  if(!bytes || bytes->size() != out.size()) return false;
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return true;
}

Digest hmac_sha256(const std::vector<uint8_t>& key, const uint8_t* data, std::size_t size) {
  Digest out{};
  unsigned int len = 0;
  static const uint8_t kEmpty = 0;
  const uint8_t* key_ptr = key.empty() ? &kEmpty : key.data();
  if(!HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
           size ? data : &kEmpty, size, out.data(), &len) || len != out.size()) {
    throw SyncError(ErrorKind::Authentication, "HMAC-SHA256 failed");
  }
  return out;
}

bool constant_time_equal(const uint8_t* a, const uint8_t* b, std::size_t size) {
  return CRYPTO_memcmp(a, b, size) == 0;
}
