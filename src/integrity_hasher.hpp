#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

inline constexpr std::size_t kDigestSize = 32;
using Digest = std::array<uint8_t, kDigestSize>;

// SHA-256 content digests for chunks, whole files and certificates.
class IntegrityHasher {
public:
  IntegrityHasher();
  ~IntegrityHasher();

  IntegrityHasher(const IntegrityHasher&) = delete;
  IntegrityHasher& operator=(const IntegrityHasher&) = delete;

  void update(const void* data, std::size_t size);
  // Finalizes and resets, so the hasher can be reused for the next range.
  Digest finish();

  static Digest digest(const void* data, std::size_t size);
  static Digest digest(const std::vector<uint8_t>& data) { return digest(data.data(), data.size()); }
  static Digest digest(const std::string& data) { return digest(data.data(), data.size()); }

  // Streams the file in 64 KiB blocks. Throws SyncError(InvalidArgument) when
  // the path is not a readable regular file.
  static Digest digest_file(const std::filesystem::path& path);

  // Digest of the first `length` bytes of the file.
  static Digest digest_file_prefix(const std::filesystem::path& path, uint64_t length);

  static std::string to_hex(const Digest& digest);
  static bool from_hex(const std::string& hex, Digest& out);

private:
  void reset();

  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

Digest hmac_sha256(const std::vector<uint8_t>& key, const uint8_t* data, std::size_t size);
bool constant_time_equal(const uint8_t* a, const uint8_t* b, std::size_t size);
