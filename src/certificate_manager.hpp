#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

struct x509_st;
struct evp_pkey_st;
struct ssl_st;

namespace asio {
namespace ssl {
class context;
} // namespace ssl
} // namespace asio

enum class PeerVerdict {
  Pinned,     // fingerprint matched the stored pin
  Unverified, // no pin on record; channel is encrypted but identity unknown
};

// Owns the device's self-signed TLS identity. The pair is generated on first
// use and stored as PEM under `directory`; the private key never leaves this
// object except through the SSL context it configures.
class CertificateManager {
public:
  CertificateManager(std::filesystem::path directory,
                     std::string device_id,
                     std::string display_name,
                     Logger* logger = nullptr);
  ~CertificateManager();

  CertificateManager(const CertificateManager&) = delete;
  CertificateManager& operator=(const CertificateManager&) = delete;

  // Lowercase hex SHA-256 over the DER encoding of the certificate.
  std::string fingerprint() const;
  std::vector<uint8_t> certificate_der() const;

  // Throws SyncError(Pinning) when `pinned_fingerprint` is set and differs,
  // SyncError(Authentication) when `der` is not a well-formed self-signed
  // certificate.
  PeerVerdict verify_peer_certificate(const std::vector<uint8_t>& der,
                                      const std::optional<std::string>& pinned_fingerprint) const;

  // Replaces the key pair. Contexts configured earlier keep the old identity.
  void rotate();

  // Installs our certificate and key and requests the peer certificate.
  // Chain validation is replaced by pinning after the handshake.
  void configure_context(asio::ssl::context& context) const;

  std::filesystem::path certificate_path() const { return directory_ / "cert.pem"; }
  std::filesystem::path key_path() const { return directory_ / "key.pem"; }

  static std::string fingerprint_of(const std::vector<uint8_t>& der);
  // DER of the certificate the peer presented on `ssl`, if any.
  static std::optional<std::vector<uint8_t>> peer_certificate_der(ssl_st* ssl);

private:
  struct X509Deleter { void operator()(x509_st* p) const; };
  struct PKeyDeleter { void operator()(evp_pkey_st* p) const; };
  using X509Ptr = std::unique_ptr<x509_st, X509Deleter>;
  using PKeyPtr = std::unique_ptr<evp_pkey_st, PKeyDeleter>;

  bool load();
  // Finishes or discards a persist() that was cut short, leaving either the
  // old pair or the new pair on disk.
  void recover_interrupted_write();
  void generate();
  // Writes both files beside their final names, then renames key and
  // certificate into place.
  void persist() const;
  // Null when the file is missing or does not parse.
  static X509Ptr read_certificate(const std::filesystem::path& path);
  static PKeyPtr read_key(const std::filesystem::path& path);
  static std::filesystem::path staged(const std::filesystem::path& path);

  std::filesystem::path directory_;
  std::string device_id_;
  std::string display_name_;
  Logger* logger_ = nullptr;

  mutable std::mutex mutex_;
  X509Ptr certificate_;
  PKeyPtr key_;
  std::string fingerprint_;
};
