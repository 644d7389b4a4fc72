#include "certificate_manager.hpp"

#include "integrity_hasher.hpp"
#include "sync_types.hpp"

#include <asio/ssl.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>

namespace {

constexpr long kValiditySeconds = 10L * 365L * 24L * 60L * 60L;

std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if(code == 0) return "unknown OpenSSL error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

[[noreturn]] void fail(const std::string& what) {
  throw SyncError(ErrorKind::Authentication, what + ": " + openssl_error());
}

struct BioDeleter {
  void operator()(BIO* b) const { BIO_free(b); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct PKeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); }
};

std::vector<uint8_t> to_der(X509* cert) {
  int len = i2d_X509(cert, nullptr);
  if(len <= 0) fail("i2d_X509");
  std::vector<uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if(i2d_X509(cert, &out) != len) fail("i2d_X509");
  return der;
}

void add_name_entry(X509_NAME* name, const char* field, const std::string& value) {
  if(X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                reinterpret_cast<const unsigned char*>(value.c_str()),
                                -1, -1, 0) != 1) {
    fail(std::string("X509_NAME_add_entry_by_txt ") + field);
  }
}

} // namespace

void CertificateManager::X509Deleter::operator()(x509_st* p) const { X509_free(p); }
void CertificateManager::PKeyDeleter::operator()(evp_pkey_st* p) const { EVP_PKEY_free(p); }

CertificateManager::CertificateManager(std::filesystem::path directory,
                                       std::string device_id,
                                       std::string display_name,
                                       Logger* logger)
  : directory_(std::move(directory)),
    device_id_(std::move(device_id)),
    display_name_(std::move(display_name)),
    logger_(logger) {
  std::lock_guard lg(mutex_);
  if(load()) {
    log_info(logger_, "loaded device certificate {}", fingerprint_);
    return;
  }
  generate();
  persist();
  log_info(logger_, "generated device certificate {}", fingerprint_);
}

CertificateManager::~CertificateManager() = default;

bool CertificateManager::load() {
  recover_interrupted_write();

  std::error_code ec;
  const bool have_cert = std::filesystem::exists(certificate_path(), ec);
  const bool have_key = std::filesystem::exists(key_path(), ec);
  if(!have_cert && !have_key) return false;
  if(have_cert != have_key) {
    throw SyncError(ErrorKind::Authentication,
                    "incomplete identity in " + directory_.string() + ": cert.pem and key.pem must both exist");
  }

  X509Ptr cert = read_certificate(certificate_path());
  if(!cert) fail("read " + certificate_path().string());
  PKeyPtr key = read_key(key_path());
  if(!key) fail("read " + key_path().string());

  if(X509_check_private_key(cert.get(), key.get()) != 1) {
    fail("certificate and key in " + directory_.string() + " do not match");
  }
  certificate_ = std::move(cert);
  key_ = std::move(key);
  fingerprint_ = fingerprint_of(to_der(certificate_.get()));
  return true;
}

void CertificateManager::recover_interrupted_write() {
  const auto cert_new = staged(certificate_path());
  const auto key_new = staged(key_path());
  std::error_code ec;
  const bool have_cert_new = std::filesystem::exists(cert_new, ec);
  const bool have_key_new = std::filesystem::exists(key_new, ec);
  if(!have_cert_new && !have_key_new) return;

  // The key is renamed first, so a complete new certificate matches either
  // the staged key or the one already in place.
  if(have_cert_new) {
    X509Ptr cert = read_certificate(cert_new);
    PKeyPtr key = read_key(have_key_new ? key_new : key_path());
    if(cert && key && X509_check_private_key(cert.get(), key.get()) == 1) {
      if(have_key_new) std::filesystem::rename(key_new, key_path(), ec);
      if(!ec) std::filesystem::rename(cert_new, certificate_path(), ec);
      if(ec) {
        throw SyncError(ErrorKind::Persistence,
                        "cannot complete certificate write in " + directory_.string() + ": " + ec.message());
      }
      log_warn(logger_, "completed interrupted certificate write in {}", directory_.string());
      return;
    }
    ERR_clear_error();
  }
  std::filesystem::remove(cert_new, ec);
  std::filesystem::remove(key_new, ec);
  log_warn(logger_, "discarded incomplete certificate write in {}", directory_.string());
}

CertificateManager::X509Ptr CertificateManager::read_certificate(const std::filesystem::path& path) {
  BioPtr bio(BIO_new_file(path.string().c_str(), "rb"));
  if(!bio) return nullptr;
  return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

CertificateManager::PKeyPtr CertificateManager::read_key(const std::filesystem::path& path) {
  BioPtr bio(BIO_new_file(path.string().c_str(), "rb"));
  if(!bio) return nullptr;
  return PKeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

std::filesystem::path CertificateManager::staged(const std::filesystem::path& path) {
  return path.string() + ".new";
}

void CertificateManager::generate() {
  std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter> kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if(!kctx || EVP_PKEY_keygen_init(kctx.get()) != 1 ||
     EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1) {
    fail("EC key context");
  }
  EVP_PKEY* raw_key = nullptr;
  if(EVP_PKEY_keygen(kctx.get(), &raw_key) != 1) fail("EVP_PKEY_keygen");
  PKeyPtr key(raw_key);

  X509Ptr cert(X509_new());
  if(!cert) fail("X509_new");
  X509_set_version(cert.get(), 2);

  uint64_t serial = 0;
  if(RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) fail("RAND_bytes");
  serial &= 0x7fffffffffffffffULL;
  if(ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial) != 1) fail("serial");

  X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), kValiditySeconds);
  if(X509_set_pubkey(cert.get(), key.get()) != 1) fail("X509_set_pubkey");

  X509_NAME* name = X509_get_subject_name(cert.get());
  add_name_entry(name, "CN", display_name_.empty() ? device_id_ : display_name_);
  add_name_entry(name, "OU", device_id_);
  if(X509_set_issuer_name(cert.get(), name) != 1) fail("X509_set_issuer_name");

  // Bound to the device's logical address rather than a DNS name.
  X509V3_CTX v3;
  X509V3_set_ctx_nodb(&v3);
  X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);
  const std::string san = "URI:urn:lansync:device:" + device_id_;
  X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name, san.c_str());
  if(!ext) fail("subjectAltName");
  const int added = X509_add_ext(cert.get(), ext, -1);
  X509_EXTENSION_free(ext);
  if(added != 1) fail("X509_add_ext");

  if(X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) fail("X509_sign");

  certificate_ = std::move(cert);
  key_ = std::move(key);
  fingerprint_ = fingerprint_of(to_der(certificate_.get()));
}

void CertificateManager::persist() const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if(ec) {
    throw SyncError(ErrorKind::Persistence, "cannot create " + directory_.string() + ": " + ec.message());
  }

  const auto key_new = staged(key_path());
  const auto cert_new = staged(certificate_path());
  {
    BioPtr key_bio(BIO_new_file(key_new.string().c_str(), "wb"));
    if(!key_bio) fail("open " + key_new.string());
    std::filesystem::permissions(key_new,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if(ec) {
      log_warn(logger_, "cannot restrict permissions on {}: {}", key_new.string(), ec.message());
    }
    if(PEM_write_bio_PrivateKey(key_bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
      fail("write " + key_new.string());
    }
  }
  {
    BioPtr cert_bio(BIO_new_file(cert_new.string().c_str(), "wb"));
    if(!cert_bio) fail("open " + cert_new.string());
    if(PEM_write_bio_X509(cert_bio.get(), certificate_.get()) != 1) {
      fail("write " + cert_new.string());
    }
  }

  std::filesystem::rename(key_new, key_path(), ec);
  if(!ec) std::filesystem::rename(cert_new, certificate_path(), ec);
  if(ec) {
    throw SyncError(ErrorKind::Persistence, "cannot install identity in " + directory_.string() + ": " + ec.message());
  }
}

std::string CertificateManager::fingerprint() const {
  std::lock_guard lg(mutex_);
  return fingerprint_;
}

std::vector<uint8_t> CertificateManager::certificate_der() const {
  std::lock_guard lg(mutex_);
  return to_der(certificate_.get());
}

std::string CertificateManager::fingerprint_of(const std::vector<uint8_t>& der) {
  return IntegrityHasher::to_hex(IntegrityHasher::digest(der));
}

PeerVerdict CertificateManager::verify_peer_certificate(const std::vector<uint8_t>& der,
                                                        const std::optional<std::string>& pinned_fingerprint) const {
  const unsigned char* p = der.data();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
  if(!cert || p != der.data() + der.size()) {
    throw SyncError(ErrorKind::Authentication, "peer presented a malformed certificate");
  }
  EVP_PKEY* pub = X509_get0_pubkey(cert.get());
  if(!pub || X509_verify(cert.get(), pub) != 1) {
    ERR_clear_error();
    throw SyncError(ErrorKind::Authentication, "peer certificate is not validly self-signed");
  }

  if(!pinned_fingerprint) return PeerVerdict::Unverified;

  std::string wanted;
  for(char c : *pinned_fingerprint) {
    if(c == ':') continue;
    wanted.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  Digest expected{};
  if(!IntegrityHasher::from_hex(wanted, expected)) {
    throw SyncError(ErrorKind::Pinning, "stored pin is not a SHA-256 fingerprint");
  }
  const Digest presented = IntegrityHasher::digest(der);
  if(!constant_time_equal(presented.data(), expected.data(), presented.size())) {
    throw SyncError(ErrorKind::Pinning,
                    "certificate fingerprint " + IntegrityHasher::to_hex(presented) +
                    " does not match pinned " + wanted);
  }
  return PeerVerdict::Pinned;
}

void CertificateManager::rotate() {
  std::lock_guard lg(mutex_);
  const std::string previous = fingerprint_;
  generate();
  persist();
  log_warn(logger_, "device certificate rotated {} -> {}; peers must re-pair", previous, fingerprint_);
}

void CertificateManager::configure_context(asio::ssl::context& context) const {
  std::lock_guard lg(mutex_);
  context.set_options(asio::ssl::context::default_workarounds |
                      asio::ssl::context::no_sslv2 |
                      asio::ssl::context::no_sslv3 |
                      asio::ssl::context::single_dh_use);
  SSL_CTX* native = context.native_handle();
  if(SSL_CTX_set_min_proto_version(native, TLS1_2_VERSION) != 1) fail("SSL_CTX_set_min_proto_version");
  if(SSL_CTX_use_certificate(native, certificate_.get()) != 1) fail("SSL_CTX_use_certificate");
  if(SSL_CTX_use_PrivateKey(native, key_.get()) != 1) fail("SSL_CTX_use_PrivateKey");
  if(SSL_CTX_check_private_key(native) != 1) fail("SSL_CTX_check_private_key");

  context.set_verify_mode(asio::ssl::verify_peer | asio::ssl::verify_fail_if_no_peer_cert);
  // Self-signed identities never chain to a CA; the pin is checked once the
  // handshake completes and before any frame is exchanged.
  context.set_verify_callback([](bool, asio::ssl::verify_context&) { return true; });
}

std::optional<std::vector<uint8_t>> CertificateManager::peer_certificate_der(ssl_st* ssl) {
  X509Ptr cert(SSL_get1_peer_certificate(ssl));
  if(!cert) return std::nullopt;
  return to_der(cert.get());
}
