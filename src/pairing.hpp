#pragma once

#include <cstddef>
#include <string>

// Out-of-band pairing record. The UI that renders or scans it treats the
// encoded form as opaque text.
struct PairingPayload {
  int version = 1;
  std::string device_id;
  std::string display_name;
  std::string fingerprint;   // lowercase hex SHA-256 of the DER certificate
  std::string shared_secret; // discovery MAC key
};

inline constexpr int kPairingPayloadVersion = 1;
inline constexpr std::size_t kMinSharedSecretBytes = 16;

std::string encode_pairing_payload(const PairingPayload& payload);

// Throws SyncError(InvalidArgument) for malformed JSON, an unsupported
// version, a non-UUID device id, a fingerprint that is not 32 hex bytes or a
// secret shorter than kMinSharedSecretBytes. Fingerprints may use ':'
// separators and upper case; they come back normalized.
PairingPayload decode_pairing_payload(const std::string& text);

// 32 random bytes as lowercase hex.
std::string generate_shared_secret();
