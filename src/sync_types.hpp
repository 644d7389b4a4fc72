#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// ---- errors ----------------------------------------------------------------

enum class ErrorKind : uint8_t {
  None = 0,
  TransientNetwork = 1,
  Authentication = 2,
  Pinning = 3,
  Integrity = 4,
  Persistence = 5,
  Protocol = 6,
  InvalidArgument = 7,
};

const char* to_string(ErrorKind kind);

class SyncError : public std::runtime_error {
public:
  SyncError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// ---- identity and peers ----------------------------------------------------

struct DeviceIdentity {
  std::string device_id;     // canonical UUID text
  std::string display_name;
  std::string certificate_fingerprint; // lowercase hex SHA-256 of the DER certificate
};

enum class PeerStatus { Online, Stale };

const char* to_string(PeerStatus status);

struct PeerRecord {
  std::string device_id;
  std::string display_name;
  std::string network_address; // observed source IP
  int64_t last_seen_at_ms = 0;
  PeerStatus status = PeerStatus::Online; // filled in by snapshots only
};

// ---- files -----------------------------------------------------------------

enum class SyncStatus { Pending, Syncing, Synced, Failed, Conflict };

const char* to_string(SyncStatus status);
std::optional<SyncStatus> sync_status_from_string(const std::string& value);

struct FileRecord {
  std::string file_id;
  std::string absolute_path;
  std::string content_hash; // lowercase hex SHA-256
  uint64_t size_bytes = 0;
  int64_t modified_at_ms = 0;
  SyncStatus sync_status = SyncStatus::Pending;
};

enum class ChangeKind { Created, Modified, Deleted };

struct ChangeEvent {
  std::string path;
  ChangeKind kind = ChangeKind::Modified;
  std::optional<std::string> new_content_hash;
};

// ---- transfer sessions -----------------------------------------------------

enum class TransferDirection { Send, Receive };

const char* to_string(TransferDirection direction);
std::optional<TransferDirection> direction_from_string(const std::string& value);

enum class SessionState { Handshaking, Transferring, Paused, Completed, Failed };

const char* to_string(SessionState state);
std::optional<SessionState> session_state_from_string(const std::string& value);

inline bool is_terminal(SessionState state) {
  return state == SessionState::Completed || state == SessionState::Failed;
}

// Handshaking and Transferring sessions hold the (file, peer) slot. Paused
// sessions are dormant and get superseded by the session that resumes them.
inline bool is_active(SessionState state) {
  return state == SessionState::Handshaking || state == SessionState::Transferring;
}

inline constexpr int64_t kNoChunkAcknowledged = -1;

struct TransferSession {
  std::string session_id;
  std::string file_id;
  TransferDirection direction = TransferDirection::Send;
  std::string peer_device_id;
  uint32_t total_chunks = 0;
  int64_t last_acknowledged_chunk = kNoChunkAcknowledged;
  SessionState state = SessionState::Handshaking;
  std::string content_hash;
  uint32_t chunk_size = 0;
  std::string local_path;
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;

  uint32_t resume_offset() const {
    return static_cast<uint32_t>(last_acknowledged_chunk + 1);
  }
};

struct SessionProgress {
  std::string session_id;
  uint32_t chunks_done = 0;
  uint32_t total_chunks = 0;
  SessionState state = SessionState::Handshaking;
  ErrorKind error = ErrorKind::None;
  std::string message;
  // Set when the peer certificate was accepted without a pin.
  bool identity_unverified = false;
};

// ---- pairing ---------------------------------------------------------------

struct TrustedPeer {
  std::string device_id;
  std::string display_name;
  std::string fingerprint;
  int64_t paired_at_ms = 0;
};

struct PairingResult {
  std::string peer_device_id;
  std::string peer_display_name;
  std::string pinned_fingerprint;
  std::string shared_secret;
};

inline int64_t wall_clock_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}
