#include "sync_types.hpp"

const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::TransientNetwork: return "transient-network";
    case ErrorKind::Authentication: return "authentication";
    case ErrorKind::Pinning: return "pinning";
    case ErrorKind::Integrity: return "integrity";
    case ErrorKind::Persistence: return "persistence";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::InvalidArgument: return "invalid-argument";
  }
  return "unknown";
}

const char* to_string(PeerStatus status) {
  return status == PeerStatus::Online ? "online" : "stale";
}

const char* to_string(SyncStatus status) {
  switch(status) {
    case SyncStatus::Pending: return "Pending";
    case SyncStatus::Syncing: return "Syncing";
    case SyncStatus::Synced: return "Synced";
    case SyncStatus::Failed: return "Failed";
    case SyncStatus::Conflict: return "Conflict";
  }
  return "Pending";
}

std::optional<SyncStatus> sync_status_from_string(const std::string& value) {
  if(value == "Pending") return SyncStatus::Pending;
  if(value == "Syncing") return SyncStatus::Syncing;
  if(value == "Synced") return SyncStatus::Synced;
  if(value == "Failed") return SyncStatus::Failed;
  if(value == "Conflict") return SyncStatus::Conflict;
  return std::nullopt;
}

const char* to_string(TransferDirection direction) {
  return direction == TransferDirection::Send ? "Send" : "Receive";
}

std::optional<TransferDirection> direction_from_string(const std::string& value) {
  if(value == "Send") return TransferDirection::Send;
  if(value == "Receive") return TransferDirection::Receive;
  return std::nullopt;
}

const char* to_string(SessionState state) {
  switch(state) {
    case SessionState::Handshaking: return "Handshaking";
    case SessionState::Transferring: return "Transferring";
    case SessionState::Paused: return "Paused";
    case SessionState::Completed: return "Completed";
    case SessionState::Failed: return "Failed";
  }
  return "Failed";
}

std::optional<SessionState> session_state_from_string(const std::string& value) {
  if(value == "Handshaking") return SessionState::Handshaking;
  if(value == "Transferring") return SessionState::Transferring;
  if(value == "Paused") return SessionState::Paused;
  if(value == "Completed") return SessionState::Completed;
  if(value == "Failed") return SessionState::Failed;
  return std::nullopt;
}
