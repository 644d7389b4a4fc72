#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "sync_types.hpp"

struct sqlite3;

// SQLite-backed record of tracked files, transfer checkpoints and pinned
// peers. One connection guarded by a mutex; every write is a single
// statement or an explicit transaction, committed with synchronous=FULL so a
// checkpoint is either durable or absent after a crash.
//
// All methods throw SyncError(ErrorKind::Persistence) on database failure.
class PersistenceStore {
public:
  // Pass ":memory:" for a private in-memory database.
  explicit PersistenceStore(const std::filesystem::path& db_path, Logger* logger = nullptr);
  ~PersistenceStore();

  PersistenceStore(const PersistenceStore&) = delete;
  PersistenceStore& operator=(const PersistenceStore&) = delete;

  // ---- files --------------------------------------------------------------
  void upsert_file(const FileRecord& record);
  std::optional<FileRecord> file_by_id(const std::string& file_id) const;
  std::optional<FileRecord> file_by_path(const std::string& absolute_path) const;
  std::vector<FileRecord> list_files() const;
  std::vector<FileRecord> files_with_status(SyncStatus status) const;
  bool set_sync_status(const std::string& file_id, SyncStatus status);
  // Only applies when the stored hash still equals `expected_hash`; a newer
  // local edit wins over a stale transfer outcome.
  bool set_sync_status_if_hash(const std::string& file_id,
                               const std::string& expected_hash,
                               SyncStatus status);
  bool remove_file_by_path(const std::string& absolute_path);

  // ---- transfer sessions --------------------------------------------------
  void insert_session(const TransferSession& session);
  std::optional<TransferSession> session(const std::string& session_id) const;
  std::vector<TransferSession> list_sessions() const;
  // Advances last_acknowledged_chunk to `chunk_index` if that moves it
  // forward. Returns false when the stored checkpoint is already at or past it.
  bool advance_checkpoint(const std::string& session_id, int64_t chunk_index);
  void set_session_state(const std::string& session_id, SessionState state);
  // Most recent session for the (file, peer, direction) triple that was
  // transferring the same content with the same chunk size and has not
  // completed or failed.
  std::optional<TransferSession> latest_resumable_session(const std::string& file_id,
                                                          const std::string& peer_device_id,
                                                          TransferDirection direction,
                                                          const std::string& content_hash,
                                                          uint32_t chunk_size) const;
  // Handshaking/Transferring rows left behind by a crash become Paused.
  int recover_interrupted_sessions();

  // ---- pinned peers -------------------------------------------------------
  void put_trusted_peer(const TrustedPeer& peer);
  std::optional<TrustedPeer> trusted_peer(const std::string& device_id) const;
  std::vector<TrustedPeer> trusted_peers() const;
  bool remove_trusted_peer(const std::string& device_id);

private:
  void migrate();

  sqlite3* db_ = nullptr;
  Logger* logger_ = nullptr;
  mutable std::mutex mutex_;
};
