#include "persistence_store.hpp"

#include <sqlite3.h>

namespace {

class StmtGuard {
public:
  StmtGuard() = default;
  explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
  ~StmtGuard() { if(stmt_) sqlite3_finalize(stmt_); }

  StmtGuard(const StmtGuard&) = delete;
  StmtGuard& operator=(const StmtGuard&) = delete;
  StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }

  sqlite3_stmt* get() const { return stmt_; }

private:
  sqlite3_stmt* stmt_ = nullptr;
};

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw SyncError(ErrorKind::Persistence, what + ": " + (db ? sqlite3_errmsg(db) : "no database"));
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if(sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw SyncError(ErrorKind::Persistence, msg);
  }
}

StmtGuard prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    fail(db, "prepare");
  }
  return StmtGuard(stmt);
}

void step_done(sqlite3* db, sqlite3_stmt* stmt) {
  if(sqlite3_step(stmt) != SQLITE_DONE) {
    fail(db, "step");
  }
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool step_row(sqlite3* db, sqlite3_stmt* stmt) {
  int rc = sqlite3_step(stmt);
  if(rc == SQLITE_ROW) return true;
  if(rc == SQLITE_DONE) return false;
  fail(db, "step");
}

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
  if(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    fail(db, "bind");
  }
}

void bind_int(sqlite3* db, sqlite3_stmt* stmt, int index, int64_t value) {
  if(sqlite3_bind_int64(stmt, index, value) != SQLITE_OK) {
    fail(db, "bind");
  }
}

std::string column_text(sqlite3_stmt* stmt, int index) {
  auto* text = sqlite3_column_text(stmt, index);
  if(!text) return std::string();
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }
  ~Transaction() {
    if(!committed_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
  }
  void commit() {
    exec(db_, "COMMIT");
    committed_ = true;
  }

private:
  sqlite3* db_;
  bool committed_ = false;
};

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS files (
  file_id      TEXT PRIMARY KEY,
  path         TEXT NOT NULL UNIQUE,
  content_hash TEXT NOT NULL,
  size_bytes   INTEGER NOT NULL,
  modified_at  INTEGER NOT NULL,
  sync_status  TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS transfer_sessions (
  session_id              TEXT PRIMARY KEY,
  file_id                 TEXT NOT NULL,
  direction               TEXT NOT NULL,
  peer_device_id          TEXT NOT NULL,
  total_chunks            INTEGER NOT NULL,
  last_acknowledged_chunk INTEGER NOT NULL,
  state                   TEXT NOT NULL,
  content_hash            TEXT NOT NULL,
  chunk_size              INTEGER NOT NULL,
  local_path              TEXT NOT NULL,
  created_at              INTEGER NOT NULL,
  updated_at              INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_sessions_resume
  ON transfer_sessions(file_id, peer_device_id, direction, created_at);
CREATE TABLE IF NOT EXISTS trusted_peers (
  device_id    TEXT PRIMARY KEY,
  display_name TEXT NOT NULL,
  fingerprint  TEXT NOT NULL,
  paired_at    INTEGER NOT NULL
);
)sql";

constexpr const char* kFileColumns =
  "file_id, path, content_hash, size_bytes, modified_at, sync_status";

constexpr const char* kSessionColumns =
  "session_id, file_id, direction, peer_device_id, total_chunks, last_acknowledged_chunk, "
  "state, content_hash, chunk_size, local_path, created_at, updated_at";

FileRecord read_file(sqlite3_stmt* stmt) {
  FileRecord record;
  record.file_id = column_text(stmt, 0);
  record.absolute_path = column_text(stmt, 1);
  record.content_hash = column_text(stmt, 2);
  record.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
  record.modified_at_ms = sqlite3_column_int64(stmt, 4);
  record.sync_status = sync_status_from_string(column_text(stmt, 5)).value_or(SyncStatus::Pending);
  return record;
}

TransferSession read_session(sqlite3_stmt* stmt) {
  TransferSession s;
  s.session_id = column_text(stmt, 0);
  s.file_id = column_text(stmt, 1);
  s.direction = direction_from_string(column_text(stmt, 2)).value_or(TransferDirection::Send);
  s.peer_device_id = column_text(stmt, 3);
  s.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
  s.last_acknowledged_chunk = sqlite3_column_int64(stmt, 5);
  s.state = session_state_from_string(column_text(stmt, 6)).value_or(SessionState::Paused);
  s.content_hash = column_text(stmt, 7);
  s.chunk_size = static_cast<uint32_t>(sqlite3_column_int64(stmt, 8));
  s.local_path = column_text(stmt, 9);
  s.created_at_ms = sqlite3_column_int64(stmt, 10);
  s.updated_at_ms = sqlite3_column_int64(stmt, 11);
  return s;
}

TrustedPeer read_peer(sqlite3_stmt* stmt) {
  TrustedPeer peer;
  peer.device_id = column_text(stmt, 0);
  peer.display_name = column_text(stmt, 1);
  peer.fingerprint = column_text(stmt, 2);
  peer.paired_at_ms = sqlite3_column_int64(stmt, 3);
  return peer;
}

} // namespace

PersistenceStore::PersistenceStore(const std::filesystem::path& db_path, Logger* logger)
  : logger_(logger) {
  const std::string path = db_path.string();
  if(path != ":memory:" && db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if(ec) {
      throw SyncError(ErrorKind::Persistence,
                      "cannot create " + db_path.parent_path().string() + ": " + ec.message());
    }
  }
  if(sqlite3_open_v2(path.c_str(), &db_,
                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw SyncError(ErrorKind::Persistence, "cannot open " + path + ": " + msg);
  }
  try {
    sqlite3_busy_timeout(db_, 5000);
    if(path != ":memory:") exec(db_, "PRAGMA journal_mode=WAL");
    exec(db_, "PRAGMA synchronous=FULL");
    migrate();
  } catch(const SyncError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  log_debug(logger_, "opened {}", path);
}

PersistenceStore::~PersistenceStore() {
  if(db_) sqlite3_close(db_);
}

void PersistenceStore::migrate() {
  exec(db_, kSchema);
}

// ---- files ----------------------------------------------------------------

void PersistenceStore::upsert_file(const FileRecord& record) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_,
    "INSERT INTO files (file_id, path, content_hash, size_bytes, modified_at, sync_status) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
    "ON CONFLICT(file_id) DO UPDATE SET path = excluded.path, content_hash = excluded.content_hash, "
    "size_bytes = excluded.size_bytes, modified_at = excluded.modified_at, sync_status = excluded.sync_status");
  bind_text(db_, stmt.get(), 1, record.file_id);
  bind_text(db_, stmt.get(), 2, record.absolute_path);
  bind_text(db_, stmt.get(), 3, record.content_hash);
  bind_int(db_, stmt.get(), 4, static_cast<int64_t>(record.size_bytes));
  bind_int(db_, stmt.get(), 5, record.modified_at_ms);
  bind_text(db_, stmt.get(), 6, to_string(record.sync_status));
  step_done(db_, stmt.get());
}

std::optional<FileRecord> PersistenceStore::file_by_id(const std::string& file_id) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kFileColumns + " FROM files WHERE file_id = ?1").c_str());
  bind_text(db_, stmt.get(), 1, file_id);
  if(!step_row(db_, stmt.get())) return std::nullopt;
  return read_file(stmt.get());
}

std::optional<FileRecord> PersistenceStore::file_by_path(const std::string& absolute_path) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kFileColumns + " FROM files WHERE path = ?1").c_str());
  bind_text(db_, stmt.get(), 1, absolute_path);
  if(!step_row(db_, stmt.get())) return std::nullopt;
  return read_file(stmt.get());
}

std::vector<FileRecord> PersistenceStore::list_files() const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kFileColumns + " FROM files ORDER BY path").c_str());
  std::vector<FileRecord> out;
  while(step_row(db_, stmt.get())) out.push_back(read_file(stmt.get()));
  return out;
}

std::vector<FileRecord> PersistenceStore::files_with_status(SyncStatus status) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kFileColumns +
                            " FROM files WHERE sync_status = ?1 ORDER BY path").c_str());
  bind_text(db_, stmt.get(), 1, to_string(status));
  std::vector<FileRecord> out;
  while(step_row(db_, stmt.get())) out.push_back(read_file(stmt.get()));
  return out;
}

bool PersistenceStore::set_sync_status(const std::string& file_id, SyncStatus status) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, "UPDATE files SET sync_status = ?2 WHERE file_id = ?1");
  bind_text(db_, stmt.get(), 1, file_id);
  bind_text(db_, stmt.get(), 2, to_string(status));
  step_done(db_, stmt.get());
  return sqlite3_changes(db_) > 0;
}

bool PersistenceStore::set_sync_status_if_hash(const std::string& file_id,
                                               const std::string& expected_hash,
                                               SyncStatus status) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, "UPDATE files SET sync_status = ?3 WHERE file_id = ?1 AND content_hash = ?2");
  bind_text(db_, stmt.get(), 1, file_id);
  bind_text(db_, stmt.get(), 2, expected_hash);
  bind_text(db_, stmt.get(), 3, to_string(status));
  step_done(db_, stmt.get());
  return sqlite3_changes(db_) > 0;
}

bool PersistenceStore::remove_file_by_path(const std::string& absolute_path) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, "DELETE FROM files WHERE path = ?1");
  bind_text(db_, stmt.get(), 1, absolute_path);
  step_done(db_, stmt.get());
  return sqlite3_changes(db_) > 0;
}

// ---- transfer sessions ----------------------------------------------------

void PersistenceStore::insert_session(const TransferSession& s) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("INSERT INTO transfer_sessions (") + kSessionColumns +
                            ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)").c_str());
  const auto now = wall_clock_millis();
  bind_text(db_, stmt.get(), 1, s.session_id);
  bind_text(db_, stmt.get(), 2, s.file_id);
  bind_text(db_, stmt.get(), 3, to_string(s.direction));
  bind_text(db_, stmt.get(), 4, s.peer_device_id);
  bind_int(db_, stmt.get(), 5, s.total_chunks);
  bind_int(db_, stmt.get(), 6, s.last_acknowledged_chunk);
  bind_text(db_, stmt.get(), 7, to_string(s.state));
  bind_text(db_, stmt.get(), 8, s.content_hash);
  bind_int(db_, stmt.get(), 9, s.chunk_size);
  bind_text(db_, stmt.get(), 10, s.local_path);
  bind_int(db_, stmt.get(), 11, s.created_at_ms ? s.created_at_ms : now);
  bind_int(db_, stmt.get(), 12, now);
  step_done(db_, stmt.get());
}

std::optional<TransferSession> PersistenceStore::session(const std::string& session_id) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kSessionColumns +
                            " FROM transfer_sessions WHERE session_id = ?1").c_str());
  bind_text(db_, stmt.get(), 1, session_id);
  if(!step_row(db_, stmt.get())) return std::nullopt;
  return read_session(stmt.get());
}

std::vector<TransferSession> PersistenceStore::list_sessions() const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kSessionColumns +
                            " FROM transfer_sessions ORDER BY created_at, rowid").c_str());
  std::vector<TransferSession> out;
  while(step_row(db_, stmt.get())) out.push_back(read_session(stmt.get()));
  return out;
}

bool PersistenceStore::advance_checkpoint(const std::string& session_id, int64_t chunk_index) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_,
    "UPDATE transfer_sessions SET last_acknowledged_chunk = ?2, updated_at = ?3 "
    "WHERE session_id = ?1 AND last_acknowledged_chunk < ?2");
  bind_text(db_, stmt.get(), 1, session_id);
  bind_int(db_, stmt.get(), 2, chunk_index);
  bind_int(db_, stmt.get(), 3, wall_clock_millis());
  step_done(db_, stmt.get());
  return sqlite3_changes(db_) > 0;
}

void PersistenceStore::set_session_state(const std::string& session_id, SessionState state) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, "UPDATE transfer_sessions SET state = ?2, updated_at = ?3 WHERE session_id = ?1");
  bind_text(db_, stmt.get(), 1, session_id);
  bind_text(db_, stmt.get(), 2, to_string(state));
  bind_int(db_, stmt.get(), 3, wall_clock_millis());
  step_done(db_, stmt.get());
}

std::optional<TransferSession> PersistenceStore::latest_resumable_session(const std::string& file_id,
                                                                          const std::string& peer_device_id,
                                                                          TransferDirection direction,
                                                                          const std::string& content_hash,
                                                                          uint32_t chunk_size) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, (std::string("SELECT ") + kSessionColumns +
    " FROM transfer_sessions WHERE file_id = ?1 AND peer_device_id = ?2 AND direction = ?3 "
    "AND content_hash = ?4 AND chunk_size = ?5 AND state NOT IN (?6, ?7) "
    "ORDER BY created_at DESC, rowid DESC LIMIT 1").c_str());
  bind_text(db_, stmt.get(), 1, file_id);
  bind_text(db_, stmt.get(), 2, peer_device_id);
  bind_text(db_, stmt.get(), 3, to_string(direction));
  bind_text(db_, stmt.get(), 4, content_hash);
  bind_int(db_, stmt.get(), 5, chunk_size);
  bind_text(db_, stmt.get(), 6, to_string(SessionState::Completed));
  bind_text(db_, stmt.get(), 7, to_string(SessionState::Failed));
  if(!step_row(db_, stmt.get())) return std::nullopt;
  return read_session(stmt.get());
}

int PersistenceStore::recover_interrupted_sessions() {
  std::lock_guard lg(mutex_);
  Transaction tx(db_);
  auto stmt = prepare(db_,
    "UPDATE transfer_sessions SET state = ?1, updated_at = ?2 WHERE state IN (?3, ?4)");
  bind_text(db_, stmt.get(), 1, to_string(SessionState::Paused));
  bind_int(db_, stmt.get(), 2, wall_clock_millis());
  bind_text(db_, stmt.get(), 3, to_string(SessionState::Handshaking));
  bind_text(db_, stmt.get(), 4, to_string(SessionState::Transferring));
  step_done(db_, stmt.get());
  const int changed = sqlite3_changes(db_);

  // Files that were mid-flight go back to Pending so they get picked up again.
  exec(db_, "UPDATE files SET sync_status = 'Pending' WHERE sync_status = 'Syncing'");
  tx.commit();
  if(changed > 0) {
    log_info(logger_, "{} interrupted transfer session(s) marked Paused", changed);
  }
  return changed;
}

// ---- pinned peers ---------------------------------------------------------

void PersistenceStore::put_trusted_peer(const TrustedPeer& peer) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_,
    "INSERT INTO trusted_peers (device_id, display_name, fingerprint, paired_at) VALUES (?1, ?2, ?3, ?4) "
    "ON CONFLICT(device_id) DO UPDATE SET display_name = excluded.display_name, "
    "fingerprint = excluded.fingerprint, paired_at = excluded.paired_at");
  bind_text(db_, stmt.get(), 1, peer.device_id);
  bind_text(db_, stmt.get(), 2, peer.display_name);
  bind_text(db_, stmt.get(), 3, peer.fingerprint);
  bind_int(db_, stmt.get(), 4, peer.paired_at_ms ? peer.paired_at_ms : wall_clock_millis());
  step_done(db_, stmt.get());
}

std::optional<TrustedPeer> PersistenceStore::trusted_peer(const std::string& device_id) const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_,
    "SELECT device_id, display_name, fingerprint, paired_at FROM trusted_peers WHERE device_id = ?1");
  bind_text(db_, stmt.get(), 1, device_id);
  if(!step_row(db_, stmt.get())) return std::nullopt;
  return read_peer(stmt.get());
}

std::vector<TrustedPeer> PersistenceStore::trusted_peers() const {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_,
    "SELECT device_id, display_name, fingerprint, paired_at FROM trusted_peers ORDER BY paired_at");
  std::vector<TrustedPeer> out;
  while(step_row(db_, stmt.get())) out.push_back(read_peer(stmt.get()));
  return out;
}

bool PersistenceStore::remove_trusted_peer(const std::string& device_id) {
  std::lock_guard lg(mutex_);
  auto stmt = prepare(db_, "DELETE FROM trusted_peers WHERE device_id = ?1");
  bind_text(db_, stmt.get(), 1, device_id);
  step_done(db_, stmt.get());
  return sqlite3_changes(db_) > 0;
}
