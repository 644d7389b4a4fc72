#include "persistence_store.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

using namespace lansync::test;

namespace {

FileRecord make_file(const std::string& path, const std::string& hash) {
  FileRecord f;
  f.file_id = generate_uuid();
  f.absolute_path = path;
  f.content_hash = hash;
  f.size_bytes = 1234;
  f.modified_at_ms = 1700000000000;
  f.sync_status = SyncStatus::Pending;
  return f;
}

TransferSession make_session(const std::string& file_id, const std::string& peer, SessionState state) {
  TransferSession s;
  s.session_id = generate_uuid();
  s.file_id = file_id;
  s.direction = TransferDirection::Send;
  s.peer_device_id = peer;
  s.total_chunks = 10;
  s.state = state;
  s.content_hash = std::string(64, 'a');
  s.chunk_size = 4096;
  s.local_path = "/tmp/x";
  return s;
}

bool test_file_crud(TestContext&) {
  PersistenceStore store(":memory:");
  auto f = make_file("/data/a.txt", std::string(64, 'a'));
  store.upsert_file(f);
  auto by_id = store.file_by_id(f.file_id);
  auto by_path = store.file_by_path("/data/a.txt");
  if(!by_id || !by_path || by_id->file_id != by_path->file_id) return false;
  if(by_id->size_bytes != 1234 || by_id->sync_status != SyncStatus::Pending) return false;

  f.content_hash = std::string(64, 'b');
  f.sync_status = SyncStatus::Synced;
  store.upsert_file(f);
  auto updated = store.file_by_id(f.file_id);
  if(!updated || updated->content_hash != std::string(64, 'b') || updated->sync_status != SyncStatus::Synced) {
    return false;
  }
  store.upsert_file(make_file("/data/b.txt", std::string(64, 'c')));
  auto all = store.list_files();
  return all.size() == 2 && all[0].absolute_path == "/data/a.txt" &&
         store.remove_file_by_path("/data/a.txt") && !store.remove_file_by_path("/data/a.txt") &&
         !store.file_by_id(f.file_id) && store.list_files().size() == 1;
}

bool test_duplicate_path_rejected(TestContext&) {
  PersistenceStore store(":memory:");
  store.upsert_file(make_file("/data/a.txt", std::string(64, 'a')));
  try {
    store.upsert_file(make_file("/data/a.txt", std::string(64, 'b')));
  } catch(const SyncError& e) {
    return e.kind() == ErrorKind::Persistence;
  }
  return false;
}

bool test_status_if_hash(TestContext&) {
  PersistenceStore store(":memory:");
  auto f = make_file("/data/a.txt", std::string(64, 'a'));
  store.upsert_file(f);
  bool stale = store.set_sync_status_if_hash(f.file_id, std::string(64, 'b'), SyncStatus::Synced);
  bool fresh = store.set_sync_status_if_hash(f.file_id, std::string(64, 'a'), SyncStatus::Synced);
  return !stale && fresh && store.file_by_id(f.file_id)->sync_status == SyncStatus::Synced &&
         store.set_sync_status(f.file_id, SyncStatus::Failed) &&
         !store.set_sync_status(generate_uuid(), SyncStatus::Failed);
}

bool test_files_with_status(TestContext&) {
  PersistenceStore store(":memory:");
  auto b = make_file("/data/b.txt", std::string(64, 'b'));
  auto a = make_file("/data/a.txt", std::string(64, 'a'));
  auto c = make_file("/data/c.txt", std::string(64, 'c'));
  store.upsert_file(b);
  store.upsert_file(a);
  store.upsert_file(c);
  store.set_sync_status(c.file_id, SyncStatus::Synced);

  auto pending = store.files_with_status(SyncStatus::Pending);
  auto synced = store.files_with_status(SyncStatus::Synced);
  return pending.size() == 2 && pending[0].absolute_path == "/data/a.txt" &&
         pending[1].absolute_path == "/data/b.txt" &&
         synced.size() == 1 && synced[0].file_id == c.file_id &&
         store.files_with_status(SyncStatus::Conflict).empty();
}

bool test_checkpoint_only_moves_forward(TestContext&) {
  PersistenceStore store(":memory:");
  auto s = make_session(generate_uuid(), generate_uuid(), SessionState::Transferring);
  store.insert_session(s);
  if(store.session(s.session_id)->last_acknowledged_chunk != kNoChunkAcknowledged) return false;
  bool a = store.advance_checkpoint(s.session_id, 0);
  bool b = store.advance_checkpoint(s.session_id, 4);
  bool back = store.advance_checkpoint(s.session_id, 2);
  bool same = store.advance_checkpoint(s.session_id, 4);
  auto loaded = store.session(s.session_id);
  return a && b && !back && !same && loaded && loaded->last_acknowledged_chunk == 4 &&
         loaded->resume_offset() == 5 && loaded->chunk_size == 4096 && loaded->total_chunks == 10;
}

bool test_recover_interrupted(TestContext& ctx) {
  TempWorkspace ws("persistence_recover");
  Logger logger("store");
  ctx.logs.attach(&logger);
  const auto db = ws / "state.db";
  auto f = make_file("/data/a.txt", std::string(64, 'a'));
  std::string transferring_id;
  std::string done_id;
  {
    PersistenceStore store(db, &logger);
    f.sync_status = SyncStatus::Syncing;
    store.upsert_file(f);
    auto t = make_session(f.file_id, "peer", SessionState::Transferring);
    auto h = make_session(f.file_id, "peer", SessionState::Handshaking);
    auto c = make_session(f.file_id, "peer", SessionState::Completed);
    store.insert_session(t);
    store.insert_session(h);
    store.insert_session(c);
    store.advance_checkpoint(t.session_id, 3);
    transferring_id = t.session_id;
    done_id = c.session_id;
  }
  PersistenceStore reopened(db, &logger);
  int changed = reopened.recover_interrupted_sessions();
  auto t = reopened.session(transferring_id);
  return changed == 2 && t && t->state == SessionState::Paused && t->last_acknowledged_chunk == 3 &&
         reopened.session(done_id)->state == SessionState::Completed &&
         reopened.file_by_id(f.file_id)->sync_status == SyncStatus::Pending &&
         reopened.list_sessions().size() == 3 &&
         ctx.logs.contains("2 interrupted transfer session(s) marked Paused");
}

bool test_latest_resumable(TestContext&) {
  PersistenceStore store(":memory:");
  const auto file = generate_uuid();
  const auto peer = generate_uuid();
  const auto hash = std::string(64, 'a');

  auto old = make_session(file, peer, SessionState::Paused);
  old.created_at_ms = 1000;
  store.insert_session(old);
  auto newer = make_session(file, peer, SessionState::Paused);
  newer.created_at_ms = 2000;
  store.insert_session(newer);
  store.advance_checkpoint(newer.session_id, 6);

  auto found = store.latest_resumable_session(file, peer, TransferDirection::Send, hash, 4096);
  if(!found || found->session_id != newer.session_id || found->resume_offset() != 7) return false;

  // Different content, chunk size or direction never resumes.
  if(store.latest_resumable_session(file, peer, TransferDirection::Send, std::string(64, 'b'), 4096)) return false;
  if(store.latest_resumable_session(file, peer, TransferDirection::Send, hash, 8192)) return false;
  if(store.latest_resumable_session(file, peer, TransferDirection::Receive, hash, 4096)) return false;

  // Terminal sessions are skipped; the older paused one is next.
  store.set_session_state(newer.session_id, SessionState::Completed);
  auto fallback = store.latest_resumable_session(file, peer, TransferDirection::Send, hash, 4096);
  store.set_session_state(old.session_id, SessionState::Failed);
  auto none = store.latest_resumable_session(file, peer, TransferDirection::Send, hash, 4096);
  return fallback && fallback->session_id == old.session_id && !none;
}

bool test_trusted_peers(TestContext&) {
  PersistenceStore store(":memory:");
  TrustedPeer p;
  p.device_id = generate_uuid();
  p.display_name = "desk";
  p.fingerprint = std::string(64, 'f');
  store.put_trusted_peer(p);
  auto loaded = store.trusted_peer(p.device_id);
  if(!loaded || loaded->fingerprint != p.fingerprint || loaded->paired_at_ms == 0) return false;

  p.fingerprint = std::string(64, 'e');
  store.put_trusted_peer(p);
  if(store.trusted_peer(p.device_id)->fingerprint != p.fingerprint) return false;
  if(store.trusted_peers().size() != 1) return false;
  return store.remove_trusted_peer(p.device_id) && !store.trusted_peer(p.device_id) &&
         !store.remove_trusted_peer(p.device_id);
}

bool test_unopenable_database(TestContext&) {
  TempWorkspace ws("persistence_bad");
  // A directory where the database file should be.
  std::filesystem::create_directories(ws / "db");
  try {
    PersistenceStore store(ws / "db");
  } catch(const SyncError& e) {
    return e.kind() == ErrorKind::Persistence;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"file_crud", test_file_crud},
    {"duplicate_path_rejected", test_duplicate_path_rejected},
    {"status_if_hash", test_status_if_hash},
    {"files_with_status", test_files_with_status},
    {"checkpoint_only_moves_forward", test_checkpoint_only_moves_forward},
    {"recover_interrupted", test_recover_interrupted},
    {"latest_resumable", test_latest_resumable},
    {"trusted_peers", test_trusted_peers},
    {"unopenable_database", test_unopenable_database},
  };
  return run_tests("persistence", argc, argv, tests);
}
