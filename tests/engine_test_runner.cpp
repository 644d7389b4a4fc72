#include "SyncCLI.hpp"
#include "command_line_parser.hpp"
#include "integrity_hasher.hpp"
#include "pairing.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace lansync::test;

namespace {

struct EnginePorts {
  int transfer;
  int peer_transfer;
  int discovery;
  int broadcast;
};

std::shared_ptr<SettingsManager> engine_settings(const std::filesystem::path& data_dir,
                                                 const std::string& name,
                                                 const EnginePorts& ports) {
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  bool ok = settings->set_from_string("data_dir", data_dir.string(), error) &&
            settings->set_from_string("device_name", name, error) &&
            settings->set_from_string("listen_ip", "127.0.0.1", error) &&
            settings->set_from_string("broadcast_address", "127.0.0.1", error) &&
            settings->set_from_string("transfer_port", std::to_string(ports.transfer), error) &&
            settings->set_from_string("peer_transfer_port", std::to_string(ports.peer_transfer), error) &&
            settings->set_from_string("discovery_port", std::to_string(ports.discovery), error) &&
            settings->set_from_string("broadcast_port", std::to_string(ports.broadcast), error) &&
            settings->set_from_string("broadcast_interval_ms", "100", error) &&
            settings->set_from_string("reaper_interval_ms", "100", error) &&
            settings->set_from_string("chunk_size", "4096", error) &&
            settings->set_from_string("worker_threads", "2", error);
  if(!ok) throw std::runtime_error("test settings rejected: " + error);
  return settings;
}

bool test_settings_validation(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(settings.get<int64_t>("chunk_size") != 1048576 || settings.get<int64_t>("broadcast_port") != 37845) return false;
  if(settings.set_from_string("chunk_size", "512", error) || error.find("out of range") == std::string::npos) return false;
  if(settings.set_from_string("window_size", "four", error)) return false;
  if(settings.set_from_string("no_such_key", "1", error) || error != "unknown setting") return false;
  if(!settings.set_from_string("cs", "2048", error) || settings.get<int64_t>("chunk_size") != 2048) return false;
  if(!settings.set_from_string("verbose", "on", error) || !settings.get<bool>("verbose")) return false;
  return settings.resolve_key("TP") == std::string("transfer_port") &&
         settings.is_bool_setting("verbose") && !settings.is_bool_setting("chunk_size");
}

bool test_settings_persist(TestContext&) {
  TempWorkspace ws("engine_settings");
  SettingsManager settings;
  std::string error;
  settings.set_from_string("data_dir", ws.root().string(), error);
  settings.set_from_string("window_size", "8", error);
  settings.set_from_string("shared_secret", "0123456789abcdef", error);
  settings.set_from_string("help", "true", error);
  if(!settings.save()) return false;
  if(settings.settings_path() != ws / ".config" / "settings.json") return false;

  SettingsManager reloaded;
  reloaded.set_from_string("data_dir", ws.root().string(), error);
  if(!reloaded.load()) return false;
  // Non-persistent settings never reach the file.
  return reloaded.get<int64_t>("window_size") == 8 &&
         reloaded.get<std::string>("shared_secret") == "0123456789abcdef" &&
         !reloaded.get<bool>("help") &&
         !settings.get_json(true).contains("data_dir");
}

bool test_settings_file_rejects_bad_values(TestContext&) {
  TempWorkspace ws("engine_settings_bad");
  const auto path = ws / "settings.json";
  {
    std::ofstream out(path);
    out << R"({"window_size": 1000, "chunk_size": 8192, "mystery": 1, "verbose": "yes"})";
  }
  SettingsManager settings;
  settings.set_settings_path(path);
  if(!settings.load()) return false;
  return settings.get<int64_t>("window_size") == 4 && settings.get<int64_t>("chunk_size") == 8192 &&
         !settings.get<bool>("verbose");
}

bool test_command_line(TestContext&) {
  CommandLineParser parser("lansyncd");
  SettingsManager settings;
  const char* argv[] = {"lansyncd", "/srv/lansync", "kitchen", "-v", "--chunk_size", "65536",
                        "-dp", "40000", "--save", "off"};
  parser.parse(10, argv, settings);
  if(settings.get<std::string>("data_dir") != "/srv/lansync" ||
     settings.get<std::string>("device_name") != "kitchen" ||
     !settings.get<bool>("verbose") || settings.get<int64_t>("chunk_size") != 65536 ||
     settings.get<int64_t>("discovery_port") != 40000 || settings.save_requested()) {
    return false;
  }

  auto rejects = [&](std::vector<const char*> args) {
    SettingsManager scratch;
    try {
      parser.parse(static_cast<int>(args.size()), args.data(), scratch);
    } catch(const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  return rejects({"lansyncd", "--bogus", "1"}) &&
         rejects({"lansyncd", "--chunk_size"}) &&
         rejects({"lansyncd", "--transfer_port", "70000"}) &&
         rejects({"lansyncd", "a", "b", "c"});
}

bool test_identity_persists(TestContext& ctx) {
  TempWorkspace ws("engine_identity");
  SyncEngine engine(engine_settings(ws.root(), "first", {47851, 47852, 47853, 47854}));
  ctx.logs.attach(engine);
  engine.start();
  const auto first = engine.identity();
  if(!uuid_from_string(first.device_id) || first.display_name != "first" || first.certificate_fingerprint.size() != 64) {
    return false;
  }
  if(!std::filesystem::exists(ws / "lansync.db") || !std::filesystem::exists(ws / "inbox") ||
     !std::filesystem::exists(ws / ".config" / "settings.json")) {
    return false;
  }
  engine.stop();

  auto settings = engine_settings(ws.root(), "first", {47851, 47852, 47853, 47854});
  if(!settings->load()) return false;
  SyncEngine again(settings);
  again.start();
  const auto second = again.identity();
  return second.device_id == first.device_id &&
         second.certificate_fingerprint == first.certificate_fingerprint &&
         ctx.logs.contains("generated device id " + first.device_id) &&
         ctx.logs.contains("no shared secret configured");
}

bool test_change_feed(TestContext& ctx) {
  TempWorkspace ws("engine_changes");
  SyncEngine engine(engine_settings(ws / "data", "changes", {47861, 47862, 47863, 47864}));
  ctx.logs.attach(engine);
  engine.start();

  const auto path = ws / "docs" / "notes.txt";
  write_file(path, pattern_bytes(1000));
  ChangeEvent created;
  created.path = (ws / "docs" / "." / "notes.txt").string();
  created.kind = ChangeKind::Created;
  auto record = engine.apply_change(created);
  if(!record || record->absolute_path != path.string() || record->size_bytes != 1000 ||
     record->sync_status != SyncStatus::Pending ||
     record->content_hash != IntegrityHasher::to_hex(IntegrityHasher::digest(pattern_bytes(1000)))) {
    return false;
  }

  // Same content again: nothing changes.
  engine.store()->set_sync_status(record->file_id, SyncStatus::Synced);
  ChangeEvent touched;
  touched.path = path.string();
  auto same = engine.apply_change(touched);
  if(!same || same->file_id != record->file_id || same->sync_status != SyncStatus::Synced) return false;

  // New content keeps the file id and goes back to Pending.
  write_file(path, pattern_bytes(2000, 3));
  auto modified = engine.apply_change(touched);
  if(!modified || modified->file_id != record->file_id || modified->size_bytes != 2000 ||
     modified->sync_status != SyncStatus::Pending) {
    return false;
  }

  // A watcher-supplied hash is trusted and normalized.
  ChangeEvent hinted;
  hinted.path = path.string();
  hinted.new_content_hash = std::string(64, 'A');
  auto with_hint = engine.apply_change(hinted);
  if(!with_hint || with_hint->content_hash != std::string(64, 'a')) return false;

  hinted.new_content_hash = std::string("xyz");
  bool bad_hash = false;
  try {
    engine.apply_change(hinted);
  } catch(const SyncError& e) {
    bad_hash = e.kind() == ErrorKind::InvalidArgument;
  }
  ChangeEvent missing;
  missing.path = (ws / "docs" / "absent.txt").string();
  bool bad_path = false;
  try {
    engine.apply_change(missing);
  } catch(const SyncError& e) {
    bad_path = e.kind() == ErrorKind::InvalidArgument;
  }

  ChangeEvent deleted;
  deleted.path = path.string();
  deleted.kind = ChangeKind::Deleted;
  return bad_hash && bad_path && !engine.apply_change(deleted) && engine.files().empty() &&
         ctx.logs.contains("untracked " + path.string());
}

bool test_scan_and_pending(TestContext& ctx) {
  TempWorkspace ws("engine_scan");
  // The data directory, and the inbox inside it, sit below the scanned tree.
  SyncEngine engine(engine_settings(ws / "tree" / "data", "scanner", {47891, 47892, 47893, 47894}));
  ctx.logs.attach(engine);
  engine.start();

  write_file(ws / "tree" / "a.txt", pattern_bytes(100));
  write_file(ws / "tree" / "nested" / "deeper" / "b.bin", pattern_bytes(5000, 9));
  write_file(engine.inbox_dir() / "received.txt", pattern_bytes(10));
  std::filesystem::create_directories(ws / "tree" / "empty");

  auto records = engine.scan_directory((ws / "tree").string());
  if(records.size() != 2) return false;
  for(const auto& r : records) {
    if(r.sync_status != SyncStatus::Pending) return false;
    if(r.absolute_path.find((ws / "tree" / "data").string()) == 0) return false;
  }
  if(engine.files().size() != 2 || engine.pending_files().size() != 2) return false;

  // A second scan finds the same content and changes nothing.
  engine.store()->set_sync_status(records.front().file_id, SyncStatus::Synced);
  auto again = engine.scan_directory((ws / "tree").string());
  auto pending = engine.pending_files();
  if(again.size() != 2 || engine.files().size() != 2 || pending.size() != 1 ||
     pending.front().file_id != records.back().file_id) {
    return false;
  }

  bool not_a_directory = false;
  try {
    engine.scan_directory((ws / "tree" / "a.txt").string());
  } catch(const SyncError& e) {
    not_a_directory = e.kind() == ErrorKind::InvalidArgument;
  }
  return not_a_directory && ctx.logs.contains("2 files tracked, 0 skipped");
}

bool test_restart(TestContext& ctx) {
  TempWorkspace ws("engine_restart");
  // Beacons go to our own discovery port, so a running loop shows up as self echoes.
  SyncEngine engine(engine_settings(ws.root(), "restart", {47901, 47902, 47903, 47903}));
  ctx.logs.attach(engine);
  engine.start();
  engine.start_discovery("restart-secret");
  auto first = engine.discovery();
  if(!first || !wait_for_condition([&] { return first->counters().self_echo > 0; }, std::chrono::seconds(5))) {
    return false;
  }
  engine.stop();
  if(engine.discovery()) return false;

  engine.start();
  auto second = engine.discovery();
  if(!second || second == first) return false;
  const bool echoing = wait_for_condition([&] { return second->counters().self_echo > 0; },
                                          std::chrono::seconds(5));

  // Transfers run on the same loop: an enqueue to an unknown peer still answers.
  write_file(ws / "outbox" / "f.txt", pattern_bytes(64));
  ChangeEvent created;
  created.path = (ws / "outbox" / "f.txt").string();
  created.kind = ChangeKind::Created;
  auto record = engine.apply_change(created);
  bool unknown_peer = false;
  try {
    engine.enqueue_sync(record->file_id, generate_uuid());
  } catch(const SyncError& e) {
    unknown_peer = e.kind() == ErrorKind::InvalidArgument;
  }
  return echoing && unknown_peer && engine.running();
}

bool test_pair_discover_and_sync(TestContext& ctx) {
  TempWorkspace ws("engine_pair");
  SyncEngine alpha(engine_settings(ws / "alpha", "alpha", {47871, 47872, 47873, 47874}));
  SyncEngine beta(engine_settings(ws / "beta", "beta", {47872, 47871, 47874, 47873}));
  ctx.logs.attach(alpha, "alpha");
  ctx.logs.attach(beta, "beta");
  alpha.start();
  beta.start();

  const auto alpha_payload = alpha.make_pairing_payload();
  auto to_alpha = beta.pair_with_peer(alpha_payload);
  auto to_beta = alpha.pair_with_peer(beta.make_pairing_payload());
  if(to_alpha.peer_device_id != alpha.identity().device_id ||
     to_alpha.pinned_fingerprint != alpha.identity().certificate_fingerprint ||
     to_beta.peer_device_id != beta.identity().device_id ||
     to_beta.shared_secret != to_alpha.shared_secret) {
    return false;
  }

  bool self_rejected = false;
  try {
    alpha.pair_with_peer(alpha_payload);
  } catch(const SyncError& e) {
    self_rejected = e.kind() == ErrorKind::InvalidArgument;
  }
  if(!self_rejected) return false;

  const auto beta_id = beta.identity().device_id;
  if(!wait_for_condition([&] {
       for(const auto& p : alpha.current_peers()) {
         if(p.device_id == beta_id) return true;
       }
       return false;
     }, std::chrono::seconds(5))) {
    return false;
  }

  const auto bytes = pattern_bytes(3 * 4096 + 11);
  write_file(ws / "outbox" / "photo.raw", bytes);
  ChangeEvent created;
  created.path = (ws / "outbox" / "photo.raw").string();
  created.kind = ChangeKind::Created;
  auto record = alpha.apply_change(created);
  const auto session = alpha.enqueue_sync(record->file_id, beta_id);

  std::optional<SessionProgress> outcome;
  wait_for_condition([&] {
    outcome = alpha.session_progress(session);
    return outcome && (is_terminal(outcome->state) || outcome->state == SessionState::Paused);
  }, std::chrono::seconds(10));
  if(!outcome || outcome->state != SessionState::Completed || outcome->identity_unverified) return false;

  const auto landed = beta.inbox_dir() / "photo.raw";
  auto received = beta.file_by_path(landed.string());
  return read_file(landed) == bytes && received && received->sync_status == SyncStatus::Synced &&
         alpha.files().front().sync_status == SyncStatus::Synced &&
         alpha.trusted_peers().size() == 1 && alpha.forget_peer(beta_id) && alpha.trusted_peers().empty();
}

bool test_cli_commands(TestContext& ctx) {
  TempWorkspace ws("engine_cli");
  auto settings = engine_settings(ws / "data", "console", {47881, 47882, 47883, 47884});
  SyncEngine engine(settings);
  ctx.logs.attach(engine);
  engine.start();
  SyncCLI cli(engine, settings);

  write_file(ws / "a.txt", pattern_bytes(10));
  write_file(ws / "more" / "b.txt", pattern_bytes(20));
  write_file(ws / "more" / "c.txt", pattern_bytes(30));
  bool still_running = cli.execute("help") &&
                       cli.execute("") &&
                       cli.execute("pending") &&
                       cli.execute("track " + (ws / "a.txt").string()) &&
                       cli.execute("files") &&
                       cli.execute("scan") &&
                       cli.execute("scan " + (ws / "more").string()) &&
                       cli.execute("scan " + (ws / "nowhere").string()) &&
                       cli.execute("pending") &&
                       cli.execute("settings get cs") &&
                       cli.execute("settings set cs 10") &&
                       cli.execute("settings set window_size 8") &&
                       cli.execute("sync only-one-arg") &&
                       cli.execute("sync " + engine.files().front().file_id + " " + generate_uuid()) &&
                       cli.execute("progress") &&
                       cli.execute("forget nobody") &&
                       cli.execute("pair {not json") &&
                       cli.execute("frobnicate");
  const bool quit = !cli.execute("quit");

  return still_running && quit &&
         ctx.logs.contains("Commands:") &&
         ctx.logs.contains("Pending") &&
         ctx.logs.contains("No pending files") &&
         ctx.logs.contains("Usage: scan <dir>") &&
         ctx.logs.contains("Scanned 2 files under " + (ws / "more").string()) &&
         ctx.logs.contains("nowhere is not a directory") &&
         ctx.logs.contains((ws / "more" / "c.txt").string()) &&
         engine.pending_files().size() == 3 &&
         ctx.logs.contains("chunk_size = 4096") &&
         ctx.logs.contains("Cannot set cs: out of range") &&
         ctx.logs.contains("window_size updated; restart to apply") &&
         settings->get<int64_t>("window_size") == 8 &&
         ctx.logs.contains("Usage: sync <fileId> <peerId>") &&
         ctx.logs.contains("error (invalid-argument): peer") &&
         ctx.logs.contains("No active sessions") &&
         ctx.logs.contains("nobody is not paired") &&
         ctx.logs.contains("error (invalid-argument)") &&
         ctx.logs.contains("Unknown command: frobnicate (try 'help')") &&
         ctx.logs.contains("Quitting...");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"settings_validation", test_settings_validation},
    {"settings_persist", test_settings_persist},
    {"settings_file_rejects_bad_values", test_settings_file_rejects_bad_values},
    {"command_line", test_command_line},
    {"identity_persists", test_identity_persists},
    {"change_feed", test_change_feed},
    {"scan_and_pending", test_scan_and_pending},
    {"restart", test_restart},
    {"pair_discover_and_sync", test_pair_discover_and_sync},
    {"cli_commands", test_cli_commands},
  };
  return run_tests("engine", argc, argv, tests);
}
