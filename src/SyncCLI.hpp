#pragma once
#include <readline/readline.h>
#include <readline/history.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"

// Interactive operator console for lansyncd. Every command prints through the
// engine logger's print channel so embedders and tests can capture output.
class SyncCLI {
public:
  SyncCLI(SyncEngine& engine, std::shared_ptr<SettingsManager> settings)
    : engine_(engine), settings_(std::move(settings)), out_(engine.logger()) {}

  // Reads commands until `quit` or end of input.
  void run() {
    running_ = true;
    while(running_) {
      auto input = read_command_line("lansync> ");
      if(!input) break;
      if(!execute(*input)) break;
    }
    running_ = false;
  }

  void stop() { running_ = false; }

  // Returns false once the console should exit.
  bool execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if(!(iss >> cmd)) return true;
    std::string args;
    std::getline(iss, args);
    args = SettingsManager::trim_copy(args);

    try {
      if(cmd == "peers" || cmd == "p") {
        list_peers();
      } else if(cmd == "files" || cmd == "ls") {
        list_files();
      } else if(cmd == "pending") {
        list_pending();
      } else if(cmd == "scan") {
        scan(args);
      } else if(cmd == "track") {
        track(args);
      } else if(cmd == "untrack") {
        untrack(args);
      } else if(cmd == "sync") {
        sync(args);
      } else if(cmd == "progress") {
        progress(args);
      } else if(cmd == "cancel") {
        cancel(args);
      } else if(cmd == "pairing") {
        print_out(out_, "{}", engine_.make_pairing_payload());
      } else if(cmd == "pair") {
        pair(args);
      } else if(cmd == "forget") {
        forget(args);
      } else if(cmd == "fingerprint" || cmd == "fp") {
        auto id = engine_.identity();
        print_out(out_, "{} ({})", id.display_name, id.device_id);
        print_out(out_, "fingerprint {}", id.certificate_fingerprint);
      } else if(cmd == "settings" || cmd == "s") {
        handle_settings_command(args.empty() ? "list" : args);
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
        print_out(out_, "Quitting...");
        return false;
      } else {
        print_out(out_, "Unknown command: {} (try 'help')", cmd);
      }
    } catch(const SyncError& e) {
      print_out(out_, "error ({}): {}", to_string(e.kind()), e.what());
    } catch(const std::exception& e) {
      print_out(out_, "error: {}", e.what());
    }
    return true;
  }

private:
  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  static std::vector<std::string> split_args(const std::string& args) {
    std::istringstream iss(args);
    std::vector<std::string> out;
    std::string token;
    while(iss >> token) out.push_back(token);
    return out;
  }

  void list_peers() {
    auto peers = engine_.current_peers();
    auto trusted = engine_.trusted_peers();
    if(peers.empty()) {
      print_out(out_, "No peers discovered");
    }
    const auto now = wall_clock_millis();
    for(const auto& peer : peers) {
      bool pinned = false;
      for(const auto& t : trusted) {
        if(t.device_id == peer.device_id) pinned = true;
      }
      print_out(out_, "  {} {:<20} {:<15} {:<6} seen {}s ago{}",
                peer.device_id, peer.display_name, peer.network_address, to_string(peer.status),
                (now - peer.last_seen_at_ms) / 1000, pinned ? " [paired]" : "");
    }
    if(!trusted.empty()) {
      print_out(out_, "Paired devices:");
      for(const auto& t : trusted) {
        print_out(out_, "  {} {} {}", t.device_id, t.display_name, t.fingerprint);
      }
    }
  }

  void list_files() {
    auto files = engine_.files();
    if(files.empty()) {
      print_out(out_, "No tracked files");
      return;
    }
    for(const auto& f : files) {
      print_out(out_, "  {} {:<8} {:>12} {} {}",
                f.file_id, to_string(f.sync_status), f.size_bytes, f.content_hash.substr(0, 12), f.absolute_path);
    }
  }

  void list_pending() {
    auto files = engine_.pending_files();
    if(files.empty()) {
      print_out(out_, "No pending files");
      return;
    }
    for(const auto& f : files) {
      print_out(out_, "  {} {:>12} {}", f.file_id, f.size_bytes, f.absolute_path);
    }
  }

  void scan(const std::string& dir) {
    if(dir.empty()) {
      print_out(out_, "Usage: scan <dir>");
      return;
    }
    auto records = engine_.scan_directory(dir);
    print_out(out_, "Scanned {} files under {}", records.size(), dir);
  }

  void track(const std::string& path) {
    if(path.empty()) {
      print_out(out_, "Usage: track <path>");
      return;
    }
    auto existing = engine_.file_by_path(path);
    ChangeEvent event;
    event.path = path;
    event.kind = existing ? ChangeKind::Modified : ChangeKind::Created;
    if(auto record = engine_.apply_change(event)) {
      print_out(out_, "{} {} ({})", record->file_id, record->absolute_path, to_string(record->sync_status));
    }
  }

  void untrack(const std::string& path) {
    if(path.empty()) {
      print_out(out_, "Usage: untrack <path>");
      return;
    }
    ChangeEvent event;
    event.path = path;
    event.kind = ChangeKind::Deleted;
    engine_.apply_change(event);
    print_out(out_, "Untracked {}", path);
  }

  void sync(const std::string& args) {
    auto parts = split_args(args);
    if(parts.size() != 2) {
      print_out(out_, "Usage: sync <fileId> <peerId>");
      return;
    }
    auto session = engine_.enqueue_sync(parts[0], parts[1]);
    print_out(out_, "session {}", session);
  }

  void progress(const std::string& session_id) {
    if(session_id.empty()) {
      auto live = engine_.live_sessions();
      if(live.empty()) print_out(out_, "No active sessions");
      for(const auto& p : live) print_progress(p);
      return;
    }
    auto p = engine_.session_progress(session_id);
    if(!p) {
      print_out(out_, "Unknown session {}", session_id);
      return;
    }
    print_progress(*p);
  }

  void print_progress(const SessionProgress& p) {
    print_out(out_, "  {} {:<12} {}/{} chunks{}{}{}",
              p.session_id, to_string(p.state), p.chunks_done, p.total_chunks,
              p.error != ErrorKind::None ? std::string(" [") + to_string(p.error) + "]" : std::string(),
              p.message.empty() ? std::string() : " " + p.message,
              p.identity_unverified ? " (identity not verified)" : "");
  }

  void cancel(const std::string& session_id) {
    if(session_id.empty()) {
      print_out(out_, "Usage: cancel <sessionId>");
      return;
    }
    if(engine_.cancel_session(session_id)) {
      print_out(out_, "Cancelling {}", session_id);
    } else {
      print_out(out_, "No running session {}", session_id);
    }
  }

  void pair(const std::string& payload) {
    if(payload.empty()) {
      print_out(out_, "Usage: pair <payload>");
      return;
    }
    auto result = engine_.pair_with_peer(payload);
    print_out(out_, "Paired with {} ({}), pinned {}",
              result.peer_display_name, result.peer_device_id, result.pinned_fingerprint);
  }

  void forget(const std::string& device_id) {
    if(device_id.empty()) {
      print_out(out_, "Usage: forget <deviceId>");
      return;
    }
    if(engine_.forget_peer(device_id)) {
      print_out(out_, "Forgot {}", device_id);
    } else {
      print_out(out_, "{} is not paired", device_id);
    }
  }

  void handle_settings_command(const std::string& args) {
    auto parts = split_args(args);
    const std::string sub = parts.empty() ? "list" : parts[0];
    if(sub == "list") {
      for(const auto& key : settings_->keys()) {
        if(key == "shared_secret") {
          print_out(out_, "  {:<26} {}", key, settings_->get<std::string>(key).empty() ? "" : "<set>");
          continue;
        }
        print_out(out_, "  {:<26} {}", key, settings_->value_as_string(key));
      }
    } else if(sub == "get" && parts.size() == 2) {
      auto key = settings_->resolve_key(parts[1]);
      if(!key) {
        print_out(out_, "Unknown setting {}", parts[1]);
        return;
      }
      print_out(out_, "{} = {}", *key, settings_->value_as_string(*key));
    } else if(sub == "set" && parts.size() >= 3) {
      std::string value = args.substr(args.find(parts[1]) + parts[1].size());
      std::string error;
      if(!settings_->set_from_string(parts[1], SettingsManager::trim_copy(value), error)) {
        print_out(out_, "Cannot set {}: {}", parts[1], error);
        return;
      }
      print_out(out_, "{} updated; restart to apply", *settings_->resolve_key(parts[1]));
    } else if(sub == "save") {
      if(settings_->save()) {
        print_out(out_, "Settings saved to {}", settings_->settings_path().string());
      } else {
        print_out(out_, "Unable to save settings to {}", settings_->settings_path().string());
      }
    } else {
      print_out(out_, "Usage: settings [list | get <key> | set <key> <value> | save]");
    }
  }

  void print_help() {
    print_out(out_, "Commands:");
    print_out(out_, "  peers                    discovered and paired devices");
    print_out(out_, "  files                    tracked files and their sync status");
    print_out(out_, "  pending                  tracked files not yet delivered");
    print_out(out_, "  scan <dir>               track every file below a directory");
    print_out(out_, "  track <path>             start tracking or rehash a file");
    print_out(out_, "  untrack <path>           stop tracking a file");
    print_out(out_, "  sync <fileId> <peerId>   send a file to a peer");
    print_out(out_, "  progress [sessionId]     show one session or all active ones");
    print_out(out_, "  cancel <sessionId>       pause a session");
    print_out(out_, "  pairing                  print this device's pairing payload");
    print_out(out_, "  pair <payload>           pin a peer and adopt its discovery secret");
    print_out(out_, "  forget <deviceId>        remove a pinned peer");
    print_out(out_, "  fingerprint              this device's certificate fingerprint");
    print_out(out_, "  settings [...]           list, get, set or save settings");
    print_out(out_, "  help                     this text");
    print_out(out_, "  quit                     exit");
  }

  SyncEngine& engine_;
  std::shared_ptr<SettingsManager> settings_;
  Logger* out_ = nullptr;
  std::atomic<bool> running_{false};
};
