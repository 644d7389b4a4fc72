#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "discovery_service.hpp"
#include "log.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"

class CertificateManager;
class PersistenceStore;
class SettingsManager;

// Wires the core together for one device: identity, store, discovery and
// transfers on a shared io_context run by a small thread pool. This is the
// surface the console and any embedding UI call into.
class SyncEngine {
public:
  using PeerListObserver = DiscoveryService::PeerListener;
  using ProgressListener = TransferEngine::ProgressListener;

  explicit SyncEngine(std::shared_ptr<SettingsManager> settings);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Creates the data directory, generates the device id on first run, opens
  // the store (recovering interrupted sessions), loads or creates the
  // certificate, starts the transfer listener and the worker threads. When a
  // shared secret is configured discovery starts as well.
  void start();
  void stop();
  bool running() const { return started_; }

  // ---- discovery ----------------------------------------------------------
  // Starts discovery, or rotates the secret when it is already running.
  // Throws SyncError(InvalidArgument) for an empty secret.
  DiscoveryService::ListenerHandle start_discovery(const std::string& shared_secret,
                                                   PeerListObserver observer = nullptr);
  void remove_peer_observer(DiscoveryService::ListenerHandle handle);
  std::vector<PeerRecord> current_peers() const;

  // ---- pairing ------------------------------------------------------------
  // Our own payload. A shared secret is generated and adopted when none is
  // configured yet.
  std::string make_pairing_payload();
  // Pins the peer's fingerprint and adopts the carried discovery secret.
  PairingResult pair_with_peer(const std::string& payload);
  bool forget_peer(const std::string& device_id);
  std::vector<TrustedPeer> trusted_peers() const;

  // ---- transfers ----------------------------------------------------------
  std::string enqueue_sync(const std::string& file_id, const std::string& peer_device_id);
  bool cancel_session(const std::string& session_id);
  std::optional<SessionProgress> session_progress(const std::string& session_id) const;
  std::vector<SessionProgress> live_sessions() const;
  TransferEngine::ListenerHandle add_progress_listener(ProgressListener listener,
                                                       std::optional<std::string> session_id = std::nullopt);
  void remove_progress_listener(TransferEngine::ListenerHandle handle);

  // ---- change feed --------------------------------------------------------
  // Maps a watcher event onto the file table. Returns the resulting record,
  // or nothing for deletions. Throws SyncError(InvalidArgument) when a
  // created or modified path cannot be read.
  std::optional<FileRecord> apply_change(const ChangeEvent& event);
  // Tracks every regular file below `directory` as if it had just been
  // created, skipping the data and inbox directories. Files that cannot be
  // read are logged and skipped. Throws SyncError(InvalidArgument) when
  // `directory` is not a directory.
  std::vector<FileRecord> scan_directory(const std::string& directory);
  std::vector<FileRecord> files() const;
  // Tracked files whose current content has not been delivered yet.
  std::vector<FileRecord> pending_files() const;
  std::optional<FileRecord> file_by_path(const std::string& path) const;

  // ---- introspection ------------------------------------------------------
  DeviceIdentity identity() const;
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  Logger* logger() const { return engine_logger_.get(); }
  std::shared_ptr<TransferEngine> transfers() const { return transfer_; }
  std::shared_ptr<DiscoveryService> discovery() const;
  std::shared_ptr<PersistenceStore> store() const { return store_; }
  const std::filesystem::path& data_dir() const { return data_dir_; }
  const std::filesystem::path& inbox_dir() const { return inbox_dir_; }

  // Attaches to every channel logger owned by the engine.
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  static std::string default_display_name();

private:
  void ensure_identity();
  void adopt_secret(const std::string& secret);
  void persist_settings() const;
  std::optional<std::string> resolve_peer(const std::string& peer_device_id) const;
  std::vector<Logger*> channel_loggers() const;

  std::shared_ptr<SettingsManager> settings_;

  // Loggers outlive the io_context so late handlers can still log.
  std::shared_ptr<Logger> engine_logger_;
  std::shared_ptr<Logger> discovery_logger_;
  std::shared_ptr<Logger> transfer_logger_;
  std::shared_ptr<Logger> store_logger_;
  std::shared_ptr<Logger> cert_logger_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> workers_;

  std::filesystem::path data_dir_;
  std::filesystem::path inbox_dir_;
  std::string device_id_;
  std::string display_name_;

  std::shared_ptr<CertificateManager> certificates_;
  std::shared_ptr<PersistenceStore> store_;
  std::shared_ptr<TransferEngine> transfer_;

  mutable std::mutex discovery_mutex_;
  std::shared_ptr<DiscoveryService> discovery_;

  std::mutex log_listener_mutex_;
  std::map<LogListenerHandle, std::vector<std::pair<Logger*, LogListenerHandle>>> log_listeners_;
  LogListenerHandle next_log_listener_ = 1;

  std::atomic<bool> started_{false};
};
