#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "sync_types.hpp"

class CertificateManager;
class PersistenceStore;
class SendSession;
class ReceiveSession;

// Runs outbound and inbound transfer sessions over mutually authenticated
// TLS. Each session lives on its own strand of the shared io_context; this
// object keeps the (fileId, peer) registry, the concurrency limit, the
// progress snapshots and the auto-resume schedule.
class TransferEngine : public std::enable_shared_from_this<TransferEngine> {
public:
  struct Options {
    std::string device_id;
    std::string display_name;
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 37846;
    uint16_t peer_port = 37846;
    std::filesystem::path inbox_dir;
    uint32_t chunk_size = 1024 * 1024;
    uint32_t window_size = 4;
    uint32_t max_chunk_retries = 3;
    std::size_t max_concurrent_transfers = 4;
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds ack_timeout{15000};
    uint32_t auto_resume_attempts = 3;
    std::chrono::milliseconds auto_resume_base_delay{1000};
    // Finished sessions whose last progress snapshot stays in memory; older
    // ones are answered from the store.
    std::size_t retained_outcomes = 256;
  };

  // Connections and frames dropped for security or protocol reasons.
  struct Counters {
    uint64_t auth_failed = 0;
    uint64_t pinning_failed = 0;
    uint64_t protocol_violations = 0;
    uint64_t busy_rejected = 0;
  };

  using ProgressListener = std::function<void(const SessionProgress&)>;
  using ListenerHandle = std::size_t;
  // Maps a peer device id to the address it was last seen at.
  using PeerResolver = std::function<std::optional<std::string>(const std::string& peer_device_id)>;
  // Sees every outbound chunk payload after its digest is computed.
  using ChunkFilter = std::function<void(uint32_t index, uint32_t attempt, std::vector<uint8_t>& payload)>;

  // Construct with std::make_shared; sessions hold a reference back.
  TransferEngine(asio::io_context& io,
                 Options options,
                 std::shared_ptr<PersistenceStore> store,
                 std::shared_ptr<CertificateManager> certificates,
                 PeerResolver resolver,
                 Logger* logger = nullptr);
  ~TransferEngine();

  // Binds the acceptor. Throws SyncError(TransientNetwork) when the port is
  // unavailable.
  void start();
  void stop();
  uint16_t local_port() const { return local_port_; }

  // Returns the id of the session carrying fileId to the peer. When a
  // session for the pair is already active, its id is returned instead of
  // starting another. Throws SyncError(InvalidArgument) for unknown files.
  std::string enqueue_sync(const std::string& file_id, const std::string& peer_device_id);
  // Pauses the session. Returns false when it is unknown or already finished.
  bool cancel_session(const std::string& session_id);

  std::optional<SessionProgress> session_progress(const std::string& session_id) const;
  std::vector<SessionProgress> live_sessions() const;

  // With a session id the listener only sees that session.
  ListenerHandle add_progress_listener(ProgressListener listener,
                                       std::optional<std::string> session_id = std::nullopt);
  void remove_progress_listener(ListenerHandle handle);

  void set_outbound_chunk_filter(ChunkFilter filter);

  const Options& options() const { return options_; }
  Counters counters() const;
  std::size_t running_outbound() const;
  std::size_t queued_outbound() const;
  std::size_t running_inbound() const { return inbound_active_; }
  std::size_t retained_progress() const;

private:
  friend class SendSession;
  friend class ReceiveSession;

  // ---- called by sessions ---------------------------------------------
  void publish(const SessionProgress& progress);
  void on_send_finished(const std::string& session_id, SessionState state, ErrorKind error, bool cancelled);
  void on_receive_finished(const std::string& session_id);
  // Registers an incoming session for (fileId, peer). An older active
  // receive session for the pair is told to pause.
  void claim_receive_slot(const std::string& file_id, const std::string& peer_device_id,
                          const std::shared_ptr<ReceiveSession>& session);
  // Inbound sessions share max_concurrent_transfers with outbound ones but
  // are counted separately. A refused connection is told the receiver is busy.
  bool try_admit_inbound();
  void release_inbound();
  ChunkFilter chunk_filter() const;
  asio::ssl::context& client_context() { return client_context_; }
  PersistenceStore& store() { return *store_; }
  CertificateManager& certificates() { return *certificates_; }
  Logger* logger() const { return logger_; }
  asio::io_context& io() { return io_; }
  std::optional<std::string> resolve_peer(const std::string& peer_device_id) const;

  // ---- internal -------------------------------------------------------
  struct Listener {
    std::optional<std::string> session_id;
    ProgressListener callback;
  };

  std::string enqueue_locked(const std::string& file_id, const std::string& peer_device_id,
                             uint32_t resume_attempt);
  void auto_resume(const std::string& file_id, const std::string& peer_device_id, uint32_t attempt);
  void start_next_locked(std::vector<std::shared_ptr<SendSession>>& to_start);
  void schedule_auto_resume(const std::string& file_id, const std::string& peer_device_id, uint32_t attempt);
  void start_accept();
  static std::string slot_key(TransferDirection direction, const std::string& file_id,
                              const std::string& peer_device_id);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<PersistenceStore> store_;
  std::shared_ptr<CertificateManager> certificates_;
  PeerResolver resolver_;
  Logger* logger_ = nullptr;

  asio::ssl::context client_context_;
  asio::ssl::context server_context_;
  std::shared_ptr<asio::ip::tcp::acceptor> acceptor_;
  uint16_t local_port_ = 0;
  std::atomic<bool> started_{false};

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<SendSession>> send_sessions_;       // by session id
  std::map<std::string, std::shared_ptr<ReceiveSession>> receive_sessions_; // by session id
  std::unordered_map<std::string, std::string> active_slots_;              // slot key -> session id
  std::unordered_map<std::string, uint32_t> resume_attempts_;              // slot key -> attempt
  std::deque<std::string> waiting_;                                         // queued send session ids
  std::set<std::string> running_ids_;
  std::vector<std::weak_ptr<ReceiveSession>> incoming_;
  std::map<std::string, SessionProgress> progress_;
  std::deque<std::string> finished_order_;
  std::map<ListenerHandle, Listener> listeners_;
  ListenerHandle next_listener_ = 1;
  std::vector<std::shared_ptr<asio::steady_timer>> resume_timers_;
  ChunkFilter chunk_filter_;

  std::atomic<std::size_t> inbound_active_{0};
  std::atomic<uint64_t> auth_failed_{0};
  std::atomic<uint64_t> pinning_failed_{0};
  std::atomic<uint64_t> protocol_violations_{0};
  std::atomic<uint64_t> busy_rejected_{0};
};
