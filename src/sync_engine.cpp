#include "sync_engine.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <stdexcept>

#include "certificate_manager.hpp"
#include "integrity_hasher.hpp"
#include "pairing.hpp"
#include "persistence_store.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::chrono::milliseconds setting_ms(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<int64_t>(key));
}

std::string normalize_path(const std::string& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if(ec) return std::filesystem::path(path).lexically_normal().string();
  return absolute.lexically_normal().string();
}

int64_t modified_millis(const std::string& path) {
  struct stat st {};
  if(::stat(path.c_str(), &st) != 0) return wall_clock_millis();
  return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
}

std::vector<uint8_t> secret_bytes(const std::string& secret) {
  return std::vector<uint8_t>(secret.begin(), secret.end());
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    engine_logger_(std::make_shared<Logger>("engine")),
    discovery_logger_(std::make_shared<Logger>("discovery")),
    transfer_logger_(std::make_shared<Logger>("transfer")),
    store_logger_(std::make_shared<Logger>("store")),
    cert_logger_(std::make_shared<Logger>("certs")) {}

SyncEngine::~SyncEngine() {
  stop();
}

std::string SyncEngine::default_display_name() {
  char hostname[256] = {};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    return "lansync-device";
  }
  return hostname;
}

void SyncEngine::ensure_identity() {
  device_id_ = settings_->get<std::string>("device_id");
  auto parsed = uuid_from_string(device_id_);
  if(!parsed) {
    if(!device_id_.empty()) {
      log_warn(engine_logger_.get(), "configured device_id '{}' is not a UUID; generating a new one", device_id_);
    }
    device_id_ = generate_uuid();
    std::string error;
    if(!settings_->set_from_string("device_id", device_id_, error)) {
      throw std::runtime_error("cannot store device_id: " + error);
    }
    log_info(engine_logger_.get(), "generated device id {}", device_id_);
    persist_settings();
  } else {
    device_id_ = uuid_to_string(*parsed);
  }

  display_name_ = settings_->get<std::string>("device_name");
  if(display_name_.empty()) display_name_ = default_display_name();
  if(display_name_.size() > kMaxDisplayNameBytes) display_name_.resize(kMaxDisplayNameBytes);
}

void SyncEngine::persist_settings() const {
  if(!settings_->save()) {
    log_warn(engine_logger_.get(), "unable to persist settings to {}", settings_->settings_path().string());
  }
}

void SyncEngine::start() {
  if(started_) return;

  data_dir_ = settings_->get<std::string>("data_dir");
  if(data_dir_.empty()) data_dir_ = std::filesystem::current_path();
  data_dir_ = std::filesystem::absolute(data_dir_);
  std::filesystem::create_directories(data_dir_);

  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));
  ensure_identity();

  const std::string inbox = settings_->get<std::string>("inbox_dir");
  inbox_dir_ = inbox.empty() ? data_dir_ / "inbox" : std::filesystem::absolute(inbox);
  std::filesystem::create_directories(inbox_dir_);

  certificates_ = std::make_shared<CertificateManager>(data_dir_ / "identity", device_id_, display_name_,
                                                       cert_logger_.get());
  store_ = std::make_shared<PersistenceStore>(data_dir_ / "lansync.db", store_logger_.get());
  if(int recovered = store_->recover_interrupted_sessions(); recovered > 0) {
    log_info(engine_logger_.get(), "{} interrupted sessions marked paused", recovered);
  }

  TransferEngine::Options topts;
  topts.device_id = device_id_;
  topts.display_name = display_name_;
  topts.listen_address = settings_->get<std::string>("listen_ip");
  topts.listen_port = static_cast<uint16_t>(settings_->get<int64_t>("transfer_port"));
  topts.peer_port = static_cast<uint16_t>(settings_->get<int64_t>("peer_transfer_port"));
  topts.inbox_dir = inbox_dir_;
  topts.chunk_size = static_cast<uint32_t>(settings_->get<int64_t>("chunk_size"));
  topts.window_size = static_cast<uint32_t>(settings_->get<int64_t>("window_size"));
  topts.max_chunk_retries = static_cast<uint32_t>(settings_->get<int64_t>("max_chunk_retries"));
  topts.max_concurrent_transfers = static_cast<std::size_t>(settings_->get<int64_t>("max_concurrent_transfers"));
  topts.handshake_timeout = setting_ms(*settings_, "handshake_timeout_ms");
  topts.ack_timeout = setting_ms(*settings_, "ack_timeout_ms");
  topts.auto_resume_attempts = static_cast<uint32_t>(settings_->get<int64_t>("auto_resume_attempts"));

  transfer_ = std::make_shared<TransferEngine>(
    io_, topts, store_, certificates_,
    [this](const std::string& peer) { return resolve_peer(peer); },
    transfer_logger_.get());

  // A previous stop() leaves the context stopped; run() would return at once.
  io_.restart();
  work_guard_.emplace(io_.get_executor());
  started_ = true;
  try {
    transfer_->start();
    const auto threads = settings_->get<int64_t>("worker_threads");
    for(int64_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this] {
        try {
          io_.run();
        } catch(const std::exception& e) {
          log_error(engine_logger_.get(), "worker thread stopped: {}", e.what());
        }
      });
    }
    const auto secret = settings_->get<std::string>("shared_secret");
    if(!secret.empty()) adopt_secret(secret);
  } catch(const std::exception&) {
    stop();
    throw;
  }

  log_info(engine_logger_.get(), "device {} ({}) ready, certificate fingerprint {}",
           display_name_, device_id_, certificates_->fingerprint());
  if(settings_->get<std::string>("shared_secret").empty()) {
    log_warn(engine_logger_.get(), "no shared secret configured; discovery starts after pairing");
  }
}

void SyncEngine::stop() {
  if(!started_.exchange(false)) return;

  std::shared_ptr<DiscoveryService> discovery;
  {
    std::lock_guard lg(discovery_mutex_);
    discovery = std::move(discovery_);
    discovery_.reset();
  }
  if(discovery) discovery->stop();
  if(transfer_) transfer_->stop();

  work_guard_.reset();
  // Sessions get a moment to flush their abort frames before the loop is cut.
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while(!workers_.empty() && !io_.stopped() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  io_.stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();
  log_info(engine_logger_.get(), "engine stopped");
}

void SyncEngine::adopt_secret(const std::string& secret) {
  if(secret.empty()) {
    throw SyncError(ErrorKind::InvalidArgument, "shared secret must not be empty");
  }
  if(settings_->get<std::string>("shared_secret") != secret) {
    std::string error;
    if(!settings_->set_from_string("shared_secret", secret, error)) {
      throw SyncError(ErrorKind::InvalidArgument, "cannot store shared secret: " + error);
    }
    persist_settings();
  }
  if(!started_) return;

  std::lock_guard lg(discovery_mutex_);
  if(discovery_) {
    discovery_->set_shared_secret(secret_bytes(secret));
    log_info(engine_logger_.get(), "discovery secret rotated");
    return;
  }

  DiscoveryService::Options dopts;
  dopts.device_id = device_id_;
  dopts.display_name = display_name_;
  dopts.listen_address = settings_->get<std::string>("listen_ip");
  dopts.listen_port = static_cast<uint16_t>(settings_->get<int64_t>("discovery_port"));
  dopts.broadcast_address = settings_->get<std::string>("broadcast_address");
  dopts.broadcast_port = static_cast<uint16_t>(settings_->get<int64_t>("broadcast_port"));
  dopts.broadcast_interval = setting_ms(*settings_, "broadcast_interval_ms");
  dopts.presence_timeout = setting_ms(*settings_, "presence_timeout_ms");
  dopts.replay_window = setting_ms(*settings_, "replay_window_ms");
  dopts.reaper_interval = setting_ms(*settings_, "reaper_interval_ms");

  auto discovery = std::make_shared<DiscoveryService>(io_, dopts, secret_bytes(secret), discovery_logger_.get());
  discovery->start();
  discovery_ = std::move(discovery);
}

DiscoveryService::ListenerHandle SyncEngine::start_discovery(const std::string& shared_secret,
                                                             PeerListObserver observer) {
  if(!started_) {
    throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  }
  adopt_secret(shared_secret);
  if(!observer) return 0;
  auto service = discovery();
  return service ? service->add_peer_listener(std::move(observer)) : 0;
}

void SyncEngine::remove_peer_observer(DiscoveryService::ListenerHandle handle) {
  if(auto service = discovery()) service->remove_peer_listener(handle);
}

std::shared_ptr<DiscoveryService> SyncEngine::discovery() const {
  std::lock_guard lg(discovery_mutex_);
  return discovery_;
}

std::vector<PeerRecord> SyncEngine::current_peers() const {
  auto service = discovery();
  if(!service) return {};
  return service->current_peers();
}

std::optional<std::string> SyncEngine::resolve_peer(const std::string& peer_device_id) const {
  auto service = discovery();
  if(!service) return std::nullopt;
  auto record = service->peer(peer_device_id);
  if(!record) return std::nullopt;
  return record->network_address;
}

std::string SyncEngine::make_pairing_payload() {
  if(!started_) {
    throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  }
  auto secret = settings_->get<std::string>("shared_secret");
  if(secret.empty()) {
    secret = generate_shared_secret();
    adopt_secret(secret);
    log_info(engine_logger_.get(), "generated a new discovery secret for pairing");
  }
  PairingPayload payload;
  payload.device_id = device_id_;
  payload.display_name = display_name_;
  payload.fingerprint = certificates_->fingerprint();
  payload.shared_secret = secret;
  return encode_pairing_payload(payload);
}

PairingResult SyncEngine::pair_with_peer(const std::string& text) {
  if(!started_) {
    throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  }
  auto payload = decode_pairing_payload(text);
  if(payload.device_id == device_id_) {
    throw SyncError(ErrorKind::InvalidArgument, "cannot pair with this device itself");
  }

  TrustedPeer peer;
  peer.device_id = payload.device_id;
  peer.display_name = payload.display_name;
  peer.fingerprint = payload.fingerprint;
  peer.paired_at_ms = wall_clock_millis();
  if(auto previous = store_->trusted_peer(peer.device_id); previous && previous->fingerprint != peer.fingerprint) {
    log_warn(engine_logger_.get(), "re-pairing {} replaces pinned fingerprint {} with {}",
             peer.device_id, previous->fingerprint, peer.fingerprint);
  }
  store_->put_trusted_peer(peer);
  adopt_secret(payload.shared_secret);
  log_info(engine_logger_.get(), "paired with {} ({}), pinned {}",
           peer.display_name, peer.device_id, peer.fingerprint);

  PairingResult result;
  result.peer_device_id = peer.device_id;
  result.peer_display_name = peer.display_name;
  result.pinned_fingerprint = peer.fingerprint;
  result.shared_secret = payload.shared_secret;
  return result;
}

bool SyncEngine::forget_peer(const std::string& device_id) {
  if(!store_) return false;
  const bool removed = store_->remove_trusted_peer(device_id);
  if(removed) log_info(engine_logger_.get(), "forgot pinned peer {}", device_id);
  return removed;
}

std::vector<TrustedPeer> SyncEngine::trusted_peers() const {
  if(!store_) return {};
  return store_->trusted_peers();
}

std::string SyncEngine::enqueue_sync(const std::string& file_id, const std::string& peer_device_id) {
  if(!transfer_) throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  return transfer_->enqueue_sync(file_id, peer_device_id);
}

bool SyncEngine::cancel_session(const std::string& session_id) {
  return transfer_ && transfer_->cancel_session(session_id);
}

std::optional<SessionProgress> SyncEngine::session_progress(const std::string& session_id) const {
  if(!transfer_) return std::nullopt;
  return transfer_->session_progress(session_id);
}

std::vector<SessionProgress> SyncEngine::live_sessions() const {
  if(!transfer_) return {};
  return transfer_->live_sessions();
}

TransferEngine::ListenerHandle SyncEngine::add_progress_listener(ProgressListener listener,
                                                                 std::optional<std::string> session_id) {
  if(!transfer_) throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  return transfer_->add_progress_listener(std::move(listener), std::move(session_id));
}

void SyncEngine::remove_progress_listener(TransferEngine::ListenerHandle handle) {
  if(transfer_) transfer_->remove_progress_listener(handle);
}

std::optional<FileRecord> SyncEngine::apply_change(const ChangeEvent& event) {
  if(!store_) throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  const std::string path = normalize_path(event.path);

  if(event.kind == ChangeKind::Deleted) {
    if(store_->remove_file_by_path(path)) {
      log_info(engine_logger_.get(), "untracked {}", path);
    }
    return std::nullopt;
  }

  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw SyncError(ErrorKind::InvalidArgument, path + " is not a regular file");
  }
  const uint64_t size = std::filesystem::file_size(path, ec);
  if(ec) throw SyncError(ErrorKind::InvalidArgument, "cannot stat " + path + ": " + ec.message());

  std::string hash;
  if(event.new_content_hash) {
    Digest parsed{};
    if(!IntegrityHasher::from_hex(SettingsManager::to_lower(*event.new_content_hash), parsed)) {
      throw SyncError(ErrorKind::InvalidArgument, "content hash for " + path + " is not a SHA-256 digest");
    }
    hash = IntegrityHasher::to_hex(parsed);
  } else {
    hash = IntegrityHasher::to_hex(IntegrityHasher::digest_file(path));
  }

  auto existing = store_->file_by_path(path);
  if(existing && existing->content_hash == hash) {
    return existing;
  }

  FileRecord record;
  if(existing) {
    record = *existing;
  } else {
    record.file_id = generate_uuid();
    record.absolute_path = path;
  }
  record.content_hash = hash;
  record.size_bytes = size;
  record.modified_at_ms = modified_millis(path);
  record.sync_status = SyncStatus::Pending;
  store_->upsert_file(record);
  log_info(engine_logger_.get(), "{} {} ({} bytes, {})", existing ? "updated" : "tracking",
           path, size, hash.substr(0, 12));
  return record;
}

std::vector<FileRecord> SyncEngine::files() const {
  if(!store_) return {};
  return store_->list_files();
}

std::vector<FileRecord> SyncEngine::pending_files() const {
  if(!store_) return {};
  return store_->files_with_status(SyncStatus::Pending);
}

std::vector<FileRecord> SyncEngine::scan_directory(const std::string& directory) {
  if(!store_) throw SyncError(ErrorKind::InvalidArgument, "engine is not running");
  const std::filesystem::path root = normalize_path(directory);
  std::error_code ec;
  if(!std::filesystem::is_directory(root, ec)) {
    throw SyncError(ErrorKind::InvalidArgument, root.string() + " is not a directory");
  }
  const auto data_dir = data_dir_.lexically_normal();
  const auto inbox_dir = inbox_dir_.lexically_normal();

  std::vector<FileRecord> out;
  std::size_t skipped = 0;
  std::filesystem::recursive_directory_iterator it(
    root, std::filesystem::directory_options::skip_permission_denied, ec);
  for(; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    std::error_code type_ec;
    if(entry.is_directory(type_ec)) {
      const auto path = entry.path().lexically_normal();
      if(path == data_dir || path == inbox_dir) it.disable_recursion_pending();
      continue;
    }
    if(!entry.is_regular_file(type_ec)) continue;

    ChangeEvent event;
    event.path = entry.path().string();
    event.kind = ChangeKind::Created;
    try {
      if(auto record = apply_change(event)) out.push_back(*record);
    } catch(const SyncError& e) {
      ++skipped;
      log_warn(engine_logger_.get(), "scan skipped {}: {}", event.path, e.what());
    }
  }
  if(ec) {
    log_warn(engine_logger_.get(), "scan of {} stopped early: {}", root.string(), ec.message());
  }
  log_info(engine_logger_.get(), "scanned {}: {} files tracked, {} skipped", root.string(), out.size(), skipped);
  return out;
}

std::optional<FileRecord> SyncEngine::file_by_path(const std::string& path) const {
  if(!store_) return std::nullopt;
  return store_->file_by_path(normalize_path(path));
}

DeviceIdentity SyncEngine::identity() const {
  DeviceIdentity id;
  id.device_id = device_id_;
  id.display_name = display_name_;
  if(certificates_) id.certificate_fingerprint = certificates_->fingerprint();
  return id;
}

std::vector<Logger*> SyncEngine::channel_loggers() const {
  return {engine_logger_.get(), discovery_logger_.get(), transfer_logger_.get(),
          store_logger_.get(), cert_logger_.get()};
}

LogListenerHandle SyncEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  std::vector<std::pair<Logger*, LogListenerHandle>> attached;
  for(auto* logger : channel_loggers()) {
    attached.emplace_back(logger, logger->add_listener(listener, user_data));
  }
  std::lock_guard lg(log_listener_mutex_);
  const auto handle = next_log_listener_++;
  log_listeners_[handle] = std::move(attached);
  return handle;
}

void SyncEngine::remove_log_listener(LogListenerHandle handle) {
  std::vector<std::pair<Logger*, LogListenerHandle>> attached;
  {
    std::lock_guard lg(log_listener_mutex_);
    auto it = log_listeners_.find(handle);
    if(it == log_listeners_.end()) return;
    attached = std::move(it->second);
    log_listeners_.erase(it);
  }
  for(auto& [logger, id] : attached) logger->remove_listener(id);
}
