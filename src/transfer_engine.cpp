#include "transfer_engine.hpp"

#include "certificate_manager.hpp"
#include "persistence_store.hpp"
#include "protocol.hpp"
#include "transfer_session.hpp"
#include "utils.hpp"

#include <algorithm>

TransferEngine::TransferEngine(asio::io_context& io,
                               Options options,
                               std::shared_ptr<PersistenceStore> store,
                               std::shared_ptr<CertificateManager> certificates,
                               PeerResolver resolver,
                               Logger* logger)
  : io_(io),
    options_(std::move(options)),
    store_(std::move(store)),
    certificates_(std::move(certificates)),
    resolver_(std::move(resolver)),
    logger_(logger),
    client_context_(asio::ssl::context::tls_client),
    server_context_(asio::ssl::context::tls_server) {
  if(!store_ || !certificates_) {
    throw SyncError(ErrorKind::InvalidArgument, "transfer engine needs a store and a certificate manager");
  }
  if(options_.inbox_dir.empty()) {
    throw SyncError(ErrorKind::InvalidArgument, "transfer engine needs an inbox directory");
  }
  if(options_.chunk_size == 0 || options_.chunk_size > kMaxChunkSize) {
    throw SyncError(ErrorKind::InvalidArgument, "chunk size must be between 1 byte and 8 MiB");
  }
  if(!uuid_from_string(options_.device_id)) {
    throw SyncError(ErrorKind::InvalidArgument, "device id '" + options_.device_id + "' is not a UUID");
  }
  certificates_->configure_context(client_context_);
  certificates_->configure_context(server_context_);
}

TransferEngine::~TransferEngine() {
  stop();
}

void TransferEngine::start() {
  if(started_) return;

  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_address, ec);
  if(ec) {
    throw SyncError(ErrorKind::InvalidArgument, "invalid listen address '" + options_.listen_address + "'");
  }
  asio::ip::tcp::endpoint endpoint(address, options_.listen_port);
  auto acceptor = std::make_shared<asio::ip::tcp::acceptor>(asio::make_strand(io_));
  acceptor->open(endpoint.protocol(), ec);
  if(!ec) acceptor->set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) acceptor->bind(endpoint, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw SyncError(ErrorKind::TransientNetwork,
                    "cannot listen on " + options_.listen_address + ":" +
                    std::to_string(options_.listen_port) + ": " + ec.message());
  }
  local_port_ = acceptor->local_endpoint(ec).port();
  {
    std::lock_guard lg(mutex_);
    acceptor_ = acceptor;
  }
  started_ = true;
  log_info(logger_, "accepting transfers on {}:{} into {}",
           options_.listen_address, local_port_, options_.inbox_dir.string());
  start_accept();
}

void TransferEngine::stop() {
  if(!started_.exchange(false)) return;

  std::shared_ptr<asio::ip::tcp::acceptor> acceptor;
  std::vector<std::shared_ptr<SendSession>> sends;
  std::vector<std::shared_ptr<ReceiveSession>> receives;
  std::vector<std::shared_ptr<asio::steady_timer>> timers;
  {
    std::lock_guard lg(mutex_);
    acceptor = std::move(acceptor_);
    for(auto& [id, session] : send_sessions_) sends.push_back(session);
    for(auto& [id, session] : receive_sessions_) receives.push_back(session);
    for(auto& weak : incoming_) {
      if(auto session = weak.lock()) receives.push_back(session);
    }
    incoming_.clear();
    timers.swap(resume_timers_);
  }

  if(acceptor) {
    asio::post(acceptor->get_executor(), [acceptor] {
      std::error_code ec;
      acceptor->close(ec);
    });
  }
  for(auto& timer : timers) {
    asio::post(timer->get_executor(), [timer] { timer->cancel(); });
  }
  for(auto& session : sends) session->abandon();
  for(auto& session : receives) session->abandon();
  log_info(logger_, "transfer engine stopped ({} outbound, {} inbound sessions paused)",
           sends.size(), receives.size());
}

void TransferEngine::start_accept() {
  std::shared_ptr<asio::ip::tcp::acceptor> acceptor;
  {
    std::lock_guard lg(mutex_);
    acceptor = acceptor_;
  }
  if(!acceptor) return;

  auto socket = std::make_shared<asio::ip::tcp::socket>(asio::make_strand(io_));
  acceptor->async_accept(*socket, [self = shared_from_this(), acceptor, socket](const std::error_code& ec) {
    if(ec) {
      if(ec == asio::error::operation_aborted || !self->started_) return;
      log_warn(self->logger_, "accept failed: {}", ec.message());
    } else if(self->started_) {
      const bool admitted = self->try_admit_inbound();
      auto session = std::make_shared<ReceiveSession>(self, std::move(*socket), self->server_context_, admitted);
      {
        std::lock_guard lg(self->mutex_);
        self->incoming_.erase(std::remove_if(self->incoming_.begin(), self->incoming_.end(),
                                             [](const std::weak_ptr<ReceiveSession>& w) { return w.expired(); }),
                              self->incoming_.end());
        self->incoming_.push_back(session);
      }
      session->start();
    }
    if(self->started_) self->start_accept();
  });
}

std::string TransferEngine::slot_key(TransferDirection direction, const std::string& file_id,
                                     const std::string& peer_device_id) {
  return std::string(to_string(direction)) + "|" + file_id + "|" + peer_device_id;
}

std::string TransferEngine::enqueue_sync(const std::string& file_id, const std::string& peer_device_id) {
  std::vector<std::shared_ptr<SendSession>> to_start;
  std::string session_id;
  {
    std::lock_guard lg(mutex_);
    if(!started_) {
      throw SyncError(ErrorKind::InvalidArgument, "transfer engine is not running");
    }
    const auto key = slot_key(TransferDirection::Send, file_id, peer_device_id);
    if(auto it = active_slots_.find(key); it != active_slots_.end()) {
      return it->second;
    }
    if(!resolve_peer(peer_device_id)) {
      throw SyncError(ErrorKind::InvalidArgument, "peer " + peer_device_id + " has not been discovered");
    }
    // A manual request gets a fresh auto-resume budget.
    resume_attempts_.erase(key);
    session_id = enqueue_locked(file_id, peer_device_id, 0);
    start_next_locked(to_start);
  }
  for(auto& session : to_start) session->start();
  return session_id;
}

std::string TransferEngine::enqueue_locked(const std::string& file_id, const std::string& peer_device_id,
                                           uint32_t resume_attempt) {
  auto file = store_->file_by_id(file_id);
  if(!file) {
    throw SyncError(ErrorKind::InvalidArgument, "unknown file " + file_id);
  }
  std::error_code ec;
  if(!std::filesystem::is_regular_file(file->absolute_path, ec)) {
    throw SyncError(ErrorKind::InvalidArgument, file->absolute_path + " is not a readable file");
  }

  const uint32_t total = chunk_count(file->size_bytes, options_.chunk_size);
  uint32_t sender_offset = 0;
  if(auto previous = store_->latest_resumable_session(file_id, peer_device_id, TransferDirection::Send,
                                                      file->content_hash, options_.chunk_size)) {
    sender_offset = std::min(previous->resume_offset(), total);
  }

  // The checkpoint starts empty; the receiver's resume-accept sets it.
  TransferSession row;
  row.session_id = generate_uuid();
  row.file_id = file_id;
  row.direction = TransferDirection::Send;
  row.peer_device_id = peer_device_id;
  row.total_chunks = total;
  row.last_acknowledged_chunk = kNoChunkAcknowledged;
  row.state = SessionState::Handshaking;
  row.content_hash = file->content_hash;
  row.chunk_size = options_.chunk_size;
  row.local_path = file->absolute_path;

  auto session = std::make_shared<SendSession>(shared_from_this(), row, *file, sender_offset);
  store_->insert_session(row);
  store_->set_sync_status(file_id, SyncStatus::Syncing);

  send_sessions_[row.session_id] = session;
  active_slots_[slot_key(TransferDirection::Send, file_id, peer_device_id)] = row.session_id;
  waiting_.push_back(row.session_id);
  progress_[row.session_id] = session->initial_progress();

  if(resume_attempt > 0) {
    log_info(logger_, "auto-resume {} of {}: session {} continues {} to {} from chunk {}",
             resume_attempt, options_.auto_resume_attempts, row.session_id,
             file->absolute_path, peer_device_id, sender_offset);
  } else {
    log_info(logger_, "queued session {}: {} to {}", row.session_id, file->absolute_path, peer_device_id);
  }
  return row.session_id;
}

void TransferEngine::start_next_locked(std::vector<std::shared_ptr<SendSession>>& to_start) {
  const std::size_t limit = std::max<std::size_t>(1, options_.max_concurrent_transfers);
  while(running_ids_.size() < limit && !waiting_.empty()) {
    auto id = waiting_.front();
    waiting_.pop_front();
    auto it = send_sessions_.find(id);
    if(it == send_sessions_.end()) continue;
    running_ids_.insert(id);
    to_start.push_back(it->second);
  }
}

void TransferEngine::on_send_finished(const std::string& session_id, SessionState state,
                                      ErrorKind error, bool cancelled) {
  std::vector<std::shared_ptr<SendSession>> to_start;
  std::string file_id;
  std::string peer_device_id;
  uint32_t attempt = 0;
  bool resume = false;
  {
    std::lock_guard lg(mutex_);
    auto it = send_sessions_.find(session_id);
    if(it == send_sessions_.end()) return;
    file_id = it->second->file_id();
    peer_device_id = it->second->peer_device_id();
    send_sessions_.erase(it);
    running_ids_.erase(session_id);
    waiting_.erase(std::remove(waiting_.begin(), waiting_.end(), session_id), waiting_.end());

    const auto key = slot_key(TransferDirection::Send, file_id, peer_device_id);
    if(auto slot = active_slots_.find(key); slot != active_slots_.end() && slot->second == session_id) {
      active_slots_.erase(slot);
    }

    if(state == SessionState::Paused && error == ErrorKind::TransientNetwork && !cancelled && started_) {
      auto previous = resume_attempts_.find(key);
      attempt = (previous == resume_attempts_.end() ? 0 : previous->second) + 1;
      if(attempt <= options_.auto_resume_attempts) {
        resume_attempts_[key] = attempt;
        resume = true;
      } else {
        resume_attempts_.erase(key);
        log_warn(logger_, "giving up on {} to {} after {} automatic resumes",
                 file_id, peer_device_id, options_.auto_resume_attempts);
      }
    } else {
      resume_attempts_.erase(key);
    }
    if(started_) start_next_locked(to_start);
  }
  for(auto& session : to_start) session->start();
  if(resume) schedule_auto_resume(file_id, peer_device_id, attempt);
}

void TransferEngine::schedule_auto_resume(const std::string& file_id, const std::string& peer_device_id,
                                          uint32_t attempt) {
  const uint32_t shift = std::min<uint32_t>(attempt - 1, 16);
  const auto delay = options_.auto_resume_base_delay * (1u << shift);
  auto timer = std::make_shared<asio::steady_timer>(asio::make_strand(io_));
  {
    std::lock_guard lg(mutex_);
    resume_timers_.push_back(timer);
  }
  log_info(logger_, "resuming {} to {} in {} ms", file_id, peer_device_id, delay.count());
  timer->expires_after(delay);
  timer->async_wait([weak = weak_from_this(), timer, file_id, peer_device_id, attempt](const std::error_code& ec) {
    auto self = weak.lock();
    if(!self) return;
    {
      std::lock_guard lg(self->mutex_);
      auto& timers = self->resume_timers_;
      timers.erase(std::remove(timers.begin(), timers.end(), timer), timers.end());
    }
    if(ec || !self->started_) return;
    self->auto_resume(file_id, peer_device_id, attempt);
  });
}

void TransferEngine::auto_resume(const std::string& file_id, const std::string& peer_device_id, uint32_t attempt) {
  std::vector<std::shared_ptr<SendSession>> to_start;
  {
    std::lock_guard lg(mutex_);
    if(!started_) return;
    const auto key = slot_key(TransferDirection::Send, file_id, peer_device_id);
    if(active_slots_.count(key)) return;
    try {
      enqueue_locked(file_id, peer_device_id, attempt);
    } catch(const SyncError& e) {
      resume_attempts_.erase(key);
      log_warn(logger_, "cannot resume {} to {}: {}", file_id, peer_device_id, e.what());
      return;
    }
    start_next_locked(to_start);
  }
  for(auto& session : to_start) session->start();
}

bool TransferEngine::cancel_session(const std::string& session_id) {
  std::shared_ptr<SendSession> send;
  std::shared_ptr<ReceiveSession> receive;
  {
    std::lock_guard lg(mutex_);
    if(auto it = send_sessions_.find(session_id); it != send_sessions_.end()) {
      send = it->second;
    } else if(auto rit = receive_sessions_.find(session_id); rit != receive_sessions_.end()) {
      receive = rit->second;
    }
  }
  if(send) {
    send->cancel();
    return true;
  }
  if(receive) {
    receive->cancel();
    return true;
  }
  return false;
}

void TransferEngine::claim_receive_slot(const std::string& file_id, const std::string& peer_device_id,
                                        const std::shared_ptr<ReceiveSession>& session) {
  std::shared_ptr<ReceiveSession> previous;
  {
    std::lock_guard lg(mutex_);
    const auto key = slot_key(TransferDirection::Receive, file_id, peer_device_id);
    if(auto it = active_slots_.find(key); it != active_slots_.end()) {
      auto existing = receive_sessions_.find(it->second);
      if(existing != receive_sessions_.end() && existing->second != session) {
        previous = existing->second;
      }
    }
    active_slots_[key] = session->id();
    receive_sessions_[session->id()] = session;
  }
  if(previous) {
    log_info(logger_, "session {} replaces session {} for {} from {}",
             session->id(), previous->id(), file_id, peer_device_id);
    previous->supersede();
  }
}

void TransferEngine::on_receive_finished(const std::string& session_id) {
  std::lock_guard lg(mutex_);
  auto it = receive_sessions_.find(session_id);
  if(it == receive_sessions_.end()) return;
  receive_sessions_.erase(it);
  for(auto slot = active_slots_.begin(); slot != active_slots_.end(); ++slot) {
    if(slot->second == session_id) {
      active_slots_.erase(slot);
      break;
    }
  }
}

bool TransferEngine::try_admit_inbound() {
  const std::size_t limit = std::max<std::size_t>(1, options_.max_concurrent_transfers);
  std::size_t current = inbound_active_.load();
  while(current < limit) {
    if(inbound_active_.compare_exchange_weak(current, current + 1)) return true;
  }
  return false;
}

void TransferEngine::release_inbound() {
  inbound_active_.fetch_sub(1);
}

void TransferEngine::publish(const SessionProgress& progress) {
  std::vector<ProgressListener> callbacks;
  {
    std::lock_guard lg(mutex_);
    progress_[progress.session_id] = progress;
    if(is_terminal(progress.state) || progress.state == SessionState::Paused) {
      finished_order_.push_back(progress.session_id);
      while(finished_order_.size() > options_.retained_outcomes) {
        progress_.erase(finished_order_.front());
        finished_order_.pop_front();
      }
    }
    for(auto& [handle, listener] : listeners_) {
      if(!listener.session_id || *listener.session_id == progress.session_id) {
        callbacks.push_back(listener.callback);
      }
    }
  }
  for(auto& callback : callbacks) {
    try {
      callback(progress);
    } catch(const std::exception& e) {
      log_warn(logger_, "progress listener threw: {}", e.what());
    }
  }
}

std::optional<SessionProgress> TransferEngine::session_progress(const std::string& session_id) const {
  {
    std::lock_guard lg(mutex_);
    if(auto it = progress_.find(session_id); it != progress_.end()) return it->second;
  }
  auto row = store_->session(session_id);
  if(!row) return std::nullopt;
  SessionProgress progress;
  progress.session_id = row->session_id;
  progress.total_chunks = row->total_chunks;
  progress.chunks_done = row->resume_offset();
  progress.state = row->state;
  return progress;
}

std::vector<SessionProgress> TransferEngine::live_sessions() const {
  std::lock_guard lg(mutex_);
  std::vector<SessionProgress> out;
  auto collect = [&](const std::string& id) {
    if(auto it = progress_.find(id); it != progress_.end()) out.push_back(it->second);
  };
  for(auto& [id, session] : send_sessions_) collect(id);
  for(auto& [id, session] : receive_sessions_) collect(id);
  return out;
}

TransferEngine::ListenerHandle TransferEngine::add_progress_listener(ProgressListener listener,
                                                                     std::optional<std::string> session_id) {
  std::lock_guard lg(mutex_);
  const auto handle = next_listener_++;
  listeners_[handle] = Listener{std::move(session_id), std::move(listener)};
  return handle;
}

void TransferEngine::remove_progress_listener(ListenerHandle handle) {
  std::lock_guard lg(mutex_);
  listeners_.erase(handle);
}

void TransferEngine::set_outbound_chunk_filter(ChunkFilter filter) {
  std::lock_guard lg(mutex_);
  chunk_filter_ = std::move(filter);
}

TransferEngine::ChunkFilter TransferEngine::chunk_filter() const {
  std::lock_guard lg(mutex_);
  return chunk_filter_;
}

std::optional<std::string> TransferEngine::resolve_peer(const std::string& peer_device_id) const {
  if(!resolver_) return std::nullopt;
  return resolver_(peer_device_id);
}

std::size_t TransferEngine::running_outbound() const {
  std::lock_guard lg(mutex_);
  return running_ids_.size();
}

std::size_t TransferEngine::queued_outbound() const {
  std::lock_guard lg(mutex_);
  return waiting_.size();
}

std::size_t TransferEngine::retained_progress() const {
  std::lock_guard lg(mutex_);
  return progress_.size();
}

TransferEngine::Counters TransferEngine::counters() const {
  Counters c;
  c.auth_failed = auth_failed_;
  c.pinning_failed = pinning_failed_;
  c.protocol_violations = protocol_violations_;
  c.busy_rejected = busy_rejected_;
  return c;
}
