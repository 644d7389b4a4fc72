#include "discovery_service.hpp"

#include "integrity_hasher.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdlib>

const char* to_string(PeerEvent event) {
  switch(event) {
    case PeerEvent::Found: return "found";
    case PeerEvent::Updated: return "updated";
    case PeerEvent::Lost: return "lost";
  }
  return "unknown";
}

// ---- PeerTable ------------------------------------------------------------

PeerRecord PeerTable::derive(const Entry& entry, int64_t now_ms, int64_t stale_after_ms) {
  PeerRecord out = entry.record;
  out.status = (now_ms - out.last_seen_at_ms > stale_after_ms) ? PeerStatus::Stale : PeerStatus::Online;
  return out;
}

bool PeerTable::upsert(const PeerRecord& record, uint64_t timestamp_millis) {
  std::lock_guard lg(mutex_);
  auto [it, inserted] = peers_.try_emplace(record.device_id);
  it->second.record = record;
  it->second.timestamp_millis = timestamp_millis;
  return inserted;
}

std::optional<uint64_t> PeerTable::last_timestamp(const std::string& device_id) const {
  std::lock_guard lg(mutex_);
  auto it = peers_.find(device_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second.timestamp_millis;
}

std::vector<PeerRecord> PeerTable::reap(int64_t now_ms, int64_t timeout_ms) {
  std::lock_guard lg(mutex_);
  std::vector<PeerRecord> lost;
  for(auto it = peers_.begin(); it != peers_.end();) {
    if(now_ms - it->second.record.last_seen_at_ms > timeout_ms) {
      PeerRecord record = it->second.record;
      record.status = PeerStatus::Stale;
      lost.push_back(std::move(record));
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return lost;
}

std::vector<PeerRecord> PeerTable::snapshot(int64_t now_ms, int64_t stale_after_ms) const {
  std::lock_guard lg(mutex_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for(const auto& [id, entry] : peers_) {
    out.push_back(derive(entry, now_ms, stale_after_ms));
  }
  return out;
}

std::optional<PeerRecord> PeerTable::find(const std::string& device_id, int64_t now_ms, int64_t stale_after_ms) const {
  std::lock_guard lg(mutex_);
  auto it = peers_.find(device_id);
  if(it == peers_.end()) return std::nullopt;
  return derive(it->second, now_ms, stale_after_ms);
}

std::size_t PeerTable::size() const {
  std::lock_guard lg(mutex_);
  return peers_.size();
}

// ---- DiscoveryService -----------------------------------------------------

DiscoveryService::DiscoveryService(asio::io_context& io,
                                   Options options,
                                   std::vector<uint8_t> shared_secret,
                                   Logger* logger)
  : strand_(asio::make_strand(io)),
    options_(std::move(options)),
    logger_(logger),
    shared_secret_(std::move(shared_secret)) {
  auto id = uuid_from_string(options_.device_id);
  if(!id) {
    throw SyncError(ErrorKind::InvalidArgument, "device id '" + options_.device_id + "' is not a UUID");
  }
  local_device_id_ = *id;
  if(options_.display_name.size() > kMaxDisplayNameBytes) {
    options_.display_name.resize(kMaxDisplayNameBytes);
  }
  if(!options_.clock) {
    options_.clock = [] { return wall_clock_millis(); };
  }
}

DiscoveryService::~DiscoveryService() = default;

int64_t DiscoveryService::now() const {
  return options_.clock();
}

int64_t DiscoveryService::stale_after_ms() const {
  // One missed beacon is tolerated before a peer is shown as stale.
  return std::min<int64_t>(2 * options_.broadcast_interval.count(), options_.presence_timeout.count());
}

std::vector<uint8_t> DiscoveryService::secret_copy() const {
  std::lock_guard lg(secret_mutex_);
  return shared_secret_;
}

void DiscoveryService::set_shared_secret(std::vector<uint8_t> secret) {
  if(secret.empty()) {
    throw SyncError(ErrorKind::InvalidArgument, "discovery secret must not be empty");
  }
  std::lock_guard lg(secret_mutex_);
  shared_secret_ = std::move(secret);
}

void DiscoveryService::start() {
  if(running_) return;
  if(secret_copy().empty()) {
    throw SyncError(ErrorKind::InvalidArgument, "discovery secret must not be empty");
  }

  using udp = asio::ip::udp;
  std::error_code ec;
  auto listen_ip = asio::ip::make_address(options_.listen_address, ec);
  if(ec) {
    throw SyncError(ErrorKind::InvalidArgument, "invalid listen address '" + options_.listen_address + "'");
  }
  auto broadcast_ip = asio::ip::make_address(options_.broadcast_address, ec);
  if(ec) {
    throw SyncError(ErrorKind::InvalidArgument, "invalid broadcast address '" + options_.broadcast_address + "'");
  }
  broadcast_endpoint_ = udp::endpoint(broadcast_ip, options_.broadcast_port);

  auto socket = std::make_unique<udp::socket>(strand_);
  udp::endpoint local(listen_ip, options_.listen_port);
  socket->open(local.protocol(), ec);
  if(!ec) socket->set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) socket->set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket->bind(local, ec);
  if(ec) {
    throw SyncError(ErrorKind::TransientNetwork,
                    "cannot bind discovery socket " + options_.listen_address + ":" +
                    std::to_string(options_.listen_port) + ": " + ec.message());
  }
  local_port_ = socket->local_endpoint().port();
  socket_ = std::move(socket);
  broadcast_timer_ = std::make_unique<asio::steady_timer>(strand_);
  reaper_timer_ = std::make_unique<asio::steady_timer>(strand_);
  running_ = true;

  log_info(logger_, "discovery listening on {}:{}, beacons to {}:{} every {} ms",
           options_.listen_address, local_port_, options_.broadcast_address,
           options_.broadcast_port, options_.broadcast_interval.count());

  auto self = shared_from_this();
  asio::dispatch(strand_, [self] {
    self->start_receive();
    self->schedule_broadcast(std::chrono::milliseconds(0));
    self->schedule_reaper();
  });
}

void DiscoveryService::stop() {
  if(!running_.exchange(false)) return;
  auto self = shared_from_this();
  asio::dispatch(strand_, [self] { self->close_socket(); });
}

void DiscoveryService::close_socket() {
  std::error_code ec;
  if(broadcast_timer_) broadcast_timer_->cancel();
  if(reaper_timer_) reaper_timer_->cancel();
  if(socket_) socket_->close(ec);
  log_debug(logger_, "discovery stopped");
}

std::vector<uint8_t> DiscoveryService::make_presence_datagram() const {
  PresenceMessage msg;
  msg.device_id = local_device_id_;
  msg.display_name = options_.display_name;
  msg.timestamp_millis = static_cast<uint64_t>(now());
  auto input = presence_signing_input(msg.device_id, msg.display_name, msg.timestamp_millis);
  msg.signature = hmac_sha256(secret_copy(), input.data(), input.size());
  return encode_presence(msg);
}

void DiscoveryService::schedule_broadcast(std::chrono::milliseconds delay) {
  if(!running_) return;
  broadcast_timer_->expires_after(delay);
  broadcast_timer_->async_wait([self = shared_from_this()](const std::error_code& ec) {
    if(ec || !self->running_) return;
    self->send_beacon();
    self->schedule_broadcast(self->options_.broadcast_interval);
  });
}

void DiscoveryService::send_beacon() {
  std::shared_ptr<std::vector<uint8_t>> datagram;
  try {
    datagram = std::make_shared<std::vector<uint8_t>>(make_presence_datagram());
  } catch(const SyncError& e) {
    ++send_errors_;
    log_warn(logger_, "cannot build presence beacon: {}", e.what());
    return;
  }
  socket_->async_send_to(asio::buffer(*datagram), broadcast_endpoint_,
    [self = shared_from_this(), datagram](const std::error_code& ec, std::size_t) {
      if(ec && ec != asio::error::operation_aborted) {
        ++self->send_errors_;
        log_warn(self->logger_, "presence beacon send failed: {}", ec.message());
      }
    });
}

void DiscoveryService::start_receive() {
  if(!running_) return;
  socket_->async_receive_from(asio::buffer(receive_buffer_), sender_endpoint_,
    [self = shared_from_this()](const std::error_code& ec, std::size_t bytes) {
      if(ec == asio::error::operation_aborted || !self->running_) return;
      if(ec) {
        ++self->receive_errors_;
        log_warn(self->logger_, "discovery receive failed: {}", ec.message());
      } else {
        self->handle_datagram(self->receive_buffer_.data(), bytes,
                              self->sender_endpoint_.address().to_string());
      }
      self->start_receive();
    });
}

bool DiscoveryService::handle_datagram(const uint8_t* data, std::size_t size, const std::string& source_address) {
  ++received_;
  auto msg = decode_presence(data, size);
  if(!msg) {
    ++malformed_;
    log_debug(logger_, "dropped malformed datagram ({} bytes) from {}", size, source_address);
    return false;
  }
  if(msg->device_id == local_device_id_) {
    ++self_echo_;
    return false;
  }

  const auto secret = secret_copy();
  auto input = presence_signing_input(msg->device_id, msg->display_name, msg->timestamp_millis);
  if(secret.empty()) {
    ++auth_failed_;
    return false;
  }
  const Digest expected = hmac_sha256(secret, input.data(), input.size());
  if(!constant_time_equal(expected.data(), msg->signature.data(), expected.size())) {
    ++auth_failed_;
    log_debug(logger_, "dropped beacon with bad MAC from {}", source_address);
    return false;
  }

  // Timestamps are untrusted 64-bit values; compare them unsigned.
  const int64_t now_ms = now();
  const uint64_t local = static_cast<uint64_t>(std::max<int64_t>(now_ms, 0));
  const uint64_t ts = msg->timestamp_millis;
  const uint64_t skew = local > ts ? local - ts : ts - local;
  const std::string device_id = uuid_to_string(msg->device_id);
  if(skew > static_cast<uint64_t>(options_.replay_window.count())) {
    ++replayed_;
    log_debug(logger_, "dropped beacon from {} outside replay window ({} {} ms)",
              device_id, ts > local ? "ahead by" : "behind by", skew);
    return false;
  }
  auto previous = table_.last_timestamp(device_id);
  if(previous && *previous >= msg->timestamp_millis) {
    ++replayed_;
    log_debug(logger_, "dropped repeated beacon from {}", device_id);
    return false;
  }

  PeerRecord record;
  record.device_id = device_id;
  record.display_name = msg->display_name;
  record.network_address = source_address;
  record.last_seen_at_ms = now_ms;
  record.status = PeerStatus::Online;
  const bool is_new = table_.upsert(record, msg->timestamp_millis);
  ++accepted_;
  if(is_new) {
    log_info(logger_, "peer found: {} ({}) at {}", record.display_name, device_id, source_address);
  }
  notify(is_new ? PeerEvent::Found : PeerEvent::Updated, record);
  return true;
}

void DiscoveryService::schedule_reaper() {
  if(!running_) return;
  reaper_timer_->expires_after(options_.reaper_interval);
  reaper_timer_->async_wait([self = shared_from_this()](const std::error_code& ec) {
    if(ec || !self->running_) return;
    self->reap_now();
    self->schedule_reaper();
  });
}

void DiscoveryService::reap_now() {
  for(const auto& lost : table_.reap(now(), options_.presence_timeout.count())) {
    log_info(logger_, "peer lost: {} ({})", lost.display_name, lost.device_id);
    notify(PeerEvent::Lost, lost);
  }
}

std::vector<PeerRecord> DiscoveryService::current_peers() const {
  return table_.snapshot(now(), stale_after_ms());
}

std::optional<PeerRecord> DiscoveryService::peer(const std::string& device_id) const {
  return table_.find(device_id, now(), stale_after_ms());
}

DiscoveryService::ListenerHandle DiscoveryService::add_peer_listener(PeerListener listener) {
  std::lock_guard lg(listener_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void DiscoveryService::remove_peer_listener(ListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void DiscoveryService::notify(PeerEvent event, const PeerRecord& record) {
  std::vector<PeerListener> targets;
  {
    std::lock_guard lg(listener_mutex_);
    for(const auto& [handle, listener] : listeners_) targets.push_back(listener);
  }
  for(auto& listener : targets) {
    try {
      listener(event, record);
    } catch(const std::exception& e) {
      log_error(logger_, "peer listener threw: {}", e.what());
    }
  }
}

DiscoveryService::Counters DiscoveryService::counters() const {
  Counters c;
  c.received = received_;
  c.accepted = accepted_;
  c.malformed = malformed_;
  c.auth_failed = auth_failed_;
  c.replayed = replayed_;
  c.self_echo = self_echo_;
  c.send_errors = send_errors_;
  c.receive_errors = receive_errors_;
  return c;
}
