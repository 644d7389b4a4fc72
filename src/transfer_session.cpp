#include "transfer_session.hpp"

#include "certificate_manager.hpp"
#include "persistence_store.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace {

ErrorKind kind_from_wire(uint8_t raw) {
  if(raw > static_cast<uint8_t>(ErrorKind::InvalidArgument)) return ErrorKind::Protocol;
  return static_cast<ErrorKind>(raw);
}

// Security and integrity outcomes are final; anything else may be resumed.
SessionState state_for_abort(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Integrity:
    case ErrorKind::Pinning:
    case ErrorKind::Protocol:
    case ErrorKind::Persistence:
    case ErrorKind::InvalidArgument:
      return SessionState::Failed;
    default:
      return SessionState::Paused;
  }
}

std::vector<uint8_t> make_abort(ErrorKind kind, const std::string& message) {
  AbortFrame abort;
  abort.kind = static_cast<uint8_t>(kind);
  abort.message = message;
  return encode_abort(abort);
}

std::string errno_text(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

} // namespace

// ===========================================================================
// SendSession
// ===========================================================================

SendSession::SendSession(std::shared_ptr<TransferEngine> engine,
                         TransferSession record,
                         FileRecord file,
                         uint32_t sender_offset)
  : engine_(std::move(engine)),
    strand_(asio::make_strand(engine_->io())),
    timer_(strand_),
    record_(std::move(record)),
    file_(std::move(file)),
    sender_offset_(sender_offset) {
  if(!IntegrityHasher::from_hex(record_.content_hash, content_hash_)) {
    throw SyncError(ErrorKind::InvalidArgument, "file " + record_.file_id + " has no valid content hash");
  }
  progress_ = initial_progress();
}

SessionProgress SendSession::initial_progress() const {
  SessionProgress p;
  p.session_id = record_.session_id;
  p.total_chunks = record_.total_chunks;
  p.chunks_done = sender_offset_;
  p.state = SessionState::Handshaking;
  return p;
}

void SendSession::start() {
  asio::dispatch(strand_, [self = shared_from_this()] { self->begin(); });
}

void SendSession::cancel() {
  asio::dispatch(strand_, [self = shared_from_this()] {
    if(self->finished_) return;
    self->cancelled_ = true;
    if(self->connection_ && self->connection_->is_open()) {
      self->connection_->send(make_abort(ErrorKind::None, "cancelled by sender"));
    }
    self->finish(SessionState::Paused, ErrorKind::None, "cancelled");
  });
}

void SendSession::abandon() {
  asio::dispatch(strand_, [self = shared_from_this()] {
    self->cancelled_ = true;
    self->finish(SessionState::Paused, ErrorKind::TransientNetwork, "transfer engine stopped");
  });
}

void SendSession::begin() {
  if(finished_ || phase_ != Phase::Idle) return;
  Logger* log = engine_->logger();

  auto address = engine_->resolve_peer(record_.peer_device_id);
  if(!address) {
    finish(SessionState::Paused, ErrorKind::TransientNetwork,
           "peer " + record_.peer_device_id + " is not currently discovered");
    return;
  }
  std::error_code ec;
  auto ip = asio::ip::make_address(*address, ec);
  if(ec) {
    finish(SessionState::Paused, ErrorKind::TransientNetwork, "peer address '" + *address + "' is invalid");
    return;
  }

  source_.open(record_.local_path, std::ios::binary);
  if(!source_) {
    finish(SessionState::Failed, ErrorKind::InvalidArgument, "cannot open " + record_.local_path);
    return;
  }

  asio::ip::tcp::endpoint endpoint(ip, engine_->options().peer_port);
  log_info(log, "session {}: sending {} ({} bytes, {} chunks) to {} at {}",
           record_.session_id, record_.local_path, file_.size_bytes, record_.total_chunks,
           record_.peer_device_id, endpoint.address().to_string());

  phase_ = Phase::Connecting;
  connection_ = std::make_shared<Connection>(asio::ip::tcp::socket(strand_), engine_->client_context(), log);
  arm_timer(engine_->options().handshake_timeout, "handshake");
  connection_->async_connect(endpoint, [self = shared_from_this()](const std::error_code& cec) {
    self->on_connected(cec);
  });
}

void SendSession::on_connected(const std::error_code& ec) {
  if(finished_) return;
  if(ec) {
    if(ec.category() == asio::error::get_ssl_category()) {
      ++engine_->auth_failed_;
      finish(SessionState::Paused, ErrorKind::Authentication, "TLS handshake failed: " + ec.message());
    } else {
      finish(SessionState::Paused, ErrorKind::TransientNetwork, "connect failed: " + ec.message());
    }
    return;
  }

  auto der = connection_->peer_certificate_der();
  if(!der) {
    ++engine_->auth_failed_;
    finish(SessionState::Paused, ErrorKind::Authentication, "receiver presented no certificate");
    return;
  }
  try {
    std::optional<std::string> pin;
    if(auto trusted = engine_->store().trusted_peer(record_.peer_device_id)) {
      pin = trusted->fingerprint;
    }
    auto verdict = engine_->certificates().verify_peer_certificate(*der, pin);
    if(verdict == PeerVerdict::Unverified) {
      progress_.identity_unverified = true;
      log_warn(engine_->logger(), "session {}: peer {} is not paired; identity NOT verified",
               record_.session_id, record_.peer_device_id);
    }
  } catch(const SyncError& e) {
    if(e.kind() == ErrorKind::Pinning) {
      ++engine_->pinning_failed_;
      log_error(engine_->logger(), "SECURITY: session {} refused peer {}: {}",
                record_.session_id, record_.peer_device_id, e.what());
      finish(SessionState::Failed, ErrorKind::Pinning, e.what());
    } else {
      if(e.kind() == ErrorKind::Authentication) ++engine_->auth_failed_;
      finish(SessionState::Paused, e.kind(), e.what());
    }
    return;
  }

  auto self = shared_from_this();
  connection_->start_reading(
    [self](Frame&& frame) { self->on_frame(std::move(frame)); },
    [self](const std::error_code& rec) {
      self->finish(SessionState::Paused, ErrorKind::TransientNetwork, "connection lost: " + rec.message());
    });

  HelloFrame hello;
  hello.device_id = uuid_from_string(engine_->options().device_id).value_or(Uuid{});
  hello.display_name = engine_->options().display_name;
  connection_->send(encode_hello(hello));

  MetadataFrame meta;
  meta.file_id = uuid_from_string(record_.file_id).value_or(Uuid{});
  meta.total_size_bytes = file_.size_bytes;
  meta.chunk_size = record_.chunk_size;
  meta.resume_offset = sender_offset_;
  meta.content_hash = content_hash_;
  meta.file_name = std::filesystem::path(record_.local_path).filename().string();
  connection_->send(encode_metadata(meta));

  phase_ = Phase::AwaitResume;
  publish();
}

void SendSession::on_frame(Frame&& frame) {
  if(finished_) return;
  switch(frame.type) {
    case FrameType::ResumeAccept:
    case FrameType::Ack:
    case FrameType::CumulativeAck:
    case FrameType::Retransmit: {
      auto index = decode_index(frame);
      if(!index) {
        protocol_violation(std::string("malformed ") + to_string(frame.type) + " frame");
        return;
      }
      if(frame.type == FrameType::ResumeAccept) on_resume_accepted(*index);
      else if(frame.type == FrameType::Retransmit) on_retransmit(*index);
      else on_ack_range(*index, frame.type == FrameType::CumulativeAck);
      return;
    }
    case FrameType::Verdict: {
      auto verdict = decode_verdict(frame);
      if(!verdict) {
        protocol_violation("malformed verdict frame");
        return;
      }
      on_verdict(*verdict);
      return;
    }
    case FrameType::Abort: {
      auto abort = decode_abort(frame);
      if(!abort) {
        protocol_violation("malformed abort frame");
        return;
      }
      on_abort(*abort);
      return;
    }
    default:
      protocol_violation(std::string("unexpected ") + to_string(frame.type) + " frame from receiver");
  }
}

void SendSession::on_resume_accepted(uint32_t offset) {
  if(phase_ != Phase::AwaitResume) {
    protocol_violation("unexpected resume-accept");
    return;
  }
  if(offset > record_.total_chunks) {
    protocol_violation("resume offset " + std::to_string(offset) + " beyond " +
                       std::to_string(record_.total_chunks) + " chunks");
    return;
  }
  if(offset != sender_offset_) {
    log_info(engine_->logger(), "session {}: receiver resumes at chunk {} (sender had {})",
             record_.session_id, offset, sender_offset_);
  }
  next_to_send_ = offset;
  acked_ = static_cast<int64_t>(offset) - 1;
  try {
    if(offset > 0) engine_->store().advance_checkpoint(record_.session_id, acked_);
    engine_->store().set_session_state(record_.session_id, SessionState::Transferring);
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Persistence, "sender store failure"));
    finish(SessionState::Failed, ErrorKind::Persistence, e.what());
    return;
  }
  phase_ = Phase::Streaming;
  progress_.state = SessionState::Transferring;
  progress_.chunks_done = offset;
  publish();
  arm_timer(engine_->options().ack_timeout, "acknowledgment");
  pump();
}

void SendSession::pump() {
  const auto window = std::max<uint32_t>(1, engine_->options().window_size);
  while(!finished_ && in_flight_.size() < window && next_to_send_ < record_.total_chunks) {
    send_chunk(next_to_send_++, 0);
  }
  if(!finished_ && phase_ == Phase::Streaming && acked_ + 1 == static_cast<int64_t>(record_.total_chunks)) {
    send_complete();
  }
}

std::vector<uint8_t> SendSession::read_chunk(uint32_t index) {
  const uint64_t offset = static_cast<uint64_t>(index) * record_.chunk_size;
  const uint64_t length = std::min<uint64_t>(record_.chunk_size, file_.size_bytes - offset);
  std::vector<uint8_t> payload(static_cast<std::size_t>(length));
  source_.clear();
  source_.seekg(static_cast<std::streamoff>(offset));
  source_.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(length));
  if(static_cast<uint64_t>(source_.gcount()) != length) {
    throw SyncError(ErrorKind::Integrity, "short read of chunk " + std::to_string(index) +
                    " from " + record_.local_path);
  }
  return payload;
}

void SendSession::send_chunk(uint32_t index, uint32_t attempt) {
  ChunkFrame chunk;
  chunk.index = index;
  try {
    chunk.payload = read_chunk(index);
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Integrity, "source file changed"));
    finish(SessionState::Failed, ErrorKind::Integrity, e.what());
    return;
  }
  chunk.digest = IntegrityHasher::digest(chunk.payload);
  if(auto filter = engine_->chunk_filter()) {
    filter(index, attempt, chunk.payload);
  }
  in_flight_.insert(index);
  connection_->send(encode_chunk(chunk));
}

void SendSession::on_ack_range(uint32_t last, bool cumulative) {
  if(phase_ != Phase::Streaming) {
    protocol_violation("acknowledgment outside streaming");
    return;
  }
  if(static_cast<int64_t>(last) <= acked_) {
    if(cumulative) return;
    protocol_violation("duplicate ack for chunk " + std::to_string(last));
    return;
  }
  if(!cumulative && static_cast<int64_t>(last) != acked_ + 1) {
    protocol_violation("ack for chunk " + std::to_string(last) + " arrived out of order");
    return;
  }
  if(last >= next_to_send_) {
    protocol_violation("ack for unsent chunk " + std::to_string(last));
    return;
  }
  for(int64_t i = acked_ + 1; i <= static_cast<int64_t>(last); ++i) {
    in_flight_.erase(static_cast<uint32_t>(i));
  }
  acked_ = last;
  try {
    engine_->store().advance_checkpoint(record_.session_id, acked_);
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Persistence, "sender store failure"));
    finish(SessionState::Failed, ErrorKind::Persistence, e.what());
    return;
  }
  progress_.chunks_done = last + 1;
  publish();
  arm_timer(engine_->options().ack_timeout, "acknowledgment");
  pump();
}

void SendSession::on_retransmit(uint32_t index) {
  if(phase_ != Phase::Streaming || static_cast<int64_t>(index) <= acked_ || index >= next_to_send_) {
    protocol_violation("retransmit request for chunk " + std::to_string(index) + " not in flight");
    return;
  }
  const uint32_t attempt = ++retries_[index];
  if(attempt > engine_->options().max_chunk_retries) {
    const std::string message = "chunk " + std::to_string(index) + " failed verification " +
                                std::to_string(attempt) + " times";
    connection_->send(make_abort(ErrorKind::Integrity, message));
    finish(SessionState::Failed, ErrorKind::Integrity, message);
    return;
  }
  log_warn(engine_->logger(), "session {}: resending chunk {} (attempt {})",
           record_.session_id, index, attempt);
  send_chunk(index, attempt);
}

void SendSession::send_complete() {
  phase_ = Phase::AwaitVerdict;
  try {
    auto local = IntegrityHasher::digest_file_prefix(record_.local_path, file_.size_bytes);
    if(local != content_hash_) {
      connection_->send(make_abort(ErrorKind::Integrity, "source file changed during transfer"));
      finish(SessionState::Failed, ErrorKind::Integrity, "source file changed during transfer");
      return;
    }
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Integrity, "source file unreadable"));
    finish(SessionState::Failed, ErrorKind::Integrity, e.what());
    return;
  }
  connection_->send(encode_complete());
  arm_timer(engine_->options().ack_timeout, "verdict");
}

void SendSession::on_verdict(const VerdictFrame& verdict) {
  if(phase_ != Phase::AwaitVerdict) {
    protocol_violation("verdict before completion");
    return;
  }
  if(!verdict.ok || verdict.digest != content_hash_) {
    finish(SessionState::Failed, ErrorKind::Integrity,
           "receiver computed " + IntegrityHasher::to_hex(verdict.digest) + ", expected " + record_.content_hash);
    return;
  }
  finish(SessionState::Completed, ErrorKind::None, std::string());
}

void SendSession::on_abort(const AbortFrame& abort) {
  const ErrorKind kind = kind_from_wire(abort.kind);
  const std::string message = "receiver aborted: " + abort.message;
  if(kind == ErrorKind::None) {
    finish(SessionState::Paused, ErrorKind::None, message);
    return;
  }
  finish(state_for_abort(kind), kind, message);
}

void SendSession::arm_timer(std::chrono::milliseconds timeout, const char* what) {
  timer_.expires_after(timeout);
  timer_.async_wait([self = shared_from_this(), what](const std::error_code& ec) {
    if(ec || self->finished_) return;
    self->finish(SessionState::Paused, ErrorKind::TransientNetwork, std::string(what) + " timed out");
  });
}

void SendSession::protocol_violation(const std::string& message) {
  ++engine_->protocol_violations_;
  if(connection_) connection_->send(make_abort(ErrorKind::Protocol, message));
  finish(SessionState::Failed, ErrorKind::Protocol, message);
}

void SendSession::finish(SessionState state, ErrorKind error, const std::string& message) {
  if(finished_) return;
  finished_ = true;
  phase_ = Phase::Done;
  timer_.cancel();
  if(connection_) connection_->close_after_flush();
  source_.close();

  try {
    engine_->store().set_session_state(record_.session_id, state);
    SyncStatus status = SyncStatus::Pending;
    if(state == SessionState::Completed) status = SyncStatus::Synced;
    else if(state == SessionState::Failed) status = SyncStatus::Failed;
    engine_->store().set_sync_status_if_hash(record_.file_id, record_.content_hash, status);
  } catch(const SyncError& e) {
    log_error(engine_->logger(), "session {}: cannot record outcome: {}", record_.session_id, e.what());
  }

  progress_.state = state;
  progress_.error = error;
  progress_.message = message;
  if(state == SessionState::Completed) {
    log_info(engine_->logger(), "session {}: sent {} chunks of {} to {}",
             record_.session_id, record_.total_chunks, record_.local_path, record_.peer_device_id);
  } else if(state == SessionState::Failed) {
    log_error(engine_->logger(), "session {} failed ({}): {}", record_.session_id, to_string(error), message);
  } else {
    log_warn(engine_->logger(), "session {} paused at chunk {}: {}", record_.session_id, acked_ + 1, message);
  }
  publish();
  engine_->on_send_finished(record_.session_id, state, error, cancelled_);
}

void SendSession::publish() {
  engine_->publish(progress_);
}

// ===========================================================================
// ReceiveSession
// ===========================================================================

ReceiveSession::ReceiveSession(std::shared_ptr<TransferEngine> engine,
                               asio::ip::tcp::socket socket,
                               asio::ssl::context& context,
                               bool admitted)
  : engine_(std::move(engine)),
    connection_(std::make_shared<Connection>(std::move(socket), context, engine_->logger())),
    timer_(connection_->executor()),
    remote_(connection_->remote_address()),
    admitted_(admitted) {}

ReceiveSession::~ReceiveSession() {
  if(fd_ >= 0) ::close(fd_);
  release_slot();
}

void ReceiveSession::start() {
  asio::dispatch(connection_->executor(), [self = shared_from_this()] {
    self->arm_timer(self->engine_->options().handshake_timeout, "handshake");
    self->connection_->async_accept([self](const std::error_code& ec) { self->on_handshake(ec); });
  });
}

void ReceiveSession::cancel() {
  asio::dispatch(connection_->executor(), [self = shared_from_this()] {
    if(self->finished_) return;
    self->connection_->send(make_abort(ErrorKind::None, "cancelled by receiver"));
    self->finish(SessionState::Paused, ErrorKind::None, "cancelled");
  });
}

void ReceiveSession::supersede() {
  asio::dispatch(connection_->executor(), [self = shared_from_this()] {
    self->finish(SessionState::Paused, ErrorKind::TransientNetwork, "superseded by a newer connection");
  });
}

void ReceiveSession::abandon() {
  asio::dispatch(connection_->executor(), [self = shared_from_this()] {
    self->finish(SessionState::Paused, ErrorKind::TransientNetwork, "transfer engine stopped");
  });
}

void ReceiveSession::on_handshake(const std::error_code& ec) {
  if(finished_) return;
  if(ec) {
    // No session record exists yet.
    ++engine_->auth_failed_;
    log_warn(engine_->logger(), "TLS handshake with {} failed: {}", remote_, ec.message());
    finished_ = true;
    phase_ = Phase::Done;
    timer_.cancel();
    connection_->close();
    release_slot();
    return;
  }
  if(!admitted_) {
    ++engine_->busy_rejected_;
    log_warn(engine_->logger(), "refusing transfer from {}: {} inbound transfers already running",
             remote_, engine_->running_inbound());
    connection_->send(make_abort(ErrorKind::TransientNetwork, "receiver busy"));
    finish(SessionState::Paused, ErrorKind::TransientNetwork, "receiver busy");
    return;
  }
  phase_ = Phase::AwaitHello;
  auto self = shared_from_this();
  connection_->start_reading(
    [self](Frame&& frame) { self->on_frame(std::move(frame)); },
    [self](const std::error_code& rec) {
      self->finish(SessionState::Paused, ErrorKind::TransientNetwork, "connection lost: " + rec.message());
    });
}

void ReceiveSession::on_frame(Frame&& frame) {
  if(finished_) return;
  if(frame.type == FrameType::Abort) {
    auto abort = decode_abort(frame);
    if(!abort) {
      protocol_violation("malformed abort frame");
      return;
    }
    on_abort(*abort);
    return;
  }
  switch(phase_) {
    case Phase::AwaitHello: {
      auto hello = decode_hello(frame);
      if(!hello) {
        protocol_violation("expected hello");
        return;
      }
      on_hello(*hello);
      return;
    }
    case Phase::AwaitMetadata: {
      auto meta = decode_metadata(frame);
      if(!meta) {
        protocol_violation("expected valid metadata");
        return;
      }
      on_metadata(*meta);
      return;
    }
    case Phase::Streaming:
      if(frame.type == FrameType::Chunk) {
        auto chunk = decode_chunk(frame);
        if(!chunk) {
          protocol_violation("malformed chunk frame");
          return;
        }
        on_chunk(std::move(*chunk));
        return;
      }
      if(frame.type == FrameType::Complete && frame.body.empty()) {
        on_complete();
        return;
      }
      protocol_violation(std::string("unexpected ") + to_string(frame.type) + " frame from sender");
      return;
    default:
      protocol_violation("frame before handshake");
  }
}

void ReceiveSession::on_hello(const HelloFrame& hello) {
  peer_device_id_ = uuid_to_string(hello.device_id);
  peer_name_ = hello.display_name;

  auto der = connection_->peer_certificate_der();
  if(!der) {
    ++engine_->auth_failed_;
    reject(ErrorKind::Authentication, "sender presented no certificate");
    return;
  }
  try {
    std::optional<std::string> pin;
    if(auto trusted = engine_->store().trusted_peer(peer_device_id_)) {
      pin = trusted->fingerprint;
    }
    if(engine_->certificates().verify_peer_certificate(*der, pin) == PeerVerdict::Unverified) {
      identity_unverified_ = true;
      log_warn(engine_->logger(), "incoming transfer from unpaired peer {} ({}); identity NOT verified",
               peer_name_, peer_device_id_);
    }
  } catch(const SyncError& e) {
    if(e.kind() == ErrorKind::Pinning) {
      ++engine_->pinning_failed_;
      log_error(engine_->logger(), "SECURITY: refused incoming transfer from {} at {}: {}",
                peer_device_id_, remote_, e.what());
    } else if(e.kind() == ErrorKind::Authentication) {
      ++engine_->auth_failed_;
    }
    reject(e.kind(), e.what());
    return;
  }
  phase_ = Phase::AwaitMetadata;
}

void ReceiveSession::on_metadata(const MetadataFrame& meta) {
  if(meta.file_name.empty() || meta.file_name.find('/') != std::string::npos ||
     meta.file_name.find('\\') != std::string::npos || meta.file_name.find('\0') != std::string::npos ||
     meta.file_name == "." || meta.file_name == "..") {
    protocol_violation("unacceptable file name '" + meta.file_name + "'");
    return;
  }

  auto& store = engine_->store();
  const auto& options = engine_->options();
  file_id_ = uuid_to_string(meta.file_id);
  file_name_ = meta.file_name;
  content_hash_ = meta.content_hash;
  total_size_ = meta.total_size_bytes;
  chunk_size_ = meta.chunk_size;
  total_chunks_ = chunk_count(total_size_, chunk_size_);
  const std::string hash_hex = IntegrityHasher::to_hex(content_hash_);

  std::error_code ec;
  std::filesystem::create_directories(options.inbox_dir, ec);
  staged_path_ = options.inbox_dir / (file_name_ + "." + file_id_.substr(0, 8) + ".lspart");

  // The receiver decides where to resume. Only chunks that are both
  // checkpointed and physically present in the staged file are trusted.
  uint32_t offset = 0;
  try {
    auto prior = store.latest_resumable_session(file_id_, peer_device_id_, TransferDirection::Receive,
                                                hash_hex, chunk_size_);
    if(prior && std::filesystem::exists(staged_path_, ec)) {
      const uint64_t staged_size = std::filesystem::file_size(staged_path_, ec);
      uint32_t present = 0;
      if(!ec) {
        present = staged_size >= total_size_ ? total_chunks_
                                             : static_cast<uint32_t>(staged_size / chunk_size_);
      }
      offset = std::min({prior->resume_offset(), present, total_chunks_});
    }
    if(offset != meta.resume_offset) {
      log_info(engine_->logger(), "resume disagreement for {}: sender offered chunk {}, resuming at {}",
               file_name_, meta.resume_offset, offset);
    }

    session_id_ = generate_uuid();
    TransferSession row;
    row.session_id = session_id_;
    row.file_id = file_id_;
    row.direction = TransferDirection::Receive;
    row.peer_device_id = peer_device_id_;
    row.total_chunks = total_chunks_;
    row.last_acknowledged_chunk = static_cast<int64_t>(offset) - 1;
    row.state = SessionState::Transferring;
    row.content_hash = hash_hex;
    row.chunk_size = chunk_size_;
    row.local_path = staged_path_.string();
    store.insert_session(row);
  } catch(const SyncError& e) {
    reject(ErrorKind::Persistence, e.what());
    return;
  }

  progress_.session_id = session_id_;
  progress_.total_chunks = total_chunks_;
  progress_.chunks_done = offset;
  progress_.state = SessionState::Transferring;
  progress_.identity_unverified = identity_unverified_;
  next_expected_ = offset;
  engine_->claim_receive_slot(file_id_, peer_device_id_, shared_from_this());

  // Drops torn bytes past the resume point. The last chunk may be short, so
  // a fully staged file keeps exactly total_size_ bytes.
  const uint64_t keep = std::min<uint64_t>(static_cast<uint64_t>(offset) * chunk_size_, total_size_);
  fd_ = ::open(staged_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if(fd_ < 0 || ::ftruncate(fd_, static_cast<off_t>(keep)) != 0) {
    const std::string message = errno_text("cannot prepare " + staged_path_.string());
    connection_->send(make_abort(ErrorKind::Persistence, "receiver cannot write"));
    finish(SessionState::Failed, ErrorKind::Persistence, message);
    return;
  }

  log_info(engine_->logger(), "session {}: receiving {} ({} bytes, {} chunks) from {} starting at chunk {}",
           session_id_, file_name_, total_size_, total_chunks_, peer_name_, offset);
  connection_->set_max_body(static_cast<std::size_t>(chunk_size_) + 64);
  connection_->send(encode_resume_accept(offset));
  phase_ = Phase::Streaming;
  publish();
  arm_timer(options.ack_timeout, "chunk");
}

uint64_t ReceiveSession::expected_length(uint32_t index) const {
  const uint64_t offset = static_cast<uint64_t>(index) * chunk_size_;
  return std::min<uint64_t>(chunk_size_, total_size_ - offset);
}

void ReceiveSession::on_chunk(ChunkFrame&& chunk) {
  const auto& options = engine_->options();
  if(chunk.index >= total_chunks_) {
    protocol_violation("chunk index " + std::to_string(chunk.index) + " out of range");
    return;
  }
  if(chunk.index < next_expected_) {
    connection_->send(encode_cumulative_ack(next_expected_ - 1));
    return;
  }
  const uint32_t window = std::max<uint32_t>(1, options.window_size);
  if(chunk.index >= next_expected_ + 2 * window) {
    protocol_violation("chunk " + std::to_string(chunk.index) + " is outside the window");
    return;
  }
  arm_timer(options.ack_timeout, "chunk");

  const bool valid = chunk.payload.size() == expected_length(chunk.index) &&
                     IntegrityHasher::digest(chunk.payload) == chunk.digest;
  if(!valid) {
    const uint32_t failures = ++failures_[chunk.index];
    if(failures > options.max_chunk_retries) {
      const std::string message = "chunk " + std::to_string(chunk.index) + " failed verification " +
                                  std::to_string(failures) + " times";
      connection_->send(make_abort(ErrorKind::Integrity, message));
      finish(SessionState::Failed, ErrorKind::Integrity, message);
      return;
    }
    log_warn(engine_->logger(), "session {}: chunk {} failed verification, requesting retransmit",
             session_id_, chunk.index);
    connection_->send(encode_retransmit(chunk.index));
    return;
  }

  if(chunk.index != next_expected_) {
    buffered_[chunk.index] = std::move(chunk.payload);
    return;
  }

  try {
    commit(chunk.index, chunk.payload);
    uint32_t committed = 1;
    for(auto it = buffered_.find(next_expected_); it != buffered_.end(); it = buffered_.find(next_expected_)) {
      commit(it->first, it->second);
      buffered_.erase(it);
      ++committed;
    }
    if(committed == 1) {
      connection_->send(encode_ack(next_expected_ - 1));
    } else {
      connection_->send(encode_cumulative_ack(next_expected_ - 1));
    }
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Persistence, "receiver cannot persist chunk"));
    finish(SessionState::Failed, ErrorKind::Persistence, e.what());
    return;
  }
  publish();
}

void ReceiveSession::commit(uint32_t index, const std::vector<uint8_t>& payload) {
  const uint64_t offset = static_cast<uint64_t>(index) * chunk_size_;
  std::size_t written = 0;
  while(written < payload.size()) {
    ssize_t n = ::pwrite(fd_, payload.data() + written, payload.size() - written,
                         static_cast<off_t>(offset + written));
    if(n < 0) {
      if(errno == EINTR) continue;
      throw SyncError(ErrorKind::Persistence, errno_text("write to " + staged_path_.string()));
    }
    written += static_cast<std::size_t>(n);
  }
  if(::fdatasync(fd_) != 0) {
    throw SyncError(ErrorKind::Persistence, errno_text("sync " + staged_path_.string()));
  }
  engine_->store().advance_checkpoint(session_id_, index);
  next_expected_ = index + 1;
  progress_.chunks_done = next_expected_;
}

void ReceiveSession::on_complete() {
  if(next_expected_ != total_chunks_) {
    protocol_violation("complete after " + std::to_string(next_expected_) + " of " +
                       std::to_string(total_chunks_) + " chunks");
    return;
  }
  timer_.cancel();
  close_file();

  VerdictFrame verdict;
  try {
    std::error_code ec;
    const auto size = std::filesystem::file_size(staged_path_, ec);
    verdict.digest = IntegrityHasher::digest_file(staged_path_);
    verdict.ok = !ec && size == total_size_ && verdict.digest == content_hash_;
  } catch(const SyncError& e) {
    log_error(engine_->logger(), "session {}: cannot hash {}: {}", session_id_, staged_path_.string(), e.what());
    verdict.ok = false;
  }

  if(!verdict.ok) {
    connection_->send(encode_verdict(verdict));
    finish(SessionState::Failed, ErrorKind::Integrity, "whole-file digest mismatch");
    return;
  }

  std::filesystem::path installed;
  try {
    installed = install();
  } catch(const SyncError& e) {
    connection_->send(make_abort(ErrorKind::Persistence, "receiver cannot store file"));
    finish(SessionState::Failed, ErrorKind::Persistence, e.what());
    return;
  }
  connection_->send(encode_verdict(verdict));
  log_info(engine_->logger(), "session {}: received {} from {} into {}",
           session_id_, file_name_, peer_name_, installed.string());
  finish(SessionState::Completed, ErrorKind::None, progress_.message);
}

std::filesystem::path ReceiveSession::install() {
  auto& store = engine_->store();
  const auto& inbox = engine_->options().inbox_dir;
  const std::filesystem::path destination = inbox / file_name_;
  const std::string hash_hex = IntegrityHasher::to_hex(content_hash_);
  std::error_code ec;

  auto existing = store.file_by_path(destination.string());
  if(existing && existing->sync_status == SyncStatus::Pending && existing->content_hash != hash_hex) {
    const auto conflict = inbox / (file_name_ + ".conflict-" + peer_device_id_.substr(0, 8));
    std::filesystem::rename(staged_path_, conflict, ec);
    if(ec) throw SyncError(ErrorKind::Persistence, "cannot store " + conflict.string() + ": " + ec.message());
    store.set_sync_status(existing->file_id, SyncStatus::Conflict);
    progress_.message = "conflict: local edits kept, incoming copy saved as " + conflict.filename().string();
    log_warn(engine_->logger(), "{} has unsynced local changes; incoming copy saved as {}",
             destination.string(), conflict.string());
    return conflict;
  }

  std::filesystem::rename(staged_path_, destination, ec);
  if(ec) throw SyncError(ErrorKind::Persistence, "cannot install " + destination.string() + ": " + ec.message());

  FileRecord record;
  if(existing) {
    record.file_id = existing->file_id;
  } else if(store.file_by_id(file_id_)) {
    record.file_id = generate_uuid();
  } else {
    record.file_id = file_id_;
  }
  record.absolute_path = destination.string();
  record.content_hash = hash_hex;
  record.size_bytes = total_size_;
  record.modified_at_ms = wall_clock_millis();
  record.sync_status = SyncStatus::Synced;
  store.upsert_file(record);
  return destination;
}

void ReceiveSession::on_abort(const AbortFrame& abort) {
  const ErrorKind kind = kind_from_wire(abort.kind);
  const std::string message = "sender aborted: " + abort.message;
  finish(kind == ErrorKind::None ? SessionState::Paused : state_for_abort(kind), kind, message);
}

void ReceiveSession::arm_timer(std::chrono::milliseconds timeout, const char* what) {
  timer_.expires_after(timeout);
  timer_.async_wait([self = shared_from_this(), what](const std::error_code& ec) {
    if(ec || self->finished_) return;
    self->finish(SessionState::Paused, ErrorKind::TransientNetwork, std::string(what) + " wait timed out");
  });
}

void ReceiveSession::protocol_violation(const std::string& message) {
  ++engine_->protocol_violations_;
  reject(ErrorKind::Protocol, message);
}

void ReceiveSession::reject(ErrorKind kind, const std::string& message) {
  connection_->send(make_abort(kind, message));
  finish(state_for_abort(kind), kind, message);
}

void ReceiveSession::close_file() {
  if(fd_ < 0) return;
  if(::fdatasync(fd_) != 0) {
    log_warn(engine_->logger(), "sync of {} failed: {}", staged_path_.string(), std::strerror(errno));
  }
  ::close(fd_);
  fd_ = -1;
}

void ReceiveSession::release_slot() {
  if(!admitted_) return;
  admitted_ = false;
  engine_->release_inbound();
}

void ReceiveSession::finish(SessionState state, ErrorKind error, const std::string& message) {
  if(finished_) return;
  finished_ = true;
  phase_ = Phase::Done;
  timer_.cancel();
  close_file();
  connection_->close_after_flush();
  release_slot();

  if(session_id_.empty()) {
    if(error != ErrorKind::None && error != ErrorKind::TransientNetwork) {
      log_warn(engine_->logger(), "dropped incoming connection from {} ({}): {}",
               remote_, to_string(error), message);
    }
    return;
  }

  try {
    engine_->store().set_session_state(session_id_, state);
  } catch(const SyncError& e) {
    log_error(engine_->logger(), "session {}: cannot record outcome: {}", session_id_, e.what());
  }
  progress_.state = state;
  progress_.error = error;
  progress_.message = message;
  if(state == SessionState::Failed) {
    // Failed sessions are not resumable.
    std::error_code ec;
    std::filesystem::remove(staged_path_, ec);
    log_error(engine_->logger(), "session {} failed ({}): {}", session_id_, to_string(error), message);
  } else if(state == SessionState::Paused) {
    log_warn(engine_->logger(), "session {} paused at chunk {}: {}", session_id_, next_expected_, message);
  }
  publish();
  engine_->on_receive_finished(session_id_);
}

void ReceiveSession::publish() {
  if(!session_id_.empty()) engine_->publish(progress_);
}
