#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "connection.hpp"
#include "integrity_hasher.hpp"
#include "protocol.hpp"
#include "sync_types.hpp"

class TransferEngine;

// Outbound half of a transfer. Connects, pins the receiver, sends metadata,
// then streams chunks inside a bounded window until every chunk is
// acknowledged and the receiver's whole-file verdict arrives.
class SendSession : public std::enable_shared_from_this<SendSession> {
public:
  SendSession(std::shared_ptr<TransferEngine> engine,
              TransferSession record,
              FileRecord file,
              uint32_t sender_offset);

  const std::string& id() const { return record_.session_id; }
  const std::string& file_id() const { return record_.file_id; }
  const std::string& peer_device_id() const { return record_.peer_device_id; }
  SessionProgress initial_progress() const;

  void start();
  void cancel();
  void abandon();

private:
  enum class Phase { Idle, Connecting, AwaitResume, Streaming, AwaitVerdict, Done };

  void begin();
  void on_connected(const std::error_code& ec);
  void on_frame(Frame&& frame);
  void on_resume_accepted(uint32_t offset);
  void on_ack_range(uint32_t last, bool cumulative);
  void on_retransmit(uint32_t index);
  void on_verdict(const VerdictFrame& verdict);
  void on_abort(const AbortFrame& abort);
  void pump();
  void send_chunk(uint32_t index, uint32_t attempt);
  std::vector<uint8_t> read_chunk(uint32_t index);
  void send_complete();
  void arm_timer(std::chrono::milliseconds timeout, const char* what);
  void protocol_violation(const std::string& message);
  void finish(SessionState state, ErrorKind error, const std::string& message);
  void publish();

  std::shared_ptr<TransferEngine> engine_;
  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer timer_;
  std::shared_ptr<Connection> connection_;
  TransferSession record_;
  FileRecord file_;
  Digest content_hash_{};
  uint32_t sender_offset_ = 0;
  std::ifstream source_;

  Phase phase_ = Phase::Idle;
  uint32_t next_to_send_ = 0;
  int64_t acked_ = kNoChunkAcknowledged;
  std::set<uint32_t> in_flight_;
  std::map<uint32_t, uint32_t> retries_;
  SessionProgress progress_;
  bool cancelled_ = false;
  bool finished_ = false;
};

// Inbound half. Accepts the TLS connection, pins the sender once it
// introduces itself, decides the resume offset, and commits verified chunks
// in index order: write, sync, checkpoint, acknowledge.
class ReceiveSession : public std::enable_shared_from_this<ReceiveSession> {
public:
  ReceiveSession(std::shared_ptr<TransferEngine> engine,
                 asio::ip::tcp::socket socket,
                 asio::ssl::context& context,
                 bool admitted);
  ~ReceiveSession();

  // Empty until the metadata frame has been accepted.
  const std::string& id() const { return session_id_; }

  void start();
  void cancel();
  void supersede();
  void abandon();

private:
  enum class Phase { Handshake, AwaitHello, AwaitMetadata, Streaming, Done };

  void on_handshake(const std::error_code& ec);
  void on_frame(Frame&& frame);
  void on_hello(const HelloFrame& hello);
  void on_metadata(const MetadataFrame& meta);
  void on_chunk(ChunkFrame&& chunk);
  void on_complete();
  void on_abort(const AbortFrame& abort);
  void commit(uint32_t index, const std::vector<uint8_t>& payload);
  // Moves the verified staged file into place. Returns the final path.
  std::filesystem::path install();
  uint64_t expected_length(uint32_t index) const;
  void arm_timer(std::chrono::milliseconds timeout, const char* what);
  void protocol_violation(const std::string& message);
  void reject(ErrorKind kind, const std::string& message);
  void finish(SessionState state, ErrorKind error, const std::string& message);
  void close_file();
  void release_slot();
  void publish();

  std::shared_ptr<TransferEngine> engine_;
  std::shared_ptr<Connection> connection_;
  asio::steady_timer timer_;
  std::string remote_;
  bool admitted_ = false;

  Phase phase_ = Phase::Handshake;
  std::string peer_device_id_;
  std::string peer_name_;
  bool identity_unverified_ = false;

  std::string session_id_;
  std::string file_id_;
  std::string file_name_;
  Digest content_hash_{};
  uint64_t total_size_ = 0;
  uint32_t chunk_size_ = 0;
  uint32_t total_chunks_ = 0;
  std::filesystem::path staged_path_;
  int fd_ = -1;

  uint32_t next_expected_ = 0;
  std::map<uint32_t, std::vector<uint8_t>> buffered_;
  std::map<uint32_t, uint32_t> failures_;
  SessionProgress progress_;
  bool finished_ = false;
};
