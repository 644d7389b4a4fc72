#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"
#include "sync_types.hpp"

enum class PeerEvent { Found, Updated, Lost };

const char* to_string(PeerEvent event);

// Single owner of the live peer map. Every mutation goes through one mutex;
// readers receive copies. Status is never stored, it is derived from
// last_seen_at_ms whenever a snapshot is taken.
class PeerTable {
public:
  // Returns true when the device was not in the table before.
  bool upsert(const PeerRecord& record, uint64_t timestamp_millis);
  // Last accepted beacon timestamp for the device, if present.
  std::optional<uint64_t> last_timestamp(const std::string& device_id) const;
  // Removes and returns every peer last seen more than `timeout_ms` ago.
  std::vector<PeerRecord> reap(int64_t now_ms, int64_t timeout_ms);
  std::vector<PeerRecord> snapshot(int64_t now_ms, int64_t stale_after_ms) const;
  std::optional<PeerRecord> find(const std::string& device_id, int64_t now_ms, int64_t stale_after_ms) const;
  std::size_t size() const;

private:
  struct Entry {
    PeerRecord record;
    uint64_t timestamp_millis = 0;
  };

  static PeerRecord derive(const Entry& entry, int64_t now_ms, int64_t stale_after_ms);

  mutable std::mutex mutex_;
  std::map<std::string, Entry> peers_;
};

// Authenticated UDP presence beacons. The broadcaster, the receive loop and
// the reaper all run on the io_context handed in; bind failures throw from
// start(), steady-state socket errors are logged and the loop carries on.
class DiscoveryService : public std::enable_shared_from_this<DiscoveryService> {
public:
  struct Options {
    std::string device_id;
    std::string display_name;
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 37845;
    std::string broadcast_address = "255.255.255.255";
    uint16_t broadcast_port = 37845;
    std::chrono::milliseconds broadcast_interval{5000};
    std::chrono::milliseconds presence_timeout{15000};
    std::chrono::milliseconds replay_window{30000};
    std::chrono::milliseconds reaper_interval{1000};
    // Wall clock in milliseconds since the epoch. Tests substitute a fake.
    std::function<int64_t()> clock;
  };

  struct Counters {
    uint64_t received = 0;
    uint64_t accepted = 0;
    uint64_t malformed = 0;
    uint64_t auth_failed = 0;
    uint64_t replayed = 0;
    uint64_t self_echo = 0;
    uint64_t send_errors = 0;
    uint64_t receive_errors = 0;
  };

  using PeerListener = std::function<void(PeerEvent, const PeerRecord&)>;
  using ListenerHandle = std::size_t;

  DiscoveryService(asio::io_context& io,
                   Options options,
                   std::vector<uint8_t> shared_secret,
                   Logger* logger = nullptr);
  ~DiscoveryService();

  void start();
  void stop();
  bool running() const { return running_; }

  // Takes effect for the next beacon sent and the next datagram verified.
  void set_shared_secret(std::vector<uint8_t> secret);

  std::vector<PeerRecord> current_peers() const;
  std::optional<PeerRecord> peer(const std::string& device_id) const;

  ListenerHandle add_peer_listener(PeerListener listener);
  void remove_peer_listener(ListenerHandle handle);

  std::vector<uint8_t> make_presence_datagram() const;
  // Verifies and applies one datagram. Returns true when it was accepted.
  bool handle_datagram(const uint8_t* data, std::size_t size, const std::string& source_address);
  void reap_now();

  Counters counters() const;
  uint16_t local_port() const { return local_port_; }
  const Options& options() const { return options_; }

private:
  int64_t now() const;
  int64_t stale_after_ms() const;
  std::vector<uint8_t> secret_copy() const;

  void schedule_broadcast(std::chrono::milliseconds delay);
  void send_beacon();
  void start_receive();
  void schedule_reaper();
  void notify(PeerEvent event, const PeerRecord& record);
  void close_socket();

  // Socket, timers and their handlers are serialized on this strand so the
  // service can share a multi-threaded io_context.
  asio::strand<asio::io_context::executor_type> strand_;
  Options options_;
  Logger* logger_ = nullptr;
  Uuid local_device_id_{};

  mutable std::mutex secret_mutex_;
  std::vector<uint8_t> shared_secret_;

  PeerTable table_;

  std::unique_ptr<asio::ip::udp::socket> socket_;
  asio::ip::udp::endpoint broadcast_endpoint_;
  asio::ip::udp::endpoint sender_endpoint_;
  std::array<uint8_t, kMaxDatagramBytes + 1> receive_buffer_{};
  std::unique_ptr<asio::steady_timer> broadcast_timer_;
  std::unique_ptr<asio::steady_timer> reaper_timer_;
  std::atomic<bool> running_{false};
  uint16_t local_port_ = 0;

  std::mutex listener_mutex_;
  std::unordered_map<ListenerHandle, PeerListener> listeners_;
  ListenerHandle next_listener_ = 1;

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> malformed_{0};
  std::atomic<uint64_t> auth_failed_{0};
  std::atomic<uint64_t> replayed_{0};
  std::atomic<uint64_t> self_echo_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> receive_errors_{0};
};
