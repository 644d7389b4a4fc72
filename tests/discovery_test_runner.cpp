#include "discovery_service.hpp"
#include "integrity_hasher.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <atomic>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace lansync::test;

namespace {

std::vector<uint8_t> secret_bytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

struct FakeClock {
  std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(1700000000000);
  std::function<int64_t()> fn() const {
    auto n = now;
    return [n] { return n->load(); };
  }
  void advance(int64_t ms) { *now += ms; }
};

std::shared_ptr<DiscoveryService> make_service(asio::io_context& io,
                                               const std::string& name,
                                               const std::string& secret,
                                               const FakeClock& clock,
                                               Logger* logger = nullptr) {
  DiscoveryService::Options opts;
  opts.device_id = generate_uuid();
  opts.display_name = name;
  opts.clock = clock.fn();
  return std::make_shared<DiscoveryService>(io, opts, secret_bytes(secret), logger);
}

bool test_accepts_valid_beacon(TestContext& ctx) {
  asio::io_context io;
  FakeClock clock;
  Logger logger("discovery");
  ctx.logs.attach(&logger);
  auto local = make_service(io, "local", "s3cret", clock, &logger);
  auto remote = make_service(io, "remote", "s3cret", clock);

  std::vector<PeerEvent> events;
  local->add_peer_listener([&](PeerEvent e, const PeerRecord&) { events.push_back(e); });

  auto first = remote->make_presence_datagram();
  if(!local->handle_datagram(first.data(), first.size(), "10.0.0.7")) return false;
  clock.advance(10);
  auto second = remote->make_presence_datagram();
  if(!local->handle_datagram(second.data(), second.size(), "10.0.0.8")) return false;

  auto peers = local->current_peers();
  if(peers.size() != 1) return false;
  const auto& p = peers.front();
  return p.device_id == remote->options().device_id && p.display_name == "remote" &&
         p.network_address == "10.0.0.8" && p.status == PeerStatus::Online &&
         events.size() == 2 && events[0] == PeerEvent::Found && events[1] == PeerEvent::Updated &&
         local->counters().accepted == 2 && ctx.logs.contains("peer found: remote");
}

bool test_rejects_bad_mac(TestContext&) {
  asio::io_context io;
  FakeClock clock;
  auto local = make_service(io, "local", "s3cret", clock);
  auto intruder = make_service(io, "intruder", "other", clock);
  auto datagram = intruder->make_presence_datagram();
  bool rejected = !local->handle_datagram(datagram.data(), datagram.size(), "10.0.0.9");

  // A flipped bit in the name invalidates the MAC even with the right key.
  auto friendly = make_service(io, "friend", "s3cret", clock);
  auto tampered = friendly->make_presence_datagram();
  tampered[16 + 2] ^= 0x01;
  bool tamper_rejected = !local->handle_datagram(tampered.data(), tampered.size(), "10.0.0.9");
  return rejected && tamper_rejected && local->counters().auth_failed == 2 && local->current_peers().empty();
}

bool test_rejects_replay_and_stale_timestamp(TestContext&) {
  asio::io_context io;
  FakeClock local_clock;
  FakeClock remote_clock;
  auto local = make_service(io, "local", "k", local_clock);
  auto remote = make_service(io, "remote", "k", remote_clock);

  auto datagram = remote->make_presence_datagram();
  if(!local->handle_datagram(datagram.data(), datagram.size(), "10.0.0.2")) return false;
  // Exact replay, same timestamp.
  if(local->handle_datagram(datagram.data(), datagram.size(), "10.0.0.2")) return false;

  // Remote clock far in the past: outside the 30 s window.
  remote_clock.advance(-60000);
  auto old = remote->make_presence_datagram();
  if(local->handle_datagram(old.data(), old.size(), "10.0.0.2")) return false;

  // Remote clock far ahead is rejected too.
  remote_clock.advance(120000);
  auto future = remote->make_presence_datagram();
  if(local->handle_datagram(future.data(), future.size(), "10.0.0.2")) return false;

  return local->counters().replayed == 3 && local->counters().accepted == 1;
}

std::vector<uint8_t> signed_presence(const std::string& secret, const Uuid& device_id, uint64_t timestamp) {
  PresenceMessage msg;
  msg.device_id = device_id;
  msg.display_name = "skewed";
  msg.timestamp_millis = timestamp;
  auto input = presence_signing_input(msg.device_id, msg.display_name, msg.timestamp_millis);
  msg.signature = hmac_sha256(secret_bytes(secret), input.data(), input.size());
  return encode_presence(msg);
}

bool test_rejects_extreme_timestamps(TestContext&) {
  asio::io_context io;
  FakeClock clock;
  auto local = make_service(io, "local", "k", clock);
  const Uuid sender = *uuid_from_string(generate_uuid());

  // Validly signed, but the timestamps sit at the edges of the 64-bit range.
  for(uint64_t ts : {std::numeric_limits<uint64_t>::max(), uint64_t{1} << 63, uint64_t{0}}) {
    auto datagram = signed_presence("k", sender, ts);
    if(local->handle_datagram(datagram.data(), datagram.size(), "10.0.0.6")) return false;
  }
  if(local->counters().replayed != 3 || !local->current_peers().empty()) return false;

  auto current = signed_presence("k", sender, static_cast<uint64_t>(*clock.now));
  return local->handle_datagram(current.data(), current.size(), "10.0.0.6") &&
         local->counters().accepted == 1 && local->current_peers().size() == 1;
}

bool test_ignores_self_and_malformed(TestContext&) {
  asio::io_context io;
  FakeClock clock;
  auto local = make_service(io, "local", "k", clock);
  auto echo = local->make_presence_datagram();
  bool self_dropped = !local->handle_datagram(echo.data(), echo.size(), "127.0.0.1");

  std::vector<uint8_t> junk = pattern_bytes(40);
  bool junk_dropped = !local->handle_datagram(junk.data(), junk.size(), "10.0.0.3");
  std::vector<uint8_t> huge(kMaxDatagramBytes + 1, 0);
  bool huge_dropped = !local->handle_datagram(huge.data(), huge.size(), "10.0.0.3");

  auto c = local->counters();
  return self_dropped && junk_dropped && huge_dropped &&
         c.self_echo == 1 && c.malformed == 2 && c.received == 3 && local->current_peers().empty();
}

bool test_stale_then_reaped(TestContext&) {
  asio::io_context io;
  FakeClock clock;
  auto local = make_service(io, "local", "k", clock);
  auto remote = make_service(io, "remote", "k", clock);
  std::vector<PeerEvent> events;
  local->add_peer_listener([&](PeerEvent e, const PeerRecord&) { events.push_back(e); });

  auto datagram = remote->make_presence_datagram();
  if(!local->handle_datagram(datagram.data(), datagram.size(), "10.0.0.4")) return false;

  // Default interval 5 s: stale after two missed beacons, gone after 15 s.
  clock.advance(11000);
  auto stale = local->peer(remote->options().device_id);
  if(!stale || stale->status != PeerStatus::Stale) return false;
  local->reap_now();
  if(local->current_peers().size() != 1) return false;

  clock.advance(5000);
  local->reap_now();
  return local->current_peers().empty() && events.size() == 2 && events.back() == PeerEvent::Lost;
}

bool test_secret_rotation(TestContext&) {
  asio::io_context io;
  FakeClock clock;
  auto local = make_service(io, "local", "old", clock);
  auto remote = make_service(io, "remote", "new", clock);
  auto before = remote->make_presence_datagram();
  if(local->handle_datagram(before.data(), before.size(), "10.0.0.5")) return false;
  local->set_shared_secret(secret_bytes("new"));
  clock.advance(1);
  auto after = remote->make_presence_datagram();
  bool accepted = local->handle_datagram(after.data(), after.size(), "10.0.0.5");

  bool empty_rejected = false;
  try {
    local->set_shared_secret({});
  } catch(const SyncError& e) {
    empty_rejected = e.kind() == ErrorKind::InvalidArgument;
  }
  return accepted && empty_rejected;
}

bool test_rejects_bad_device_id(TestContext&) {
  asio::io_context io;
  DiscoveryService::Options opts;
  opts.device_id = "laptop";
  try {
    DiscoveryService service(io, opts, secret_bytes("k"));
  } catch(const SyncError& e) {
    return e.kind() == ErrorKind::InvalidArgument;
  }
  return false;
}

bool test_loopback_pair(TestContext& ctx) {
  asio::io_context io;
  auto work = asio::make_work_guard(io);
  std::thread runner([&] { io.run(); });

  Logger log_a("disc-a");
  Logger log_b("disc-b");
  ctx.logs.attach(&log_a);
  ctx.logs.attach(&log_b);

  auto make = [&](const std::string& name, uint16_t listen, uint16_t target, Logger* logger) {
    DiscoveryService::Options opts;
    opts.device_id = generate_uuid();
    opts.display_name = name;
    opts.listen_address = "127.0.0.1";
    opts.listen_port = listen;
    opts.broadcast_address = "127.0.0.1";
    opts.broadcast_port = target;
    opts.broadcast_interval = std::chrono::milliseconds(100);
    opts.reaper_interval = std::chrono::milliseconds(100);
    return std::make_shared<DiscoveryService>(io, opts, secret_bytes("loopback"), logger);
  };
  auto a = make("alpha", 47811, 47812, &log_a);
  auto b = make("beta", 47812, 47811, &log_b);

  bool ok = false;
  try {
    a->start();
    b->start();
    ok = wait_for_condition([&] {
      return a->peer(b->options().device_id).has_value() && b->peer(a->options().device_id).has_value();
    }, std::chrono::seconds(5));
    if(ok) {
      auto seen = a->peer(b->options().device_id);
      ok = seen->display_name == "beta" && seen->network_address == "127.0.0.1";
    }
  } catch(const SyncError& e) {
    std::cerr << "loopback discovery: " << e.what() << "\n";
  }

  a->stop();
  b->stop();
  work.reset();
  runner.join();
  return ok && !a->running();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"accepts_valid_beacon", test_accepts_valid_beacon},
    {"rejects_bad_mac", test_rejects_bad_mac},
    {"rejects_replay_and_stale_timestamp", test_rejects_replay_and_stale_timestamp},
    {"rejects_extreme_timestamps", test_rejects_extreme_timestamps},
    {"ignores_self_and_malformed", test_ignores_self_and_malformed},
    {"stale_then_reaped", test_stale_then_reaped},
    {"secret_rotation", test_secret_rotation},
    {"rejects_bad_device_id", test_rejects_bad_device_id},
    {"loopback_pair", test_loopback_pair},
  };
  return run_tests("discovery", argc, argv, tests);
}
