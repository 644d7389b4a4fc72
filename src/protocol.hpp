#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "integrity_hasher.hpp"
#include "utils.hpp"

// Discovery datagram and transfer stream frames. All integers are big-endian.

inline constexpr std::size_t kMaxDisplayNameBytes = 255;
inline constexpr std::size_t kMaxDatagramBytes = 1024;
inline constexpr std::size_t kMaxFileNameBytes = 1024;
inline constexpr uint32_t kMaxChunkSize = 8u * 1024u * 1024u;
inline constexpr std::size_t kFrameHeaderBytes = 5; // type u8 | body length u32

// ---- byte helpers ----------------------------------------------------------

class ByteWriter {
public:
  void u8(uint8_t v) { out_.push_back(v); }
  void u16(uint16_t v);
  void u32(uint32_t v);
  void u64(uint64_t v);
  void raw(const uint8_t* data, std::size_t size);
  void short_string(const std::string& s); // u16 length prefix

  std::vector<uint8_t>& bytes() { return out_; }
  std::vector<uint8_t> take() { return std::move(out_); }

private:
  std::vector<uint8_t> out_;
};

// All reads return false once the buffer is exhausted; the reader never
// throws so that hostile input can be dropped cheaply.
class ByteReader {
public:
  ByteReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  bool u8(uint8_t& v);
  bool u16(uint16_t& v);
  bool u32(uint32_t& v);
  bool u64(uint64_t& v);
  bool raw(uint8_t* out, std::size_t size);
  bool short_string(std::string& out, std::size_t max_bytes);

  std::size_t remaining() const { return size_ - pos_; }
  const uint8_t* cursor() const { return data_ + pos_; }
  bool skip(std::size_t n);

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

// ---- discovery -------------------------------------------------------------

struct PresenceMessage {
  Uuid device_id{};
  std::string display_name;
  uint64_t timestamp_millis = 0;
  Digest signature{};
};

// Bytes covered by the MAC: deviceId || displayName || timestampMillis.
std::vector<uint8_t> presence_signing_input(const Uuid& device_id,
                                            const std::string& display_name,
                                            uint64_t timestamp_millis);

std::vector<uint8_t> encode_presence(const PresenceMessage& message);
std::optional<PresenceMessage> decode_presence(const uint8_t* data, std::size_t size);

// ---- stream frames ---------------------------------------------------------

enum class FrameType : uint8_t {
  Hello = 1,
  Metadata = 2,
  ResumeAccept = 3,
  Chunk = 4,
  Ack = 5,
  CumulativeAck = 6,
  Retransmit = 7,
  Complete = 8,
  Verdict = 9,
  Abort = 10,
};

const char* to_string(FrameType type);

struct Frame {
  FrameType type = FrameType::Abort;
  std::vector<uint8_t> body;
};

struct HelloFrame {
  Uuid device_id{};
  std::string display_name;
};

struct MetadataFrame {
  Uuid file_id{};
  uint64_t total_size_bytes = 0;
  uint32_t chunk_size = 0;
  uint32_t resume_offset = 0;
  Digest content_hash{};
  std::string file_name;
};

struct ChunkFrame {
  uint32_t index = 0;
  Digest digest{};
  std::vector<uint8_t> payload;
};

struct VerdictFrame {
  bool ok = false;
  Digest digest{};
};

struct AbortFrame {
  uint8_t kind = 0;
  std::string message;
};

// Header followed by body. Every encode_* below returns a complete frame.
std::vector<uint8_t> encode_frame(FrameType type, const std::vector<uint8_t>& body);
// Parses the 5-byte header. Returns false for unknown types or oversize bodies.
bool decode_frame_header(const uint8_t* header, std::size_t max_body,
                         FrameType& type, uint32_t& body_length);

std::vector<uint8_t> encode_hello(const HelloFrame& hello);
std::vector<uint8_t> encode_metadata(const MetadataFrame& meta);
std::vector<uint8_t> encode_resume_accept(uint32_t resume_offset);
std::vector<uint8_t> encode_chunk(const ChunkFrame& chunk);
std::vector<uint8_t> encode_ack(uint32_t index);
std::vector<uint8_t> encode_cumulative_ack(uint32_t up_to_index);
std::vector<uint8_t> encode_retransmit(uint32_t index);
std::vector<uint8_t> encode_complete();
std::vector<uint8_t> encode_verdict(const VerdictFrame& verdict);
std::vector<uint8_t> encode_abort(const AbortFrame& abort);

std::optional<HelloFrame> decode_hello(const Frame& frame);
std::optional<MetadataFrame> decode_metadata(const Frame& frame);
std::optional<uint32_t> decode_index(const Frame& frame); // ResumeAccept, Ack, CumulativeAck, Retransmit
std::optional<ChunkFrame> decode_chunk(const Frame& frame);
std::optional<VerdictFrame> decode_verdict(const Frame& frame);
std::optional<AbortFrame> decode_abort(const Frame& frame);

inline uint32_t chunk_count(uint64_t total_size, uint32_t chunk_size) {
  if(chunk_size == 0) return 0;
  return static_cast<uint32_t>((total_size + chunk_size - 1) / chunk_size);
}
