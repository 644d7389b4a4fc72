#include "protocol.hpp"

#include <algorithm>

void ByteWriter::u16(uint16_t v) {
  out_.push_back(static_cast<uint8_t>(v >> 8));
  out_.push_back(static_cast<uint8_t>(v));
}

void ByteWriter::u32(uint32_t v) {
  for(int shift = 24; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<uint8_t>(v >> shift));
  }
}

void ByteWriter::u64(uint64_t v) {
  for(int shift = 56; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<uint8_t>(v >> shift));
  }
}

void ByteWriter::raw(const uint8_t* data, std::size_t size) {
  out_.insert(out_.end(), data, data + size);
}

void ByteWriter::short_string(const std::string& s) {
  u16(static_cast<uint16_t>(s.size()));
  raw(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

bool ByteReader::u8(uint8_t& v) {
  if(remaining() < 1) return false;
  v = data_[pos_++];
  return true;
}

bool ByteReader::u16(uint16_t& v) {
  if(remaining() < 2) return false;
  v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
  pos_ += 2;
  return true;
}

bool ByteReader::u32(uint32_t& v) {
  if(remaining() < 4) return false;
  v = 0;
  for(int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_ + i];
  pos_ += 4;
  return true;
}

bool ByteReader::u64(uint64_t& v) {
  if(remaining() < 8) return false;
  v = 0;
  for(int i = 0; i < 8; ++i) v = (v << 8) | data_[pos_ + i];
  pos_ += 8;
  return true;
}

bool ByteReader::raw(uint8_t* out, std::size_t size) {
  if(remaining() < size) return false;
  std::copy(data_ + pos_, data_ + pos_ + size, out);
  pos_ += size;
  return true;
}

bool ByteReader::short_string(std::string& out, std::size_t max_bytes) {
  uint16_t len = 0;
  if(!u16(len)) return false;
  if(len > max_bytes || remaining() < len) return false;
  out.assign(reinterpret_cast<const char*>(data_ + pos_), len);
  pos_ += len;
  return true;
}

bool ByteReader::skip(std::size_t n) {
  if(remaining() < n) return false;
  pos_ += n;
  return true;
}

// ---- discovery -------------------------------------------------------------

std::vector<uint8_t> presence_signing_input(const Uuid& device_id,
                                            const std::string& display_name,
                                            uint64_t timestamp_millis) {
  ByteWriter w;
  w.raw(device_id.data(), device_id.size());
  w.raw(reinterpret_cast<const uint8_t*>(display_name.data()), display_name.size());
  w.u64(timestamp_millis);
  return w.take();
}

std::vector<uint8_t> encode_presence(const PresenceMessage& message) {
  ByteWriter w;
  w.raw(message.device_id.data(), message.device_id.size());
  std::string name = message.display_name.substr(0, kMaxDisplayNameBytes);
  w.short_string(name);
  w.u64(message.timestamp_millis);
  w.raw(message.signature.data(), message.signature.size());
  return w.take();
}

std::optional<PresenceMessage> decode_presence(const uint8_t* data, std::size_t size) {
  if(size > kMaxDatagramBytes) return std::nullopt;
  ByteReader r(data, size);
  PresenceMessage msg;
  if(!r.raw(msg.device_id.data(), msg.device_id.size())) return std::nullopt;
  if(!r.short_string(msg.display_name, kMaxDisplayNameBytes)) return std::nullopt;
  if(!r.u64(msg.timestamp_millis)) return std::nullopt;
  if(!r.raw(msg.signature.data(), msg.signature.size())) return std::nullopt;
  if(r.remaining() != 0) return std::nullopt;
  return msg;
}

// ---- stream frames ---------------------------------------------------------

const char* to_string(FrameType type) {
  switch(type) {
    case FrameType::Hello: return "hello";
    case FrameType::Metadata: return "metadata";
    case FrameType::ResumeAccept: return "resume-accept";
    case FrameType::Chunk: return "chunk";
    case FrameType::Ack: return "ack";
    case FrameType::CumulativeAck: return "cumulative-ack";
    case FrameType::Retransmit: return "retransmit";
    case FrameType::Complete: return "complete";
    case FrameType::Verdict: return "verdict";
    case FrameType::Abort: return "abort";
  }
  return "unknown";
}

std::vector<uint8_t> encode_frame(FrameType type, const std::vector<uint8_t>& body) {
  ByteWriter w;
  w.u8(static_cast<uint8_t>(type));
  w.u32(static_cast<uint32_t>(body.size()));
  w.raw(body.data(), body.size());
  return w.take();
}

bool decode_frame_header(const uint8_t* header, std::size_t max_body,
                         FrameType& type, uint32_t& body_length) {
  ByteReader r(header, kFrameHeaderBytes);
  uint8_t raw_type = 0;
  if(!r.u8(raw_type) || !r.u32(body_length)) return false;
  if(raw_type < static_cast<uint8_t>(FrameType::Hello) ||
     raw_type > static_cast<uint8_t>(FrameType::Abort)) {
    return false;
  }
  if(body_length > max_body) return false;
  type = static_cast<FrameType>(raw_type);
  return true;
}

std::vector<uint8_t> encode_hello(const HelloFrame& hello) {
  ByteWriter w;
  w.raw(hello.device_id.data(), hello.device_id.size());
  w.short_string(hello.display_name.substr(0, kMaxDisplayNameBytes));
  return encode_frame(FrameType::Hello, w.bytes());
}

std::vector<uint8_t> encode_metadata(const MetadataFrame& meta) {
  ByteWriter w;
  w.raw(meta.file_id.data(), meta.file_id.size());
  w.u64(meta.total_size_bytes);
  w.u32(meta.chunk_size);
  w.u32(meta.resume_offset);
  w.raw(meta.content_hash.data(), meta.content_hash.size());
  w.short_string(meta.file_name.substr(0, kMaxFileNameBytes));
  return encode_frame(FrameType::Metadata, w.bytes());
}

namespace {

std::vector<uint8_t> encode_index_frame(FrameType type, uint32_t index) {
  ByteWriter w;
  w.u32(index);
  return encode_frame(type, w.bytes());
}

} // namespace

std::vector<uint8_t> encode_resume_accept(uint32_t resume_offset) {
  return encode_index_frame(FrameType::ResumeAccept, resume_offset);
}

std::vector<uint8_t> encode_chunk(const ChunkFrame& chunk) {
  ByteWriter w;
  w.bytes().reserve(4 + 4 + kDigestSize + chunk.payload.size());
  w.u32(chunk.index);
  w.u32(static_cast<uint32_t>(chunk.payload.size()));
  w.raw(chunk.digest.data(), chunk.digest.size());
  w.raw(chunk.payload.data(), chunk.payload.size());
  return encode_frame(FrameType::Chunk, w.bytes());
}

std::vector<uint8_t> encode_ack(uint32_t index) {
  return encode_index_frame(FrameType::Ack, index);
}

std::vector<uint8_t> encode_cumulative_ack(uint32_t up_to_index) {
  return encode_index_frame(FrameType::CumulativeAck, up_to_index);
}

std::vector<uint8_t> encode_retransmit(uint32_t index) {
  return encode_index_frame(FrameType::Retransmit, index);
}

std::vector<uint8_t> encode_complete() {
  return encode_frame(FrameType::Complete, {});
}

std::vector<uint8_t> encode_verdict(const VerdictFrame& verdict) {
  ByteWriter w;
  w.u8(verdict.ok ? 1 : 0);
  w.raw(verdict.digest.data(), verdict.digest.size());
  return encode_frame(FrameType::Verdict, w.bytes());
}

std::vector<uint8_t> encode_abort(const AbortFrame& abort) {
  ByteWriter w;
  w.u8(abort.kind);
  w.short_string(abort.message.substr(0, 512));
  return encode_frame(FrameType::Abort, w.bytes());
}

std::optional<HelloFrame> decode_hello(const Frame& frame) {
  if(frame.type != FrameType::Hello) return std::nullopt;
  ByteReader r(frame.body.data(), frame.body.size());
  HelloFrame hello;
  if(!r.raw(hello.device_id.data(), hello.device_id.size())) return std::nullopt;
  if(!r.short_string(hello.display_name, kMaxDisplayNameBytes)) return std::nullopt;
  if(r.remaining() != 0) return std::nullopt;
  return hello;
}

std::optional<MetadataFrame> decode_metadata(const Frame& frame) {
  if(frame.type != FrameType::Metadata) return std::nullopt;
  ByteReader r(frame.body.data(), frame.body.size());
  MetadataFrame meta;
  if(!r.raw(meta.file_id.data(), meta.file_id.size())) return std::nullopt;
  if(!r.u64(meta.total_size_bytes)) return std::nullopt;
  if(!r.u32(meta.chunk_size)) return std::nullopt;
  if(!r.u32(meta.resume_offset)) return std::nullopt;
  if(!r.raw(meta.content_hash.data(), meta.content_hash.size())) return std::nullopt;
  if(!r.short_string(meta.file_name, kMaxFileNameBytes)) return std::nullopt;
  if(r.remaining() != 0) return std::nullopt;
  if(meta.chunk_size == 0 || meta.chunk_size > kMaxChunkSize) return std::nullopt;
  if(chunk_count(meta.total_size_bytes, meta.chunk_size) < meta.resume_offset) return std::nullopt;
  return meta;
}

std::optional<uint32_t> decode_index(const Frame& frame) {
  switch(frame.type) {
    case FrameType::ResumeAccept:
    case FrameType::Ack:
    case FrameType::CumulativeAck:
    case FrameType::Retransmit:
      break;
    default:
      return std::nullopt;
  }
  ByteReader r(frame.body.data(), frame.body.size());
  uint32_t index = 0;
  if(!r.u32(index) || r.remaining() != 0) return std::nullopt;
  return index;
}

std::optional<ChunkFrame> decode_chunk(const Frame& frame) {
  if(frame.type != FrameType::Chunk) return std::nullopt;
  ByteReader r(frame.body.data(), frame.body.size());
  ChunkFrame chunk;
  uint32_t length = 0;
  if(!r.u32(chunk.index) || !r.u32(length)) return std::nullopt;
  if(!r.raw(chunk.digest.data(), chunk.digest.size())) return std::nullopt;
  if(r.remaining() != length) return std::nullopt;
  chunk.payload.assign(r.cursor(), r.cursor() + length);
  return chunk;
}

std::optional<VerdictFrame> decode_verdict(const Frame& frame) {
  if(frame.type != FrameType::Verdict) return std::nullopt;
  ByteReader r(frame.body.data(), frame.body.size());
  VerdictFrame verdict;
  uint8_t ok = 0;
  if(!r.u8(ok) || !r.raw(verdict.digest.data(), verdict.digest.size())) return std::nullopt;
  if(r.remaining() != 0) return std::nullopt;
  verdict.ok = ok != 0;
  return verdict;
}

std::optional<AbortFrame> decode_abort(const Frame& frame) {
  if(frame.type != FrameType::Abort) return std::nullopt;
  ByteReader r(frame.body.data(), frame.body.size());
  AbortFrame abort;
  if(!r.u8(abort.kind) || !r.short_string(abort.message, 512)) return std::nullopt;
  return abort;
}
