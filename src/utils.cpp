#include "utils.hpp"
#include "sync_types.hpp"

#include <openssl/rand.h>

#include <cctype>

namespace {

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string hex_from_bytes(const uint8_t* data, std::size_t size){
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for(std::size_t i = 0; i < size; ++i){
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string hex_from_bytes(const std::vector<uint8_t>& bytes){
    return hex_from_bytes(bytes.data(), bytes.size());
}

std::optional<std::vector<uint8_t>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::vector<uint8_t> random_bytes(std::size_t count){
    std::vector<uint8_t> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw SyncError(ErrorKind::InvalidArgument, "RAND_bytes failed");
    }
    return out;
}

std::string generate_uuid(){
    auto bytes = random_bytes(16);
    Uuid id{};
    for(std::size_t i = 0; i < id.size(); ++i) id[i] = bytes[i];
    // RFC 4122 version 4, variant 1
    id[6] = static_cast<uint8_t>((id[6] & 0x0f) | 0x40);
    id[8] = static_cast<uint8_t>((id[8] & 0x3f) | 0x80);
    return uuid_to_string(id);
}

std::string uuid_to_string(const Uuid& id){
    auto hex = hex_from_bytes(id.data(), id.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<Uuid> uuid_from_string(const std::string& text){
    if(text.size() != 36) return std::nullopt;
    std::string compact;
    compact.reserve(32);
    for(std::size_t i = 0; i < text.size(); ++i){
        if(i == 8 || i == 13 || i == 18 || i == 23){
            if(text[i] != '-') return std::nullopt;
            continue;
        }
        compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    auto bytes = bytes_from_hex(compact);
    if(!bytes || bytes->size() != 16) return std::nullopt;
    Uuid id{};
    for(std::size_t i = 0; i < id.size(); ++i) id[i] = (*bytes)[i];
    return id;
}
