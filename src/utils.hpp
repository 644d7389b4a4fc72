#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Uuid = std::array<uint8_t, 16>;

std::string hex_from_bytes(const uint8_t* data, std::size_t size);
std::string hex_from_bytes(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> bytes_from_hex(const std::string& hex);

// Throws SyncError(InvalidArgument) when OpenSSL cannot supply entropy.
std::vector<uint8_t> random_bytes(std::size_t count);

std::string generate_uuid();
std::optional<Uuid> uuid_from_string(const std::string& text);
std::string uuid_to_string(const Uuid& id);
