#include "pairing.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

#include "integrity_hasher.hpp"
#include "sync_types.hpp"
#include "utils.hpp"

namespace {

std::string normalize_fingerprint(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for(char c : raw) {
    if(c == ':') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

[[noreturn]] void reject(const std::string& why) {
  throw SyncError(ErrorKind::InvalidArgument, "invalid pairing payload: " + why);
}

} // namespace

std::string encode_pairing_payload(const PairingPayload& payload) {
  nlohmann::json j;
  j["v"] = payload.version;
  j["device_id"] = payload.device_id;
  j["display_name"] = payload.display_name;
  j["fingerprint"] = payload.fingerprint;
  j["shared_secret"] = payload.shared_secret;
  return j.dump();
}

PairingPayload decode_pairing_payload(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch(const nlohmann::json::parse_error& e) {
    reject(e.what());
  }
  if(!j.is_object()) reject("expected a JSON object");

  PairingPayload payload;
  try {
    payload.version = j.at("v").get<int>();
    payload.device_id = j.at("device_id").get<std::string>();
    payload.display_name = j.value("display_name", std::string());
    payload.fingerprint = normalize_fingerprint(j.at("fingerprint").get<std::string>());
    payload.shared_secret = j.at("shared_secret").get<std::string>();
  } catch(const nlohmann::json::exception& e) {
    reject(e.what());
  }

  if(payload.version != kPairingPayloadVersion) {
    reject("unsupported version " + std::to_string(payload.version));
  }
  auto id = uuid_from_string(payload.device_id);
  if(!id) reject("device_id '" + payload.device_id + "' is not a UUID");
  payload.device_id = uuid_to_string(*id);

  Digest fingerprint{};
  if(!IntegrityHasher::from_hex(payload.fingerprint, fingerprint)) {
    reject("fingerprint is not a SHA-256 digest");
  }
  if(payload.shared_secret.size() < kMinSharedSecretBytes) {
    reject("shared secret is shorter than " + std::to_string(kMinSharedSecretBytes) + " bytes");
  }
  return payload;
}

std::string generate_shared_secret() {
  return hex_from_bytes(random_bytes(32));
}
