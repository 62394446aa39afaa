#pragma once

#include <string>
#include <string_view>

namespace arf {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Binary digest (32 bytes)
std::string hash_bytes_blake3(std::string_view payload);

// Domain-separated hashing. Every identifier family in the engine hashes under
// its own domain so an event fingerprint can never equal an intent id.
std::string hash_domain(std::string_view domain, std::string_view payload);

inline constexpr std::string_view kEventDomain   = "arf:event:v2:";
inline constexpr std::string_view kIntentDomain  = "arf:intent:v2:";
inline constexpr std::string_view kOutcomeDomain = "arf:outcome:v2:";
inline constexpr std::string_view kAuditDomain   = "arf:audit:v2:";
inline constexpr std::string_view kEmbedDomain   = "arf:embed:v2:";

// prefix + first 16 hex chars of digest, e.g. "inc_3fa0c2..."
std::string short_id(std::string_view prefix, std::string_view hex_digest);

}  // namespace arf
