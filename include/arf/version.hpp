#pragma once

// arf/version.hpp — Explicit version manifest for every persisted surface.
//
// PURPOSE:
//   Prevent silent format drift in fingerprints, audit entries and policy
//   files. Every component that reads or writes a versioned format checks its
//   constant here before processing data.
//
// INVARIANT:
//   All version constants are compile-time. Policy files carry a
//   schema_version that is checked by check_policy_schema() on load.

#include <cstdint>
#include <string>

namespace arf {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.4.0";

// ---------------------------------------------------------------------------
// FINGERPRINT_VERSION
// Tracks the canonical Event encoding and the hash domains derived from it.
// Changing the metric set, number formatting or domain prefixes requires a
// bump: fingerprints stored in IncidentMemory would otherwise silently miss.
// Version 2 = metrics encoded at round-trip precision (%.17g).
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_VERSION = 2;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = current: NDJSON ExecutionRecord with BLAKE3 hash chain.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// POLICY_SCHEMA_VERSION
// Version 1 = current: {schema_version, policies:[{name, priority, conditions,
// actions, cooldown_seconds, max_executions_per_hour, ...}]}.
// ---------------------------------------------------------------------------
constexpr uint32_t POLICY_SCHEMA_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  uint32_t fingerprint{FINGERPRINT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t policy_schema{POLICY_SCHEMA_VERSION};
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

// Never silently accept a policy document from a newer schema than this
// build understands.
CompatibilityResult check_policy_schema(uint32_t schema_version);

}  // namespace version
}  // namespace arf
