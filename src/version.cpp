#include "arf/version.hpp"

#include <sstream>

namespace arf {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"fingerprint\":" << m.fingerprint
    << ",\"audit_log\":" << m.audit_log
    << ",\"policy_schema\":" << m.policy_schema
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_policy_schema(uint32_t schema_version) {
  CompatibilityResult r;
  if (schema_version == 0 || schema_version > POLICY_SCHEMA_VERSION) {
    r.ok          = false;
    r.error_code  = "policy_schema_mismatch";
    r.description = "Policy schema version " + std::to_string(schema_version) +
                    " is not supported (engine supports 1.." +
                    std::to_string(POLICY_SCHEMA_VERSION) + ").";
  }
  return r;
}

}  // namespace version
}  // namespace arf
