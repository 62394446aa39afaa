#pragma once

// arf/audit.hpp — Immutable, append-only audit trail of Safety Gateway decisions.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number,
//      assigned under the trail mutex at append time.
//   3. CHAINED: each entry records the BLAKE3 digest of the previous entry's
//      canonical line, forming a tamper-evident chain (verify_chain()).
//   4. FAIL-SAFE: file sink write failures are non-fatal to the decision; the
//      in-memory trail is authoritative. Sink failures increment a counter.
//
// EXTENSION_POINT: compliance_export
//   Current: NDJSON export (optionally zstd-compressed) and a local file sink.
//   Upgrade path: forward entries to an immutable log service.
//   Invariant: AUDIT_LOG_VERSION must be bumped before any structural change
//   to ExecutionRecord fields.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arf/types.hpp"

namespace arf {

// ---------------------------------------------------------------------------
// ExecutionRecord — one Safety Gateway decision
// ---------------------------------------------------------------------------
struct ExecutionRecord {
  uint64_t    sequence{0};         // assigned by AuditTrail::append
  std::string intent_id;
  std::string tool;
  std::string component;
  std::string justification;
  ExecutionMode mode{ExecutionMode::advisory};
  bool        validation_ok{false};
  std::string validation_reason;   // empty when validation passed
  GatewayStatus status{GatewayStatus::received};
  uint64_t    received_ms{0};
  uint64_t    decided_ms{0};
  std::string approval_id;
  std::string result_message;
  std::string previous_digest;     // assigned by AuditTrail::append
};

// Compact single-line JSON (NDJSON entry).
std::string execution_record_to_json(const ExecutionRecord& r);

// ---------------------------------------------------------------------------
// AuditTrail
// ---------------------------------------------------------------------------
// Thread-safe: uses an internal mutex for appends and snapshots.
class AuditTrail {
 public:
  // path: optional NDJSON file sink, opened in append mode. Empty = memory only.
  explicit AuditTrail(const std::string& path = "");
  ~AuditTrail();

  AuditTrail(const AuditTrail&) = delete;
  AuditTrail& operator=(const AuditTrail&) = delete;

  // Assigns sequence and previous_digest in-place and returns the sequence.
  uint64_t append(ExecutionRecord& record);

  std::vector<ExecutionRecord> records() const;
  std::optional<ExecutionRecord> find(uint64_t sequence) const;

  // Timestamp-ordered read-only export, one JSON object per line.
  std::string export_ndjson() const;

  // zstd-compressed export. nullopt when built without ARF_WITH_ZSTD or when
  // compression fails.
  std::optional<std::string> export_compressed() const;

  // Recompute every digest and check each entry links to its predecessor.
  bool verify_chain() const;

  uint64_t entry_count() const;
  uint64_t sink_failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// Inverse of export_compressed(); nullopt without zstd or on corrupt input.
std::optional<std::string> decompress_export(const std::string& data);

}  // namespace arf
