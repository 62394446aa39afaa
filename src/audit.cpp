#include "arf/audit.hpp"

#include <cstdio>
#include <mutex>

#if defined(ARF_WITH_ZSTD)
#include <zstd.h>
#endif

#include "arf/hash.hpp"
#include "arf/jsonlite.hpp"
#include "arf/observability.hpp"
#include "arf/version.hpp"

namespace arf {

namespace {

const std::string kGenesisDigest(64, '0');

std::string record_digest(const std::string& line) {
  return hash_domain(kAuditDomain, line);
}

}  // namespace

// ---------------------------------------------------------------------------
// ExecutionRecord → JSON
// ---------------------------------------------------------------------------
std::string execution_record_to_json(const ExecutionRecord& r) {
  jsonlite::Object o;
  o["v"] = jsonlite::Value{static_cast<std::uint64_t>(version::AUDIT_LOG_VERSION)};
  o["seq"] = jsonlite::Value{r.sequence};
  o["prev"] = jsonlite::Value{r.previous_digest};
  o["intent_id"] = jsonlite::Value{r.intent_id};
  o["tool"] = jsonlite::Value{r.tool};
  o["component"] = jsonlite::Value{r.component};
  o["justification"] = jsonlite::Value{r.justification};
  o["mode"] = jsonlite::Value{to_string(r.mode)};
  o["validation_ok"] = jsonlite::Value{r.validation_ok};
  o["validation_reason"] = jsonlite::Value{r.validation_reason};
  o["status"] = jsonlite::Value{to_string(r.status)};
  o["received_ms"] = jsonlite::Value{r.received_ms};
  o["decided_ms"] = jsonlite::Value{r.decided_ms};
  if (!r.approval_id.empty()) o["approval_id"] = jsonlite::Value{r.approval_id};
  if (!r.result_message.empty()) o["result"] = jsonlite::Value{r.result_message};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// AuditTrail
// ---------------------------------------------------------------------------

struct AuditTrail::Impl {
  mutable std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t sink_failures{0};
  std::string last_digest{kGenesisDigest};
  std::vector<ExecutionRecord> records;
};

AuditTrail::AuditTrail(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
  if (!path_.empty()) {
    impl_->file = std::fopen(path_.c_str(), "a");
    if (!impl_->file) {
      log_event(LogLevel::error, "audit", "audit_sink_open_failed",
                "audit log file could not be opened; continuing memory-only",
                {{"path", path_}});
    }
  }
}

AuditTrail::~AuditTrail() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

uint64_t AuditTrail::append(ExecutionRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  // MONOTONICITY and CHAINING
  record.sequence = ++impl_->seq;
  record.previous_digest = impl_->last_digest;

  const std::string line = execution_record_to_json(record);
  impl_->last_digest = record_digest(line);
  impl_->records.push_back(record);

  if (impl_->file) {
    const std::string final_line = line + "\n";
    const bool written = std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) ==
                         final_line.size();
    std::fflush(impl_->file);
    if (!written) {
      ++impl_->sink_failures;
      log_event(LogLevel::error, "audit", "audit_sink_write_failed",
                "audit entry kept in memory but not persisted",
                {{"seq", std::to_string(record.sequence)}, {"path", path_}});
    }
  }
  return record.sequence;
}

std::vector<ExecutionRecord> AuditTrail::records() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->records;
}

std::optional<ExecutionRecord> AuditTrail::find(uint64_t sequence) const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  // Sequences start at 1 and are dense.
  if (sequence == 0 || sequence > impl_->records.size()) return std::nullopt;
  return impl_->records[sequence - 1];
}

std::string AuditTrail::export_ndjson() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  std::string out;
  for (const auto& r : impl_->records) {
    out += execution_record_to_json(r);
    out += '\n';
  }
  return out;
}

std::optional<std::string> AuditTrail::export_compressed() const {
#if defined(ARF_WITH_ZSTD)
  const std::string data = export_ndjson();
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) {
    log_event(LogLevel::error, "audit", "audit_compress_failed", ZSTD_getErrorName(n));
    return std::nullopt;
  }
  out.resize(n);
  return out;
#else
  return std::nullopt;
#endif
}

std::optional<std::string> decompress_export(const std::string& data) {
#if defined(ARF_WITH_ZSTD)
  const unsigned long long size = ZSTD_getFrameContentSize(data.data(), data.size());
  if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN) return std::nullopt;
  std::string out;
  out.resize(static_cast<size_t>(size));
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
#else
  (void)data;
  return std::nullopt;
#endif
}

bool AuditTrail::verify_chain() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  for (const auto& r : impl_->records) {
    if (r.sequence != expected_seq++) return false;
    if (r.previous_digest != expected_prev) return false;
    expected_prev = record_digest(execution_record_to_json(r));
  }
  return expected_prev == impl_->last_digest;
}

uint64_t AuditTrail::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seq;
}

uint64_t AuditTrail::sink_failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->sink_failures;
}

}  // namespace arf
