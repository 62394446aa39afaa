#pragma once

// arf/observability.hpp — Structured logging and pipeline statistics.
//
// DESIGN:
//   Every component reports through log_event(), which renders one JSON object
//   per line. The sink is stderr by default, a file when ARF_LOG_FILE is set,
//   or a process hook when one is registered (tests use the hook to observe
//   side effects such as "validation_rejected" without touching stderr).
//
//   PipelineStats is the per-engine counter block. It is owned by
//   EngineContext, never a process singleton, so two engines in one process
//   report independently.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Current: JSONL lines (ARF_LOG_FILE / ARF_EVENT_LOG) or in-memory counters.
//   Upgrade: forward PipelineEvent as spans through an OTLP exporter.
//   Invariant: emission must NEVER block the decision path on a slow sink.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "arf/types.hpp"

namespace arf {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(std::string_view s);

using LogFields = std::map<std::string, std::string>;

// Render and write one structured log line if level >= the active threshold.
// Threshold defaults to ARF_LOG_LEVEL (debug/info/warn/error), else info.
void log_event(LogLevel level, std::string_view component, std::string_view event,
               std::string_view message, const LogFields& fields = {});

void set_log_level(LogLevel level);
LogLevel log_level();

// Hook registration. When set, lines go to the hook instead of the sink.
using LogHook = void (*)(LogLevel level, const std::string& line);
void set_log_hook(LogHook hook);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0: [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Returns microseconds, 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// PipelineStats — per-engine counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic and cache-line separated where they are
// bumped from different pipeline stages concurrently.
class PipelineStats {
 public:
  void record_bucket(AnomalyBucket bucket);
  void record_gateway(GatewayStatus status, bool duplicate);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> events_received{0};
  alignas(64) std::atomic<uint64_t> events_rejected{0};
  alignas(64) std::atomic<uint64_t> events_processed{0};
  std::atomic<uint64_t> events_cancelled{0};

  std::array<std::atomic<uint64_t>, 4> buckets{};

  alignas(64) std::atomic<uint64_t> intents_emitted{0};
  std::atomic<uint64_t> gateway_denied{0};
  std::atomic<uint64_t> gateway_advisory{0};
  std::atomic<uint64_t> gateway_pending{0};
  std::atomic<uint64_t> gateway_completed{0};
  std::atomic<uint64_t> gateway_failed{0};
  std::atomic<uint64_t> gateway_duplicates{0};

  // Degradations: none of these fail the pipeline.
  alignas(64) std::atomic<uint64_t> memory_unavailable{0};
  std::atomic<uint64_t> analysis_timeouts{0};
  std::atomic<uint64_t> policy_errors{0};
  std::atomic<uint64_t> classification_errors{0};

  LatencyHistogram latency_histogram;
};

// ---------------------------------------------------------------------------
// PipelineEvent — per-event summary for the JSONL event stream
// ---------------------------------------------------------------------------
struct PipelineEvent {
  std::string fingerprint;
  std::string component;
  std::string status;
  std::string bucket;
  double score{0.0};
  size_t intents{0};
  uint64_t duration_ns{0};
};

// Appends to ARF_EVENT_LOG when set; no-op otherwise.
void emit_pipeline_event(const PipelineEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace arf
