#include "arf/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "arf/jsonlite.hpp"

namespace arf {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) using hardware BSR/CLZ.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

LogLevel initial_log_level() {
  const char* env = std::getenv("ARF_LOG_LEVEL");
  if (env && env[0]) {
    if (auto parsed = log_level_from_string(env)) return *parsed;
  }
  return LogLevel::info;
}

std::atomic<int> g_log_level{static_cast<int>(initial_log_level())};
std::atomic<LogHook> g_log_hook{nullptr};
std::mutex g_sink_mu;

void append_line(const char* path, const std::string& line) {
  // O_APPEND writes below PIPE_BUF are atomic on POSIX; the mutex keeps lines
  // whole for larger payloads within this process.
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (FILE* f = std::fopen(path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void append_fmt(std::string& out, const char* key, double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += key;
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::optional<LogLevel> log_level_from_string(std::string_view s) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return std::nullopt;
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_hook(LogHook hook) {
  g_log_hook.store(hook, std::memory_order_release);
}

void log_event(LogLevel level, std::string_view component, std::string_view event,
               std::string_view message, const LogFields& fields) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;

  jsonlite::Object o;
  for (const auto& [k, v] : fields) o[k] = jsonlite::Value{v};
  o["ts_ms"] = jsonlite::Value{static_cast<std::uint64_t>(system_now_ms())};
  o["level"] = jsonlite::Value{to_string(level)};
  o["component"] = jsonlite::Value{std::string(component)};
  o["event"] = jsonlite::Value{std::string(event)};
  o["message"] = jsonlite::Value{std::string(message)};
  std::string line = jsonlite::to_json(o);

  LogHook hook = g_log_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(level, line);
    return;
  }

  line += '\n';
  const char* path = std::getenv("ARF_LOG_FILE");
  if (path && path[0]) {
    append_line(path, line);
    return;
  }
  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::fwrite(line.data(), 1, line.size(), stderr);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  append_fmt(out, ",\"mean_us\":", mean_us(), "%.2f");
  append_fmt(out, ",\"p50_ms\":", percentile(0.50) / 1000.0, "%.3f");
  append_fmt(out, ",\"p95_ms\":", percentile(0.95) / 1000.0, "%.3f");
  append_fmt(out, ",\"p99_ms\":", percentile(0.99) / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// PipelineStats
// ---------------------------------------------------------------------------

void PipelineStats::record_bucket(AnomalyBucket bucket) {
  buckets[static_cast<size_t>(bucket)].fetch_add(1, std::memory_order_relaxed);
}

void PipelineStats::record_gateway(GatewayStatus status, bool duplicate) {
  if (duplicate) {
    gateway_duplicates.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  switch (status) {
    case GatewayStatus::denied:
    case GatewayStatus::rejected:
    case GatewayStatus::expired:
      gateway_denied.fetch_add(1, std::memory_order_relaxed);
      break;
    case GatewayStatus::advisory_only:
      gateway_advisory.fetch_add(1, std::memory_order_relaxed);
      break;
    case GatewayStatus::pending_approval:
      gateway_pending.fetch_add(1, std::memory_order_relaxed);
      break;
    case GatewayStatus::completed:
      gateway_completed.fetch_add(1, std::memory_order_relaxed);
      break;
    case GatewayStatus::failed:
      gateway_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      break;
  }
}

std::string PipelineStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(768);
  out += "{\"events\":{\"received\":" + n(events_received);
  out += ",\"rejected\":" + n(events_rejected);
  out += ",\"processed\":" + n(events_processed);
  out += ",\"cancelled\":" + n(events_cancelled) + "}";

  out += ",\"classification\":{";
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (i) out += ',';
    out += "\"" + to_string(static_cast<AnomalyBucket>(i)) + "\":" + n(buckets[i]);
  }
  out += "}";

  out += ",\"gateway\":{\"intents\":" + n(intents_emitted);
  out += ",\"denied\":" + n(gateway_denied);
  out += ",\"advisory_only\":" + n(gateway_advisory);
  out += ",\"pending_approval\":" + n(gateway_pending);
  out += ",\"completed\":" + n(gateway_completed);
  out += ",\"failed\":" + n(gateway_failed);
  out += ",\"duplicates\":" + n(gateway_duplicates) + "}";

  out += ",\"degradations\":{\"memory_unavailable\":" + n(memory_unavailable);
  out += ",\"analysis_timeouts\":" + n(analysis_timeouts);
  out += ",\"policy_errors\":" + n(policy_errors);
  out += ",\"classification_errors\":" + n(classification_errors) + "}";

  out += ",\"latency\":" + latency_histogram.to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Event stream
// ---------------------------------------------------------------------------

void emit_pipeline_event(const PipelineEvent& ev) {
  const char* log_path = std::getenv("ARF_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  jsonlite::Object o;
  o["fingerprint"] = jsonlite::Value{ev.fingerprint};
  o["component"] = jsonlite::Value{ev.component};
  o["status"] = jsonlite::Value{ev.status};
  o["bucket"] = jsonlite::Value{ev.bucket};
  o["score"] = jsonlite::Value{ev.score};
  o["intents"] = jsonlite::Value{static_cast<std::uint64_t>(ev.intents)};
  o["duration_ns"] = jsonlite::Value{ev.duration_ns};
  append_line(log_path, jsonlite::to_json(o) + "\n");
}

}  // namespace arf
