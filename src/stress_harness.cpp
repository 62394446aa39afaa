// stress_harness.cpp — Concurrent decision-pipeline stress harness.
//
// Drives the engine through Pipeline::process (advisory deployment,
// execution capability withheld):
//   - 200 distinct components with mixed healthy / degraded / failing metrics
//   - 10,000 sequential events
//   - 1,000 concurrent events (burst across 32 worker threads)
//   - a rate-limit probe: one max-2-per-hour policy hammered from 16 threads
//
// FAIL conditions (non-zero exit):
//   2  fingerprint drift for identical canonical inputs
//   3  a policy fired more often than its hourly limit
//   4  a gateway response reached COMPLETED without execution capability
//   5  an exception escaped the pipeline
//
// Produces: artifacts/reports/ARF_STRESS_REPORT.json

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "arf/hash.hpp"
#include "arf/pipeline.hpp"
#include "arf/validator.hpp"

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using Ms = std::chrono::duration<double, std::milli>;

namespace {

constexpr int kNumComponents = 200;
constexpr int kSeqEvents = 10000;
constexpr int kConcurrent = 1000;
constexpr int kWorkers = 32;
constexpr int kRateProbeThreads = 16;
constexpr int kRateProbeEventsPerThread = 25;

// ---- helpers ---------------------------------------------------------------

std::string fmt_double(double v, int prec = 3) {
  std::ostringstream oss;
  oss.precision(prec);
  oss << std::fixed << v;
  return oss.str();
}

std::string component_name(int i) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "svc-%03d", i + 1);
  return buf;
}

double percentile(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const std::size_t idx = static_cast<std::size_t>((sorted.size() - 1) * p);
  return sorted[std::min(idx, sorted.size() - 1)];
}

void write_report(const std::string& path, const std::string& json) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
  ofs << json;
}

// Deterministic metric mix: every 5th event is failing, every 3rd degraded.
arf::RawEvent make_event(int component, int seq) {
  arf::RawEvent raw;
  raw["component"] = component_name(component);
  const int profile = seq % 15;
  if (profile % 5 == 0) {
    raw["latency_p99"] = "620";
    raw["error_rate"] = "0.22";
    raw["throughput"] = "900";
    raw["cpu_util"] = "0.93";
    raw["memory_util"] = "0.91";
  } else if (profile % 3 == 0) {
    raw["latency_p99"] = "240";
    raw["error_rate"] = "0.07";
    raw["throughput"] = "1100";
  } else {
    raw["latency_p99"] = std::to_string(80 + (seq % 40));
    raw["error_rate"] = "0.01";
    raw["throughput"] = std::to_string(1200 + (seq % 50));
  }
  return raw;
}

// ---- drift detector --------------------------------------------------------

// canonical encoding → first fingerprint seen.
struct DriftDetector {
  std::mutex mu;
  std::map<std::string, std::string> seen;
  int drift_count{0};

  bool check(const arf::RawEvent& raw, const std::string& fingerprint) {
    const auto v = arf::validate_event(raw, 0);
    if (!v.ok) return true;
    const std::string canon = arf::canonical_event(v.event);
    std::lock_guard<std::mutex> lock(mu);
    auto it = seen.find(canon);
    if (it == seen.end()) {
      seen[canon] = fingerprint;
      return true;
    }
    if (it->second != fingerprint) {
      ++drift_count;
      std::cerr << "DRIFT DETECTED: canon=" << canon << " expected=" << it->second
                << " got=" << fingerprint << "\n";
      return false;
    }
    return true;
  }
};

// ---- statistics aggregator -------------------------------------------------

struct Stats {
  std::mutex mu;
  std::vector<double> latencies;
  std::map<std::string, int> status_dist;
  int intents{0};
  int completed_without_capability{0};

  void record(const arf::PipelineResult& r, double latency_ms) {
    std::lock_guard<std::mutex> lock(mu);
    latencies.push_back(latency_ms);
    status_dist[r.status]++;
    intents += static_cast<int>(r.healing_intents.size());
    for (const auto& g : r.gateway_responses) {
      if (g.status == arf::GatewayStatus::completed) ++completed_without_capability;
    }
  }

  std::string to_json(const std::string& phase, double wall_s) const {
    std::vector<double> sorted_lat = latencies;
    std::sort(sorted_lat.begin(), sorted_lat.end());
    const size_t total = latencies.size();
    std::ostringstream oss;
    oss << "{"
        << "\"phase\":\"" << phase << "\""
        << ",\"total\":" << total
        << ",\"intents\":" << intents
        << ",\"throughput_events_sec\":" << fmt_double(total / (wall_s > 0 ? wall_s : 1.0))
        << ",\"latency_ms\":{"
        << "\"p50\":" << fmt_double(percentile(sorted_lat, 0.50))
        << ",\"p95\":" << fmt_double(percentile(sorted_lat, 0.95))
        << ",\"p99\":" << fmt_double(percentile(sorted_lat, 0.99))
        << ",\"max\":" << fmt_double(sorted_lat.empty() ? 0.0 : sorted_lat.back())
        << "}"
        << ",\"status_dist\":{";
    bool first = true;
    for (const auto& [status, cnt] : status_dist) {
      if (!first) oss << ",";
      first = false;
      oss << "\"" << status << "\":" << cnt;
    }
    oss << "}"
        << ",\"completed_without_capability\":" << completed_without_capability << "}";
    return oss.str();
  }
};

bool run_one(arf::Pipeline& pipeline, const arf::RawEvent& raw, Stats& stats,
             DriftDetector& drift, std::atomic<bool>& drifted) {
  const auto t0 = Clock::now();
  arf::PipelineResult r;
  try {
    r = pipeline.process(raw);
  } catch (const std::exception& ex) {
    std::cerr << "FATAL: exception escaped pipeline: " << ex.what() << "\n";
    return false;
  }
  stats.record(r, Ms(Clock::now() - t0).count());
  if (!r.fingerprint.empty() && !drift.check(raw, r.fingerprint)) drifted = true;
  return true;
}

}  // namespace

int main() {
  const auto hi = arf::hash_runtime_info();
  if (hi.primitive != "blake3") {
    std::cerr << "FATAL: BLAKE3 not available, aborting stress harness\n";
    return 1;
  }
  arf::set_log_level(arf::LogLevel::error);

  arf::EngineConfig config;
  config.memory.max_incidents = 500;
  auto ctx = arf::EngineContext::create(config, arf::Capabilities{});
  arf::Pipeline pipeline(ctx);

  DriftDetector drift;
  Stats seq_stats;
  Stats conc_stats;
  std::atomic<bool> drifted{false};
  std::atomic<bool> escaped{false};

  // ---- sequential ------------------------------------------------------------
  std::cout << "[stress] sequential: " << kSeqEvents << " events...\n";
  const auto seq_t0 = Clock::now();
  for (int i = 0; i < kSeqEvents; ++i) {
    if (!run_one(pipeline, make_event(i % kNumComponents, i), seq_stats, drift, drifted)) {
      return 5;
    }
    if (drifted) {
      std::cerr << "FATAL: fingerprint drift in sequential run at i=" << i << "\n";
      return 2;
    }
    if (i % 1000 == 999) {
      std::cout << "  [seq] " << (i + 1) << "/" << kSeqEvents << " intents=" << seq_stats.intents
                << "\n";
    }
  }
  const double seq_wall = std::chrono::duration<double>(Clock::now() - seq_t0).count();
  std::cout << "[stress] sequential done in " << fmt_double(seq_wall) << "s\n";

  // ---- concurrent burst --------------------------------------------------------
  std::cout << "[stress] concurrent: " << kConcurrent << " events on " << kWorkers
            << " workers...\n";
  std::atomic<int> next{0};
  const auto conc_t0 = Clock::now();
  {
    std::vector<std::thread> threads;
    threads.reserve(kWorkers);
    for (int w = 0; w < kWorkers; ++w) {
      threads.emplace_back([&]() {
        for (int i = next.fetch_add(1); i < kConcurrent; i = next.fetch_add(1)) {
          const int seq = kSeqEvents + i;
          if (!run_one(pipeline, make_event(i % kNumComponents, seq), conc_stats, drift,
                       drifted)) {
            escaped = true;
          }
        }
      });
    }
    for (auto& t : threads) t.join();
  }
  const double conc_wall = std::chrono::duration<double>(Clock::now() - conc_t0).count();
  std::cout << "[stress] concurrent done in " << fmt_double(conc_wall) << "s\n";
  if (escaped) return 5;
  if (drifted) {
    std::cerr << "FATAL: fingerprint drift under concurrency\n";
    return 2;
  }

  // ---- rate-limit probe ----------------------------------------------------------
  arf::HealingPolicy probe;
  probe.name = "probe_limit_two";
  probe.conditions = {{"error_rate", ">", 0.1}};
  probe.actions = {"alert_team"};
  probe.priority = 1;
  probe.cooldown_seconds = 0;
  probe.max_executions_per_hour = 2;
  arf::PolicyEngine engine({probe});
  arf::Event hot;
  hot.component = "rate-probe";
  hot.latency_p99 = 400;
  hot.error_rate = 0.4;
  hot.throughput = 10;
  arf::Classification cls;
  cls.score = 0.9;
  cls.bucket = arf::AnomalyBucket::systemic;
  std::atomic<int> fired{0};
  {
    std::vector<std::thread> threads;
    for (int t = 0; t < kRateProbeThreads; ++t) {
      threads.emplace_back([&]() {
        for (int i = 0; i < kRateProbeEventsPerThread; ++i) {
          if (!engine.evaluate(hot, cls).fired.empty()) fired.fetch_add(1);
        }
      });
    }
    for (auto& t : threads) t.join();
  }
  std::cout << "[stress] rate-limit probe fired " << fired.load() << " time(s)\n";

  ctx->shutdown();

  std::ostringstream report;
  report << "{"
         << "\"sequential\":" << seq_stats.to_json("sequential", seq_wall)
         << ",\"concurrent\":" << conc_stats.to_json("concurrent", conc_wall)
         << ",\"rate_probe\":{\"limit\":2,\"fired\":" << fired.load() << "}"
         << ",\"drift_count\":" << drift.drift_count
         << ",\"memory_incidents\":" << ctx->memory->incident_count()
         << ",\"audit_entries\":" << ctx->audit->entry_count()
         << ",\"audit_chain_valid\":" << (ctx->audit->verify_chain() ? "true" : "false")
         << ",\"pipeline_stats\":" << ctx->stats->to_json()
         << "}";
  write_report("artifacts/reports/ARF_STRESS_REPORT.json", report.str());
  std::cout << "[stress] report written to artifacts/reports/ARF_STRESS_REPORT.json\n";

  if (fired.load() > 2) {
    std::cerr << "FATAL: rate limit violated (" << fired.load() << " > 2)\n";
    return 3;
  }
  if (seq_stats.completed_without_capability + conc_stats.completed_without_capability > 0) {
    std::cerr << "FATAL: execution completed without capability\n";
    return 4;
  }
  std::cout << "[stress] PASS\n";
  return 0;
}
