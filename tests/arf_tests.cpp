#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "arf/audit.hpp"
#include "arf/circuit_breaker.hpp"
#include "arf/classifier.hpp"
#include "arf/config.hpp"
#include "arf/gateway.hpp"
#include "arf/hash.hpp"
#include "arf/impact.hpp"
#include "arf/intent.hpp"
#include "arf/jsonlite.hpp"
#include "arf/memory.hpp"
#include "arf/observability.hpp"
#include "arf/pipeline.hpp"
#include "arf/policy.hpp"
#include "arf/recorder.hpp"
#include "arf/sharded_lru.hpp"
#include "arf/tool.hpp"
#include "arf/validator.hpp"
#include "arf/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Log capture: every line goes through the hook, nothing reaches stderr.
std::atomic<int> g_validation_rejected_lines{0};
std::atomic<int> g_policy_skipped_lines{0};

void capture_log(arf::LogLevel /*level*/, const std::string& line) {
  if (line.find("\"validation_rejected\"") != std::string::npos) g_validation_rejected_lines++;
  if (line.find("\"policy_skipped\"") != std::string::npos) g_policy_skipped_lines++;
}

// Manually advanced wall clock shared by the time-dependent tests.
struct ManualClock {
  std::shared_ptr<std::atomic<uint64_t>> now = std::make_shared<std::atomic<uint64_t>>(0);

  explicit ManualClock(uint64_t start_ms) { now->store(start_ms); }
  void advance(uint64_t ms) { now->fetch_add(ms); }
  void set(uint64_t ms) { now->store(ms); }
  arf::ClockFn fn() const {
    auto n = now;
    return [n]() { return n->load(); };
  }
};

// 1970-01-05 was a Monday.
constexpr uint64_t kMonday10amUtcMs = (4ull * 86400 + 10 * 3600) * 1000;

arf::RawEvent scenario_raw() {
  return {{"component", "api-service"}, {"latency_p99", "320"}, {"error_rate", "0.18"},
          {"throughput", "1250"},       {"cpu_util", "0.87"},   {"memory_util", "0.92"}};
}

arf::Event make_event(const std::string& component, double latency, double error_rate,
                      double throughput) {
  arf::RawEvent raw{{"component", component},
                    {"latency_p99", std::to_string(latency)},
                    {"error_rate", std::to_string(error_rate)},
                    {"throughput", std::to_string(throughput)}};
  auto v = arf::validate_event(raw, 0);
  expect(v.ok, "helper event must validate: " + v.message);
  return v.event;
}

arf::HealingIntent make_test_intent(const std::string& tool, const std::string& component,
                                    uint32_t blast_radius = 1, bool business_hours_safe = false) {
  arf::HealingIntent i;
  i.tool = tool;
  i.component = component;
  i.fingerprint = arf::blake3_hex(tool + component);
  i.intent_id = arf::compute_intent_id(i.fingerprint, tool, component, i.parameters);
  i.justification = "test";
  i.confidence = 0.9;
  i.risk.blast_radius = blast_radius;
  i.risk.safe_for_business_hours = business_hours_safe;
  i.incident_id = arf::incident_id_for(i.fingerprint);
  return i;
}

std::shared_ptr<arf::SafetyGateway> make_gateway(arf::Capabilities caps, const ManualClock& clock,
                                                 arf::GatewayConfig config = {}) {
  auto registry = arf::make_builtin_registry(std::make_shared<arf::LoggingBackend>());
  return std::make_shared<arf::SafetyGateway>(config, caps, registry,
                                              std::make_shared<arf::AuditTrail>(), clock.fn());
}

arf::Capabilities autonomous_caps() {
  arf::Capabilities c;
  c.autonomous_execution = true;
  c.approval_workflow = true;
  return c;
}

class SleepyTool : public arf::Tool {
 public:
  SleepyTool() {
    meta_.name = "sleepy";
    meta_.timeout_ms = 30;
    meta_.safety_level = arf::SafetyLevel::low;
  }
  const arf::ToolMetadata& metadata() const override { return meta_; }
  arf::ToolValidation validate(const arf::ToolContext&) const override { return {}; }
  arf::ToolResult execute(const arf::ToolContext&) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    return {true, "late", {}};
  }

 private:
  arf::ToolMetadata meta_;
};

class ThrowingTool : public arf::Tool {
 public:
  ThrowingTool() {
    meta_.name = "explosive";
    meta_.timeout_ms = 1000;
  }
  const arf::ToolMetadata& metadata() const override { return meta_; }
  arf::ToolValidation validate(const arf::ToolContext&) const override { return {}; }
  arf::ToolResult execute(const arf::ToolContext&) override {
    throw std::runtime_error("backend exploded");
  }

 private:
  arf::ToolMetadata meta_;
};

class SlowEmbedder : public arf::EmbeddingProvider {
 public:
  size_t dimension() const override { return inner_.dimension(); }
  std::vector<float> embed(const arf::Event& e) const override {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return inner_.embed(e);
  }

 private:
  arf::FeatureEmbeddingProvider inner_{384};
};

// validate() throws before any gateway decision is made.
class FaultyValidatorTool : public arf::Tool {
 public:
  FaultyValidatorTool() {
    meta_.name = "faulty_check";
    meta_.timeout_ms = 1000;
  }
  const arf::ToolMetadata& metadata() const override { return meta_; }
  arf::ToolValidation validate(const arf::ToolContext&) const override {
    throw std::runtime_error("precondition service down");
  }
  arf::ToolResult execute(const arf::ToolContext&) override { return {true, "ran", {}}; }

 private:
  arf::ToolMetadata meta_;
};

class UnreachableBackupBackend : public arf::LoggingBackend {
 public:
  bool has_backup(const std::string&) const override {
    throw std::runtime_error("backup API unreachable");
  }
};

// Names that route to the same shard as `anchor` in a 16-shard table.
std::vector<std::string> same_shard_components(const std::string& anchor, size_t count) {
  const uint32_t shard = arf::fnv1a_32(anchor) % 16;
  std::vector<std::string> out;
  for (int i = 0; out.size() < count; ++i) {
    std::string name = "svc-" + std::to_string(i);
    if (name != anchor && arf::fnv1a_32(name) % 16 == shard) out.push_back(name);
  }
  return out;
}

// ============================================================================
// Phase 1: Hashing & fingerprint authority
// ============================================================================

void test_blake3_known_vectors() {
  expect(arf::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(arf::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(arf::hash_runtime_info().primitive == "blake3", "hash primitive must be blake3");
}

void test_domain_separation() {
  const std::string ev = arf::hash_domain(arf::kEventDomain, "payload");
  const std::string in = arf::hash_domain(arf::kIntentDomain, "payload");
  expect(ev.size() == 64 && in.size() == 64, "domain digests are 64 hex chars");
  expect(ev != in, "event and intent domains must differ");
  expect(ev != arf::blake3_hex("payload"), "domain digest differs from raw digest");

  const std::string id = arf::short_id("inc_", ev);
  expect(id.size() == 4 + 16, "short id is prefix + 16 hex");
  expect(id.rfind("inc_", 0) == 0, "short id keeps prefix");
}

void test_fingerprint_determinism() {
  auto a = arf::validate_event(scenario_raw(), 1000);
  auto b = arf::validate_event(scenario_raw(), 999999);
  expect(a.ok && b.ok, "scenario must validate");
  expect(a.event.fingerprint.size() == 64, "fingerprint is 64 hex chars");
  expect(a.event.fingerprint == b.event.fingerprint,
         "timestamp must not influence fingerprint");
  expect(arf::canonical_event(a.event) == arf::canonical_event(b.event),
         "canonical encoding must be stable");

  auto raw = scenario_raw();
  raw["error_rate"] = "0.181";
  auto c = arf::validate_event(raw, 1000);
  expect(c.ok && c.event.fingerprint != a.event.fingerprint,
         "different metric value must change fingerprint");
}

void test_fingerprint_no_collisions() {
  std::set<std::string> seen;
  const int n = 5000;
  for (int i = 0; i < n; ++i) {
    arf::RawEvent raw{{"component", "svc-" + std::to_string(i % 50)},
                      {"latency_p99", std::to_string(100 + i)},
                      {"error_rate", "0.01"},
                      {"throughput", std::to_string(1000 + (i % 7))}};
    auto v = arf::validate_event(raw, 0);
    expect(v.ok, "sample event must validate");
    seen.insert(v.event.fingerprint);
  }
  expect(static_cast<int>(seen.size()) == n, "distinct events must not collide");
}

void test_fingerprint_sub_micro_precision() {
  auto with_error_rate = [](const std::string& value) {
    auto raw = scenario_raw();
    raw["error_rate"] = value;
    auto v = arf::validate_event(raw, 0);
    expect(v.ok, "error_rate " + value + " must validate");
    return v.event;
  };
  const auto tiny = with_error_rate("1e-7");
  const auto tinier = with_error_rate("4e-7");
  const auto zero = with_error_rate("0");
  expect(tiny.fingerprint != tinier.fingerprint, "1e-7 and 4e-7 fingerprint apart");
  expect(tiny.fingerprint != zero.fingerprint, "1e-7 and 0 fingerprint apart");
  expect(arf::canonical_event(tiny).find("\"error_rate\":0,") == std::string::npos,
         "canonical encoding keeps sub-micro values");
  expect(with_error_rate("-0").fingerprint == zero.fingerprint, "-0 and 0 share a fingerprint");
  expect(arf::canonical_event(zero).find("\"latency_p99\":320,") != std::string::npos,
         "integral metrics encode without a fraction");
}

void test_version_manifest() {
  auto m = arf::version::current_manifest();
  expect(m.engine_semver == arf::version::ENGINE_SEMVER, "manifest semver");
  expect(m.hash_primitive == "blake3", "manifest hash primitive");
  expect(m.fingerprint == 2, "round-trip metric encoding is fingerprint version 2");
  const std::string json = arf::version::manifest_to_json(m);
  expect(json.find("\"policy_schema\"") != std::string::npos, "manifest json has policy_schema");
  expect(arf::version::check_policy_schema(arf::version::POLICY_SCHEMA_VERSION).ok,
         "current policy schema accepted");
  expect(!arf::version::check_policy_schema(arf::version::POLICY_SCHEMA_VERSION + 1).ok,
         "newer policy schema rejected");
}

// ============================================================================
// Phase 2: jsonlite
// ============================================================================

void test_json_sorted_keys() {
  std::optional<arf::jsonlite::JsonError> err;
  auto canon = arf::jsonlite::canonicalize_json("{\"b\":1,\"a\":\"x\"}", &err);
  expect(!err, "canonicalize must succeed");
  expect(canon == "{\"a\":\"x\",\"b\":1}", "keys must be sorted, got " + canon);
}

void test_json_rejects_duplicates_and_nan() {
  std::optional<arf::jsonlite::JsonError> err;
  arf::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key must be rejected");

  err.reset();
  arf::jsonlite::parse("{\"a\":NaN}", &err);
  expect(err && err->code == "json_parse_error", "NaN must be rejected");
}

void test_json_typed_getters() {
  std::optional<arf::jsonlite::JsonError> err;
  auto obj = arf::jsonlite::parse(
      "{\"n\":42,\"d\":0.5,\"s\":\"hi\",\"b\":true,\"arr\":[\"x\",\"y\"]}", &err);
  expect(!err, "parse must succeed");
  expect(arf::jsonlite::get_u64(obj, "n") == 42, "get_u64");
  expect(std::fabs(arf::jsonlite::get_double(obj, "d") - 0.5) < 1e-12, "get_double");
  expect(arf::jsonlite::get_double(obj, "n") == 42.0, "get_double accepts integers");
  expect(arf::jsonlite::get_string(obj, "s") == "hi", "get_string");
  expect(arf::jsonlite::get_bool(obj, "b"), "get_bool");
  expect(arf::jsonlite::get_string_array(obj, "arr").size() == 2, "get_string_array");
  expect(!arf::jsonlite::get_number(obj, "missing"), "missing number is nullopt");
}

// ============================================================================
// Phase 3: Validation
// ============================================================================

void test_validator_rejects_negative_error_rate() {
  auto raw = scenario_raw();
  raw["error_rate"] = "-0.1";
  const int before = g_validation_rejected_lines.load();
  auto v = arf::validate_event(raw, 0);
  expect(!v.ok, "negative error_rate must be rejected");
  expect(v.error == arf::ErrorCode::validation_error, "error code validation_error");
  expect(v.field == "error_rate", "rejection must name error_rate, got " + v.field);
  expect(g_validation_rejected_lines.load() == before + 1, "rejection must be logged once");
}

void test_validator_field_contract() {
  auto raw = scenario_raw();
  raw["component"] = "API Service";
  expect(arf::validate_event(raw, 0).field == "component", "invalid component charset");

  raw = scenario_raw();
  raw["latency_p99"] = "300000";
  expect(arf::validate_event(raw, 0).field == "latency_p99", "latency upper bound exclusive");

  raw = scenario_raw();
  raw["cpu_util"] = "1.5";
  expect(arf::validate_event(raw, 0).field == "cpu_util", "cpu_util must be <= 1");

  raw = scenario_raw();
  raw.erase("throughput");
  expect(arf::validate_event(raw, 0).field == "throughput", "throughput is required");

  raw = scenario_raw();
  raw["unrelated_key"] = "whatever";
  expect(arf::validate_event(raw, 0).ok, "unknown keys are ignored");
}

void test_validator_severity() {
  auto v = arf::validate_event(scenario_raw(), 0);
  expect(v.ok, "scenario valid");
  expect(v.event.severity == arf::Severity::high || v.event.severity == arf::Severity::critical,
         "scenario severity must be at least HIGH");

  auto calm = make_event("calm", 50, 0.001, 100);
  expect(calm.severity == arf::Severity::low, "healthy event is LOW");
}

// ============================================================================
// Phase 4: Classification
// ============================================================================

void test_classifier_scenario_critical() {
  arf::AnomalyClassifier classifier;
  auto v = arf::validate_event(scenario_raw(), 0);
  auto c = classifier.score(v.event);
  expect(c.bucket >= arf::AnomalyBucket::critical,
         "scenario must be CRITICAL or above, got " + arf::to_string(c.bucket));
  expect(c.score >= 0.6 && c.score <= 1.0, "score in critical range");
  expect(c.used_static_only, "cold component uses static thresholds only");
  expect(classifier.tracked_components() == 0, "score() must not create a baseline");
}

void test_classifier_baseline_warmup() {
  arf::ClassifierConfig cfg;
  cfg.warmup_samples = 5;
  arf::AnomalyClassifier classifier(cfg);
  auto e = make_event("warm", 100, 0.01, 1000);
  for (int i = 0; i < 5; ++i) classifier.classify(e);
  auto b = classifier.baseline("warm");
  expect(b.has_value(), "baseline must exist after classify");
  expect(b->latency.samples == 5, "five samples folded in");
  auto c = classifier.score(e);
  expect(!c.used_static_only, "dynamic scoring after warmup");
  expect(c.bucket == arf::AnomalyBucket::normal, "steady metrics stay NORMAL");
}

void test_classifier_restore_baseline() {
  arf::AnomalyClassifier classifier;
  arf::ComponentBaseline b;
  for (arf::MetricBaseline* m : {&b.latency, &b.error_rate, &b.throughput}) m->samples = 50;
  b.latency.mean = 100.0;
  b.latency.variance = 25.0;
  b.error_rate.mean = 0.01;
  b.error_rate.variance = 0.0001;
  b.throughput.mean = 1000.0;
  b.throughput.variance = 100.0;
  classifier.restore_baseline("restored", b);
  auto c = classifier.score(make_event("restored", 100, 0.01, 1000));
  expect(!c.used_static_only, "restored baseline enables dynamic scoring");
  auto spike = classifier.score(make_event("restored", 140, 0.01, 1000));
  expect(spike.score > c.score, "deviation from restored mean raises score");

  arf::ComponentBaseline corrupt = b;
  corrupt.latency.variance = -1.0;
  expect(arf::baseline_is_corrupt(corrupt), "negative variance is corrupt");
  classifier.restore_baseline("corrupt", corrupt);
  auto fallback = classifier.score(make_event("corrupt", 100, 0.01, 1000));
  expect(fallback.error == arf::ErrorCode::classification_error, "corrupt baseline reported");
  expect(fallback.used_static_only, "corrupt baseline falls back to static thresholds");
}

void test_bucket_boundaries() {
  expect(arf::bucket_for_score(0.29) == arf::AnomalyBucket::normal, "0.29 NORMAL");
  expect(arf::bucket_for_score(0.3) == arf::AnomalyBucket::degrading, "0.3 DEGRADING");
  expect(arf::bucket_for_score(0.6) == arf::AnomalyBucket::critical, "0.6 CRITICAL");
  expect(arf::bucket_for_score(0.85) == arf::AnomalyBucket::systemic, "0.85 SYSTEMIC");
}

// ============================================================================
// Phase 5: Incident memory & circuit breaker
// ============================================================================

void test_memory_dedupe_and_outcome_idempotence() {
  ManualClock clock(1000000);
  arf::IncidentMemory mem(arf::MemoryConfig{}, std::make_shared<arf::FeatureEmbeddingProvider>(),
                          clock.fn());
  auto e = make_event("db", 400, 0.2, 500);
  auto id1 = mem.record_incident(e);
  auto id2 = mem.record_incident(e);
  expect(id1 && id2 && *id1 == *id2, "same fingerprint → same incident");
  expect(mem.incident_count() == 1, "exactly one incident node");
  expect(id1->rfind("inc_", 0) == 0, "incident id prefix");

  auto o1 = mem.store_outcome(*id1, {"restart_container"}, true, 3.0, "worked");
  auto o2 = mem.store_outcome(*id1, {"restart_container"}, true, 3.0, "worked");
  expect(o1 && o1->ok && !o1->duplicate, "first outcome stored");
  expect(o2 && o2->ok && o2->duplicate, "second outcome is a duplicate");
  expect(o1->outcome_id == o2->outcome_id, "idempotent outcome id");
  expect(mem.incident_count() == 1, "outcomes never create incidents");
  expect(mem.stats().outcomes == 1, "one outcome node");

  auto bad = mem.store_outcome("inc_0000000000000000", {"scale_out"}, true, 1.0, "");
  expect(bad && !bad->ok && bad->error == arf::ErrorCode::unknown_incident,
         "unknown incident rejected");
}

void test_memory_eviction_and_recall() {
  ManualClock clock(1000000);
  arf::MemoryConfig cfg;
  cfg.max_incidents = 2;
  arf::IncidentMemory mem(cfg, std::make_shared<arf::FeatureEmbeddingProvider>(), clock.fn());

  auto first = mem.record_incident(make_event("svc-a", 100, 0.01, 100));
  clock.advance(10);
  mem.record_incident(make_event("svc-b", 200, 0.05, 200));
  clock.advance(10);
  mem.record_incident(make_event("svc-c", 300, 0.10, 300));
  expect(mem.incident_count() == 2, "bounded at max_incidents");
  expect(!mem.contains(*first), "least recently used incident evicted");
  expect(mem.stats().evictions == 1, "one eviction counted");

  auto hits = mem.recall(make_event("svc-a", 100, 0.01, 100), 5);
  expect(hits.has_value(), "recall must succeed");
  expect(hits->size() == 2, "recall returns live incidents only");
  for (const auto& h : *hits) expect(h.incident.id != *first, "evicted id never recalled");
  for (size_t i = 1; i < hits->size(); ++i) {
    expect((*hits)[i - 1].distance <= (*hits)[i].distance, "ascending distance");
  }
}

void test_most_effective_actions() {
  ManualClock clock(5000000);
  arf::IncidentMemory mem(arf::MemoryConfig{}, std::make_shared<arf::FeatureEmbeddingProvider>(),
                          clock.fn());
  auto inc = mem.record_incident(make_event("web", 400, 0.2, 100));
  mem.store_outcome(*inc, {"restart_container"}, true, 2.0, "");
  clock.advance(120000);
  mem.store_outcome(*inc, {"restart_container"}, false, 5.0, "");
  clock.advance(120000);
  mem.store_outcome(*inc, {"scale_out"}, true, 4.0, "");

  auto eff = mem.most_effective_actions("web", 5);
  expect(eff.size() == 2, "two distinct actions");
  expect(eff[0].action == "scale_out" && eff[0].success_rate == 1.0,
         "best action first, got " + eff[0].action);
  expect(eff[1].attempts == 2 && std::fabs(eff[1].success_rate - 0.5) < 1e-9,
         "restart 1/2 success");
}

void test_breaker_opens_and_half_opens() {
  ManualClock clock(1000);
  auto mem = std::make_shared<arf::IncidentMemory>(
      arf::MemoryConfig{}, std::make_shared<arf::FeatureEmbeddingProvider>(), clock.fn());
  arf::BreakerConfig bc;
  bc.failure_threshold = 3;
  bc.recovery_timeout_ms = 30000;
  arf::GuardedMemory guarded(mem, bc, clock.fn());

  auto invocations = std::make_shared<std::atomic<int>>(0);
  auto failing = std::make_shared<std::atomic<bool>>(true);
  guarded.set_fault_injector([invocations, failing](std::string_view) {
    invocations->fetch_add(1);
    return failing->load();
  });

  auto e = make_event("flaky", 100, 0.01, 100);
  for (int i = 0; i < 3; ++i) {
    auto r = guarded.recall(e, 3);
    expect(!r.ok() && r.available, "failing call is attempted");
    expect(r.error == arf::ErrorCode::memory_unavailable, "failure maps to memory_unavailable");
  }
  expect(guarded.breaker().state() == arf::BreakerState::open, "opens after 3 failures");
  expect(invocations->load() == 3, "three invocations");

  auto fast = guarded.recall(e, 3);
  expect(!fast.available, "open breaker fast-fails");
  expect(invocations->load() == 3, "no invocation while open");

  clock.advance(30000);
  failing->store(false);
  auto trial = guarded.recall(e, 3);
  expect(trial.ok(), "trial call succeeds after recovery timeout");
  expect(invocations->load() == 4, "exactly one trial invocation");
  expect(guarded.breaker().state() == arf::BreakerState::closed, "closes on trial success");
}

void test_breaker_half_open_single_permit() {
  ManualClock clock(0);
  arf::BreakerConfig bc;
  bc.failure_threshold = 1;
  bc.recovery_timeout_ms = 100;
  arf::CircuitBreaker b("single", bc, clock.fn());
  expect(b.allow(), "closed allows");
  b.on_failure();
  expect(b.state() == arf::BreakerState::open, "threshold 1 opens immediately");
  expect(!b.would_allow(), "would_allow false while open");
  clock.advance(100);
  expect(b.would_allow(), "would_allow true once recovery elapsed");
  expect(b.allow(), "first caller takes the trial permit");
  expect(b.state() == arf::BreakerState::half_open, "half open");
  expect(!b.allow(), "second caller rejected during trial");
  b.on_failure();
  expect(b.state() == arf::BreakerState::open, "trial failure reopens");
}

void test_breaker_non_standard_throw_returns_permit() {
  ManualClock clock(0);
  arf::BreakerConfig bc;
  bc.failure_threshold = 1;
  bc.recovery_timeout_ms = 100;
  arf::CircuitBreaker b("odd-throw", bc, clock.fn());
  b.allow();
  b.on_failure();
  clock.advance(100);

  auto trial = b.call([]() -> std::optional<int> { throw 42; });
  expect(trial.available && !trial.ok(), "non-standard throw is a failed trial");
  expect(b.state() == arf::BreakerState::open, "failed trial reopens");

  clock.advance(100);
  auto next = b.call([]() -> std::optional<int> { return 7; });
  expect(next.ok() && *next.value == 7, "next trial admitted after recovery");
  expect(b.state() == arf::BreakerState::closed, "successful trial closes");
}

void test_sharded_lru_global_capacity() {
  arf::ShardedLru<int> lru(16, 100);
  const auto crowd = same_shard_components("api-service", 8);
  lru.with("api-service", [](int& v) { v = 1; });
  for (const auto& name : crowd) lru.with(name, [](int& v) { v = 2; });
  expect(lru.size() == 9 && lru.evictions() == 0, "one crowded shard stays within capacity");
  expect(lru.peek("api-service", [](const int* v) { return v && *v == 1; }),
         "anchor survives its shard filling up");

  for (int i = 0; i < 300; ++i) lru.with("bulk-" + std::to_string(i), [](int& v) { v = 3; });
  expect(lru.size() == 100, "global capacity enforced, got " + std::to_string(lru.size()));
  expect(lru.evictions() == 209, "evictions account for the overflow");
}

// ============================================================================
// Phase 6: Policy engine
// ============================================================================

arf::HealingPolicy simple_policy(const std::string& name, int priority, uint64_t cooldown_s,
                                 uint32_t max_per_hour) {
  arf::HealingPolicy p;
  p.name = name;
  p.priority = priority;
  p.conditions = {{"error_rate", ">", 0.1}};
  p.actions = {"alert_team"};
  p.cooldown_seconds = cooldown_s;
  p.max_executions_per_hour = max_per_hour;
  return p;
}

arf::Classification hot_classification() {
  arf::Classification c;
  c.score = 0.9;
  c.bucket = arf::AnomalyBucket::systemic;
  return c;
}

void test_policy_rate_limit_concurrent() {
  ManualClock clock(10000000);
  arf::PolicyEngine engine({simple_policy("limit_two", 1, 0, 2)}, {}, clock.fn());
  const auto e = make_event("contended", 400, 0.4, 10);
  const auto c = hot_classification();
  std::atomic<int> fired{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 20; ++i) {
        if (!engine.evaluate(e, c).fired.empty()) fired.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(fired.load() == 2, "exactly 2 firings per hour, got " + std::to_string(fired.load()));

  clock.advance(3600000);
  expect(!engine.evaluate(e, c).fired.empty(), "window rolls after an hour");
}

void test_policy_rate_limit_with_shared_shard() {
  ManualClock clock(10000000);
  arf::PolicyEngine engine({simple_policy("limit_two", 1, 0, 2)}, {}, clock.fn());
  const auto c = hot_classification();
  const auto anchor = make_event("api-service", 400, 0.4, 10);
  const auto neighbours = same_shard_components("api-service", 7);

  int anchor_fired = 0;
  for (int round = 0; round < 3; ++round) {
    for (int i = 0; i < 2; ++i) {
      if (!engine.evaluate(anchor, c).fired.empty()) ++anchor_fired;
    }
    for (const auto& name : neighbours) engine.evaluate(make_event(name, 400, 0.4, 10), c);
    clock.advance(1000);
  }
  expect(anchor_fired == 2, "limit holds across shard neighbours, got " +
                                std::to_string(anchor_fired));
  expect(engine.tracked_components() == 8, "all eight components tracked");
  expect(engine.tracker_evictions() == 0, "no eviction below capacity");
}

void test_policy_clock_step_back_keeps_cooldown() {
  ManualClock clock(10000000);
  arf::PolicyEngine engine({simple_policy("cool", 1, 60, 100)}, {}, clock.fn());
  const auto e = make_event("skewed", 400, 0.4, 10);
  const auto c = hot_classification();
  expect(engine.evaluate(e, c).fired.size() == 1, "first evaluation fires");
  clock.set(10000000 - 5000);
  expect(engine.evaluate(e, c).fired.empty(), "clock stepping back does not lift cooldown");
  clock.set(10000000 + 61000);
  expect(engine.evaluate(e, c).fired.size() == 1, "fires once cooldown elapses");
}

void test_policy_cooldown_and_preview() {
  ManualClock clock(10000000);
  arf::PolicyEngine engine({simple_policy("cool", 1, 60, 100)}, {}, clock.fn());
  const auto e = make_event("cooling", 400, 0.4, 10);
  const auto c = hot_classification();

  auto p1 = engine.preview(e, c);
  auto p2 = engine.preview(e, c);
  expect(p1.fired.size() == 1 && p2.fired.size() == 1, "preview never consumes a firing");

  expect(engine.evaluate(e, c).fired.size() == 1, "first evaluation fires");
  auto second = engine.evaluate(e, c);
  expect(second.fired.empty(), "cooldown suppresses re-fire");
  expect(second.suppressed.size() == 1, "suppression reported");
  expect(!engine.commit_firing("cooling", "cool"), "commit refused during cooldown");

  clock.advance(61000);
  expect(engine.commit_firing("cooling", "cool"), "commit allowed after cooldown");
}

void test_policy_priority_and_terminal() {
  auto a = simple_policy("a_terminal", 1, 0, 100);
  a.terminal = true;
  a.actions = {"circuit_breaker"};
  auto b = simple_policy("b_lower", 2, 0, 100);
  b.actions = {"scale_out"};
  arf::PolicyEngine engine({b, a});
  auto d = engine.evaluate(make_event("term", 400, 0.4, 10), hot_classification());
  expect(d.fired.size() == 1 && d.fired[0].policy == "a_terminal", "terminal stops evaluation");
  expect(d.actions == std::vector<std::string>{"circuit_breaker"}, "only terminal actions");

  a.terminal = false;
  arf::PolicyEngine additive({b, a});
  auto d2 = additive.evaluate(make_event("term", 400, 0.4, 10), hot_classification());
  expect(d2.actions.size() == 2 && d2.actions[0] == "circuit_breaker",
         "priority order preserved in actions");
}

void test_policy_malformed_skipped() {
  auto good = simple_policy("good", 2, 0, 100);
  auto bad = simple_policy("bad", 1, 0, 100);
  bad.conditions = {{"not_a_metric", ">", 1.0}};
  arf::PolicyEngine engine({good, bad});
  auto d = engine.evaluate(make_event("malformed", 400, 0.4, 10), hot_classification());
  expect(d.skipped == std::vector<std::string>{"bad"}, "malformed policy reported skipped");
  expect(d.fired.size() == 1 && d.fired[0].policy == "good", "other policies still fire");
}

void test_policy_min_bucket_and_absent_metric() {
  auto p = simple_policy("cpu_only", 1, 0, 100);
  p.conditions = {{"cpu_util", ">", 0.5}};
  arf::PolicyEngine engine({p});
  auto d = engine.evaluate(make_event("nocpu", 400, 0.4, 10), hot_classification());
  expect(d.fired.empty(), "condition on absent optional metric does not match");

  auto q = simple_policy("needs_critical", 1, 0, 100);
  q.min_bucket = arf::AnomalyBucket::critical;
  arf::PolicyEngine gated({q});
  arf::Classification mild;
  mild.score = 0.4;
  mild.bucket = arf::AnomalyBucket::degrading;
  expect(gated.evaluate(make_event("mild", 400, 0.4, 10), mild).fired.empty(),
         "bucket below min_bucket is ineligible");
}

void test_policy_json_load() {
  g_policy_skipped_lines = 0;
  const std::string doc = R"({
    "schema_version": 1,
    "policies": [
      {"name": "json_one", "priority": 1, "actions": ["scale_out", "scale_out", "alert_team"],
       "conditions": [{"metric": "latency_p99", "operator": ">", "threshold": 250}]},
      {"name": "json_one", "actions": ["alert_team"]},
      {"name": "broken", "actions": ["alert_team"], "conditions": [{"metric": "error_rate", "op": ">"}]},
      {"name": "json_two", "priority": 4, "min_bucket": "CRITICAL", "actions": ["rollback"],
       "conditions": [{"metric": "error_rate", "op": ">=", "threshold": 0.5}]}
    ]})";
  auto r = arf::load_policies_json(doc);
  expect(r.ok, "document loads");
  expect(r.policies.size() == 2, "duplicate and malformed entries skipped");
  expect(r.errors.size() == 2, "one error per skipped entry");
  expect(g_policy_skipped_lines.load() == 2, "skips are logged");
  expect(r.policies[0].actions.size() == 2, "actions de-duplicated on load");
  expect(r.policies[1].min_bucket == arf::AnomalyBucket::critical, "min_bucket parsed");

  auto round = arf::load_policies_json(arf::policies_to_json(r.policies));
  expect(round.ok && round.policies.size() == 2, "serialized policies reload");

  auto future = arf::load_policies_json("{\"schema_version\": 99, \"policies\": []}");
  expect(!future.ok, "newer schema rejected");
}

void test_default_policies_well_formed() {
  auto defaults = arf::default_policies();
  expect(defaults.size() == 5, "five default policies");
  for (const auto& p : defaults) {
    expect(arf::policy_defect(p).empty(), "default policy well-formed: " + p.name);
  }
}

// ============================================================================
// Phase 7: Intents & business impact
// ============================================================================

void test_intent_id_determinism() {
  std::map<std::string, std::string> params{{"scale_factor", "2"}};
  auto a = arf::compute_intent_id("fp", "scale_out", "api", params);
  auto b = arf::compute_intent_id("fp", "scale_out", "api", params);
  auto c = arf::compute_intent_id("fp", "scale_out", "api", {{"scale_factor", "3"}});
  expect(a == b, "intent id deterministic");
  expect(a != c, "parameters change intent id");
  expect(a.rfind("intent_", 0) == 0, "intent id prefix");
}

void test_intent_confidence_and_sanitize() {
  auto restart = arf::action_profile("restart_container");
  expect(restart.has_value(), "restart profile exists");
  expect(std::fabs(arf::intent_confidence(*restart, 0, std::nullopt) - 0.85) < 1e-9,
         "base confidence");
  expect(std::fabs(arf::intent_confidence(*restart, 3, std::nullopt) - 0.935) < 1e-9,
         "similar incidents boost");
  expect(std::fabs(arf::intent_confidence(*restart, 3, 0.5) - (0.7 * 0.935 + 0.3 * 0.5)) < 1e-9,
         "historical blend");

  std::map<std::string, std::string> raw{{std::string(101, 'k'), "v"},
                                         {"", "v"},
                                         {"ok", std::string("a\x01") + "b"}};
  auto clean = arf::sanitize_parameters(raw);
  expect(clean.size() == 1, "overlong and empty keys dropped");
  expect(clean["ok"] == "ab", "control characters stripped");
}

void test_business_impact_scenario() {
  auto v = arf::validate_event(scenario_raw(), 0);
  arf::Classification c;
  c.bucket = arf::AnomalyBucket::critical;
  c.score = 0.62;
  auto impact = arf::estimate_business_impact(v.event, c);
  expect(std::fabs(impact.revenue_loss_estimate - 885.0) < 1e-6,
         "revenue 100 * 1.5 * 1.18 * 5");
  expect(impact.affected_users_estimate == 13500, "users 1250 * 0.18 * 60");
  expect(impact.severity_level == "CRITICAL", "critical impact label");
  expect(std::fabs(impact.throughput_reduction_pct - 18.0) < 1e-6, "throughput reduction");
}

// ============================================================================
// Phase 8: Safety gateway
// ============================================================================

void test_gateway_capability_false_never_completes() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(arf::Capabilities{}, clock);
  for (auto mode : {arf::ExecutionMode::advisory, arf::ExecutionMode::approval,
                    arf::ExecutionMode::autonomous}) {
    auto intent = make_test_intent("scale_out", "api-" + arf::to_string(mode));
    auto r = gw->submit(intent, mode);
    expect(r.status == arf::GatewayStatus::advisory_only,
           "capability false → ADVISORY_ONLY, got " + arf::to_string(r.status));
    expect(r.would_execute, "advisory carries would_execute");
    expect(!r.result.has_value(), "no tool result without execution");
  }
  expect(gw->pending_count() == 0, "no approvals created without capability");
  expect(gw->audit().entry_count() == 3, "every request audited");
}

void test_gateway_duplicate_intent() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(arf::Capabilities{}, clock);
  auto intent = make_test_intent("alert_team", "api-service");
  auto first = gw->submit(intent, arf::ExecutionMode::advisory);
  auto second = gw->submit(intent, arf::ExecutionMode::advisory);
  expect(!first.duplicate && second.duplicate, "second submission is a duplicate");
  expect(second.audit_sequence == first.audit_sequence, "duplicate reuses audit entry");
  expect(second.status == first.status, "duplicate reuses status");
  expect(gw->audit().entry_count() == 1, "duplicate adds no audit entry");
}

void test_gateway_validation_order() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(autonomous_caps(), clock);

  auto r = gw->submit(make_test_intent("database_drop", "db"), arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied && r.error == arf::ErrorCode::gateway_denied,
         "blacklist matched case-insensitively");

  r = gw->submit(make_test_intent("scale_out", "wide", 5), arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.reason.find("blast radius") != std::string::npos,
         "blast radius enforced");

  r = gw->submit(make_test_intent("teleport", "api"), arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied && r.error == arf::ErrorCode::unknown_tool,
         "unknown tool fails closed");

  auto bad_params = make_test_intent("scale_out", "params");
  bad_params.parameters = {{"scale_factor", "50"}};
  bad_params.intent_id =
      arf::compute_intent_id(bad_params.fingerprint, "scale_out", "params", bad_params.parameters);
  r = gw->submit(bad_params, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied, "tool validate() rejects out-of-range parameter");

  arf::HealingIntent anonymous = make_test_intent("scale_out", "anon");
  anonymous.intent_id.clear();
  r = gw->submit(anonymous, arf::ExecutionMode::advisory);
  expect(r.status == arf::GatewayStatus::denied && r.error == arf::ErrorCode::validation_error,
         "missing intent id denied");
  expect(gw->audit().verify_chain(), "audit chain intact");
}

void test_gateway_business_hours() {
  ManualClock clock(kMonday10amUtcMs);
  arf::GatewayConfig cfg;
  cfg.business_hours.enabled = true;
  auto gw = make_gateway(autonomous_caps(), clock, cfg);

  auto r = gw->submit(make_test_intent("restart_container", "shop"),
                      arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.reason.find("business-hours") != std::string::npos,
         "unsafe tool denied during business hours");

  r = gw->submit(make_test_intent("alert_team", "shop", 0, true), arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::completed, "business-hours-safe tool proceeds");

  arf::BusinessHours bh;
  bh.enabled = true;
  expect(!bh.active(kMonday10amUtcMs - 4 * 3600 * 1000), "06:00 Monday outside window");
  expect(!bh.active(kMonday10amUtcMs - 86400ull * 1000), "Sunday outside window");
  bh.start_hour = 22;
  bh.end_hour = 6;
  bh.weekdays_only = false;
  expect(bh.active(kMonday10amUtcMs - 8 * 3600 * 1000), "02:00 inside window wrapping midnight");
}

void test_gateway_execution_and_cooldown() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(autonomous_caps(), clock);
  std::atomic<int> notified{0};
  gw->set_execution_listener(
      [&notified](const arf::HealingIntent&, const arf::GatewayResponse& resp, double) {
        if (resp.status == arf::GatewayStatus::completed) notified++;
      });

  auto first = make_test_intent("restart_container", "orders");
  auto r = gw->submit(first, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::completed, "autonomous execution completes");
  expect(r.result && r.result->success, "tool result attached");
  expect(notified.load() == 1, "listener invoked after completion");
  expect(gw->audit().entry_count() == 2, "EXECUTING and COMPLETED both audited");

  auto again = first;
  again.parameters = {{"grace_period_seconds", "10"}};
  again.intent_id = arf::compute_intent_id(again.fingerprint, again.tool, again.component,
                                           again.parameters);
  r = gw->submit(again, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.reason.find("cooling down") != std::string::npos,
         "tool+component cooldown enforced");

  clock.advance(300000);
  auto later = again;
  later.parameters = {{"grace_period_seconds", "20"}};
  later.intent_id = arf::compute_intent_id(later.fingerprint, later.tool, later.component,
                                           later.parameters);
  r = gw->submit(later, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::completed, "cooldown elapsed");
}

void test_gateway_approval_flow() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(autonomous_caps(), clock);

  auto pending = gw->submit(make_test_intent("scale_out", "checkout"), arf::ExecutionMode::approval);
  expect(pending.status == arf::GatewayStatus::pending_approval, "approval mode pends");
  expect(pending.approval_id.rfind("apr_", 0) == 0, "approval id prefix");
  expect(gw->pending_count() == 1, "one pending");

  auto done = gw->approve(pending.approval_id);
  expect(done.status == arf::GatewayStatus::completed, "approved request executes");
  expect(gw->pending_count() == 0, "approval consumed");

  auto to_reject =
      gw->submit(make_test_intent("traffic_shift", "checkout", 2), arf::ExecutionMode::approval);
  auto rejected = gw->reject(to_reject.approval_id, "not now");
  expect(rejected.status == arf::GatewayStatus::rejected && rejected.reason == "not now",
         "rejection recorded");

  auto to_expire =
      gw->submit(make_test_intent("alert_team", "checkout", 0), arf::ExecutionMode::approval);
  clock.advance(900000);
  expect(gw->expire_pending() == 1, "overdue approval expired");
  auto looked = gw->lookup(to_expire.intent_id);
  expect(looked && looked->status == arf::GatewayStatus::expired, "expired status recorded");

  auto missing = gw->approve("apr_doesnotexist00");
  expect(missing.error == arf::ErrorCode::approval_not_found, "unknown approval id");
  expect(gw->audit().verify_chain(), "audit chain intact after approvals");
}

void test_gateway_tool_timeout_and_throw() {
  ManualClock clock(kMonday10amUtcMs);
  auto registry = std::make_shared<arf::ToolRegistry>();
  expect(registry->register_tool(std::make_shared<SleepyTool>()), "register sleepy");
  expect(registry->register_tool(std::make_shared<ThrowingTool>()), "register explosive");
  expect(!registry->register_tool(std::make_shared<ThrowingTool>()), "duplicate name refused");
  arf::SafetyGateway gw(arf::GatewayConfig{}, autonomous_caps(), registry,
                        std::make_shared<arf::AuditTrail>(), clock.fn());

  auto slow = gw.submit(make_test_intent("sleepy", "batch"), arf::ExecutionMode::autonomous);
  expect(slow.status == arf::GatewayStatus::failed && slow.error == arf::ErrorCode::tool_timeout,
         "timeout → FAILED tool_timeout");

  auto boom = gw.submit(make_test_intent("explosive", "batch"), arf::ExecutionMode::autonomous);
  expect(boom.status == arf::GatewayStatus::failed &&
             boom.error == arf::ErrorCode::tool_execution_error,
         "throw → FAILED tool_execution_error");
  expect(boom.reason.find("backend exploded") != std::string::npos, "exception text kept");
}

void test_rollback_requires_backup() {
  ManualClock clock(kMonday10amUtcMs);
  auto registry = arf::make_builtin_registry(std::make_shared<arf::LoggingBackend>(false));
  arf::SafetyGateway gw(arf::GatewayConfig{}, autonomous_caps(), registry,
                        std::make_shared<arf::AuditTrail>(), clock.fn());
  expect(registry->names().size() == 6, "six built-in tools");
  auto r = gw.submit(make_test_intent("rollback", "payments"), arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied, "rollback denied without backup");
}

void test_gateway_business_hours_ignores_intent_claim() {
  ManualClock clock(kMonday10amUtcMs);
  arf::GatewayConfig cfg;
  cfg.business_hours.enabled = true;
  auto gw = make_gateway(autonomous_caps(), clock, cfg);

  auto claimed = make_test_intent("restart_container", "shop", 1, true);
  auto r = gw->submit(claimed, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.reason.find("business-hours") != std::string::npos,
         "tool metadata overrides the intent's business-hours flag");
  expect(!r.result.has_value(), "nothing executed");
}

void test_gateway_validate_throw_is_denied() {
  ManualClock clock(kMonday10amUtcMs);
  auto registry = std::make_shared<arf::ToolRegistry>();
  expect(registry->register_tool(std::make_shared<FaultyValidatorTool>()), "register faulty");
  arf::SafetyGateway gw(arf::GatewayConfig{}, autonomous_caps(), registry,
                        std::make_shared<arf::AuditTrail>(), clock.fn());

  auto intent = make_test_intent("faulty_check", "billing");
  auto r = gw.submit(intent, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.error == arf::ErrorCode::tool_execution_error,
         "throwing validate() → DENIED tool_execution_error");
  expect(r.reason.find("precondition service down") != std::string::npos, "exception text kept");
  expect(gw.audit().entry_count() == 1, "denial audited");
  auto again = gw.submit(intent, arf::ExecutionMode::autonomous);
  expect(again.duplicate && again.status == arf::GatewayStatus::denied,
         "resubmission returns the recorded denial");
}

void test_rollback_backend_throw_is_denied() {
  ManualClock clock(kMonday10amUtcMs);
  auto registry = arf::make_builtin_registry(std::make_shared<UnreachableBackupBackend>());
  arf::SafetyGateway gw(arf::GatewayConfig{}, autonomous_caps(), registry,
                        std::make_shared<arf::AuditTrail>(), clock.fn());

  auto intent = make_test_intent("rollback", "payments");
  auto r = gw.submit(intent, arf::ExecutionMode::autonomous);
  expect(r.status == arf::GatewayStatus::denied &&
             r.error == arf::ErrorCode::tool_execution_error,
         "backend throw during validation → DENIED");
  expect(r.reason.find("backup API unreachable") != std::string::npos, "backend message kept");
  expect(gw.audit().entry_count() == 1, "denial audited");
  auto stored = gw.lookup(intent.intent_id);
  expect(stored && stored->status == arf::GatewayStatus::denied, "denial remembered");
  auto again = gw.submit(intent, arf::ExecutionMode::autonomous);
  expect(again.duplicate && again.status == arf::GatewayStatus::denied,
         "resubmission is not stuck in VALIDATING");
}

void test_gateway_approval_expires_untouched() {
  ManualClock clock(kMonday10amUtcMs);
  auto gw = make_gateway(autonomous_caps(), clock);

  auto pending = gw->submit(make_test_intent("scale_out", "idle"), arf::ExecutionMode::approval);
  expect(pending.status == arf::GatewayStatus::pending_approval, "approval pends");
  clock.advance(900000);

  auto looked = gw->lookup(pending.intent_id);
  expect(looked && looked->status == arf::GatewayStatus::expired,
         "lookup reports EXPIRED without a manual sweep");
  expect(gw->pending_count() == 0, "expired approval removed");

  auto late = gw->approve(pending.approval_id);
  expect(late.status == arf::GatewayStatus::expired &&
             late.error == arf::ErrorCode::approval_expired,
         "approving after expiry reports EXPIRED");
  expect(gw->expire_pending() == 0, "nothing left to sweep");
  expect(gw->audit().verify_chain(), "audit chain intact");
}

// ============================================================================
// Phase 9: Outcome recorder & audit trail
// ============================================================================

void test_recorder_flush_and_counters() {
  auto mem = std::make_shared<arf::IncidentMemory>(
      arf::MemoryConfig{}, std::make_shared<arf::FeatureEmbeddingProvider>());
  auto guarded = std::make_shared<arf::GuardedMemory>(mem, arf::BreakerConfig{});
  arf::OutcomeRecorder recorder(guarded);

  auto inc = mem->record_incident(make_event("recorded", 400, 0.2, 100));
  expect(inc.has_value(), "incident recorded");
  arf::OutcomeReport report;
  report.incident_id = *inc;
  report.actions = {"restart_container"};
  report.success = true;
  report.duration_minutes = 2.5;
  expect(recorder.submit(report), "submit accepted");
  expect(recorder.submit(report), "duplicate submit accepted");
  expect(recorder.report_manual("inc_ffffffffffffffff", {"scale_out"}, true, 1.0, ""),
         "manual report accepted");
  recorder.flush();

  auto s = recorder.stats();
  expect(s.submitted == 3, "three submitted");
  expect(s.stored == 1 && s.duplicates == 1, "one stored, one duplicate");
  expect(s.failures == 1, "unknown incident counted as failure");
  expect(mem->find_incident(*inc)->outcome_ids.size() == 1, "outcome linked to incident");

  recorder.stop();
  recorder.stop();
  expect(!recorder.submit(report), "submit refused after stop");
}

void test_audit_chain_and_export() {
  auto path = fs::temp_directory_path() / "arf_audit_test.ndjson";
  fs::remove(path);
  {
    arf::AuditTrail trail(path.string());
    for (int i = 0; i < 3; ++i) {
      arf::ExecutionRecord rec;
      rec.intent_id = "intent_" + std::to_string(i);
      rec.tool = "scale_out";
      rec.status = arf::GatewayStatus::advisory_only;
      rec.received_ms = 1000 + i;
      expect(trail.append(rec) == static_cast<uint64_t>(i + 1), "monotonic sequence");
    }
    expect(trail.verify_chain(), "chain verifies");
    const std::string nd = trail.export_ndjson();
    expect(std::count(nd.begin(), nd.end(), '\n') == 3, "one line per entry");
    expect(trail.records()[1].previous_digest.size() == 64, "entries link by digest");
    expect(trail.sink_failure_count() == 0, "file sink healthy");
    if (auto packed = trail.export_compressed()) {
      auto unpacked = arf::decompress_export(*packed);
      expect(unpacked && *unpacked == nd, "compressed export round-trips");
    }
  }
  std::ifstream ifs(path);
  std::string line;
  int lines = 0;
  while (std::getline(ifs, line)) ++lines;
  expect(lines == 3, "file sink persisted every entry");
  fs::remove(path);
}

// ============================================================================
// Phase 10: Configuration
// ============================================================================

void test_config_parse() {
  auto r = arf::parse_config(R"({
    "memory": {"max_incidents": 50, "breaker": {"failure_threshold": 5}},
    "gateway": {"max_blast_radius": 2, "business_hours": {"enabled": true, "start_hour": 8}},
    "pipeline": {"analysis_timeout_ms": 2500, "default_mode": "APPROVAL"}
  })");
  expect(r.ok, "config parses");
  expect(r.config.memory.max_incidents == 50, "memory.max_incidents");
  expect(r.config.memory_breaker.failure_threshold == 5, "memory breaker threshold");
  expect(r.config.gateway.max_blast_radius == 2, "gateway.max_blast_radius");
  expect(r.config.gateway.business_hours.enabled && r.config.gateway.business_hours.start_hour == 8,
         "business hours");
  expect(r.config.analysis_timeout_ms == 2500, "analysis timeout");
  expect(r.config.default_mode == arf::ExecutionMode::approval, "default mode");
  expect(r.config.policies.size() == 5, "defaults kept when no policies given");

  auto dup = arf::parse_config("{\"memory\":{},\"memory\":{}}");
  expect(!dup.ok && dup.error == arf::ErrorCode::json_duplicate_key, "duplicate key fatal");
}

void test_config_env_overrides() {
  setenv("ARF_MAX_INCIDENTS", "77", 1);
  setenv("ARF_BUSINESS_HOURS", "8-18", 1);
  setenv("ARF_ANALYSIS_TIMEOUT_MS", "-5", 1);
  arf::EngineConfig cfg;
  auto errors = arf::apply_env_overrides(cfg);
  unsetenv("ARF_MAX_INCIDENTS");
  unsetenv("ARF_BUSINESS_HOURS");
  unsetenv("ARF_ANALYSIS_TIMEOUT_MS");

  expect(cfg.memory.max_incidents == 77, "ARF_MAX_INCIDENTS applied");
  expect(cfg.gateway.business_hours.enabled && cfg.gateway.business_hours.start_hour == 8 &&
             cfg.gateway.business_hours.end_hour == 18,
         "ARF_BUSINESS_HOURS applied");
  expect(errors.size() == 1, "malformed variable reported");
  expect(cfg.analysis_timeout_ms == 10000, "malformed variable leaves default");
}

void test_config_validation() {
  arf::EngineConfig cfg;
  expect(arf::validate_config(cfg).empty(), "defaults validate");
  cfg.classifier.alpha = 0.0;
  cfg.classifier.thresholds.latency_warning_ms = 400;
  expect(arf::validate_config(cfg).size() >= 2, "bad alpha and latency ladder reported");
  const std::string json = arf::config_to_json(arf::EngineConfig{});
  expect(json.find("\"analysis_timeout_ms\"") != std::string::npos, "config_to_json");
}

// ============================================================================
// Phase 11: Pipeline end-to-end
// ============================================================================

std::set<std::string> intent_ids(const arf::PipelineResult& r) {
  std::set<std::string> ids;
  for (const auto& i : r.healing_intents) ids.insert(i.intent_id);
  return ids;
}

void test_pipeline_scenario() {
  ManualClock clock(kMonday10amUtcMs);
  arf::EngineOptions opts;
  opts.clock = clock.fn();
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{}, opts);
  arf::Pipeline pipeline(ctx);

  auto r = pipeline.process(scenario_raw());
  expect(r.status == "INTENTS_EMITTED", "scenario emits intents, got " + r.status);
  expect(r.classification && r.classification->bucket >= arf::AnomalyBucket::critical,
         "scenario classified CRITICAL or above");
  expect(std::find(r.policies_fired.begin(), r.policies_fired.end(), "cascading_failure") !=
             r.policies_fired.end(),
         "error_rate > 0.15 policy fired");
  expect(!r.healing_intents.empty(), "intent list non-empty");
  for (const auto& g : r.gateway_responses) {
    expect(g.status == arf::GatewayStatus::advisory_only, "advisory deployment");
  }
  expect(r.business_impact && r.business_impact->severity_level == "CRITICAL", "impact attached");
  expect(r.incident_id.rfind("inc_", 0) == 0, "incident recorded");
  expect(r.recall_available, "memory reachable");

  // Same engine, cooldowns elapsed: same ids, recognised as duplicates.
  clock.advance(20 * 60 * 1000);
  auto again = pipeline.process(scenario_raw());
  expect(intent_ids(again) == intent_ids(r), "identical ids across repeated submissions");
  for (const auto& g : again.gateway_responses) expect(g.duplicate, "gateway spots the repeat");
  expect(again.similar_incidents >= 1, "recall sees the first incident");
  expect(ctx->memory->incident_count() == 1, "one incident per fingerprint");

  // Fresh engine, same event: same ids.
  auto other = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{}, opts);
  arf::Pipeline second(other);
  expect(intent_ids(second.process(scenario_raw())) == intent_ids(r),
         "ids independent of engine instance");

  const std::string json = r.to_json();
  std::optional<arf::jsonlite::JsonError> err;
  auto doc = arf::jsonlite::parse(json, &err);
  expect(!err, "result JSON parses");
  expect(arf::jsonlite::get_string(doc, "status") == "INTENTS_EMITTED", "status serialized");
}

void test_pipeline_rejection_has_no_side_effects() {
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{});
  arf::Pipeline pipeline(ctx);
  auto raw = scenario_raw();
  raw["error_rate"] = "-0.1";
  const int before = g_validation_rejected_lines.load();
  auto r = pipeline.process(raw);
  expect(r.status == "REJECTED", "negative error_rate rejected");
  expect(r.rejected_field == "error_rate", "rejection names error_rate");
  expect(g_validation_rejected_lines.load() == before + 1, "rejection logged");
  expect(ctx->memory->incident_count() == 0, "no memory side effect");
  expect(ctx->policy_engine->tracked_components() == 0, "no policy side effect");
  expect(ctx->classifier->tracked_components() == 0, "no baseline side effect");
  expect(ctx->audit->entry_count() == 0, "nothing reached the gateway");
  expect(ctx->stats->events_rejected.load() == 1, "rejection counted");
}

void test_pipeline_cancellation() {
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{});
  arf::Pipeline pipeline(ctx);
  arf::CancellationToken token;
  token.cancel();
  auto r = pipeline.process(scenario_raw(), &token);
  expect(r.status == "CANCELLED", "cancelled before processing");
  expect(ctx->memory->incident_count() == 0, "no incident after cancel");
  expect(ctx->policy_engine->tracked_components() == 0, "no policy commit after cancel");
  expect(ctx->audit->entry_count() == 0, "no gateway submission after cancel");
}

void test_pipeline_analysis_timeout_degrades() {
  arf::EngineConfig cfg;
  cfg.analysis_timeout_ms = 100;
  arf::EngineOptions opts;
  opts.embedder = std::make_shared<SlowEmbedder>();
  auto ctx = arf::EngineContext::create(cfg, arf::Capabilities{}, opts);
  arf::Pipeline pipeline(ctx);
  auto r = pipeline.process(scenario_raw());
  expect(r.status == "INTENTS_EMITTED", "late recall does not fail the event");
  expect(!r.recall_available, "recall unavailable after timeout");
  bool saw_timeout = false;
  for (const auto& e : r.errors) {
    if (e.rfind("analysis_timeout", 0) == 0) saw_timeout = true;
  }
  expect(saw_timeout, "timeout listed in errors");
  expect(ctx->stats->analysis_timeouts.load() >= 1, "timeout counted");
}

void test_pipeline_memory_unavailable_degrades() {
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{});
  ctx->guarded_memory->set_fault_injector([](std::string_view) { return true; });
  arf::Pipeline pipeline(ctx);
  auto r = pipeline.process(scenario_raw());
  expect(r.status == "INTENTS_EMITTED", "memory outage does not fail the event");
  expect(!r.recall_available, "no historical context");
  expect(r.incident_id == arf::incident_id_for(r.fingerprint), "fallback incident id");
  expect(ctx->stats->memory_unavailable.load() >= 1, "outage counted");
}

void test_pipeline_autonomous_feeds_recorder() {
  arf::EngineConfig cfg;
  cfg.default_mode = arf::ExecutionMode::autonomous;
  auto ctx = arf::EngineContext::create(cfg, autonomous_caps());
  arf::Pipeline pipeline(ctx);
  auto r = pipeline.process(scenario_raw());
  bool completed = false;
  for (const auto& g : r.gateway_responses) {
    if (g.status == arf::GatewayStatus::completed) completed = true;
  }
  expect(completed, "granted capability executes at least one tool");
  ctx->recorder->flush();
  expect(ctx->recorder->stats().stored >= 1, "completion recorded as outcome");
  auto inc = ctx->memory->find_incident(r.incident_id);
  expect(inc && !inc->outcome_ids.empty(), "outcome linked to the incident");
  ctx->shutdown();
}

void test_pipeline_process_json() {
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{});
  arf::Pipeline pipeline(ctx);
  auto r = pipeline.process_json(
      R"({"component":"api-service","latency_p99":320,"error_rate":0.18,"throughput":1250,"cpu_util":0.87,"memory_util":0.92})");
  expect(r.status == "INTENTS_EMITTED", "JSON ingestion processes");
  auto bad = pipeline.process_json("{\"component\":");
  expect(bad.status == "REJECTED", "malformed JSON rejected");
}

void test_pipeline_stats_json() {
  auto ctx = arf::EngineContext::create(arf::EngineConfig{}, arf::Capabilities{});
  arf::Pipeline pipeline(ctx);
  pipeline.process(scenario_raw());
  const std::string json = ctx->stats->to_json();
  std::optional<arf::jsonlite::JsonError> err;
  arf::jsonlite::parse(json, &err);
  expect(!err, "stats JSON parses");
  expect(ctx->stats->latency_histogram.count() == 1, "latency recorded");
  expect(ctx->stats->events_processed.load() == 1, "processed counted");
}

}  // namespace

int main() {
  arf::set_log_level(arf::LogLevel::warn);
  arf::set_log_hook(&capture_log);

  std::cout << "=== arf_tests ===\n";

  std::cout << "\n[Phase 1] Hashing & fingerprint authority\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation + short ids", test_domain_separation);
  run_test("fingerprint determinism", test_fingerprint_determinism);
  run_test("fingerprint no collisions", test_fingerprint_no_collisions);
  run_test("fingerprint sub-micro precision", test_fingerprint_sub_micro_precision);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] jsonlite\n";
  run_test("sorted keys", test_json_sorted_keys);
  run_test("duplicate keys and NaN rejected", test_json_rejects_duplicates_and_nan);
  run_test("typed getters", test_json_typed_getters);

  std::cout << "\n[Phase 3] Validation\n";
  run_test("negative error_rate rejected", test_validator_rejects_negative_error_rate);
  run_test("field contract", test_validator_field_contract);
  run_test("derived severity", test_validator_severity);

  std::cout << "\n[Phase 4] Classification\n";
  run_test("scenario classified critical", test_classifier_scenario_critical);
  run_test("baseline warmup", test_classifier_baseline_warmup);
  run_test("restored baseline", test_classifier_restore_baseline);
  run_test("bucket boundaries", test_bucket_boundaries);

  std::cout << "\n[Phase 5] Incident memory + circuit breaker\n";
  run_test("incident dedupe + outcome idempotence", test_memory_dedupe_and_outcome_idempotence);
  run_test("eviction + recall", test_memory_eviction_and_recall);
  run_test("most effective actions", test_most_effective_actions);
  run_test("breaker opens and recovers", test_breaker_opens_and_half_opens);
  run_test("half-open single permit", test_breaker_half_open_single_permit);
  run_test("non-standard throw returns trial permit",
           test_breaker_non_standard_throw_returns_permit);
  run_test("sharded LRU global capacity", test_sharded_lru_global_capacity);

  std::cout << "\n[Phase 6] Policy engine\n";
  run_test("rate limit under concurrency", test_policy_rate_limit_concurrent);
  run_test("rate limit with shard neighbours", test_policy_rate_limit_with_shared_shard);
  run_test("clock step back keeps cooldown", test_policy_clock_step_back_keeps_cooldown);
  run_test("cooldown + preview", test_policy_cooldown_and_preview);
  run_test("priority + terminal", test_policy_priority_and_terminal);
  run_test("malformed policy skipped", test_policy_malformed_skipped);
  run_test("min bucket + absent metric", test_policy_min_bucket_and_absent_metric);
  run_test("policy JSON load", test_policy_json_load);
  run_test("default policies well-formed", test_default_policies_well_formed);

  std::cout << "\n[Phase 7] Intents + business impact\n";
  run_test("intent id determinism", test_intent_id_determinism);
  run_test("confidence + sanitization", test_intent_confidence_and_sanitize);
  run_test("business impact scenario", test_business_impact_scenario);

  std::cout << "\n[Phase 8] Safety gateway\n";
  run_test("capability false never completes", test_gateway_capability_false_never_completes);
  run_test("duplicate intent", test_gateway_duplicate_intent);
  run_test("validation order", test_gateway_validation_order);
  run_test("business hours", test_gateway_business_hours);
  run_test("execution + cooldown", test_gateway_execution_and_cooldown);
  run_test("approval flow", test_gateway_approval_flow);
  run_test("tool timeout + throw", test_gateway_tool_timeout_and_throw);
  run_test("rollback requires backup", test_rollback_requires_backup);
  run_test("business hours ignores intent claim", test_gateway_business_hours_ignores_intent_claim);
  run_test("throwing validate denied", test_gateway_validate_throw_is_denied);
  run_test("rollback backend throw denied", test_rollback_backend_throw_is_denied);
  run_test("approval expires untouched", test_gateway_approval_expires_untouched);

  std::cout << "\n[Phase 9] Outcome recorder + audit trail\n";
  run_test("recorder flush + counters", test_recorder_flush_and_counters);
  run_test("audit chain + export", test_audit_chain_and_export);

  std::cout << "\n[Phase 10] Configuration\n";
  run_test("config parse", test_config_parse);
  run_test("env overrides", test_config_env_overrides);
  run_test("config validation", test_config_validation);

  std::cout << "\n[Phase 11] Pipeline end-to-end\n";
  run_test("scenario", test_pipeline_scenario);
  run_test("rejection has no side effects", test_pipeline_rejection_has_no_side_effects);
  run_test("cancellation", test_pipeline_cancellation);
  run_test("analysis timeout degrades", test_pipeline_analysis_timeout_degrades);
  run_test("memory outage degrades", test_pipeline_memory_unavailable_degrades);
  run_test("autonomous execution feeds recorder", test_pipeline_autonomous_feeds_recorder);
  run_test("JSON ingestion", test_pipeline_process_json);
  run_test("stats JSON", test_pipeline_stats_json);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
