#include "arf/memory.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "arf/hash.hpp"
#include "arf/observability.hpp"

namespace arf {

namespace {

constexpr size_t kMetricSlots = 5;

double l2_distance(const std::vector<float>& a, const std::vector<float>& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    sum += d * d;
  }
  return std::sqrt(sum);
}

std::string join_actions(const std::vector<std::string>& actions) {
  std::string out;
  for (size_t i = 0; i < actions.size(); ++i) {
    if (i) out += ',';
    out += actions[i];
  }
  return out;
}

}  // namespace

std::string incident_id_for(std::string_view fingerprint) {
  return short_id("inc_", fingerprint);
}

// ---------------------------------------------------------------------------
// FeatureEmbeddingProvider
// ---------------------------------------------------------------------------

FeatureEmbeddingProvider::FeatureEmbeddingProvider(size_t dimension)
    : dimension_(std::max<size_t>(dimension, kMetricSlots + 3)) {}

std::vector<float> FeatureEmbeddingProvider::embed(const Event& e) const {
  std::vector<float> v(dimension_, 0.0f);
  v[0] = static_cast<float>(std::log1p(e.latency_p99) / std::log1p(300000.0));
  v[1] = static_cast<float>(e.error_rate);
  v[2] = static_cast<float>(std::min(1.0, std::log1p(e.throughput) / std::log1p(1.0e6)));
  v[3] = static_cast<float>(e.cpu_util.value_or(0.0));
  v[4] = static_cast<float>(e.memory_util.value_or(0.0));

  // Component signature: same component → identical block, so recall prefers
  // history of the same service at equal metric distance.
  std::string seed(kEmbedDomain);
  seed += e.component;
  const std::string bytes = hash_bytes_blake3(seed);
  const size_t n = dimension_ - kMetricSlots;
  const float scale = static_cast<float>(2.0 / std::sqrt(static_cast<double>(n)));
  for (size_t i = 0; i < n; ++i) {
    const auto b = static_cast<uint8_t>(static_cast<uint8_t>(bytes[i % bytes.size()]) ^
                                        static_cast<uint8_t>((i / bytes.size()) * 0x9du));
    v[kMetricSlots + i] = (static_cast<float>(b) / 255.0f - 0.5f) * scale;
  }
  return v;
}

// ---------------------------------------------------------------------------
// IncidentMemory
// ---------------------------------------------------------------------------

IncidentMemory::IncidentMemory(MemoryConfig config,
                               std::shared_ptr<const EmbeddingProvider> embedder, ClockFn clock)
    : config_(config), embedder_(std::move(embedder)), clock_(clock_or_system(std::move(clock))) {
  if (config_.max_incidents == 0) config_.max_incidents = 1;
  if (config_.outcome_bucket_ms == 0) config_.outcome_bucket_ms = 1;
}

std::optional<std::vector<float>> IncidentMemory::embed_checked(const Event& e) const {
  if (!embedder_) {
    log_event(LogLevel::error, "memory", "embedding_failed", "no embedding provider configured");
    return std::nullopt;
  }
  std::vector<float> v;
  try {
    v = embedder_->embed(e);
  } catch (const std::exception& ex) {
    log_event(LogLevel::error, "memory", "embedding_failed", ex.what(),
              {{"component", e.component}});
    return std::nullopt;
  }
  if (v.size() != embedder_->dimension()) {
    log_event(LogLevel::error, "memory", "embedding_dimension_mismatch",
              "embedding provider violated its dimension contract",
              {{"expected", std::to_string(embedder_->dimension())},
               {"actual", std::to_string(v.size())}});
    return std::nullopt;
  }
  return v;
}

void IncidentMemory::touch_locked(Slot& slot, uint64_t now) {
  lru_.splice(lru_.begin(), lru_, slot.lru_it);
  slot.node.last_access_ms = now;
}

void IncidentMemory::evict_locked() {
  while (incidents_.size() > config_.max_incidents && !lru_.empty()) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    auto it = incidents_.find(victim);
    if (it == incidents_.end()) continue;
    for (const auto& oid : it->second.node.outcome_ids) outcomes_.erase(oid);
    by_fingerprint_.erase(it->second.node.event.fingerprint);
    incidents_.erase(it);
    ++stats_.evictions;
    log_event(LogLevel::debug, "memory", "incident_evicted", "least-recently-used incident evicted",
              {{"incident_id", victim}});
  }
}

std::optional<std::string> IncidentMemory::record_incident(const Event& e) {
  auto embedding = embed_checked(e);
  if (!embedding) return std::nullopt;

  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);

  auto fp = by_fingerprint_.find(e.fingerprint);
  if (fp != by_fingerprint_.end()) {
    touch_locked(incidents_.at(fp->second), now);
    return fp->second;
  }

  const std::string id = incident_id_for(e.fingerprint);
  auto existing = incidents_.find(id);
  if (existing != incidents_.end()) {
    // 64-bit id prefix collision between distinct fingerprints.
    log_event(LogLevel::warn, "memory", "incident_id_collision",
              "distinct fingerprints share an incident id; reusing existing node",
              {{"incident_id", id}});
    touch_locked(existing->second, now);
    return id;
  }

  lru_.push_front(id);
  Slot slot;
  slot.node.id = id;
  slot.node.event = e;
  slot.node.embedding = std::move(*embedding);
  slot.node.created_ms = now;
  slot.node.last_access_ms = now;
  slot.lru_it = lru_.begin();
  incidents_.emplace(id, std::move(slot));
  by_fingerprint_.emplace(e.fingerprint, id);
  evict_locked();
  return id;
}

std::optional<std::vector<RecallHit>> IncidentMemory::recall(const Event& e, size_t k) {
  auto query = embed_checked(e);
  if (!query) return std::nullopt;

  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  ++stats_.recall_queries;

  struct Candidate {
    double distance;
    Slot* slot;
  };
  std::vector<Candidate> candidates;
  candidates.reserve(incidents_.size());
  for (auto& [id, slot] : incidents_) {
    if (slot.node.embedding.size() != query->size()) continue;
    candidates.push_back({l2_distance(*query, slot.node.embedding), &slot});
  }

  const size_t take = std::min(k, candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(take),
                    candidates.end(), [](const Candidate& a, const Candidate& b) {
                      if (a.distance != b.distance) return a.distance < b.distance;
                      if (a.slot->node.created_ms != b.slot->node.created_ms) {
                        return a.slot->node.created_ms > b.slot->node.created_ms;
                      }
                      return a.slot->node.id < b.slot->node.id;
                    });

  std::vector<RecallHit> hits;
  hits.reserve(take);
  for (size_t i = 0; i < take; ++i) {
    Slot& slot = *candidates[i].slot;
    touch_locked(slot, now);
    RecallHit hit;
    hit.incident = slot.node;
    hit.distance = candidates[i].distance;
    uint32_t successes = 0;
    for (const auto& oid : slot.node.outcome_ids) {
      auto o = outcomes_.find(oid);
      if (o == outcomes_.end()) continue;
      if (o->second.success) ++successes;
      hit.outcomes.push_back(o->second);
    }
    if (!hit.outcomes.empty()) {
      hit.success_rate = static_cast<double>(successes) / static_cast<double>(hit.outcomes.size());
    }
    hits.push_back(std::move(hit));
  }
  return hits;
}

std::optional<StoreOutcomeResult> IncidentMemory::store_outcome(
    const std::string& incident_id, const std::vector<std::string>& actions, bool success,
    double duration_minutes, const std::string& lessons) {
  StoreOutcomeResult r;
  if (actions.empty()) {
    r.error = ErrorCode::validation_error;
    r.message = "actions must not be empty";
    return r;
  }
  if (!std::isfinite(duration_minutes) || duration_minutes < 0.0) {
    r.error = ErrorCode::validation_error;
    r.message = "duration_minutes must be a non-negative number";
    return r;
  }

  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);

  auto inc = incidents_.find(incident_id);
  if (inc == incidents_.end()) {
    r.error = ErrorCode::unknown_incident;
    r.message = "no live incident " + incident_id;
    log_event(LogLevel::warn, "memory", "outcome_for_unknown_incident",
              "outcome dropped: incident unknown or evicted", {{"incident_id", incident_id}});
    return r;
  }

  const uint64_t bucket = now / config_.outcome_bucket_ms;
  const std::string key = incident_id + "\n" + join_actions(actions) + "\n" + std::to_string(bucket);
  const std::string oid = short_id("out_", hash_domain(kOutcomeDomain, key));

  touch_locked(inc->second, now);
  r.ok = true;
  r.outcome_id = oid;
  if (outcomes_.contains(oid)) {
    r.duplicate = true;
    ++stats_.duplicate_outcomes;
    return r;
  }

  OutcomeNode node;
  node.id = oid;
  node.incident_id = incident_id;
  node.actions = actions;
  node.success = success;
  node.resolution_minutes = duration_minutes;
  node.lessons = lessons.substr(0, config_.max_lessons_length);
  node.recorded_ms = now;
  outcomes_.emplace(oid, std::move(node));
  inc->second.node.outcome_ids.push_back(oid);
  return r;
}

std::vector<ActionEffectiveness> IncidentMemory::most_effective_actions(
    const std::string& component, size_t k) const {
  std::map<std::string, ActionEffectiveness> by_action;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, slot] : incidents_) {
      if (slot.node.event.component != component) continue;
      for (const auto& oid : slot.node.outcome_ids) {
        auto o = outcomes_.find(oid);
        if (o == outcomes_.end()) continue;
        std::set<std::string> seen;
        for (const auto& action : o->second.actions) {
          if (!seen.insert(action).second) continue;
          auto& eff = by_action[action];
          eff.action = action;
          ++eff.attempts;
          if (o->second.success) ++eff.successes;
        }
      }
    }
  }

  std::vector<ActionEffectiveness> out;
  out.reserve(by_action.size());
  for (auto& [action, eff] : by_action) {
    eff.success_rate = static_cast<double>(eff.successes) / static_cast<double>(eff.attempts);
    out.push_back(eff);
  }
  std::sort(out.begin(), out.end(), [](const ActionEffectiveness& a, const ActionEffectiveness& b) {
    if (a.success_rate != b.success_rate) return a.success_rate > b.success_rate;
    if (a.attempts != b.attempts) return a.attempts > b.attempts;
    return a.action < b.action;
  });
  if (out.size() > k) out.resize(k);
  return out;
}

std::optional<IncidentNode> IncidentMemory::find_incident(const std::string& incident_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = incidents_.find(incident_id);
  if (it == incidents_.end()) return std::nullopt;
  return it->second.node;
}

std::optional<OutcomeNode> IncidentMemory::find_outcome(const std::string& outcome_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = outcomes_.find(outcome_id);
  if (it == outcomes_.end()) return std::nullopt;
  return it->second;
}

bool IncidentMemory::contains(const std::string& incident_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return incidents_.contains(incident_id);
}

size_t IncidentMemory::incident_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return incidents_.size();
}

MemoryStats IncidentMemory::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  MemoryStats s = stats_;
  s.incidents = incidents_.size();
  s.outcomes = outcomes_.size();
  return s;
}

// ---------------------------------------------------------------------------
// GuardedMemory
// ---------------------------------------------------------------------------

namespace {

template <typename T>
BreakerResult<T> mark_unavailable(BreakerResult<T> r) {
  if (!r.ok()) r.error = ErrorCode::memory_unavailable;
  return r;
}

}  // namespace

GuardedMemory::GuardedMemory(std::shared_ptr<IncidentMemory> memory, BreakerConfig breaker_config,
                             ClockFn clock)
    : memory_(std::move(memory)), breaker_("incident_memory", breaker_config, std::move(clock)) {}

void GuardedMemory::set_fault_injector(FaultInjector injector) {
  std::lock_guard<std::mutex> lk(injector_mu_);
  injector_ = std::move(injector);
}

bool GuardedMemory::inject_fault(std::string_view operation) const {
  std::lock_guard<std::mutex> lk(injector_mu_);
  return injector_ && injector_(operation);
}

BreakerResult<std::string> GuardedMemory::record_incident(const Event& e) {
  return mark_unavailable(breaker_.call([&]() -> std::optional<std::string> {
    if (inject_fault("record_incident")) return std::nullopt;
    return memory_->record_incident(e);
  }));
}

BreakerResult<std::vector<RecallHit>> GuardedMemory::recall(const Event& e, size_t k) {
  return mark_unavailable(breaker_.call([&]() -> std::optional<std::vector<RecallHit>> {
    if (inject_fault("recall")) return std::nullopt;
    return memory_->recall(e, k);
  }));
}

BreakerResult<StoreOutcomeResult> GuardedMemory::store_outcome(
    const std::string& incident_id, const std::vector<std::string>& actions, bool success,
    double duration_minutes, const std::string& lessons) {
  return mark_unavailable(breaker_.call([&]() -> std::optional<StoreOutcomeResult> {
    if (inject_fault("store_outcome")) return std::nullopt;
    return memory_->store_outcome(incident_id, actions, success, duration_minutes, lessons);
  }));
}

BreakerResult<std::vector<ActionEffectiveness>> GuardedMemory::most_effective_actions(
    const std::string& component, size_t k) {
  return mark_unavailable(breaker_.call([&]() -> std::optional<std::vector<ActionEffectiveness>> {
    if (inject_fault("most_effective_actions")) return std::nullopt;
    return memory_->most_effective_actions(component, k);
  }));
}

}  // namespace arf
