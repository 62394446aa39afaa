#pragma once

// arf/memory.hpp — Incident-Outcome Memory.
//
// A graph of IncidentNodes (one per event fingerprint) linked by RESOLVED_BY
// edges to the OutcomeNodes recorded against them, with nearest-neighbour
// recall over event embeddings.
//
// DESIGN INVARIANTS:
//   1. DEDUPLICATION: at most one IncidentNode per fingerprint.
//   2. OWNERSHIP: every OutcomeNode references a live IncidentNode; evicting an
//      incident removes its outcomes in the same transaction.
//   3. IDEMPOTENCE: store_outcome() for the same (incident, actions,
//      timestamp bucket) returns the existing outcome id.
//   4. BOUNDED: incident count never exceeds max_incidents after a transaction
//      completes; the least-recently-accessed incident is evicted first.
//      Access = record_incident(), recall() hits and store_outcome().
//
// CONCURRENCY:
//   One mutex per instance guards every transaction (coarse-grained: one
//   logical writer at a time, readers serialized behind the same lock).
//
// EXTENSION_POINT: ann_index
//   Current: exact brute-force L2 scan, O(n * dim) per recall, which satisfies
//   the approximate-nearest-neighbour contract trivially at max_incidents=1000.
//   Upgrade path: HNSW index maintained alongside nodes_; eviction must remove
//   the node from the index in the same transaction.

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "arf/circuit_breaker.hpp"
#include "arf/types.hpp"

namespace arf {

// ---------------------------------------------------------------------------
// EmbeddingProvider — external collaborator
// ---------------------------------------------------------------------------
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;
  virtual size_t dimension() const = 0;
  virtual std::vector<float> embed(const Event& e) const = 0;
};

// Deterministic feature embedding: normalised metrics in the leading slots and
// a hashed component signature spread over the remaining slots.
class FeatureEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit FeatureEmbeddingProvider(size_t dimension = 384);
  size_t dimension() const override { return dimension_; }
  std::vector<float> embed(const Event& e) const override;

 private:
  size_t dimension_;
};

// ---------------------------------------------------------------------------
// Graph nodes
// ---------------------------------------------------------------------------
struct IncidentNode {
  std::string id;                       // "inc_" + 16 hex of fingerprint
  Event event;
  std::vector<float> embedding;
  uint64_t created_ms{0};
  uint64_t last_access_ms{0};
  std::vector<std::string> outcome_ids; // RESOLVED_BY edges, insertion order
};

struct OutcomeNode {
  std::string id;                       // "out_" + 16 hex
  std::string incident_id;
  std::vector<std::string> actions;
  bool success{false};
  double resolution_minutes{0.0};
  std::string lessons;
  uint64_t recorded_ms{0};
};

struct RecallHit {
  IncidentNode incident;
  std::vector<OutcomeNode> outcomes;
  double distance{0.0};
  double success_rate{0.0};             // over outcomes; 0 when none
};

struct StoreOutcomeResult {
  bool ok{false};
  bool duplicate{false};
  std::string outcome_id;
  ErrorCode error{ErrorCode::none};
  std::string message;
};

struct ActionEffectiveness {
  std::string action;
  uint32_t successes{0};
  uint32_t attempts{0};
  double success_rate{0.0};
};

struct MemoryStats {
  uint64_t incidents{0};
  uint64_t outcomes{0};
  uint64_t evictions{0};
  uint64_t duplicate_outcomes{0};
  uint64_t recall_queries{0};
};

struct MemoryConfig {
  size_t max_incidents{1000};
  uint64_t outcome_bucket_ms{60000};
  size_t max_lessons_length{4000};
};

std::string incident_id_for(std::string_view fingerprint);

// ---------------------------------------------------------------------------
// IncidentMemory
// ---------------------------------------------------------------------------
// Operations that can fail for infrastructure reasons (embedding failure,
// dimension mismatch) return nullopt; the guarded wrapper counts those as
// breaker failures.
class IncidentMemory {
 public:
  IncidentMemory(MemoryConfig config, std::shared_ptr<const EmbeddingProvider> embedder,
                 ClockFn clock = {});

  // Returns the incident id, creating the node on first sight of the fingerprint.
  std::optional<std::string> record_incident(const Event& e);

  // Up to k most similar incidents: ascending distance, ties newest first.
  std::optional<std::vector<RecallHit>> recall(const Event& e, size_t k);

  std::optional<StoreOutcomeResult> store_outcome(const std::string& incident_id,
                                                  const std::vector<std::string>& actions,
                                                  bool success, double duration_minutes,
                                                  const std::string& lessons);

  std::vector<ActionEffectiveness> most_effective_actions(const std::string& component,
                                                          size_t k) const;

  std::optional<IncidentNode> find_incident(const std::string& incident_id) const;
  std::optional<OutcomeNode> find_outcome(const std::string& outcome_id) const;
  bool contains(const std::string& incident_id) const;
  size_t incident_count() const;
  MemoryStats stats() const;

 private:
  struct Slot {
    IncidentNode node;
    std::list<std::string>::iterator lru_it;
  };

  std::optional<std::vector<float>> embed_checked(const Event& e) const;
  void touch_locked(Slot& slot, uint64_t now);
  void evict_locked();

  MemoryConfig config_;
  std::shared_ptr<const EmbeddingProvider> embedder_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> incidents_;          // id → node
  std::unordered_map<std::string, std::string> by_fingerprint_;
  std::unordered_map<std::string, OutcomeNode> outcomes_;
  std::list<std::string> lru_;                               // front = most recent
  MemoryStats stats_;
};

// ---------------------------------------------------------------------------
// GuardedMemory — every call goes through a CircuitBreaker
// ---------------------------------------------------------------------------
// A breaker-open response means "no historical context available"; callers
// must degrade, never fail the pipeline.
class GuardedMemory {
 public:
  // Returns true to simulate a failure of the named operation. Test seam for
  // resilience drills; unset in production.
  using FaultInjector = std::function<bool(std::string_view operation)>;

  GuardedMemory(std::shared_ptr<IncidentMemory> memory, BreakerConfig breaker_config,
                ClockFn clock = {});

  BreakerResult<std::string> record_incident(const Event& e);
  BreakerResult<std::vector<RecallHit>> recall(const Event& e, size_t k);
  BreakerResult<StoreOutcomeResult> store_outcome(const std::string& incident_id,
                                                  const std::vector<std::string>& actions,
                                                  bool success, double duration_minutes,
                                                  const std::string& lessons);
  BreakerResult<std::vector<ActionEffectiveness>> most_effective_actions(
      const std::string& component, size_t k);

  CircuitBreaker& breaker() { return breaker_; }
  const CircuitBreaker& breaker() const { return breaker_; }
  IncidentMemory& memory() { return *memory_; }
  void set_fault_injector(FaultInjector injector);

 private:
  bool inject_fault(std::string_view operation) const;

  std::shared_ptr<IncidentMemory> memory_;
  CircuitBreaker breaker_;
  mutable std::mutex injector_mu_;
  FaultInjector injector_;
};

}  // namespace arf
