#pragma once

// arf/pipeline.hpp — Decision-and-safety pipeline and its explicit context.
//
// STAGES (per event):
//   1. validate            pure; rejects never reach any later stage
//   2. score               classifier read-only
//   3. analyse             recall + policy preview in parallel, one deadline
//   4. cancel checkpoint   last point at which the call may stop
//   5. commit              baseline update, incident record, policy firings
//   6. intents             deterministic ids
//   7. gateway             submit each intent
//   8. business impact     injected estimator
//
// DESIGN INVARIANTS:
//   1. Nothing before stage 5 mutates shared state other than memory LRU
//      recency, so a rejected, cancelled or timed-out event leaves baselines,
//      incidents and cooldowns untouched.
//   2. A late or failed analysis branch degrades to "no data" (recall) or
//      "no actions" (policy). It never fails the event.
//   3. No exception escapes process().
//
// EXTENSION_POINT: ingestion_transport
//   Current: in-process calls with RawEvent or a JSON document.
//   Upgrade: a transport adapter (HTTP, Kafka) owns decoding and calls
//   process(); the pipeline stays transport-agnostic.

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arf/audit.hpp"
#include "arf/classifier.hpp"
#include "arf/config.hpp"
#include "arf/gateway.hpp"
#include "arf/memory.hpp"
#include "arf/observability.hpp"
#include "arf/policy.hpp"
#include "arf/recorder.hpp"
#include "arf/tool.hpp"
#include "arf/types.hpp"
#include "arf/validator.hpp"

namespace arf {

class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

// Collaborators a host may replace. Unset members get the built-in default.
struct EngineOptions {
  std::shared_ptr<const EmbeddingProvider> embedder;
  std::shared_ptr<RemediationBackend> backend;
  std::shared_ptr<ToolRegistry> registry;
  BusinessImpactFn impact;
  ClockFn clock;
};

// Every long-lived component, built once at startup and shared by reference.
struct EngineContext {
  EngineConfig config;
  Capabilities capabilities;
  ClockFn clock;
  BusinessImpactFn impact;

  std::shared_ptr<PipelineStats> stats;
  std::shared_ptr<AnomalyClassifier> classifier;
  std::shared_ptr<IncidentMemory> memory;
  std::shared_ptr<GuardedMemory> guarded_memory;
  std::shared_ptr<PolicyEngine> policy_engine;
  std::shared_ptr<ToolRegistry> tools;
  std::shared_ptr<AuditTrail> audit;
  std::shared_ptr<SafetyGateway> gateway;
  std::shared_ptr<OutcomeRecorder> recorder;

  static std::shared_ptr<EngineContext> create(EngineConfig config, Capabilities capabilities,
                                               EngineOptions options = {});

  // Drains and stops the outcome recorder. Idempotent.
  void shutdown();
  ~EngineContext();
};

struct PipelineResult {
  std::string status;                  // REJECTED | CANCELLED | NO_ACTION | INTENTS_EMITTED
  std::string fingerprint;
  std::string incident_id;
  std::optional<Classification> classification;
  std::vector<HealingIntent> healing_intents;
  std::vector<GatewayResponse> gateway_responses;
  std::optional<BusinessImpact> business_impact;
  std::vector<std::string> policies_fired;
  uint32_t similar_incidents{0};
  bool recall_available{false};
  std::string rejected_field;          // set when REJECTED
  std::vector<std::string> errors;     // degradations, "code: detail"

  std::string to_json() const;
};

class Pipeline {
 public:
  explicit Pipeline(std::shared_ptr<EngineContext> ctx);

  // mode defaults to config.default_mode.
  PipelineResult process(const RawEvent& raw, const CancellationToken* token = nullptr,
                         std::optional<ExecutionMode> mode = std::nullopt);

  PipelineResult process_json(const std::string& json, const CancellationToken* token = nullptr,
                              std::optional<ExecutionMode> mode = std::nullopt);

  EngineContext& context() { return *ctx_; }

 private:
  PipelineResult run(const ValidationResult& v, const CancellationToken* token,
                     ExecutionMode mode);
  PipelineResult finish(PipelineResult r, const Event* e, uint64_t duration_ns);

  std::shared_ptr<EngineContext> ctx_;
};

}  // namespace arf
