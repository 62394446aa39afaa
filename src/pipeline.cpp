#include "arf/pipeline.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <set>

#include "arf/deadline.hpp"
#include "arf/impact.hpp"
#include "arf/intent.hpp"
#include "arf/jsonlite.hpp"
#include "arf/validator.hpp"
#include "arf/version.hpp"

namespace arf {

namespace {

using SteadyClock = std::chrono::steady_clock;

struct RecallBranch {
  BreakerResult<std::vector<RecallHit>> hits;
  BreakerResult<std::vector<ActionEffectiveness>> effective;
};

constexpr size_t kEffectiveActionsConsidered = 16;

bool is_cancelled(const CancellationToken* token) { return token && token->cancelled(); }

// Re-embeds a serialized sub-document. Every *_to_json in the engine emits a
// root object, so the parse cannot fail on our own output.
jsonlite::Value embed(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  return jsonlite::Value{jsonlite::parse(json, &err)};
}

jsonlite::Object classification_object(const Classification& c) {
  jsonlite::Array metrics;
  for (const auto& m : c.metrics) {
    jsonlite::Object o;
    o["metric"] = jsonlite::Value{m.metric};
    o["static_score"] = jsonlite::Value{m.static_score};
    o["dynamic_score"] = jsonlite::Value{m.dynamic_score};
    o["score"] = jsonlite::Value{m.score};
    metrics.push_back(jsonlite::Value{o});
  }
  jsonlite::Object o;
  o["score"] = jsonlite::Value{c.score};
  o["bucket"] = jsonlite::Value{to_string(c.bucket)};
  o["used_static_only"] = jsonlite::Value{c.used_static_only};
  o["metrics"] = jsonlite::Value{metrics};
  if (c.error != ErrorCode::none) o["error"] = jsonlite::Value{to_string(c.error)};
  return o;
}

}  // namespace

// ---------------------------------------------------------------------------
// EngineContext
// ---------------------------------------------------------------------------

std::shared_ptr<EngineContext> EngineContext::create(EngineConfig config,
                                                     Capabilities capabilities,
                                                     EngineOptions options) {
  auto ctx = std::make_shared<EngineContext>();
  ctx->capabilities = capabilities;
  ctx->clock = clock_or_system(std::move(options.clock));
  ctx->impact = options.impact ? std::move(options.impact) : default_impact_estimator(config.impact);
  ctx->stats = std::make_shared<PipelineStats>();
  ctx->classifier = std::make_shared<AnomalyClassifier>(config.classifier);

  std::shared_ptr<const EmbeddingProvider> embedder = options.embedder;
  if (!embedder) embedder = std::make_shared<FeatureEmbeddingProvider>(config.embedding_dimension);
  ctx->memory = std::make_shared<IncidentMemory>(config.memory, embedder, ctx->clock);
  ctx->guarded_memory =
      std::make_shared<GuardedMemory>(ctx->memory, config.memory_breaker, ctx->clock);

  ctx->policy_engine =
      std::make_shared<PolicyEngine>(config.policies, config.policy_engine, ctx->clock);

  std::shared_ptr<RemediationBackend> backend = options.backend;
  if (!backend) backend = std::make_shared<LoggingBackend>();
  ctx->tools = options.registry ? options.registry
                                : make_builtin_registry(backend, config.tool_timeout_ms);

  ctx->audit = std::make_shared<AuditTrail>(config.audit_log_path);
  ctx->gateway = std::make_shared<SafetyGateway>(config.gateway, capabilities, ctx->tools,
                                                 ctx->audit, ctx->clock);
  ctx->recorder = std::make_shared<OutcomeRecorder>(ctx->guarded_memory, config.recorder_queue);

  std::weak_ptr<OutcomeRecorder> weak_recorder = ctx->recorder;
  ctx->gateway->set_execution_listener(
      [weak_recorder](const HealingIntent& intent, const GatewayResponse& resp, double minutes) {
        auto recorder = weak_recorder.lock();
        if (!recorder) return;
        OutcomeReport report;
        report.incident_id = intent.incident_id;
        report.actions = {intent.tool};
        report.success = resp.status == GatewayStatus::completed;
        report.duration_minutes = minutes;
        report.lessons = resp.reason;
        recorder->submit(std::move(report));
      });

  ctx->config = std::move(config);
  log_event(LogLevel::info, "engine", "engine_started", "engine context constructed",
            {{"version", version::ENGINE_SEMVER},
             {"autonomous_execution", capabilities.autonomous_execution ? "true" : "false"},
             {"policies", std::to_string(ctx->policy_engine->policies().size())},
             {"tools", std::to_string(ctx->tools->size())}});
  return ctx;
}

void EngineContext::shutdown() {
  if (recorder) recorder->stop();
}

EngineContext::~EngineContext() { shutdown(); }

// ---------------------------------------------------------------------------
// PipelineResult
// ---------------------------------------------------------------------------

std::string PipelineResult::to_json() const {
  jsonlite::Object o;
  o["status"] = jsonlite::Value{status};
  o["fingerprint"] = jsonlite::Value{fingerprint};
  o["incident_id"] = jsonlite::Value{incident_id};
  if (classification) o["classification"] = jsonlite::Value{classification_object(*classification)};

  jsonlite::Array intents;
  for (const auto& i : healing_intents) intents.push_back(embed(intent_to_json(i)));
  o["healing_intents"] = jsonlite::Value{intents};

  jsonlite::Array responses;
  for (const auto& g : gateway_responses) responses.push_back(embed(gateway_response_to_json(g)));
  o["gateway_responses"] = jsonlite::Value{responses};

  if (business_impact) o["business_impact"] = embed(business_impact_to_json(*business_impact));

  jsonlite::Array fired;
  for (const auto& p : policies_fired) fired.push_back(jsonlite::Value{p});
  o["policies_fired"] = jsonlite::Value{fired};
  o["similar_incidents"] = jsonlite::Value{static_cast<std::uint64_t>(similar_incidents)};
  o["recall_available"] = jsonlite::Value{recall_available};
  if (!rejected_field.empty()) o["rejected_field"] = jsonlite::Value{rejected_field};

  jsonlite::Array errs;
  for (const auto& e : errors) errs.push_back(jsonlite::Value{e});
  o["errors"] = jsonlite::Value{errs};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

Pipeline::Pipeline(std::shared_ptr<EngineContext> ctx) : ctx_(std::move(ctx)) {}

PipelineResult Pipeline::process(const RawEvent& raw, const CancellationToken* token,
                                 std::optional<ExecutionMode> mode) {
  ctx_->stats->events_received.fetch_add(1, std::memory_order_relaxed);
  const ValidationResult v =
      validate_event(raw, ctx_->clock(), ctx_->config.classifier.thresholds);
  return run(v, token, mode.value_or(ctx_->config.default_mode));
}

PipelineResult Pipeline::process_json(const std::string& json, const CancellationToken* token,
                                      std::optional<ExecutionMode> mode) {
  ctx_->stats->events_received.fetch_add(1, std::memory_order_relaxed);
  const ValidationResult v =
      validate_event_json(json, ctx_->clock(), ctx_->config.classifier.thresholds);
  return run(v, token, mode.value_or(ctx_->config.default_mode));
}

PipelineResult Pipeline::finish(PipelineResult r, const Event* e, uint64_t duration_ns) {
  PipelineStats& stats = *ctx_->stats;
  stats.latency_histogram.record(duration_ns);

  PipelineEvent ev;
  ev.fingerprint = r.fingerprint;
  ev.component = e ? e->component : std::string();
  ev.status = r.status;
  if (r.classification) {
    ev.bucket = to_string(r.classification->bucket);
    ev.score = r.classification->score;
  }
  ev.intents = r.healing_intents.size();
  ev.duration_ns = duration_ns;
  emit_pipeline_event(ev);

  log_event(LogLevel::debug, "pipeline", "event_processed", r.status,
            {{"fingerprint", r.fingerprint},
             {"component", ev.component},
             {"intents", std::to_string(ev.intents)},
             {"errors", std::to_string(r.errors.size())}});
  return r;
}

PipelineResult Pipeline::run(const ValidationResult& v, const CancellationToken* token,
                             ExecutionMode mode) {
  const auto started = SteadyClock::now();
  auto elapsed_ns = [&started]() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(SteadyClock::now() - started)
            .count());
  };
  PipelineStats& stats = *ctx_->stats;
  const EngineConfig& config = ctx_->config;

  PipelineResult r;
  if (!v.ok) {
    stats.events_rejected.fetch_add(1, std::memory_order_relaxed);
    r.status = "REJECTED";
    r.rejected_field = v.field;
    r.errors.push_back(to_string(v.error) + ": " + v.field + ": " + v.message);
    return finish(std::move(r), nullptr, elapsed_ns());
  }
  const Event& e = v.event;
  r.fingerprint = e.fingerprint;

  auto cancelled = [&](const char* stage) {
    stats.events_cancelled.fetch_add(1, std::memory_order_relaxed);
    r.status = "CANCELLED";
    r.errors.push_back(std::string(to_string(ErrorCode::cancelled)) + ": before " + stage);
    log_event(LogLevel::info, "pipeline", "event_cancelled", std::string("cancelled before ") + stage,
              {{"fingerprint", e.fingerprint}, {"component", e.component}});
    return finish(std::move(r), &e, elapsed_ns());
  };
  if (is_cancelled(token)) return cancelled("classification");

  // --- score (read-only) ----------------------------------------------------
  const Classification cls = ctx_->classifier->score(e);
  r.classification = cls;
  if (cls.error == ErrorCode::classification_error) {
    stats.classification_errors.fetch_add(1, std::memory_order_relaxed);
    r.errors.push_back("classification_error: baseline reset, static thresholds only");
  }

  // --- analyse: recall || policy preview, one shared deadline ---------------
  const auto deadline = SteadyClock::now() + std::chrono::milliseconds(config.analysis_timeout_ms);
  std::shared_ptr<GuardedMemory> memory = ctx_->guarded_memory;
  std::shared_ptr<PolicyEngine> policies = ctx_->policy_engine;
  const size_t k = config.recall_k;

  std::future<RecallBranch> recall_future = run_detached([memory, e, k]() {
    RecallBranch b;
    b.hits = memory->recall(e, k);
    if (b.hits.ok()) b.effective = memory->most_effective_actions(e.component, kEffectiveActionsConsidered);
    return b;
  });
  std::future<PolicyDecision> policy_future =
      run_detached([policies, e, cls]() { return policies->preview(e, cls); });

  std::vector<RecallHit> hits;
  std::vector<ActionEffectiveness> effective;
  if (recall_future.wait_until(deadline) == std::future_status::ready) {
    try {
      RecallBranch b = recall_future.get();
      if (b.hits.ok()) {
        r.recall_available = true;
        hits = std::move(*b.hits.value);
        if (b.effective.ok()) effective = std::move(*b.effective.value);
      } else {
        stats.memory_unavailable.fetch_add(1, std::memory_order_relaxed);
        r.errors.push_back(to_string(ErrorCode::memory_unavailable) + ": " + b.hits.message);
      }
    } catch (const std::exception& ex) {
      stats.memory_unavailable.fetch_add(1, std::memory_order_relaxed);
      r.errors.push_back(to_string(ErrorCode::memory_unavailable) + ": " + ex.what());
    }
  } else {
    stats.analysis_timeouts.fetch_add(1, std::memory_order_relaxed);
    r.errors.push_back(to_string(ErrorCode::analysis_timeout) + ": recall");
    log_event(LogLevel::warn, "pipeline", "analysis_timeout", "recall branch exceeded deadline",
              {{"component", e.component}});
  }

  PolicyDecision decision;
  if (policy_future.wait_until(deadline) == std::future_status::ready) {
    try {
      decision = policy_future.get();
    } catch (const std::exception& ex) {
      stats.policy_errors.fetch_add(1, std::memory_order_relaxed);
      r.errors.push_back(to_string(ErrorCode::policy_evaluation_error) + ": " + ex.what());
    }
  } else {
    stats.analysis_timeouts.fetch_add(1, std::memory_order_relaxed);
    r.errors.push_back(to_string(ErrorCode::analysis_timeout) + ": policy");
    log_event(LogLevel::warn, "pipeline", "analysis_timeout", "policy branch exceeded deadline",
              {{"component", e.component}});
  }
  for (const auto& name : decision.skipped) {
    stats.policy_errors.fetch_add(1, std::memory_order_relaxed);
    r.errors.push_back(to_string(ErrorCode::policy_evaluation_error) + ": " + name);
  }

  // --- cancel checkpoint: nothing below may be skipped half-way ------------
  if (is_cancelled(token)) return cancelled("commit");

  // --- commit -----------------------------------------------------------------
  ctx_->classifier->commit(e);

  auto incident = memory->record_incident(e);
  if (incident.ok()) {
    r.incident_id = *incident.value;
  } else {
    r.incident_id = incident_id_for(e.fingerprint);
    stats.memory_unavailable.fetch_add(1, std::memory_order_relaxed);
    r.errors.push_back(to_string(ErrorCode::memory_unavailable) + ": " + incident.message);
  }

  std::vector<const FiredPolicy*> committed;
  for (const auto& fired : decision.fired) {
    if (policies->commit_firing(e.component, fired.policy)) {
      committed.push_back(&fired);
      r.policies_fired.push_back(fired.policy);
    } else {
      log_event(LogLevel::debug, "pipeline", "policy_firing_lost",
                "policy hit its cooldown or rate limit after preview",
                {{"policy", fired.policy}, {"component", e.component}});
    }
  }

  // --- intents ----------------------------------------------------------------
  r.similar_incidents = static_cast<uint32_t>(hits.size());
  std::set<std::string> proposed;
  for (const FiredPolicy* fired : committed) {
    for (const auto& action : fired->actions) {
      if (!proposed.insert(action).second) continue;
      IntentInputs in;
      in.event = &e;
      in.classification = &cls;
      in.incident_id = r.incident_id;
      in.policy = fired;
      in.action = action;
      in.similar_incidents = r.similar_incidents;
      for (const auto& ae : effective) {
        if (ae.action == action && ae.attempts > 0) in.historical_success_rate = ae.success_rate;
      }
      r.healing_intents.push_back(make_intent(in));
    }
  }

  // --- gateway ----------------------------------------------------------------
  for (const auto& intent : r.healing_intents) {
    GatewayResponse resp = ctx_->gateway->submit(intent, mode);
    stats.record_gateway(resp.status, resp.duplicate);
    r.gateway_responses.push_back(std::move(resp));
  }

  // --- business impact ------------------------------------------------------
  if (ctx_->impact) {
    try {
      r.business_impact = ctx_->impact(e, cls);
    } catch (const std::exception& ex) {
      r.errors.push_back(std::string("business_impact: ") + ex.what());
      log_event(LogLevel::warn, "pipeline", "impact_estimator_failed", ex.what(),
                {{"component", e.component}});
    }
  }

  stats.events_processed.fetch_add(1, std::memory_order_relaxed);
  stats.record_bucket(cls.bucket);
  stats.intents_emitted.fetch_add(r.healing_intents.size(), std::memory_order_relaxed);
  r.status = r.healing_intents.empty() ? "NO_ACTION" : "INTENTS_EMITTED";
  return finish(std::move(r), &e, elapsed_ns());
}

}  // namespace arf
