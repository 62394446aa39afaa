#include "arf/gateway.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <future>

#include "arf/deadline.hpp"
#include "arf/hash.hpp"
#include "arf/jsonlite.hpp"
#include "arf/observability.hpp"

namespace arf {

namespace {

std::string upper(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

ToolContext make_context(const HealingIntent& intent, ExecutionMode mode) {
  ToolContext ctx;
  ctx.intent_id = intent.intent_id;
  ctx.component = intent.component;
  ctx.parameters = intent.parameters;
  ctx.justification = intent.justification;
  ctx.mode = mode;
  return ctx;
}

struct RunOutcome {
  bool success{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::optional<ToolResult> result;
};

// A late tool keeps running against its own copies of the tool and context;
// its result is discarded.
RunOutcome run_with_timeout(const std::shared_ptr<Tool>& tool, const ToolContext& ctx,
                            uint64_t timeout_ms) {
  std::future<ToolResult> future = run_detached([tool, ctx]() { return tool->execute(ctx); });

  RunOutcome out;
  if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
    out.error = ErrorCode::tool_timeout;
    out.message = "tool timed out after " + std::to_string(timeout_ms) + "ms";
    return out;
  }
  try {
    ToolResult r = future.get();
    out.success = r.success;
    out.message = r.message;
    if (!r.success) out.error = ErrorCode::tool_execution_error;
    out.result = std::move(r);
  } catch (const std::exception& ex) {
    out.error = ErrorCode::tool_execution_error;
    out.message = std::string("tool threw: ") + ex.what();
  } catch (...) {
    out.error = ErrorCode::tool_execution_error;
    out.message = "tool threw a non-standard exception";
  }
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// BusinessHours
// ---------------------------------------------------------------------------

bool BusinessHours::active(uint64_t now_ms) const {
  if (!enabled) return false;
  const int64_t local_s =
      static_cast<int64_t>(now_ms / 1000) + static_cast<int64_t>(utc_offset_minutes) * 60;
  if (local_s < 0) return false;
  const int64_t days = local_s / 86400;
  const int hour = static_cast<int>((local_s % 86400) / 3600);
  if (weekdays_only) {
    // 1970-01-01 was a Thursday. 0 = Sunday.
    const int weekday = static_cast<int>((days + 4) % 7);
    if (weekday == 0 || weekday == 6) return false;
  }
  if (start_hour <= end_hour) return hour >= start_hour && hour < end_hour;
  return hour >= start_hour || hour < end_hour;  // window wraps midnight
}

std::string gateway_response_to_json(const GatewayResponse& r) {
  jsonlite::Object o;
  o["intent_id"] = jsonlite::Value{r.intent_id};
  o["status"] = jsonlite::Value{to_string(r.status)};
  if (!r.approval_id.empty()) o["approval_id"] = jsonlite::Value{r.approval_id};
  if (r.result) {
    jsonlite::Object details;
    for (const auto& [k, v] : r.result->details) details[k] = jsonlite::Value{v};
    jsonlite::Object res;
    res["success"] = jsonlite::Value{r.result->success};
    res["message"] = jsonlite::Value{r.result->message};
    res["details"] = jsonlite::Value{details};
    o["result"] = jsonlite::Value{res};
  }
  if (!r.reason.empty()) o["reason"] = jsonlite::Value{r.reason};
  if (r.error != ErrorCode::none) o["error"] = jsonlite::Value{to_string(r.error)};
  o["would_execute"] = jsonlite::Value{r.would_execute};
  o["audit_sequence"] = jsonlite::Value{static_cast<std::uint64_t>(r.audit_sequence)};
  o["duplicate"] = jsonlite::Value{r.duplicate};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// SafetyGateway
// ---------------------------------------------------------------------------

SafetyGateway::SafetyGateway(GatewayConfig config, Capabilities capabilities,
                             std::shared_ptr<ToolRegistry> registry,
                             std::shared_ptr<AuditTrail> audit, ClockFn clock)
    : config_(std::move(config)),
      capabilities_(capabilities),
      registry_(std::move(registry)),
      audit_(audit ? std::move(audit) : std::make_shared<AuditTrail>()),
      clock_(clock_or_system(std::move(clock))) {
  for (auto& b : config_.blacklist) b = upper(b);
}

std::string SafetyGateway::cooldown_key(const std::string& tool, const std::string& component) {
  return tool + "|" + component;
}

CircuitBreaker& SafetyGateway::breaker_locked(const std::string& tool) {
  auto it = breakers_.find(tool);
  if (it == breakers_.end()) {
    it = breakers_
             .emplace(tool, std::make_unique<CircuitBreaker>("tool:" + tool, config_.tool_breaker,
                                                             clock_))
             .first;
  }
  return *it->second;
}

SafetyGateway::Validation SafetyGateway::validate(const HealingIntent& intent, ExecutionMode mode,
                                                  uint64_t now) {
  Validation v;
  auto deny = [&v](ErrorCode code, std::string reason) {
    v.ok = false;
    v.error = code;
    v.reason = std::move(reason);
    return v;
  };

  const std::string tool_upper = upper(intent.tool);
  if (std::find(config_.blacklist.begin(), config_.blacklist.end(), tool_upper) !=
      config_.blacklist.end()) {
    return deny(ErrorCode::gateway_denied, "action " + intent.tool + " is blacklisted");
  }

  const uint32_t max_radius = std::min(config_.max_blast_radius, capabilities_.max_blast_radius);
  if (intent.risk.blast_radius > max_radius) {
    return deny(ErrorCode::gateway_denied,
                "blast radius " + std::to_string(intent.risk.blast_radius) + " exceeds limit " +
                    std::to_string(max_radius));
  }

  v.tool = registry_ ? registry_->find(intent.tool) : nullptr;

  // The intent's claim is only honoured when the registered tool agrees.
  const bool business_hours_safe = intent.risk.safe_for_business_hours && v.tool &&
                                   v.tool->metadata().safe_for_business_hours;
  if (config_.business_hours.active(now) && !business_hours_safe) {
    return deny(ErrorCode::gateway_denied,
                "business-hours restriction active and " + intent.tool +
                    " is not marked safe for business hours");
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!breaker_locked(intent.tool).would_allow()) {
      return deny(ErrorCode::circuit_open, "circuit open for tool " + intent.tool);
    }
    auto it = cooldowns_.find(cooldown_key(intent.tool, intent.component));
    if (it != cooldowns_.end() && now >= it->second &&
        now - it->second < config_.tool_cooldown_ms) {
      const uint64_t remaining_s = (config_.tool_cooldown_ms - (now - it->second) + 999) / 1000;
      return deny(ErrorCode::gateway_denied,
                  intent.tool + " on " + intent.component + " is cooling down (" +
                      std::to_string(remaining_s) + "s remaining)");
    }
  }

  if (!v.tool) return deny(ErrorCode::unknown_tool, "unknown tool " + intent.tool);

  ToolValidation tv;
  try {
    tv = v.tool->validate(make_context(intent, mode));
  } catch (const std::exception& ex) {
    return deny(ErrorCode::tool_execution_error,
                intent.tool + " validation threw: " + std::string(ex.what()));
  } catch (...) {
    return deny(ErrorCode::tool_execution_error,
                intent.tool + " validation threw a non-standard exception");
  }
  if (!tv.ok) return deny(ErrorCode::gateway_denied, tv.reason);
  return v;
}

uint64_t SafetyGateway::append_audit(const HealingIntent& intent, ExecutionMode mode,
                                     bool validation_ok, const std::string& validation_reason,
                                     GatewayStatus status, uint64_t received_ms,
                                     const std::string& approval_id,
                                     const std::string& result_message) {
  ExecutionRecord rec;
  rec.intent_id = intent.intent_id;
  rec.tool = intent.tool;
  rec.component = intent.component;
  rec.justification = intent.justification;
  rec.mode = mode;
  rec.validation_ok = validation_ok;
  rec.validation_reason = validation_reason;
  rec.status = status;
  rec.received_ms = received_ms;
  rec.decided_ms = clock_();
  rec.approval_id = approval_id;
  rec.result_message = result_message;
  return audit_->append(rec);
}

void SafetyGateway::remember(const GatewayResponse& r) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = intents_.find(r.intent_id);
  if (it != intents_.end()) it->second = r;
}

void SafetyGateway::prune_intents_locked(uint64_t now) {
  while (!intent_order_.empty()) {
    const auto& [seen_ms, id] = intent_order_.front();
    const bool too_old = now >= seen_ms && now - seen_ms >= config_.duplicate_window_ms;
    const bool too_many = intents_.size() > config_.max_tracked_intents;
    if (!too_old && !too_many) break;
    intents_.erase(id);
    intent_order_.pop_front();
  }
}

GatewayResponse SafetyGateway::submit(const HealingIntent& intent, ExecutionMode mode) {
  const uint64_t now = clock_();
  sweep_expired(now);
  GatewayResponse resp;
  resp.intent_id = intent.intent_id;

  if (intent.intent_id.empty()) {
    resp.status = GatewayStatus::denied;
    resp.error = ErrorCode::validation_error;
    resp.reason = "intent id is required";
    resp.audit_sequence =
        append_audit(intent, mode, false, resp.reason, resp.status, now, "", "");
    return resp;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    prune_intents_locked(now);
    auto it = intents_.find(intent.intent_id);
    if (it != intents_.end()) {
      GatewayResponse dup = it->second;
      dup.duplicate = true;
      log_event(LogLevel::info, "gateway", "duplicate_intent",
                "intent already submitted; returning recorded decision",
                {{"intent_id", intent.intent_id}, {"status", to_string(dup.status)}});
      return dup;
    }
    GatewayResponse placeholder;
    placeholder.intent_id = intent.intent_id;
    placeholder.status = GatewayStatus::validating;
    intents_.emplace(intent.intent_id, placeholder);
    intent_order_.emplace_back(now, intent.intent_id);
  }

  const Validation v = validate(intent, mode, now);
  if (!v.ok) {
    resp.status = GatewayStatus::denied;
    resp.error = v.error;
    resp.reason = v.reason;
    resp.audit_sequence = append_audit(intent, mode, false, v.reason, resp.status, now, "", "");
    remember(resp);
    log_event(LogLevel::warn, "gateway", "intent_denied", v.reason,
              {{"intent_id", intent.intent_id}, {"tool", intent.tool},
               {"component", intent.component}, {"error", to_string(v.error)}});
    return resp;
  }

  const bool advisory = mode == ExecutionMode::advisory || !capabilities_.autonomous_execution ||
                        (mode == ExecutionMode::approval && !capabilities_.approval_workflow);
  if (advisory) {
    resp.status = GatewayStatus::advisory_only;
    resp.would_execute = true;
    if (mode != ExecutionMode::advisory) {
      resp.reason = capabilities_.autonomous_execution ? "approval workflow not enabled"
                                                       : "execution capability not granted";
    }
    resp.audit_sequence = append_audit(intent, mode, true, "", resp.status, now, "", "");
    remember(resp);
    log_event(LogLevel::info, "gateway", "intent_advisory", "recommendation recorded",
              {{"intent_id", intent.intent_id}, {"tool", intent.tool},
               {"requested_mode", to_string(mode)}});
    return resp;
  }

  if (mode == ExecutionMode::approval) {
    resp.status = GatewayStatus::pending_approval;
    resp.approval_id =
        short_id("apr_", hash_domain(kAuditDomain, intent.intent_id + ":" + std::to_string(now)));
    {
      std::lock_guard<std::mutex> lk(mu_);
      pending_[resp.approval_id] = Pending{intent, now};
    }
    resp.audit_sequence =
        append_audit(intent, mode, true, "", resp.status, now, resp.approval_id, "");
    remember(resp);
    log_event(LogLevel::info, "gateway", "approval_requested", "intent awaiting approval",
              {{"intent_id", intent.intent_id}, {"approval_id", resp.approval_id}});
    return resp;
  }

  return execute(intent, mode, v.tool, now, "");
}

GatewayResponse SafetyGateway::execute(const HealingIntent& intent, ExecutionMode mode,
                                       const std::shared_ptr<Tool>& tool, uint64_t received_ms,
                                       const std::string& approval_id) {
  GatewayResponse resp;
  resp.intent_id = intent.intent_id;
  resp.approval_id = approval_id;

  CircuitBreaker* breaker = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    breaker = &breaker_locked(intent.tool);
  }
  // Another request may have taken the half-open trial permit since validation.
  if (!breaker->allow()) {
    resp.status = GatewayStatus::denied;
    resp.error = ErrorCode::circuit_open;
    resp.reason = "circuit open for tool " + intent.tool;
    resp.audit_sequence =
        append_audit(intent, mode, false, resp.reason, resp.status, received_ms, approval_id, "");
    remember(resp);
    return resp;
  }

  append_audit(intent, mode, true, "", GatewayStatus::executing, received_ms, approval_id, "");
  log_event(LogLevel::info, "gateway", "tool_executing", "executing " + intent.tool,
            {{"intent_id", intent.intent_id}, {"component", intent.component}});

  const auto started = std::chrono::steady_clock::now();
  RunOutcome run = run_with_timeout(tool, make_context(intent, mode), tool->metadata().timeout_ms);
  const double elapsed_ms = std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - started)
                                .count();

  if (run.success) {
    breaker->on_success();
    resp.status = GatewayStatus::completed;
  } else {
    breaker->on_failure();
    resp.status = GatewayStatus::failed;
    resp.error = run.error;
    resp.reason = run.message;
  }
  resp.result = std::move(run.result);

  ExecutionListener listener;
  {
    std::lock_guard<std::mutex> lk(mu_);
    cooldowns_[cooldown_key(intent.tool, intent.component)] = clock_();
    listener = listener_;
  }
  resp.audit_sequence = append_audit(intent, mode, true, "", resp.status, received_ms, approval_id,
                                     run.message);
  remember(resp);

  log_event(run.success ? LogLevel::info : LogLevel::error, "gateway",
            run.success ? "tool_completed" : "tool_failed", run.message,
            {{"intent_id", intent.intent_id}, {"tool", intent.tool},
             {"duration_ms", std::to_string(static_cast<uint64_t>(elapsed_ms))}});

  if (listener) listener(intent, resp, elapsed_ms / 60000.0);
  return resp;
}

GatewayResponse SafetyGateway::approve(const std::string& approval_id) {
  const uint64_t now = clock_();
  sweep_expired(now);
  Pending p;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(approval_id);
    if (it == pending_.end()) {
      if (auto expired = find_expired_locked(approval_id)) return *expired;
      GatewayResponse r;
      r.status = GatewayStatus::denied;
      r.approval_id = approval_id;
      r.error = ErrorCode::approval_not_found;
      r.reason = "unknown approval id " + approval_id;
      return r;
    }
    p = std::move(it->second);
    pending_.erase(it);
  }

  if (now >= p.created_ms && now - p.created_ms >= config_.approval_expiry_ms) {
    return expire_entry(p, approval_id);
  }

  append_audit(p.intent, ExecutionMode::approval, true, "", GatewayStatus::approved, p.created_ms,
               approval_id, "");

  // Conditions may have changed while the request waited.
  const Validation v = validate(p.intent, ExecutionMode::approval, now);
  if (!v.ok) {
    GatewayResponse r;
    r.intent_id = p.intent.intent_id;
    r.approval_id = approval_id;
    r.status = GatewayStatus::denied;
    r.error = v.error;
    r.reason = v.reason;
    r.audit_sequence = append_audit(p.intent, ExecutionMode::approval, false, v.reason, r.status,
                                    p.created_ms, approval_id, "");
    remember(r);
    return r;
  }
  if (!capabilities_.autonomous_execution) {
    GatewayResponse r;
    r.intent_id = p.intent.intent_id;
    r.approval_id = approval_id;
    r.status = GatewayStatus::advisory_only;
    r.would_execute = true;
    r.reason = "execution capability not granted";
    r.audit_sequence = append_audit(p.intent, ExecutionMode::approval, true, "", r.status,
                                    p.created_ms, approval_id, "");
    remember(r);
    return r;
  }
  return execute(p.intent, ExecutionMode::approval, v.tool, p.created_ms, approval_id);
}

GatewayResponse SafetyGateway::reject(const std::string& approval_id, const std::string& reason) {
  sweep_expired(clock_());
  Pending p;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(approval_id);
    if (it == pending_.end()) {
      if (auto expired = find_expired_locked(approval_id)) return *expired;
      GatewayResponse r;
      r.status = GatewayStatus::denied;
      r.approval_id = approval_id;
      r.error = ErrorCode::approval_not_found;
      r.reason = "unknown approval id " + approval_id;
      return r;
    }
    p = std::move(it->second);
    pending_.erase(it);
  }
  GatewayResponse r;
  r.intent_id = p.intent.intent_id;
  r.approval_id = approval_id;
  r.status = GatewayStatus::rejected;
  r.reason = reason.empty() ? "rejected by approver" : reason;
  r.audit_sequence = append_audit(p.intent, ExecutionMode::approval, true, "", r.status,
                                  p.created_ms, approval_id, r.reason);
  remember(r);
  log_event(LogLevel::info, "gateway", "approval_rejected", r.reason,
            {{"intent_id", r.intent_id}, {"approval_id", approval_id}});
  return r;
}

GatewayResponse SafetyGateway::expire_entry(const Pending& p, const std::string& approval_id) {
  GatewayResponse r;
  r.intent_id = p.intent.intent_id;
  r.approval_id = approval_id;
  r.status = GatewayStatus::expired;
  r.error = ErrorCode::approval_expired;
  r.reason = "approval expired";
  r.audit_sequence = append_audit(p.intent, ExecutionMode::approval, true, "", r.status,
                                  p.created_ms, approval_id, r.reason);
  remember(r);
  log_event(LogLevel::warn, "gateway", "approval_expired", r.reason,
            {{"intent_id", r.intent_id}, {"approval_id", approval_id}});
  return r;
}

size_t SafetyGateway::expire_pending() { return sweep_expired(clock_()); }

std::optional<GatewayResponse> SafetyGateway::find_expired_locked(
    const std::string& approval_id) const {
  for (const auto& [id, r] : intents_) {
    if (r.approval_id == approval_id && r.status == GatewayStatus::expired) return r;
  }
  return std::nullopt;
}

size_t SafetyGateway::sweep_expired(uint64_t now) {
  std::vector<std::pair<std::string, Pending>> overdue;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (now >= it->second.created_ms &&
          now - it->second.created_ms >= config_.approval_expiry_ms) {
        overdue.emplace_back(it->first, std::move(it->second));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& [id, p] : overdue) expire_entry(p, id);
  return overdue.size();
}

void SafetyGateway::set_execution_listener(ExecutionListener listener) {
  std::lock_guard<std::mutex> lk(mu_);
  listener_ = std::move(listener);
}

size_t SafetyGateway::pending_count() {
  sweep_expired(clock_());
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.size();
}

std::optional<GatewayResponse> SafetyGateway::lookup(const std::string& intent_id) {
  sweep_expired(clock_());
  std::lock_guard<std::mutex> lk(mu_);
  auto it = intents_.find(intent_id);
  if (it == intents_.end()) return std::nullopt;
  return it->second;
}

BreakerState SafetyGateway::tool_breaker_state(const std::string& tool) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = breakers_.find(tool);
  return it == breakers_.end() ? BreakerState::closed : it->second->state();
}

}  // namespace arf
