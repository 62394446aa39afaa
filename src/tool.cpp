#include "arf/tool.hpp"

#include <cstdlib>
#include <optional>

#include "arf/observability.hpp"

namespace arf {

namespace {

std::optional<double> numeric_param(const ToolContext& ctx, const std::string& key) {
  auto it = ctx.parameters.find(key);
  if (it == ctx.parameters.end() || it->second.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(it->second.c_str(), &end);
  if (!end || *end != '\0') return std::nullopt;
  return v;
}

// Absent parameter is fine (the backend applies its default); a present one
// must parse and sit in [lo, hi].
ToolValidation check_range(const ToolContext& ctx, const std::string& key, double lo,
                           double hi) {
  auto it = ctx.parameters.find(key);
  if (it == ctx.parameters.end()) return {};
  const auto v = numeric_param(ctx, key);
  if (!v || *v < lo || *v > hi) {
    return {false, key + " must be a number in [" + std::to_string(static_cast<long long>(lo)) +
                       ", " + std::to_string(static_cast<long long>(hi)) + "]"};
  }
  return {};
}

ToolMetadata meta(std::string name, SafetyLevel level, uint64_t timeout_ms,
                  std::vector<std::string> permissions, bool business_hours_safe) {
  ToolMetadata m;
  m.name = std::move(name);
  m.safety_level = level;
  m.timeout_ms = timeout_ms;
  m.required_permissions = std::move(permissions);
  m.safe_for_business_hours = business_hours_safe;
  return m;
}

}  // namespace

// ---------------------------------------------------------------------------
// LoggingBackend
// ---------------------------------------------------------------------------

ToolResult LoggingBackend::perform(const std::string& action, const ToolContext& ctx) {
  LogFields fields{{"action", action}, {"component", ctx.component}, {"intent_id", ctx.intent_id}};
  for (const auto& [k, v] : ctx.parameters) fields["param." + k] = v;
  log_event(LogLevel::info, "remediation", "remediation_performed", action + " requested",
            fields);
  ToolResult r;
  r.success = true;
  r.message = action + " dispatched for " + ctx.component;
  return r;
}

bool LoggingBackend::has_backup(const std::string& /*component*/) const {
  return backups_available_;
}

// ---------------------------------------------------------------------------
// BackendTool
// ---------------------------------------------------------------------------

BackendTool::BackendTool(ToolMetadata metadata, std::shared_ptr<RemediationBackend> backend,
                         Precondition precondition)
    : metadata_(std::move(metadata)),
      backend_(std::move(backend)),
      precondition_(std::move(precondition)) {}

ToolValidation BackendTool::validate(const ToolContext& ctx) const {
  if (!backend_) return {false, "no remediation backend configured"};
  if (ctx.component.empty()) return {false, "component is required"};
  if (precondition_) return precondition_(ctx, *backend_);
  return {};
}

ToolResult BackendTool::execute(const ToolContext& ctx) {
  if (!backend_) return {false, "no remediation backend configured", {}};
  return backend_->perform(metadata_.name, ctx);
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool || tool->metadata().name.empty()) return false;
  std::lock_guard<std::mutex> lk(mu_);
  return tools_.emplace(tool->metadata().name, std::move(tool)).second;
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : it->second;
}

std::vector<std::string> ToolRegistry::names() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& [name, _] : tools_) out.push_back(name);
  return out;
}

size_t ToolRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tools_.size();
}

std::shared_ptr<ToolRegistry> make_builtin_registry(std::shared_ptr<RemediationBackend> backend,
                                                    uint64_t default_timeout_ms) {
  auto reg = std::make_shared<ToolRegistry>();
  const uint64_t t = default_timeout_ms;

  reg->register_tool(std::make_shared<BackendTool>(
      meta("restart_container", SafetyLevel::medium, t, {"container:restart"}, false), backend,
      [](const ToolContext& ctx, const RemediationBackend&) {
        return check_range(ctx, "grace_period_seconds", 0, 3600);
      }));

  reg->register_tool(std::make_shared<BackendTool>(
      meta("scale_out", SafetyLevel::low, t, {"deployment:scale"}, false), backend,
      [](const ToolContext& ctx, const RemediationBackend&) {
        return check_range(ctx, "scale_factor", 1, 10);
      }));

  reg->register_tool(std::make_shared<BackendTool>(
      meta("traffic_shift", SafetyLevel::medium, t, {"traffic:route"}, false), backend,
      [](const ToolContext& ctx, const RemediationBackend&) {
        return check_range(ctx, "percentage", 0, 100);
      }));

  reg->register_tool(std::make_shared<BackendTool>(
      meta("circuit_breaker", SafetyLevel::medium, t, {"traffic:route"}, false), backend,
      [](const ToolContext& ctx, const RemediationBackend&) {
        return check_range(ctx, "duration_seconds", 1, 3600);
      }));

  reg->register_tool(std::make_shared<BackendTool>(
      meta("rollback", SafetyLevel::high, t, {"deployment:rollback"}, false), backend,
      [](const ToolContext& ctx, const RemediationBackend& b) -> ToolValidation {
        if (!b.has_backup(ctx.component)) {
          return {false, "no backup exists for " + ctx.component};
        }
        return {};
      }));

  reg->register_tool(std::make_shared<BackendTool>(
      meta("alert_team", SafetyLevel::low, t, {"notify:page"}, true), backend,
      [](const ToolContext& ctx, const RemediationBackend&) -> ToolValidation {
        auto it = ctx.parameters.find("channel");
        if (it != ctx.parameters.end() && it->second.empty()) {
          return {false, "channel must not be empty"};
        }
        return {};
      }));

  return reg;
}

}  // namespace arf
