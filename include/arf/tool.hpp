#pragma once

// arf/tool.hpp — Remediation tool plugin contract and typed registry.
//
// The Safety Gateway is the only caller of Tool::execute(). Tools never
// decide whether they may run; they only check their own preconditions in
// validate() and perform the effect in execute().
//
// EXTENSION_POINT: remediation_backends
//   Current: built-in tools delegate their side effect to one injected
//   RemediationBackend (LoggingBackend records the request and succeeds).
//   Upgrade: a backend per orchestrator (Kubernetes, ECS) implementing
//   perform() against the real control plane.
//   Invariant: perform() must be safe to abandon after the gateway timeout.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "arf/types.hpp"

namespace arf {

struct ToolMetadata {
  std::string name;
  SafetyLevel safety_level{SafetyLevel::medium};
  uint64_t timeout_ms{30000};
  std::vector<std::string> required_permissions;
  bool safe_for_business_hours{false};
};

struct ToolContext {
  std::string intent_id;
  std::string component;
  std::map<std::string, std::string> parameters;
  std::string justification;
  ExecutionMode mode{ExecutionMode::advisory};
};

struct ToolValidation {
  bool ok{true};
  std::string reason;
};

struct ToolResult {
  bool success{false};
  std::string message;
  std::map<std::string, std::string> details;
};

class Tool {
 public:
  virtual ~Tool() = default;
  virtual const ToolMetadata& metadata() const = 0;
  virtual ToolValidation validate(const ToolContext& ctx) const = 0;
  // May throw; the gateway converts exceptions to FAILED.
  virtual ToolResult execute(const ToolContext& ctx) = 0;
};

class RemediationBackend {
 public:
  virtual ~RemediationBackend() = default;
  virtual ToolResult perform(const std::string& action, const ToolContext& ctx) = 0;
  virtual bool has_backup(const std::string& component) const = 0;
};

// Records each request through log_event and reports success.
class LoggingBackend : public RemediationBackend {
 public:
  explicit LoggingBackend(bool backups_available = true)
      : backups_available_(backups_available) {}
  ToolResult perform(const std::string& action, const ToolContext& ctx) override;
  bool has_backup(const std::string& component) const override;

 private:
  bool backups_available_;
};

// Built-in tool: parameter checks plus a backend call.
class BackendTool : public Tool {
 public:
  using Precondition =
      std::function<ToolValidation(const ToolContext&, const RemediationBackend&)>;

  BackendTool(ToolMetadata metadata, std::shared_ptr<RemediationBackend> backend,
              Precondition precondition = {});

  const ToolMetadata& metadata() const override { return metadata_; }
  ToolValidation validate(const ToolContext& ctx) const override;
  ToolResult execute(const ToolContext& ctx) override;

 private:
  ToolMetadata metadata_;
  std::shared_ptr<RemediationBackend> backend_;
  Precondition precondition_;
};

class ToolRegistry {
 public:
  // false when a tool with the same name is already registered.
  bool register_tool(std::shared_ptr<Tool> tool);
  std::shared_ptr<Tool> find(const std::string& name) const;
  std::vector<std::string> names() const;
  size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

// restart_container, scale_out, traffic_shift, circuit_breaker, rollback,
// alert_team. default_timeout_ms applies to every built-in.
std::shared_ptr<ToolRegistry> make_builtin_registry(
    std::shared_ptr<RemediationBackend> backend, uint64_t default_timeout_ms = 30000);

}  // namespace arf
