#pragma once

// arf/gateway.hpp — Safety Gateway: the only path from a HealingIntent to an
// observable effect.
//
// STATE MACHINE (per request):
//   RECEIVED → VALIDATING → DENIED
//                         → PENDING_APPROVAL → {APPROVED → ..., REJECTED, EXPIRED}
//                         → APPROVED → ADVISORY_ONLY
//                                    → EXECUTING → {COMPLETED, FAILED}
//
// VALIDATION ORDER (first failure wins):
//   1. blacklist   2. blast radius   3. business hours   4. per-tool breaker
//   5. tool+component cooldown   6. registry lookup (unknown tool fails closed)
//   7. tool validate(); a throw is DENIED with tool_execution_error
//
// Business-hours safety (3) needs both the intent flag and the registered
// tool's metadata; an unregistered tool is never business-hours safe.
//
// DESIGN INVARIANTS:
//   1. FAIL CLOSED: without Capabilities::autonomous_execution no request ever
//      reaches EXECUTING, whatever mode the caller asks for.
//   2. AUDITED: every request that is not a duplicate is appended to the audit
//      trail when validation completes; executions append a second entry on
//      completion. Duplicates reuse the stored response and its sequence.
//   3. NO RETRY: a tool timeout or throw is FAILED. Callers resubmit.
//   4. The capability descriptor is supplied at construction and immutable.
//
// CONCURRENCY:
//   One mutex guards the intent table, pending approvals, cooldowns and the
//   breaker map. It is never held while a tool runs or while the audit trail
//   is written.

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arf/audit.hpp"
#include "arf/circuit_breaker.hpp"
#include "arf/tool.hpp"
#include "arf/types.hpp"

namespace arf {

// Externally verified entitlement. Never derived from config or environment.
struct Capabilities {
  bool autonomous_execution{false};
  bool approval_workflow{true};
  uint32_t max_blast_radius{10};
};

struct BusinessHours {
  bool enabled{false};
  int start_hour{9};               // inclusive, local time
  int end_hour{17};                // exclusive
  bool weekdays_only{true};
  int utc_offset_minutes{0};

  bool active(uint64_t now_ms) const;
};

struct GatewayConfig {
  std::vector<std::string> blacklist{"DATABASE_DROP", "FULL_ROLLOUT", "SYSTEM_SHUTDOWN",
                                     "SECRET_ROTATION"};
  uint32_t max_blast_radius{3};
  BusinessHours business_hours;
  uint64_t tool_cooldown_ms{300000};
  uint64_t approval_expiry_ms{900000};
  uint64_t duplicate_window_ms{3600000};
  size_t max_tracked_intents{10000};
  BreakerConfig tool_breaker;
};

struct GatewayResponse {
  std::string intent_id;
  GatewayStatus status{GatewayStatus::received};
  std::string approval_id;
  std::optional<ToolResult> result;
  std::string reason;              // denial / failure reason
  ErrorCode error{ErrorCode::none};
  bool would_execute{false};       // ADVISORY_ONLY transparency flag
  uint64_t audit_sequence{0};
  bool duplicate{false};
};

std::string gateway_response_to_json(const GatewayResponse& r);

class SafetyGateway {
 public:
  // Invoked after every EXECUTING → COMPLETED | FAILED transition, outside
  // the gateway lock.
  using ExecutionListener = std::function<void(const HealingIntent& intent,
                                               const GatewayResponse& response,
                                               double duration_minutes)>;

  SafetyGateway(GatewayConfig config, Capabilities capabilities,
                std::shared_ptr<ToolRegistry> registry, std::shared_ptr<AuditTrail> audit,
                ClockFn clock = {});

  GatewayResponse submit(const HealingIntent& intent, ExecutionMode mode);

  // Approval resolution. Unknown ids → approval_not_found; overdue → EXPIRED.
  GatewayResponse approve(const std::string& approval_id);
  GatewayResponse reject(const std::string& approval_id, const std::string& reason);

  // Auto-reject every pending approval past its expiry. Returns the count.
  // Every public entry point below also sweeps, so an untouched approval
  // reads EXPIRED once its expiry has passed.
  size_t expire_pending();

  void set_execution_listener(ExecutionListener listener);

  size_t pending_count();
  std::optional<GatewayResponse> lookup(const std::string& intent_id);
  BreakerState tool_breaker_state(const std::string& tool) const;
  const Capabilities& capabilities() const { return capabilities_; }
  const GatewayConfig& config() const { return config_; }
  AuditTrail& audit() { return *audit_; }

 private:
  struct Pending {
    HealingIntent intent;
    uint64_t created_ms{0};
  };

  struct Validation {
    bool ok{true};
    ErrorCode error{ErrorCode::none};
    std::string reason;
    std::shared_ptr<Tool> tool;
  };

  Validation validate(const HealingIntent& intent, ExecutionMode mode, uint64_t now);
  CircuitBreaker& breaker_locked(const std::string& tool);
  GatewayResponse execute(const HealingIntent& intent, ExecutionMode mode,
                          const std::shared_ptr<Tool>& tool, uint64_t received_ms,
                          const std::string& approval_id);
  uint64_t append_audit(const HealingIntent& intent, ExecutionMode mode, bool validation_ok,
                        const std::string& validation_reason, GatewayStatus status,
                        uint64_t received_ms, const std::string& approval_id,
                        const std::string& result_message);
  void remember(const GatewayResponse& r);
  GatewayResponse expire_entry(const Pending& p, const std::string& approval_id);
  size_t sweep_expired(uint64_t now);
  std::optional<GatewayResponse> find_expired_locked(const std::string& approval_id) const;
  void prune_intents_locked(uint64_t now);
  static std::string cooldown_key(const std::string& tool, const std::string& component);

  GatewayConfig config_;
  const Capabilities capabilities_;
  std::shared_ptr<ToolRegistry> registry_;
  std::shared_ptr<AuditTrail> audit_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::map<std::string, GatewayResponse> intents_;             // intent_id → latest
  std::deque<std::pair<uint64_t, std::string>> intent_order_;  // first-seen order
  std::map<std::string, Pending> pending_;                     // approval_id → request
  std::map<std::string, uint64_t> cooldowns_;                  // tool|component → last exec
  std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
  ExecutionListener listener_;
};

}  // namespace arf
