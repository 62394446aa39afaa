#include "arf/impact.hpp"

#include <algorithm>
#include <cmath>

#include "arf/jsonlite.hpp"

namespace arf {

double bucket_revenue_multiplier(AnomalyBucket bucket) {
  switch (bucket) {
    case AnomalyBucket::normal: return 0.0;
    case AnomalyBucket::degrading: return 0.5;
    case AnomalyBucket::critical: return 1.5;
    case AnomalyBucket::systemic: return 3.0;
  }
  return 0.0;
}

BusinessImpact estimate_business_impact(const Event& e, const Classification& c,
                                        const ImpactConfig& config) {
  BusinessImpact out;
  const double revenue = config.base_revenue_per_minute * bucket_revenue_multiplier(c.bucket) *
                         (1.0 + e.error_rate) * config.window_minutes;
  out.revenue_loss_estimate = std::round(revenue * 100.0) / 100.0;

  const double users = std::max(0.0, e.throughput * e.error_rate * 60.0);
  out.affected_users_estimate = static_cast<uint64_t>(std::llround(users));
  out.throughput_reduction_pct = std::round(std::min(100.0, e.error_rate * 100.0) * 10.0) / 10.0;

  const double r = out.revenue_loss_estimate;
  const uint64_t u = out.affected_users_estimate;
  if (r > 500.0 || u > 5000) {
    out.severity_level = "CRITICAL";
  } else if (r > 100.0 || u > 1000) {
    out.severity_level = "HIGH";
  } else if (r > 50.0 || u > 500) {
    out.severity_level = "MEDIUM";
  } else {
    out.severity_level = "LOW";
  }
  return out;
}

BusinessImpactFn default_impact_estimator(ImpactConfig config) {
  return [config](const Event& e, const Classification& c) {
    return estimate_business_impact(e, c, config);
  };
}

std::string business_impact_to_json(const BusinessImpact& impact) {
  jsonlite::Object o;
  o["revenue_loss_estimate"] = jsonlite::Value{impact.revenue_loss_estimate};
  o["affected_users_estimate"] = jsonlite::Value{static_cast<std::uint64_t>(impact.affected_users_estimate)};
  o["severity_level"] = jsonlite::Value{impact.severity_level};
  o["throughput_reduction_pct"] = jsonlite::Value{impact.throughput_reduction_pct};
  return jsonlite::to_json(o);
}

}  // namespace arf
