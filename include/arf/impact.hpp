#pragma once

// arf/impact.hpp — Default business-impact estimator.
//
// A pure function of the event and its classification. Deployments with a
// real revenue model replace it through EngineOptions::impact.

#include "arf/types.hpp"

namespace arf {

struct ImpactConfig {
  double base_revenue_per_minute{100.0};
  double window_minutes{5.0};     // projected incident duration
};

// Revenue multiplier per bucket: NORMAL 0, DEGRADING 0.5, CRITICAL 1.5,
// SYSTEMIC 3.0.
double bucket_revenue_multiplier(AnomalyBucket bucket);

// revenue = base * multiplier(bucket) * (1 + error_rate) * window
// users   = throughput * error_rate * 60
// label   = CRITICAL > 500 / 5000, HIGH > 100 / 1000, MEDIUM > 50 / 500, else LOW
BusinessImpact estimate_business_impact(const Event& e, const Classification& c,
                                        const ImpactConfig& config = {});

BusinessImpactFn default_impact_estimator(ImpactConfig config = {});

std::string business_impact_to_json(const BusinessImpact& impact);

}  // namespace arf
