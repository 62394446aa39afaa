#include "arf/classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include "arf/observability.hpp"

namespace arf {

namespace {

using Ladder = std::array<std::pair<double, double>, 5>;

// Piecewise-linear interpolation over (value, score) points. Points with a
// non-increasing x are skipped.
double interpolate(double x, const Ladder& pts) {
  if (x <= pts.front().first) return pts.front().second;
  for (size_t i = 1; i < pts.size(); ++i) {
    const auto [x0, y0] = pts[i - 1];
    const auto [x1, y1] = pts[i];
    if (x1 <= x0) continue;
    if (x <= x1) return y0 + (x - x0) / (x1 - x0) * (y1 - y0);
  }
  return pts.back().second;
}

Ladder latency_ladder(const StaticThresholds& t) {
  return {{{0.0, 0.0},
           {t.latency_warning_ms, 0.3},
           {t.latency_critical_ms, 0.6},
           {t.latency_extreme_ms, 0.85},
           {t.latency_extreme_ms * 2.0, 1.0}}};
}

Ladder error_ladder(const StaticThresholds& t) {
  return {{{0.0, 0.0},
           {t.error_rate_warning, 0.3},
           {t.error_rate_high, 0.6},
           {t.error_rate_critical, 0.85},
           {std::min(1.0, t.error_rate_critical * 2.0), 1.0}}};
}

Ladder utilization_ladder(double warning, double critical) {
  return {{{0.0, 0.0},
           {warning, 0.3},
           {critical, 0.6},
           {(critical + 1.0) / 2.0, 0.85},
           {1.0, 1.0}}};
}

bool metric_corrupt(const MetricBaseline& m) {
  return !std::isfinite(m.mean) || !std::isfinite(m.variance) || m.variance < 0.0;
}

// z = 2 → 0.0, z = 6 → 1.0. higher_is_worse=false for throughput drops.
double dynamic_score(double x, const MetricBaseline& m, bool higher_is_worse) {
  const double stddev = std::max({std::sqrt(m.variance), 0.05 * std::fabs(m.mean), 1e-6});
  const double z = higher_is_worse ? (x - m.mean) / stddev : (m.mean - x) / stddev;
  return std::clamp((z - 2.0) / 4.0, 0.0, 1.0);
}

void ewma_update(MetricBaseline& m, double x, double alpha) {
  if (m.samples == 0) {
    m.mean = x;
    m.variance = 0.0;
  } else {
    const double diff = x - m.mean;
    m.mean += alpha * diff;
    m.variance = (1.0 - alpha) * (m.variance + alpha * diff * diff);
  }
  ++m.samples;
}

}  // namespace

bool baseline_is_corrupt(const ComponentBaseline& b) {
  return metric_corrupt(b.latency) || metric_corrupt(b.error_rate) ||
         metric_corrupt(b.throughput) || metric_corrupt(b.cpu) || metric_corrupt(b.memory);
}

AnomalyClassifier::AnomalyClassifier(ClassifierConfig config)
    : config_(config), baselines_(config.shards, config.max_components) {}

Classification AnomalyClassifier::score_against(const Event& e, const ComponentBaseline* b) const {
  Classification c;
  const auto& t = config_.thresholds;
  const auto& w = config_.weights;

  if (b && baseline_is_corrupt(*b)) {
    c.error = ErrorCode::classification_error;
    log_event(LogLevel::warn, "classifier", "baseline_corrupt",
              "baseline corrupt; scoring with static thresholds only",
              {{"component", e.component}});
    b = nullptr;
  }

  double weighted = 0.0;
  double total_weight = 0.0;
  auto add = [&](const char* name, std::optional<double> value, double weight,
                 const Ladder* ladder, const MetricBaseline* mb, bool higher_is_worse) {
    if (!value || weight <= 0.0) return;
    MetricScore ms;
    ms.metric = name;
    ms.static_score = ladder ? interpolate(*value, *ladder) : 0.0;
    const bool dynamic_ready = mb && mb->samples >= config_.warmup_samples;
    if (dynamic_ready) {
      ms.dynamic_score = dynamic_score(*value, *mb, higher_is_worse);
      c.used_static_only = false;
    } else if (!ladder) {
      return;  // no static ladder and no warm baseline: metric carries no signal yet
    }
    ms.score = std::max(ms.static_score, ms.dynamic_score);
    weighted += weight * ms.score;
    total_weight += weight;
    c.metrics.push_back(ms);
  };

  const Ladder lat = latency_ladder(t);
  const Ladder err = error_ladder(t);
  const Ladder cpu = utilization_ladder(t.cpu_warning, t.cpu_critical);
  const Ladder mem = utilization_ladder(t.memory_warning, t.memory_critical);

  add("latency_p99", e.latency_p99, w.latency, &lat, b ? &b->latency : nullptr, true);
  add("error_rate", e.error_rate, w.error_rate, &err, b ? &b->error_rate : nullptr, true);
  add("throughput", e.throughput, w.throughput, nullptr, b ? &b->throughput : nullptr, false);
  add("cpu_util", e.cpu_util, w.cpu, &cpu, b ? &b->cpu : nullptr, true);
  add("memory_util", e.memory_util, w.memory, &mem, b ? &b->memory : nullptr, true);

  c.score = total_weight > 0.0 ? std::clamp(weighted / total_weight, 0.0, 1.0) : 0.0;
  c.bucket = bucket_for_score(c.score);
  return c;
}

void AnomalyClassifier::update(ComponentBaseline& b, const Event& e) const {
  if (baseline_is_corrupt(b)) {
    log_event(LogLevel::warn, "classifier", "baseline_reset", "corrupt baseline discarded",
              {{"component", e.component}});
    b = ComponentBaseline{};
  }
  const double a = config_.alpha;
  ewma_update(b.latency, e.latency_p99, a);
  ewma_update(b.error_rate, e.error_rate, a);
  ewma_update(b.throughput, e.throughput, a);
  if (e.cpu_util) ewma_update(b.cpu, *e.cpu_util, a);
  if (e.memory_util) ewma_update(b.memory, *e.memory_util, a);
}

Classification AnomalyClassifier::classify(const Event& e) {
  return baselines_.with(e.component, [&](ComponentBaseline& b) {
    Classification c = score_against(e, &b);
    update(b, e);
    return c;
  });
}

Classification AnomalyClassifier::score(const Event& e) const {
  return baselines_.peek(e.component,
                         [&](const ComponentBaseline* b) { return score_against(e, b); });
}

void AnomalyClassifier::commit(const Event& e) {
  baselines_.with(e.component, [&](ComponentBaseline& b) { update(b, e); });
}

std::optional<ComponentBaseline> AnomalyClassifier::baseline(const std::string& component) const {
  return baselines_.peek(component, [](const ComponentBaseline* b) -> std::optional<ComponentBaseline> {
    if (!b) return std::nullopt;
    return *b;
  });
}

void AnomalyClassifier::restore_baseline(const std::string& component,
                                         const ComponentBaseline& baseline) {
  baselines_.with(component, [&](ComponentBaseline& b) { b = baseline; });
}

}  // namespace arf
