#pragma once

// arf/classifier.hpp — Anomaly scoring against static thresholds and adaptive
// per-component baselines.
//
// SCORING:
//   Each metric gets a static score from the threshold ladder (piecewise linear,
//   warning → 0.3, critical → 0.6, extreme → 0.85) and, once the component's
//   baseline has warmup_samples observations, a dynamic score from the EWMA
//   z-score (z = 2 → 0.0, z = 6 → 1.0). The metric score is the max of both.
//   Per-metric scores are combined as a weighted mean over the metrics that
//   are present; weights are normalised, default equal.
//
// CONCURRENCY:
//   Baselines live in a ShardedLru keyed by component: single writer per
//   component, no global lock across unrelated components.
//
// FAILURE MODE:
//   A corrupt baseline (non-finite or negative variance) yields a
//   classification_error, falls back to static thresholds only, and is reset
//   on the next commit.

#include <optional>
#include <string>

#include "arf/sharded_lru.hpp"
#include "arf/types.hpp"

namespace arf {

struct MetricWeights {
  double latency{1.0};
  double error_rate{1.0};
  double throughput{1.0};
  double cpu{1.0};
  double memory{1.0};
};

struct ClassifierConfig {
  StaticThresholds thresholds;
  MetricWeights weights;
  double alpha{0.1};              // EWMA blend factor for new observations
  uint32_t warmup_samples{10};    // observations before dynamic scoring
  size_t max_components{1000};
  size_t shards{16};
};

struct MetricBaseline {
  double mean{0.0};
  double variance{0.0};
  uint64_t samples{0};
};

struct ComponentBaseline {
  MetricBaseline latency;
  MetricBaseline error_rate;
  MetricBaseline throughput;
  MetricBaseline cpu;
  MetricBaseline memory;
};

bool baseline_is_corrupt(const ComponentBaseline& b);

class AnomalyClassifier {
 public:
  explicit AnomalyClassifier(ClassifierConfig config = {});

  // Score then fold the event into the baseline, atomically per component.
  Classification classify(const Event& e);

  // Score only. No baseline mutation.
  Classification score(const Event& e) const;

  // Fold the event into the component baseline.
  void commit(const Event& e);

  std::optional<ComponentBaseline> baseline(const std::string& component) const;

  // Warm-start a component from persisted state.
  void restore_baseline(const std::string& component, const ComponentBaseline& baseline);

  size_t tracked_components() const { return baselines_.size(); }
  const ClassifierConfig& config() const { return config_; }

 private:
  Classification score_against(const Event& e, const ComponentBaseline* b) const;
  void update(ComponentBaseline& b, const Event& e) const;

  ClassifierConfig config_;
  ShardedLru<ComponentBaseline> baselines_;
};

}  // namespace arf
