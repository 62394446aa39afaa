#pragma once

// arf/recorder.hpp — Outcome Recorder: closes the learning loop.
//
// Gateway completions (and manual remediation reports from advisory
// deployments) are queued and written to memory by one worker thread, so the
// gateway response path never waits on memory.
//
// DESIGN INVARIANTS:
//   1. NON-BLOCKING: submit() only takes the queue lock. When the queue is
//      full the oldest report is dropped and counted.
//   2. ISOLATED: store failures (breaker open, unknown incident) are logged and
//      counted, never propagated.
//   3. ORDERED: reports are stored in submission order. Callers record the
//      incident before any outcome for it can be submitted.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "arf/memory.hpp"

namespace arf {

struct OutcomeReport {
  std::string incident_id;
  std::vector<std::string> actions;
  bool success{false};
  double duration_minutes{0.0};
  std::string lessons;
  std::string source{"gateway"};   // "gateway" | "manual"
};

struct RecorderStats {
  uint64_t submitted{0};
  uint64_t stored{0};
  uint64_t duplicates{0};
  uint64_t failures{0};
  uint64_t dropped{0};
};

class OutcomeRecorder {
 public:
  explicit OutcomeRecorder(std::shared_ptr<GuardedMemory> memory, size_t max_queue = 1024);
  ~OutcomeRecorder();

  OutcomeRecorder(const OutcomeRecorder&) = delete;
  OutcomeRecorder& operator=(const OutcomeRecorder&) = delete;

  // false once stop() has been called.
  bool submit(OutcomeReport report);

  // External report of a remediation performed by an operator.
  bool report_manual(const std::string& incident_id, const std::vector<std::string>& actions,
                     bool success, double duration_minutes, const std::string& lessons);

  // Blocks until every report submitted so far has been processed.
  void flush();

  // Drains the queue, then joins the worker. Idempotent.
  void stop();

  RecorderStats stats() const;
  size_t queue_depth() const;

 private:
  void worker_loop();
  void store(const OutcomeReport& report);

  std::shared_ptr<GuardedMemory> memory_;
  size_t max_queue_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_idle_;
  std::deque<OutcomeReport> queue_;
  bool stopping_{false};
  bool busy_{false};
  std::thread worker_;

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> stored_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace arf
