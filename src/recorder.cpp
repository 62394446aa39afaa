#include "arf/recorder.hpp"

#include "arf/observability.hpp"

namespace arf {

OutcomeRecorder::OutcomeRecorder(std::shared_ptr<GuardedMemory> memory, size_t max_queue)
    : memory_(std::move(memory)), max_queue_(max_queue == 0 ? 1 : max_queue) {
  worker_ = std::thread([this] { worker_loop(); });
}

OutcomeRecorder::~OutcomeRecorder() { stop(); }

bool OutcomeRecorder::submit(OutcomeReport report) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return false;
    if (queue_.size() >= max_queue_) {
      const OutcomeReport& oldest = queue_.front();
      log_event(LogLevel::warn, "recorder", "outcome_dropped", "queue full; dropping oldest report",
                {{"incident_id", oldest.incident_id}});
      queue_.pop_front();
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_.push_back(std::move(report));
    submitted_.fetch_add(1, std::memory_order_relaxed);
  }
  cv_.notify_one();
  return true;
}

bool OutcomeRecorder::report_manual(const std::string& incident_id,
                                    const std::vector<std::string>& actions, bool success,
                                    double duration_minutes, const std::string& lessons) {
  OutcomeReport r;
  r.incident_id = incident_id;
  r.actions = actions;
  r.success = success;
  r.duration_minutes = duration_minutes;
  r.lessons = lessons;
  r.source = "manual";
  return submit(std::move(r));
}

void OutcomeRecorder::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void OutcomeRecorder::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

RecorderStats OutcomeRecorder::stats() const {
  RecorderStats s;
  s.submitted = submitted_.load(std::memory_order_relaxed);
  s.stored = stored_.load(std::memory_order_relaxed);
  s.duplicates = duplicates_.load(std::memory_order_relaxed);
  s.failures = failures_.load(std::memory_order_relaxed);
  s.dropped = dropped_.load(std::memory_order_relaxed);
  return s;
}

size_t OutcomeRecorder::queue_depth() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void OutcomeRecorder::worker_loop() {
  while (true) {
    OutcomeReport report;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        // stopping_ and drained.
        cv_idle_.notify_all();
        return;
      }
      report = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }
    store(report);
    {
      std::lock_guard<std::mutex> lock(mu_);
      busy_ = false;
    }
    cv_idle_.notify_all();
  }
}

void OutcomeRecorder::store(const OutcomeReport& report) {
  if (!memory_) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  auto r = memory_->store_outcome(report.incident_id, report.actions, report.success,
                                  report.duration_minutes, report.lessons);
  if (!r.ok()) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::warn, "recorder", "outcome_store_failed", r.message,
              {{"incident_id", report.incident_id}, {"error", to_string(r.error)},
               {"source", report.source}});
    return;
  }
  const StoreOutcomeResult& res = *r.value;
  if (!res.ok) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::warn, "recorder", "outcome_rejected", res.message,
              {{"incident_id", report.incident_id}, {"error", to_string(res.error)},
               {"source", report.source}});
    return;
  }
  if (res.duplicate) {
    duplicates_.fetch_add(1, std::memory_order_relaxed);
  } else {
    stored_.fetch_add(1, std::memory_order_relaxed);
  }
  log_event(LogLevel::debug, "recorder", "outcome_stored", "outcome recorded",
            {{"incident_id", report.incident_id}, {"outcome_id", res.outcome_id},
             {"duplicate", res.duplicate ? "true" : "false"}});
}

}  // namespace arf
