#include "dispatch_queue.hpp"

#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace faucet::dispatch {

JobCursor::~JobCursor() {
  if (queue_) {
    queue_->ReleaseCursor();
  }
}

JobCursor::JobCursor(JobCursor&& other) noexcept
    : queue_(std::exchange(other.queue_, nullptr)), remaining_(std::exchange(other.remaining_, 0)) {
}

JobCursor& JobCursor::operator=(JobCursor&& other) noexcept {
  if (this != &other) {
    if (queue_) {
      queue_->ReleaseCursor();
    }
    queue_     = std::exchange(other.queue_, nullptr);
    remaining_ = std::exchange(other.remaining_, 0);
  }
  return *this;
}

std::optional<JobHandle> JobCursor::Next() {
  if (!queue_ || remaining_ == 0) {
    return std::nullopt;
  }
  auto job = queue_->PopForCursor();
  if (!job) {
    remaining_ = 0;
    return std::nullopt;
  }
  --remaining_;
  return job;
}

DispatchQueue::DispatchQueue(std::shared_ptr<InFlightGauge> gauge) : gauge_(std::move(gauge)) {
}

JobHandle DispatchQueue::Enqueue(const model::AdmissionDecision& decision) {
  if (!decision.accepted()) {
    throw util::InvalidArgument("only accepted requests can be queued");
  }

  JobHandle job;
  {
    std::lock_guard lock(mutex_);
    job = std::make_shared<Job>(next_id_++, decision, gauge_);
    if (!shutdown_) {
      job->TransitionTo(model::JobState::kQueued);
      queue_.push_back(job);
      observability::Metrics::Instance().SetQueueDepth(queue_.size());
    }
  }

  if (job->state() != model::JobState::kQueued) {
    auto record   = job->Current();
    record.state  = model::JobState::kAbandoned;
    record.detail = "service is shutting down";
    job->Complete(std::move(record));
    throw util::Unavailable("service is shutting down");
  }

  cv_.notify_one();
  return job;
}

JobCursor DispatchQueue::Drain() {
  std::lock_guard lock(mutex_);
  if (cursor_active_) {
    throw util::InvalidState("dispatch queue already has an active consumer");
  }
  cursor_active_ = true;
  return JobCursor(this, queue_.size());
}

void DispatchQueue::Complete(const JobHandle& job, model::TransactionRecord record) {
  const auto state = record.state;
  if (!job->Complete(std::move(record))) {
    FAUCET_LOG_WARN("job already complete", {observability::U64Field("job_id", job->id())});
    return;
  }
  observability::Metrics::Instance().RecordOutcome(state);
}

bool DispatchQueue::WaitForWork(util::Millis timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });
  return !shutdown_ && !queue_.empty();
}

void DispatchQueue::Shutdown() {
  std::deque<JobHandle> abandoned;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
    abandoned.swap(queue_);
    observability::Metrics::Instance().SetQueueDepth(0);
  }
  cv_.notify_all();

  if (!abandoned.empty()) {
    FAUCET_LOG_WARN("abandoning queued jobs at shutdown", {observability::U64Field("count", abandoned.size())});
  }
  for (auto& job : abandoned) {
    auto record   = job->Current();
    record.state  = model::JobState::kAbandoned;
    record.detail = "service shut down before submission";
    Complete(job, std::move(record));
  }
}

bool DispatchQueue::is_shutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t DispatchQueue::depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<JobHandle> DispatchQueue::PopForCursor() {
  std::lock_guard lock(mutex_);
  if (shutdown_ || queue_.empty()) {
    return std::nullopt;
  }
  auto job = std::move(queue_.front());
  queue_.pop_front();
  observability::Metrics::Instance().SetQueueDepth(queue_.size());
  return job;
}

void DispatchQueue::ReleaseCursor() {
  std::lock_guard lock(mutex_);
  cursor_active_ = false;
}

} // namespace faucet::dispatch
