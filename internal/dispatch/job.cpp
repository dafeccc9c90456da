#include "job.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace faucet::dispatch {

Job::Job(model::JobId id, const model::AdmissionDecision& decision, std::shared_ptr<InFlightGauge> gauge)
    : id_(id), request_(decision.request), destination_(decision.destination), gauge_(std::move(gauge)) {
  record_.job_id      = id_;
  record_.request     = request_;
  record_.destination = destination_;
  record_.state       = model::JobState::kAdmitted;
}

Job::~Job() {
  // A job dropped without an outcome still frees its slot.
  if (!done_ && gauge_) {
    gauge_->Release();
  }
}

model::JobState Job::state() const {
  std::lock_guard lock(mutex_);
  return record_.state;
}

void Job::TransitionTo(model::JobState next) {
  std::lock_guard lock(mutex_);
  if (record_.state == next && !model::IsTerminal(next)) {
    return;
  }
  if (!model::CanTransition(record_.state, next)) {
    throw util::InvalidState("job " + std::to_string(id_) + ": invalid transition " + std::string(model::ToString(record_.state)) +
                             " -> " + std::string(model::ToString(next)));
  }
  record_.state = next;
}

void Job::Publish(const model::TransactionRecord& record) {
  std::lock_guard lock(mutex_);
  if (done_) {
    return;
  }
  const auto state = record_.state;
  record_          = record;
  record_.state    = state;
}

bool Job::Complete(model::TransactionRecord record) {
  if (!model::IsTerminal(record.state)) {
    throw util::InvalidState("job " + std::to_string(id_) + ": completed with non-terminal state " +
                             std::string(model::ToString(record.state)));
  }
  {
    std::lock_guard lock(mutex_);
    if (done_) {
      return false;
    }
    if (!model::CanTransition(record_.state, record.state)) {
      throw util::InvalidState("job " + std::to_string(id_) + ": invalid transition " + std::string(model::ToString(record_.state)) +
                               " -> " + std::string(model::ToString(record.state)));
    }
    record.job_id = id_;
    record_       = std::move(record);
    done_         = true;
    completed_at_ = util::Now();
  }
  if (gauge_) {
    gauge_->Release();
  }
  cv_.notify_all();
  return true;
}

model::TransactionRecord Job::Current() const {
  std::lock_guard lock(mutex_);
  return record_;
}

std::optional<model::TransactionRecord> Job::WaitFor(util::Millis timeout) const {
  std::unique_lock lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [&] { return done_; })) {
    return std::nullopt;
  }
  return record_;
}

bool Job::done() const {
  std::lock_guard lock(mutex_);
  return done_;
}

std::optional<util::TimePoint> Job::completed_at() const {
  std::lock_guard lock(mutex_);
  if (!done_) {
    return std::nullopt;
  }
  return completed_at_;
}

} // namespace faucet::dispatch
