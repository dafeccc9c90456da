#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/dispatch/in_flight_gauge.hpp"
#include "internal/model/disbursement.hpp"

namespace faucet::dispatch {

/*
  Shared state of one admitted disbursement.

  The submitter publishes progress into the record; Complete delivers the
  terminal record exactly once, wakes waiters and frees the in-flight slot.
*/
class Job {
 public:
  Job(model::JobId id, const model::AdmissionDecision& decision, std::shared_ptr<InFlightGauge> gauge);
  ~Job();

  Job(const Job&)            = delete;
  Job& operator=(const Job&) = delete;

  model::JobId id() const {
    return id_;
  }

  const model::DisbursementRequest& request() const {
    return request_;
  }

  const chain::Address& destination() const {
    return destination_;
  }

  model::JobState state() const;

  // Validated against CanTransition. Throws util::InvalidState.
  void TransitionTo(model::JobState next);

  // Progress without a state change (attempts, sequence).
  void Publish(const model::TransactionRecord& record);

  // Returns false if the job was already complete. record.state must be terminal.
  bool Complete(model::TransactionRecord record);

  model::TransactionRecord Current() const;

  // Terminal record, or nullopt if the job is still running after timeout.
  std::optional<model::TransactionRecord> WaitFor(util::Millis timeout) const;

  bool done() const;

  // Set when Complete delivered the terminal record.
  std::optional<util::TimePoint> completed_at() const;

 private:
  const model::JobId               id_;
  const model::DisbursementRequest request_;
  const chain::Address             destination_;
  std::shared_ptr<InFlightGauge>   gauge_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  model::TransactionRecord        record_;
  bool                            done_ = false;
  util::TimePoint                 completed_at_{};
};

using JobHandle = std::shared_ptr<Job>;

} // namespace faucet::dispatch
