#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/dispatch/in_flight_gauge.hpp"
#include "internal/dispatch/job.hpp"

namespace faucet::dispatch {

class DispatchQueue;

/*
  Single-consumer view over the jobs that were queued when Drain() was called.
  Destroying the cursor hands the consumer token back to the queue.
*/
class JobCursor {
 public:
  ~JobCursor();

  JobCursor(JobCursor&& other) noexcept;
  JobCursor& operator=(JobCursor&& other) noexcept;

  JobCursor(const JobCursor&)            = delete;
  JobCursor& operator=(const JobCursor&) = delete;

  // Next job in arrival order; nullopt once the snapshot is exhausted or the queue shut down.
  std::optional<JobHandle> Next();

  std::size_t remaining() const {
    return remaining_;
  }

 private:
  friend class DispatchQueue;

  JobCursor(DispatchQueue* queue, std::size_t remaining) : queue_(queue), remaining_(remaining) {
  }

  DispatchQueue* queue_ = nullptr;
  std::size_t    remaining_ = 0;
};

/*
  FIFO hand-off between the parallel admission path and the one submitter.
*/
class DispatchQueue {
 public:
  explicit DispatchQueue(std::shared_ptr<InFlightGauge> gauge);

  // The decision must be accepted and hold an in-flight slot, which the job takes over.
  // Throws util::Unavailable after Shutdown; the slot is freed in that case.
  JobHandle Enqueue(const model::AdmissionDecision& decision);

  // Throws util::InvalidState while another cursor is alive.
  JobCursor Drain();

  // Delivers the terminal record to the job handle.
  void Complete(const JobHandle& job, model::TransactionRecord record);

  // Blocks until a job is queued, shutdown, or timeout. True if work is available.
  bool WaitForWork(util::Millis timeout);

  // Stops accepting work; queued jobs end Abandoned. They hold no reservation.
  void Shutdown();

  bool is_shutdown() const;

  std::size_t depth() const;

  const std::shared_ptr<InFlightGauge>& gauge() const {
    return gauge_;
  }

 private:
  friend class JobCursor;

  std::optional<JobHandle> PopForCursor();
  void                     ReleaseCursor();

  std::shared_ptr<InFlightGauge> gauge_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<JobHandle>   queue_;
  model::JobId            next_id_       = 1;
  bool                    cursor_active_ = false;
  bool                    shutdown_      = false;
};

} // namespace faucet::dispatch
