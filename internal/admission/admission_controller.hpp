#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/dispatch/in_flight_gauge.hpp"
#include "internal/model/disbursement.hpp"

namespace faucet::admission {

/*
  Decides whether a request may enter the dispatch queue.

  Checks run in order: destination address, per-requester cooldown, global
  in-flight ceiling. Never touches the chain. The cooldown check, the slot
  acquisition and the grant record happen under the requester's own lock, so
  parallel admissions of different requesters do not contend.
*/
class AdmissionController {
 public:
  AdmissionController(util::Millis cooldown, std::shared_ptr<dispatch::InFlightGauge> gauge);

  // An accepted decision owns one in-flight slot; DispatchQueue::Enqueue takes it over.
  model::AdmissionDecision Decide(const model::DisbursementRequest& request);

  std::size_t tracked_requesters() const;

 private:
  // Accepted grant timestamps, oldest first.
  struct RateWindow {
    std::mutex                  mutex;
    std::deque<util::TimePoint> grants;
  };

  std::shared_ptr<RateWindow> WindowFor(const std::string& requester, util::TimePoint now);
  void                        PruneLocked(RateWindow& window, util::TimePoint now) const;
  void                        SweepIdleWindows(util::TimePoint now);

  const util::Millis                       cooldown_;
  std::shared_ptr<dispatch::InFlightGauge> gauge_;

  mutable std::mutex                                           windows_mutex_;
  std::unordered_map<std::string, std::shared_ptr<RateWindow>> windows_;
  std::size_t                                                  decisions_since_sweep_ = 0;
};

} // namespace faucet::admission
