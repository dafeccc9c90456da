#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/admission/admission_controller.hpp"
#include "internal/core/health_monitor.hpp"
#include "internal/dispatch/dispatch_queue.hpp"

namespace faucet::core {

struct FacadeOptions {
  chain::U256  grant_amount;
  util::Millis client_timeout{30000};
  util::Millis result_retention{std::chrono::hours(1)};
};

/*
  Entry point for every inbound surface (gRPC, HTTP).

  RequestDisbursement admits and enqueues, then waits up to client_timeout for
  the outcome. A caller timeout only ends the wait: the job keeps running and
  its outcome stays retrievable through GetDisbursement for result_retention.
*/
class FaucetService {
 public:
  FaucetService(std::shared_ptr<admission::AdmissionController> admission,
                std::shared_ptr<dispatch::DispatchQueue>        queue,
                std::shared_ptr<HealthMonitor>                  health,
                FacadeOptions                                   options,
                bool                                            credential_valid = true,
                util::NowFn                                     now              = util::Now);

  // Throws util::InvalidArgument for an empty requester and util::Unavailable
  // while the funding credential is invalid or the service is shutting down.
  model::DisbursementOutcome RequestDisbursement(const std::string& requester, const std::string& destination);

  // Throws util::NotFound for unknown or expired job ids.
  model::DisbursementOutcome GetDisbursement(model::JobId job_id);

  HealthReport HealthStatus() const;

  static model::DisbursementOutcome ToOutcome(const model::TransactionRecord& record);

 private:
  void Register(const dispatch::JobHandle& job);
  void PruneExpiredLocked();

  std::shared_ptr<admission::AdmissionController> admission_;
  std::shared_ptr<dispatch::DispatchQueue>        queue_;
  std::shared_ptr<HealthMonitor>                  health_;
  FacadeOptions                                   options_;
  bool                                            credential_valid_;
  util::NowFn                                     now_;

  std::mutex                                            jobs_mutex_;
  std::unordered_map<model::JobId, dispatch::JobHandle> jobs_;
};

} // namespace faucet::core
