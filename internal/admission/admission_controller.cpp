#include "admission_controller.hpp"

#include <chrono>
#include <vector>

#include "internal/chain/address.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace faucet::admission {
namespace {

constexpr std::size_t kSweepEvery = 1024;

model::AdmissionDecision Reject(const model::DisbursementRequest& request, model::Verdict verdict, std::string reason,
                                util::Millis retry_after = util::Millis{0}) {
  model::AdmissionDecision decision;
  decision.request     = request;
  decision.verdict     = verdict;
  decision.reason      = std::move(reason);
  decision.retry_after = retry_after;
  return decision;
}

} // namespace

AdmissionController::AdmissionController(util::Millis cooldown, std::shared_ptr<dispatch::InFlightGauge> gauge)
    : cooldown_(cooldown), gauge_(std::move(gauge)) {
}

model::AdmissionDecision AdmissionController::Decide(const model::DisbursementRequest& request) {
  auto& metrics = observability::Metrics::Instance();

  chain::Address destination{};
  try {
    destination = chain::ParseAddressOrThrow(request.destination);
  } catch (const util::InvalidArgument& e) {
    FAUCET_LOG_INFO("request rejected: invalid address",
                    {observability::StringField("requester", request.requester), observability::StringField("reason", e.what())});
    metrics.RecordAdmission(model::Verdict::kRejectedInvalidAddress);
    return Reject(request, model::Verdict::kRejectedInvalidAddress, e.what());
  }

  const auto now    = request.submitted_at;
  auto       window = WindowFor(request.requester, now);

  std::lock_guard lock(window->mutex);
  PruneLocked(*window, now);

  if (!window->grants.empty()) {
    const auto open_at     = window->grants.back() + cooldown_;
    const auto retry_after = std::chrono::ceil<util::Millis>(open_at - now);
    FAUCET_LOG_INFO("request rejected: rate limited",
                    {observability::StringField("requester", request.requester),
                     observability::IntField("retry_after_ms", retry_after.count())});
    metrics.RecordAdmission(model::Verdict::kRejectedRateLimited);
    return Reject(request, model::Verdict::kRejectedRateLimited, "cooldown active", retry_after);
  }

  if (!gauge_->TryAcquire()) {
    FAUCET_LOG_WARN("request rejected: backpressure",
                    {observability::StringField("requester", request.requester),
                     observability::U64Field("in_flight", gauge_->in_flight()), observability::U64Field("ceiling", gauge_->ceiling())});
    metrics.RecordAdmission(model::Verdict::kRejectedBackpressure);
    return Reject(request, model::Verdict::kRejectedBackpressure, "too many disbursements in flight");
  }

  window->grants.push_back(now);

  model::AdmissionDecision decision;
  decision.request     = request;
  decision.verdict     = model::Verdict::kAccepted;
  decision.destination = destination;
  metrics.RecordAdmission(model::Verdict::kAccepted);
  return decision;
}

std::size_t AdmissionController::tracked_requesters() const {
  std::lock_guard lock(windows_mutex_);
  return windows_.size();
}

std::shared_ptr<AdmissionController::RateWindow> AdmissionController::WindowFor(const std::string& requester, util::TimePoint now) {
  bool                        sweep = false;
  std::shared_ptr<RateWindow> window;
  {
    std::lock_guard lock(windows_mutex_);
    auto&           slot = windows_[requester];
    if (!slot) {
      slot = std::make_shared<RateWindow>();
    }
    window = slot;
    sweep  = ++decisions_since_sweep_ >= kSweepEvery;
    if (sweep) {
      decisions_since_sweep_ = 0;
    }
  }
  if (sweep) {
    SweepIdleWindows(now);
  }
  return window;
}

void AdmissionController::PruneLocked(RateWindow& window, util::TimePoint now) const {
  // A grant stops counting once now >= grant + cooldown.
  while (!window.grants.empty() && window.grants.front() + cooldown_ <= now) {
    window.grants.pop_front();
  }
}

void AdmissionController::SweepIdleWindows(util::TimePoint now) {
  std::lock_guard lock(windows_mutex_);
  for (auto it = windows_.begin(); it != windows_.end();) {
    auto& window = it->second;
    // use_count 1: no Decide call holds this window right now.
    if (window.use_count() == 1) {
      std::unique_lock window_lock(window->mutex, std::try_to_lock);
      if (window_lock.owns_lock()) {
        PruneLocked(*window, now);
        if (window->grants.empty()) {
          window_lock.unlock();
          it = windows_.erase(it);
          continue;
        }
      }
    }
    ++it;
  }
}

} // namespace faucet::admission
