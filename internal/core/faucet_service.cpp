#include "faucet_service.hpp"

#include "internal/chain/units.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace faucet::core {
namespace {

model::OutcomeStatus RejectionStatus(model::Verdict verdict) {
  switch (verdict) {
    case model::Verdict::kRejectedRateLimited:
      return model::OutcomeStatus::kRateLimited;
    case model::Verdict::kRejectedBackpressure:
      return model::OutcomeStatus::kBackpressure;
    case model::Verdict::kRejectedInvalidAddress:
    default:
      return model::OutcomeStatus::kInvalidAddress;
  }
}

} // namespace

FaucetService::FaucetService(std::shared_ptr<admission::AdmissionController> admission,
                             std::shared_ptr<dispatch::DispatchQueue>        queue,
                             std::shared_ptr<HealthMonitor>                  health,
                             FacadeOptions                                   options,
                             bool                                            credential_valid,
                             util::NowFn                                     now)
    : admission_(std::move(admission)),
      queue_(std::move(queue)),
      health_(std::move(health)),
      options_(std::move(options)),
      credential_valid_(credential_valid),
      now_(std::move(now)) {
}

model::DisbursementOutcome FaucetService::RequestDisbursement(const std::string& requester, const std::string& destination) {
  observability::SpanScope span("faucet.request_disbursement");
  span.SetAttribute("requester", requester);

  if (requester.empty()) {
    throw util::InvalidArgument("requester is required");
  }
  if (!credential_valid_) {
    throw util::Unavailable("funding credential is invalid; disbursements are disabled");
  }

  model::DisbursementRequest request;
  request.requester    = requester;
  request.destination  = destination;
  request.amount       = options_.grant_amount;
  request.submitted_at = now_();

  const auto decision = admission_->Decide(request);
  if (!decision.accepted()) {
    model::DisbursementOutcome outcome;
    outcome.status      = RejectionStatus(decision.verdict);
    outcome.message     = decision.reason;
    outcome.retry_after = decision.retry_after;
    span.SetAttribute("verdict", model::ToString(decision.verdict));
    return outcome;
  }

  auto job = queue_->Enqueue(decision);
  Register(job);
  span.SetAttribute("job_id", static_cast<std::int64_t>(job->id()));
  FAUCET_LOG_INFO("disbursement queued",
                  {observability::U64Field("job_id", job->id()), observability::StringField("requester", requester),
                   observability::StringField("destination", destination),
                   observability::StringField("amount_ether", chain::FormatEther(request.amount))});

  if (auto record = job->WaitFor(options_.client_timeout)) {
    return ToOutcome(*record);
  }

  auto outcome    = ToOutcome(job->Current());
  outcome.message = "still processing; query the job id for the outcome";
  return outcome;
}

model::DisbursementOutcome FaucetService::GetDisbursement(model::JobId job_id) {
  std::lock_guard lock(jobs_mutex_);
  PruneExpiredLocked();

  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("unknown disbursement job " + std::to_string(job_id));
  }
  return ToOutcome(it->second->Current());
}

HealthReport FaucetService::HealthStatus() const {
  auto report        = health_->Check();
  report.queue_depth = queue_->depth();
  return report;
}

model::DisbursementOutcome FaucetService::ToOutcome(const model::TransactionRecord& record) {
  model::DisbursementOutcome outcome;
  outcome.job_id   = record.job_id;
  outcome.sequence = record.sequence;
  outcome.message  = record.detail;
  outcome.attempts = static_cast<std::uint32_t>(record.attempts.size());

  switch (record.state) {
    case model::JobState::kConfirmed:
      outcome.status           = model::OutcomeStatus::kConfirmed;
      outcome.transaction_hash = record.included_hash;
      break;
    case model::JobState::kFailed:
      outcome.status           = model::OutcomeStatus::kFailed;
      outcome.transaction_hash = record.included_hash;
      break;
    case model::JobState::kAbandoned:
      outcome.status = model::OutcomeStatus::kAbandoned;
      break;
    default:
      outcome.status = model::OutcomeStatus::kPending;
      if (!record.attempts.empty()) {
        outcome.transaction_hash = record.attempts.back().hash;
      }
      break;
  }
  return outcome;
}

void FaucetService::Register(const dispatch::JobHandle& job) {
  std::lock_guard lock(jobs_mutex_);
  PruneExpiredLocked();
  jobs_.emplace(job->id(), job);
}

void FaucetService::PruneExpiredLocked() {
  const auto now = util::Now();
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    const auto completed = it->second->completed_at();
    if (completed && now - *completed >= options_.result_retention) {
      it = jobs_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace faucet::core
