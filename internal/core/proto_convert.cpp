#include "internal/core/proto_convert.hpp"

#include "internal/chain/address.hpp"
#include "internal/chain/units.hpp"
#include "internal/util/hex.hpp"

namespace faucet::core {

faucet::v1::DisbursementStatus ToProto(model::OutcomeStatus status) {
  switch (status) {
    case model::OutcomeStatus::kConfirmed:
      return faucet::v1::DISBURSEMENT_STATUS_CONFIRMED;
    case model::OutcomeStatus::kFailed:
      return faucet::v1::DISBURSEMENT_STATUS_FAILED;
    case model::OutcomeStatus::kAbandoned:
      return faucet::v1::DISBURSEMENT_STATUS_ABANDONED;
    case model::OutcomeStatus::kPending:
      return faucet::v1::DISBURSEMENT_STATUS_PENDING;
    case model::OutcomeStatus::kRateLimited:
      return faucet::v1::DISBURSEMENT_STATUS_RATE_LIMITED;
    case model::OutcomeStatus::kInvalidAddress:
      return faucet::v1::DISBURSEMENT_STATUS_INVALID_ADDRESS;
    case model::OutcomeStatus::kBackpressure:
      return faucet::v1::DISBURSEMENT_STATUS_BACKPRESSURE;
  }
  return faucet::v1::DISBURSEMENT_STATUS_UNSPECIFIED;
}

faucet::v1::DisbursementResponse ToProto(const model::DisbursementOutcome& outcome) {
  faucet::v1::DisbursementResponse response;
  response.set_status(ToProto(outcome.status));
  if (outcome.job_id) {
    response.set_job_id(*outcome.job_id);
  }
  if (outcome.transaction_hash) {
    response.set_transaction_hash(util::ToHex(*outcome.transaction_hash));
  }
  if (outcome.sequence) {
    response.set_sequence(*outcome.sequence);
  }
  response.set_message(outcome.message);
  response.set_retry_after_ms(static_cast<uint64_t>(outcome.retry_after.count()));
  response.set_attempts(outcome.attempts);
  return response;
}

faucet::v1::GetHealthResponse ToProto(const HealthReport& report) {
  faucet::v1::GetHealthResponse response;
  response.set_healthy(report.healthy());
  response.set_chain_reachable(report.chain_reachable);
  response.set_balance_above_threshold(report.balance_above_threshold);
  response.set_credential_valid(report.credential_valid);
  if (report.balance) {
    response.set_balance_wei(chain::ToDecimal(*report.balance));
  }
  response.set_funding_address(report.funding_address);
  response.set_queue_depth(report.queue_depth);
  return response;
}

} // namespace faucet::core
