#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/chain/types.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace faucet::model {

using JobId = std::uint64_t;

/*
  One inbound ask for funds. The amount is the configured grant; the
  destination is kept as received until admission has validated it.
*/
struct DisbursementRequest {
  std::string     requester;
  std::string     destination;
  chain::U256     amount;
  util::TimePoint submitted_at{};
};

enum class Verdict : std::uint8_t {
  kAccepted               = 0,
  kRejectedRateLimited    = 1,
  kRejectedInvalidAddress = 2,
  kRejectedBackpressure   = 3,
};

constexpr std::string_view ToString(Verdict verdict) {
  switch (verdict) {
    case Verdict::kAccepted:
      return "accepted";
    case Verdict::kRejectedRateLimited:
      return "rate_limited";
    case Verdict::kRejectedInvalidAddress:
      return "invalid_address";
    case Verdict::kRejectedBackpressure:
      return "backpressure";
    default:
      return "unknown";
  }
}

struct AdmissionDecision {
  DisbursementRequest request;
  Verdict             verdict = Verdict::kRejectedInvalidAddress;
  std::string         reason;
  util::Millis        retry_after{0};

  // Set only for kAccepted.
  chain::Address destination{};

  bool accepted() const {
    return verdict == Verdict::kAccepted;
  }
};

struct SubmissionAttempt {
  std::uint64_t   sequence = 0;
  chain::Hash     hash{};
  chain::U256     gas_price;
  util::TimePoint sent_at{};
  std::string     error;
  bool            accepted = false;
  // The send failed in a way that leaves open whether the node kept the payload.
  bool            uncertain = false;
};

/*
  Everything the submitter learned while driving one job to its outcome.
*/
struct TransactionRecord {
  JobId                          job_id = 0;
  DisbursementRequest            request;
  chain::Address                 destination{};
  std::optional<std::uint64_t>   sequence;
  std::vector<SubmissionAttempt> attempts;
  std::optional<chain::Hash>     included_hash;
  JobState                       state = JobState::kAdmitted;
  std::string                    detail;
};

/*
  What callers of the facade see.
*/
enum class OutcomeStatus : std::uint8_t {
  kConfirmed      = 0,
  kFailed         = 1,
  kAbandoned      = 2,
  kPending        = 3,
  kRateLimited    = 4,
  kInvalidAddress = 5,
  kBackpressure   = 6,
};

constexpr std::string_view ToString(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::kConfirmed:
      return "confirmed";
    case OutcomeStatus::kFailed:
      return "failed";
    case OutcomeStatus::kAbandoned:
      return "abandoned";
    case OutcomeStatus::kPending:
      return "pending";
    case OutcomeStatus::kRateLimited:
      return "rate_limited";
    case OutcomeStatus::kInvalidAddress:
      return "invalid_address";
    case OutcomeStatus::kBackpressure:
      return "backpressure";
    default:
      return "unknown";
  }
}

struct DisbursementOutcome {
  OutcomeStatus                status = OutcomeStatus::kPending;
  std::optional<JobId>         job_id;
  std::optional<chain::Hash>   transaction_hash;
  std::optional<std::uint64_t> sequence;
  std::string                  message;
  util::Millis                 retry_after{0};
  std::uint32_t                attempts = 0;
};

} // namespace faucet::model
