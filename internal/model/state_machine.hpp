#pragma once

#include <cstdint>
#include <string_view>

namespace faucet::model {

/*
  Lifecycle of one disbursement job.

  Admitted -> Queued -> Submitted -> Confirmed
                           |  ^
                           v  |
                 Retrying / AmbiguousPending
  Any non-terminal state may end in Failed or Abandoned.
*/
enum class JobState : std::uint8_t {
  kAdmitted         = 0,
  kQueued           = 1,
  kSubmitted        = 2,
  kRetrying         = 3,
  kAmbiguousPending = 4,
  kConfirmed        = 5,
  kFailed           = 6,
  kAbandoned        = 7,
};

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kConfirmed || state == JobState::kFailed || state == JobState::kAbandoned;
}

constexpr bool CanTransition(JobState from, JobState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == JobState::kFailed || to == JobState::kAbandoned) {
    return true;
  }

  switch (from) {
    case JobState::kAdmitted:
      return to == JobState::kQueued;
    case JobState::kQueued:
      return to == JobState::kSubmitted || to == JobState::kRetrying;
    case JobState::kSubmitted:
      return to == JobState::kConfirmed || to == JobState::kRetrying || to == JobState::kAmbiguousPending;
    case JobState::kRetrying:
      return to == JobState::kSubmitted || to == JobState::kRetrying || to == JobState::kAmbiguousPending;
    case JobState::kAmbiguousPending:
      return to == JobState::kConfirmed || to == JobState::kSubmitted;
    default:
      return false;
  }
}

constexpr std::string_view ToString(JobState state) {
  switch (state) {
    case JobState::kAdmitted:
      return "admitted";
    case JobState::kQueued:
      return "queued";
    case JobState::kSubmitted:
      return "submitted";
    case JobState::kRetrying:
      return "retrying";
    case JobState::kAmbiguousPending:
      return "ambiguous_pending";
    case JobState::kConfirmed:
      return "confirmed";
    case JobState::kFailed:
      return "failed";
    case JobState::kAbandoned:
      return "abandoned";
    default:
      return "unknown";
  }
}

} // namespace faucet::model
