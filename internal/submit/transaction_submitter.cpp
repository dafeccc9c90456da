#include "transaction_submitter.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "internal/chain/transaction.hpp"
#include "internal/chain/units.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/hex.hpp"

namespace faucet::submit {

using model::JobState;

namespace {

using SteadyClock = std::chrono::steady_clock;

observability::LogField JobField(const dispatch::Job& job) {
  return observability::U64Field("job_id", job.id());
}

observability::LogField SequenceField(const model::TransactionRecord& record) {
  return observability::StringField("sequence", record.sequence ? std::to_string(*record.sequence) : "-");
}

} // namespace

TransactionSubmitter::TransactionSubmitter(std::shared_ptr<chain::ChainClient>         chain,
                                           std::shared_ptr<ledger::LedgerStateCache>   ledger,
                                           std::shared_ptr<const crypto::Secp256k1Key> key,
                                           SubmitterOptions                            options)
    : chain_(std::move(chain)),
      ledger_(std::move(ledger)),
      key_(std::move(key)),
      options_(options),
      chain_id_(options.chain_id) {
}

model::TransactionRecord TransactionSubmitter::Process(dispatch::Job& job) {
  observability::SpanScope span("faucet.submit");
  span.SetAttribute("job_id", static_cast<std::int64_t>(job.id()));

  JobContext ctx{job, job.Current()};
  try {
    auto record = Drive(ctx);
    span.SetAttribute("outcome", model::ToString(record.state));
    return record;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    FAUCET_LOG_ERROR("submitter internal error", {JobField(job), observability::ErrorField(e)});
    return Finish(ctx, JobState::kFailed, std::string("internal error: ") + e.what(),
                  ctx.pinned() || ctx.ambiguous ? Disposition::kKeep : Disposition::kRelease);
  }
}

void TransactionSubmitter::Interrupt() {
  {
    std::lock_guard lock(stop_mutex_);
    stop_ = true;
  }
  stop_cv_.notify_all();
}

bool TransactionSubmitter::interrupted() const {
  std::lock_guard lock(stop_mutex_);
  return stop_;
}

util::Millis TransactionSubmitter::Backoff(std::uint32_t attempt) const {
  if (attempt == 0) {
    return util::Millis{0};
  }
  auto delay = options_.backoff_initial;
  for (std::uint32_t i = 1; i < attempt && delay < options_.backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.backoff_max);
}

model::TransactionRecord TransactionSubmitter::Drive(JobContext& ctx) {
  while (true) {
    if (interrupted()) {
      return Abort(ctx);
    }

    if (ctx.rounds >= options_.max_attempts) {
      if (!ctx.pinned() && FindEarlierPayload(ctx) == EarlierPayload::kLive) {
        auto included = WaitForInclusion(ctx);
        if (included) {
          return *included;
        }
      }
      if (ctx.pinned()) {
        return Finish(ctx, JobState::kAbandoned, "not included after " + std::to_string(ctx.rounds) + " attempts",
                      Disposition::kRelease);
      }
      return Finish(ctx, JobState::kFailed, "gave up after " + std::to_string(ctx.rounds) + " attempts: " + ctx.last_error,
                    Disposition::kRelease);
    }
    ++ctx.rounds;

    switch (SubmitOnce(ctx)) {
      case SendResult::kRetry:
        ctx.job.TransitionTo(JobState::kRetrying);
        FAUCET_LOG_WARN("submission will be retried",
                        {JobField(ctx.job), observability::U64Field("round", ctx.rounds), observability::ErrorField(ctx.last_error)});
        if (!SleepFor(Backoff(ctx.rounds))) {
          return Abort(ctx);
        }
        continue;

      case SendResult::kTerminal:
        return Finish(ctx, JobState::kFailed, ctx.last_error, Disposition::kRelease);

      case SendResult::kAmbiguous: {
        const auto& attempt  = ctx.record.attempts.back();
        auto        resolved = ResolveAmbiguous(ctx, attempt.hash, attempt.gas_price);
        if (resolved) {
          return *resolved;
        }
        break;
      }

      case SendResult::kAccepted:
      case SendResult::kWait:
        break;
    }

    auto included = WaitForInclusion(ctx);
    if (included) {
      return *included;
    }

    // Not mined in time: replace with the same sequence and a higher fee.
    ++ctx.fee_bumps;
    ctx.job.TransitionTo(JobState::kRetrying);
    FAUCET_LOG_WARN("transaction not included in time, replacing",
                    {JobField(ctx.job), SequenceField(ctx.record), observability::U64Field("round", ctx.rounds)});
  }
}

TransactionSubmitter::SendResult TransactionSubmitter::SubmitOnce(JobContext& ctx) {
  const bool  replacing = ctx.pinned();
  chain::U256 price;
  std::uint64_t chain_id = 0;
  try {
    if (ctx.sequence_stale) {
      ledger_->Release(*ctx.record.sequence);
      ctx.record.sequence.reset();
      ctx.sequence_stale = false;
    }
    if (!ctx.record.sequence) {
      ctx.record.sequence = ledger_->Reserve(ctx.force_reconcile);
      ctx.force_reconcile = false;
    }
    price    = QuotePrice(ctx);
    chain_id = ChainId();
  } catch (const chain::ChainError& e) {
    ctx.last_error = e.what();
    observability::Metrics::Instance().RecordSubmissionAttempt(e.kind());
    return replacing ? SendResult::kWait : SendResult::kRetry;
  }

  chain::LegacyTransfer transfer;
  transfer.nonce     = *ctx.record.sequence;
  transfer.gas_price = price;
  transfer.gas_limit = ctx.gas_limit;
  transfer.to        = ctx.job.destination();
  transfer.value     = ctx.job.request().amount;
  transfer.chain_id  = chain_id;
  const auto signed_tx = chain::SignTransfer(transfer, *key_);

  model::SubmissionAttempt attempt;
  attempt.sequence  = transfer.nonce;
  attempt.hash      = signed_tx.hash;
  attempt.gas_price = price;
  attempt.sent_at   = util::Now();

  ctx.job.TransitionTo(JobState::kSubmitted);

  std::optional<chain::ChainErrorKind> failure;
  try {
    chain_->SubmitTransaction(signed_tx);
    attempt.accepted = true;
  } catch (const chain::ChainError& e) {
    attempt.error  = e.what();
    ctx.last_error = e.what();
    if (e.kind() == chain::ChainErrorKind::kAlreadyKnown) {
      attempt.accepted = true;
    } else {
      failure           = e.kind();
      attempt.uncertain = e.kind() == chain::ChainErrorKind::kTimeout || e.kind() == chain::ChainErrorKind::kUnavailable;
    }
  }

  ctx.record.attempts.push_back(attempt);
  ctx.job.Publish(ctx.record);
  observability::Metrics::Instance().RecordSubmissionAttempt(failure);

  if (attempt.accepted) {
    ctx.live_hashes.push_back(signed_tx.hash);
    ctx.last_price = price;
    FAUCET_LOG_INFO("transaction submitted",
                    {JobField(ctx.job), SequenceField(ctx.record), observability::StringField("hash", util::ToHex(signed_tx.hash)),
                     observability::StringField("gas_price", chain::ToDecimal(price))});
    return SendResult::kAccepted;
  }

  FAUCET_LOG_WARN("transaction submission failed",
                  {JobField(ctx.job), SequenceField(ctx.record), observability::StringField("kind", chain::ToString(*failure)),
                   observability::ErrorField(ctx.last_error)});

  switch (*failure) {
    case chain::ChainErrorKind::kTimeout:
      ctx.ambiguous = true;
      return SendResult::kAmbiguous;

    case chain::ChainErrorKind::kFeeTooLow:
    case chain::ChainErrorKind::kNonceTooLow:
    case chain::ChainErrorKind::kNonceConflict:
      if (*failure == chain::ChainErrorKind::kFeeTooLow) {
        ++ctx.fee_bumps;
      }
      // For a pinned job this is our own earlier payload holding the sequence.
      if (replacing) {
        return SendResult::kWait;
      }
      switch (FindEarlierPayload(ctx)) {
        case EarlierPayload::kLive:
          return SendResult::kWait;
        case EarlierPayload::kUnverified:
          return SendResult::kRetry;
        case EarlierPayload::kNone:
          break;
      }
      ReleaseForRetry(ctx);
      return SendResult::kRetry;

    case chain::ChainErrorKind::kUnavailable:
      ctx.ambiguous = true;
      return replacing ? SendResult::kWait : SendResult::kRetry;

    case chain::ChainErrorKind::kRejected:
    case chain::ChainErrorKind::kAlreadyKnown:
      return replacing ? SendResult::kWait : SendResult::kTerminal;
  }
  return SendResult::kTerminal;
}

std::optional<model::TransactionRecord> TransactionSubmitter::ResolveAmbiguous(JobContext&        ctx,
                                                                               const chain::Hash& hash,
                                                                               const chain::U256& price) {
  ctx.job.TransitionTo(JobState::kAmbiguousPending);
  const auto limit = std::max<std::uint32_t>(options_.ambiguous_requery_limit, 1);

  for (std::uint32_t query = 0; query < limit; ++query) {
    if (query > 0 && !SleepFor(options_.poll_interval)) {
      return Abort(ctx);
    }

    chain::TxStatus status = chain::TxStatus::kUnknown;
    try {
      status = chain_->GetTransactionStatus(hash);
    } catch (const chain::ChainError& e) {
      FAUCET_LOG_WARN("status query failed", {JobField(ctx.job), observability::ErrorField(e)});
      continue;
    }

    switch (status) {
      case chain::TxStatus::kIncluded:
        ctx.record.included_hash = hash;
        return Finish(ctx, JobState::kConfirmed, "included", Disposition::kConsume);
      case chain::TxStatus::kReverted:
        ctx.record.included_hash = hash;
        return Finish(ctx, JobState::kFailed, "transaction reverted", Disposition::kConsume);
      case chain::TxStatus::kPending:
        ctx.record.attempts.back().accepted = true;
        ctx.live_hashes.push_back(hash);
        ctx.last_price = price;
        ctx.job.Publish(ctx.record);
        ctx.job.TransitionTo(JobState::kSubmitted);
        return std::nullopt;
      case chain::TxStatus::kUnknown:
        break;
    }
  }

  if (ctx.pinned() || FindEarlierPayload(ctx) == EarlierPayload::kLive) {
    // An earlier payload still holds the sequence; keep waiting on it.
    ctx.job.TransitionTo(JobState::kSubmitted);
    return std::nullopt;
  }
  return Finish(ctx, JobState::kFailed, "submission outcome unknown after " + std::to_string(limit) + " status checks",
                Disposition::kRelease);
}

std::optional<model::TransactionRecord> TransactionSubmitter::WaitForInclusion(JobContext& ctx) {
  ctx.job.TransitionTo(JobState::kSubmitted);
  const auto deadline = SteadyClock::now() + options_.confirmation_timeout;

  while (true) {
    for (auto it = ctx.live_hashes.rbegin(); it != ctx.live_hashes.rend(); ++it) {
      chain::TxStatus status = chain::TxStatus::kUnknown;
      try {
        status = chain_->GetTransactionStatus(*it);
      } catch (const chain::ChainError& e) {
        FAUCET_LOG_WARN("status query failed", {JobField(ctx.job), observability::ErrorField(e)});
        break;
      }

      if (status == chain::TxStatus::kIncluded) {
        ctx.record.included_hash = *it;
        return Finish(ctx, JobState::kConfirmed, "included", Disposition::kConsume);
      }
      if (status == chain::TxStatus::kReverted) {
        ctx.record.included_hash = *it;
        return Finish(ctx, JobState::kFailed, "transaction reverted", Disposition::kConsume);
      }
    }

    const auto now = SteadyClock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    const auto remaining = std::chrono::duration_cast<util::Millis>(deadline - now);
    if (!SleepFor(std::min(options_.poll_interval, remaining + util::Millis{1}))) {
      return Abort(ctx);
    }
  }
}

TransactionSubmitter::EarlierPayload TransactionSubmitter::FindEarlierPayload(JobContext& ctx) {
  if (!ctx.record.sequence || ctx.sequence_stale) {
    return EarlierPayload::kNone;
  }

  auto result = EarlierPayload::kNone;
  for (auto& attempt : ctx.record.attempts) {
    if (!attempt.uncertain || attempt.accepted || attempt.sequence != *ctx.record.sequence) {
      continue;
    }

    chain::TxStatus status = chain::TxStatus::kUnknown;
    try {
      status = chain_->GetTransactionStatus(attempt.hash);
    } catch (const chain::ChainError& e) {
      FAUCET_LOG_WARN("status query failed", {JobField(ctx.job), observability::ErrorField(e)});
      result = EarlierPayload::kUnverified;
      continue;
    }
    if (status == chain::TxStatus::kUnknown) {
      continue;
    }

    attempt.accepted = true;
    ctx.live_hashes.push_back(attempt.hash);
    ctx.last_price = attempt.gas_price;
    ctx.job.Publish(ctx.record);
    FAUCET_LOG_INFO("earlier payload found on chain",
                    {JobField(ctx.job), SequenceField(ctx.record), observability::StringField("hash", util::ToHex(attempt.hash))});
    return EarlierPayload::kLive;
  }
  return result;
}

model::TransactionRecord TransactionSubmitter::Finish(JobContext&        ctx,
                                                      model::JobState    state,
                                                      const std::string& detail,
                                                      Disposition        disposition) {
  ctx.record.state  = state;
  ctx.record.detail = detail;
  if (ctx.sequence_stale && disposition == Disposition::kKeep) {
    // The node refused this sequence; nothing of ours can hold it.
    disposition = Disposition::kRelease;
  }

  if (ctx.record.sequence) {
    const auto sequence = *ctx.record.sequence;
    switch (disposition) {
      case Disposition::kConsume:
        ledger_->Confirm(sequence);
        break;
      case Disposition::kRelease:
        ledger_->Release(sequence);
        // A payload may still surface in the pool; the next Reserve must ask the chain.
        if (ctx.pinned() || ctx.ambiguous || ctx.sequence_stale) {
          ledger_->MarkOutOfSync();
        }
        break;
      case Disposition::kKeep:
        ledger_->MarkOutOfSync();
        break;
    }
  }

  if (disposition != Disposition::kKeep) {
    try {
      ledger_->Reconcile();
    } catch (const chain::ChainError& e) {
      FAUCET_LOG_WARN("reconcile after outcome failed", {JobField(ctx.job), observability::ErrorField(e)});
    }
  }

  const std::initializer_list<observability::LogField> fields = {
      JobField(ctx.job),
      SequenceField(ctx.record),
      observability::StringField("outcome", model::ToString(state)),
      observability::U64Field("attempts", ctx.record.attempts.size()),
      observability::StringField("detail", detail),
  };
  if (state == JobState::kConfirmed) {
    FAUCET_LOG_INFO("disbursement finished", fields);
  } else {
    FAUCET_LOG_WARN("disbursement finished", fields);
  }
  return ctx.record;
}

model::TransactionRecord TransactionSubmitter::Abort(JobContext& ctx) {
  const auto disposition = ctx.pinned() || ctx.ambiguous ? Disposition::kKeep : Disposition::kRelease;
  return Finish(ctx, JobState::kAbandoned, "interrupted by shutdown", disposition);
}

void TransactionSubmitter::ReleaseForRetry(JobContext& ctx) {
  ctx.sequence_stale  = ctx.record.sequence.has_value();
  ctx.force_reconcile = true;
}

chain::U256 TransactionSubmitter::QuotePrice(JobContext& ctx) {
  const auto quote = chain_->EstimateFees();
  ctx.gas_limit    = quote.gas_limit;

  auto price = quote.gas_price;
  for (std::uint32_t i = 0; i < ctx.fee_bumps; ++i) {
    price = chain::Bump(price, options_.fee_bump_percent);
  }
  if (ctx.pinned()) {
    // Nodes only accept a replacement priced above the payload it replaces.
    price = std::max(price, chain::Bump(ctx.last_price, options_.fee_bump_percent));
  }
  return price;
}

std::uint64_t TransactionSubmitter::ChainId() {
  auto id = chain_id_.load();
  if (id == 0) {
    id = chain_->GetChainId();
    chain_id_.store(id);
  }
  return id;
}

bool TransactionSubmitter::SleepFor(util::Millis duration) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, duration, [&] { return stop_; });
}

} // namespace faucet::submit
