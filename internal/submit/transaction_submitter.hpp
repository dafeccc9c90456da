#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/chain/chain_client.hpp"
#include "internal/crypto/secp256k1.hpp"
#include "internal/dispatch/job.hpp"
#include "internal/ledger/ledger_state_cache.hpp"

namespace faucet::submit {

struct SubmitterOptions {
  std::uint32_t max_attempts = 5;
  util::Millis  backoff_initial{500};
  util::Millis  backoff_max{8000};
  std::uint32_t fee_bump_percent = 12;
  util::Millis  poll_interval{1000};
  util::Millis  confirmation_timeout{60000};
  std::uint32_t ambiguous_requery_limit = 3;
  // 0 asks the node once and caches the answer.
  std::uint64_t chain_id = 0;
};

/*
  Drives one job from sequence reservation to a terminal outcome.

  Once a payload for a sequence has been accepted by the node the job is pinned
  to that sequence: later failures only ever lead to same-sequence replacements,
  so at most one transfer per job can be included. A send that failed without a
  definite answer may still have reached the node; before such a sequence is
  given up its earlier payloads are looked up by hash and the job pins to any
  the chain knows.

  Every terminal outcome performs exactly one Confirm or Release on the ledger,
  then a best-effort Reconcile. A shutdown interrupt cuts waits short; a pinned
  job then keeps its reservation and the ledger is marked out of sync.
*/
class TransactionSubmitter {
 public:
  TransactionSubmitter(std::shared_ptr<chain::ChainClient>         chain,
                       std::shared_ptr<ledger::LedgerStateCache>   ledger,
                       std::shared_ptr<const crypto::Secp256k1Key> key,
                       SubmitterOptions                            options);

  // Never throws; internal errors become a Failed record.
  model::TransactionRecord Process(dispatch::Job& job);

  void Interrupt();
  bool interrupted() const;

  util::Millis Backoff(std::uint32_t attempt) const;

 private:
  enum class SendResult {
    kAccepted,
    kRetry,
    kAmbiguous,
    kWait,
    kTerminal,
  };

  enum class EarlierPayload {
    kNone,
    kLive,
    kUnverified,
  };

  enum class Disposition {
    kConsume,
    kRelease,
    kKeep,
  };

  struct JobContext {
    dispatch::Job&           job;
    model::TransactionRecord record;
    // Hashes the node accepted for the current sequence, oldest first.
    std::vector<chain::Hash> live_hashes;
    chain::U256              last_price;
    std::uint64_t            gas_limit = 21000;
    std::uint32_t            rounds    = 0;
    std::uint32_t            fee_bumps = 0;
    bool                     force_reconcile = false;
    bool                     ambiguous       = false;
    // The sequence was refused; it is released before the next reservation or at the outcome.
    bool                     sequence_stale  = false;
    std::string              last_error;

    bool pinned() const {
      return !live_hashes.empty();
    }
  };

  model::TransactionRecord                Drive(JobContext& ctx);
  SendResult                              SubmitOnce(JobContext& ctx);
  std::optional<model::TransactionRecord> ResolveAmbiguous(JobContext& ctx, const chain::Hash& hash, const chain::U256& price);
  std::optional<model::TransactionRecord> WaitForInclusion(JobContext& ctx);
  EarlierPayload                          FindEarlierPayload(JobContext& ctx);
  model::TransactionRecord Finish(JobContext& ctx, model::JobState state, const std::string& detail, Disposition disposition);
  model::TransactionRecord Abort(JobContext& ctx);

  void          ReleaseForRetry(JobContext& ctx);
  chain::U256   QuotePrice(JobContext& ctx);
  std::uint64_t ChainId();
  bool          SleepFor(util::Millis duration);

  std::shared_ptr<chain::ChainClient>         chain_;
  std::shared_ptr<ledger::LedgerStateCache>   ledger_;
  std::shared_ptr<const crypto::Secp256k1Key> key_;
  const SubmitterOptions                      options_;
  std::atomic<std::uint64_t>                  chain_id_;

  mutable std::mutex      stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stop_ = false;
};

} // namespace faucet::submit
