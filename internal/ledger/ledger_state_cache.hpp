#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "internal/chain/chain_client.hpp"
#include "internal/util/time.hpp"

namespace faucet::ledger {

struct LedgerSnapshot {
  // Lowest sequence not known to be used on chain.
  std::uint64_t                  last_known = 0;
  std::vector<std::uint64_t>     reserved;
  std::vector<std::uint64_t>     confirmed_above;
  std::optional<util::TimePoint> last_reconciled;
  bool                           out_of_sync = true;
  // What the next Reserve would hand out from local state.
  std::uint64_t                  next_sequence = 0;
};

/*
  Sole owner of the funding account's sequence state.

  Sequences are handed out from local state; the chain is consulted only when
  the state was never reconciled, is older than max_state_age, was marked out
  of sync, or a caller forces it. Reconciliation uses the pending transaction
  count, so transactions already in the node's pool are never reassigned.

  All operations are serialized by one mutex.
*/
class LedgerStateCache {
 public:
  LedgerStateCache(std::shared_ptr<chain::ChainClient> chain,
                   chain::Address                      account,
                   util::Millis                        max_state_age,
                   util::NowFn                         now = util::Now);

  // Throws chain::ChainError if a required reconciliation fails.
  std::uint64_t Reserve(bool force_reconcile = false);

  // The sequence was consumed on chain (included or reverted).
  void Confirm(std::uint64_t sequence);

  // The sequence was never consumed; it becomes the next candidate again.
  void Release(std::uint64_t sequence);

  // Returns the new floor. Throws chain::ChainError.
  std::uint64_t Reconcile();

  void MarkOutOfSync();

  LedgerSnapshot Snapshot() const;

  const chain::Address& account() const {
    return account_;
  }

 private:
  bool          NeedsReconcileLocked() const;
  std::uint64_t ReconcileLocked();
  void          AdvanceFloorLocked();
  std::uint64_t NextCandidateLocked() const;

  std::shared_ptr<chain::ChainClient> chain_;
  chain::Address                      account_;
  util::Millis                        max_state_age_;
  util::NowFn                         now_;

  mutable std::mutex             mutex_;
  std::uint64_t                  last_known_ = 0;
  std::set<std::uint64_t>        reserved_;
  std::set<std::uint64_t>        confirmed_above_;
  std::optional<util::TimePoint> last_reconciled_;
  bool                           out_of_sync_ = true;
};

} // namespace faucet::ledger
