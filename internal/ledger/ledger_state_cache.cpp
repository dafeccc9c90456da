#include "ledger_state_cache.hpp"

#include "internal/observability/logging.hpp"

namespace faucet::ledger {

LedgerStateCache::LedgerStateCache(std::shared_ptr<chain::ChainClient> chain,
                                   chain::Address                      account,
                                   util::Millis                        max_state_age,
                                   util::NowFn                         now)
    : chain_(std::move(chain)), account_(account), max_state_age_(max_state_age), now_(std::move(now)) {
}

std::uint64_t LedgerStateCache::Reserve(bool force_reconcile) {
  std::lock_guard lock(mutex_);

  if (force_reconcile || NeedsReconcileLocked()) {
    ReconcileLocked();
  }

  const auto sequence = NextCandidateLocked();
  reserved_.insert(sequence);
  return sequence;
}

void LedgerStateCache::Confirm(std::uint64_t sequence) {
  std::lock_guard lock(mutex_);

  reserved_.erase(sequence);
  if (sequence < last_known_) {
    return;
  }
  if (sequence > last_known_) {
    confirmed_above_.insert(sequence);
    return;
  }

  ++last_known_;
  AdvanceFloorLocked();
}

void LedgerStateCache::Release(std::uint64_t sequence) {
  std::lock_guard lock(mutex_);
  reserved_.erase(sequence);
}

std::uint64_t LedgerStateCache::Reconcile() {
  std::lock_guard lock(mutex_);
  return ReconcileLocked();
}

void LedgerStateCache::MarkOutOfSync() {
  std::lock_guard lock(mutex_);
  out_of_sync_ = true;
}

LedgerSnapshot LedgerStateCache::Snapshot() const {
  std::lock_guard lock(mutex_);

  LedgerSnapshot snapshot;
  snapshot.last_known      = last_known_;
  snapshot.reserved        = {reserved_.begin(), reserved_.end()};
  snapshot.confirmed_above = {confirmed_above_.begin(), confirmed_above_.end()};
  snapshot.last_reconciled = last_reconciled_;
  snapshot.out_of_sync     = out_of_sync_;
  snapshot.next_sequence   = NextCandidateLocked();
  return snapshot;
}

bool LedgerStateCache::NeedsReconcileLocked() const {
  if (out_of_sync_ || !last_reconciled_) {
    return true;
  }
  return max_state_age_.count() > 0 && now_() - *last_reconciled_ > max_state_age_;
}

std::uint64_t LedgerStateCache::ReconcileLocked() {
  const auto pending = chain_->GetTransactionCount(account_);

  if (pending != last_known_) {
    FAUCET_LOG_INFO("ledger reconciled",
                    {observability::U64Field("previous", last_known_), observability::U64Field("pending_count", pending),
                     observability::U64Field("reserved", reserved_.size())});
  }

  last_known_ = pending;
  confirmed_above_.erase(confirmed_above_.begin(), confirmed_above_.lower_bound(pending));
  AdvanceFloorLocked();
  last_reconciled_ = now_();
  out_of_sync_     = false;
  return last_known_;
}

void LedgerStateCache::AdvanceFloorLocked() {
  for (auto it = confirmed_above_.begin(); it != confirmed_above_.end() && *it == last_known_;) {
    it = confirmed_above_.erase(it);
    ++last_known_;
  }
}

std::uint64_t LedgerStateCache::NextCandidateLocked() const {
  auto candidate = last_known_;
  while (reserved_.count(candidate) != 0 || confirmed_above_.count(candidate) != 0) {
    ++candidate;
  }
  return candidate;
}

} // namespace faucet::ledger
