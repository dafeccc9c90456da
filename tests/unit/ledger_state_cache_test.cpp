#include "internal/ledger/ledger_state_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "tests/unit/support/fake_chain_client.hpp"

namespace {

using faucet::ledger::LedgerStateCache;
using faucet::testing::FakeChainClient;

const faucet::chain::Address kAccount{0x11};

struct ManualClock {
  faucet::util::TimePoint now = faucet::util::TimePoint{} + std::chrono::hours(1000);

  faucet::util::NowFn fn() {
    return [this] { return now; };
  }
};

void TestFirstReserveReconcilesThenServesLocally() {
  auto             chain = std::make_shared<FakeChainClient>(5);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(1));

  assert(ledger.Reserve() == 5);
  assert(ledger.Reserve() == 6);
  assert(ledger.Reserve() == 7);
  assert(chain->transaction_count_calls() == 1);

  const auto snapshot = ledger.Snapshot();
  assert(snapshot.last_known == 5);
  assert(snapshot.reserved.size() == 3);
  assert(snapshot.next_sequence == 8);
  assert(!snapshot.out_of_sync);
}

void TestReleasedSequenceIsReused() {
  auto             chain = std::make_shared<FakeChainClient>(0);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(1));

  assert(ledger.Reserve() == 0);
  assert(ledger.Reserve() == 1);
  ledger.Release(0);
  assert(ledger.Reserve() == 0);
  assert(ledger.Reserve() == 2);
}

void TestConfirmAdvancesFloorInOrder() {
  auto             chain = std::make_shared<FakeChainClient>(5);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(1));

  const auto a = ledger.Reserve();
  const auto b = ledger.Reserve();
  const auto c = ledger.Reserve();

  ledger.Confirm(b);
  auto snapshot = ledger.Snapshot();
  assert(snapshot.last_known == 5);
  assert(snapshot.confirmed_above.size() == 1 && snapshot.confirmed_above[0] == b);

  ledger.Confirm(a);
  snapshot = ledger.Snapshot();
  assert(snapshot.last_known == 7);
  assert(snapshot.confirmed_above.empty());

  ledger.Confirm(c);
  snapshot = ledger.Snapshot();
  assert(snapshot.last_known == 8);
  assert(snapshot.reserved.empty());
  assert(snapshot.next_sequence == 8);
}

void TestStaleStateIsReconciled() {
  ManualClock      clock;
  auto             chain = std::make_shared<FakeChainClient>(3);
  LedgerStateCache ledger(chain, kAccount, std::chrono::seconds(30), clock.fn());

  assert(ledger.Reserve() == 3);
  ledger.Release(3);

  clock.now += std::chrono::seconds(30);
  assert(ledger.Reserve() == 3);
  assert(chain->transaction_count_calls() == 1);
  ledger.Release(3);

  // Someone else spent from the account meanwhile.
  chain->ConsumeExternally(2);
  clock.now += std::chrono::seconds(31);
  assert(ledger.Reserve() == 5);
  assert(chain->transaction_count_calls() == 2);
}

void TestOutOfSyncForcesReconcile() {
  auto             chain = std::make_shared<FakeChainClient>(0);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(10));

  assert(ledger.Reserve() == 0);
  ledger.Release(0);
  chain->ConsumeExternally(4);

  assert(ledger.Reserve() == 0);
  ledger.Release(0);

  ledger.MarkOutOfSync();
  assert(ledger.Snapshot().out_of_sync);
  assert(ledger.Reserve() == 4);
  assert(!ledger.Snapshot().out_of_sync);

  // Forcing works regardless of age.
  ledger.Release(4);
  chain->ConsumeExternally(1);
  assert(ledger.Reserve(true) == 5);
}

void TestReconcileKeepsReservationsAboveFloor() {
  auto             chain = std::make_shared<FakeChainClient>(0);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(10));

  assert(ledger.Reserve() == 0);
  assert(ledger.Reserve() == 1);

  // Pending count still 0: the reservations stay untouched.
  assert(ledger.Reconcile() == 0);
  assert(ledger.Reserve() == 2);
}

void TestUnreachableChainFailsReserve() {
  auto             chain = std::make_shared<FakeChainClient>(0);
  LedgerStateCache ledger(chain, kAccount, std::chrono::minutes(10));
  chain->SetReachable(false);

  bool threw = false;
  try {
    (void)ledger.Reserve();
  } catch (const faucet::chain::ChainError& e) {
    threw = e.kind() == faucet::chain::ChainErrorKind::kUnavailable;
  }
  assert(threw);
  assert(ledger.Snapshot().reserved.empty());

  chain->SetReachable(true);
  assert(ledger.Reserve() == 0);
}

} // namespace

int main() {
  TestFirstReserveReconcilesThenServesLocally();
  TestReleasedSequenceIsReused();
  TestConfirmAdvancesFloorInOrder();
  TestStaleStateIsReconciled();
  TestOutOfSyncForcesReconcile();
  TestReconcileKeepsReservationsAboveFloor();
  TestUnreachableChainFailsReserve();

  std::cout << "faucet_unit_ledger_state_cache: pass\n";
  return 0;
}
