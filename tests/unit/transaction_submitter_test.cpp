#include "internal/submit/transaction_submitter.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/chain/address.hpp"
#include "internal/chain/units.hpp"
#include "internal/dispatch/dispatch_queue.hpp"
#include "tests/unit/support/fake_chain_client.hpp"

namespace {

using faucet::chain::ChainErrorKind;
using faucet::chain::U256;
using faucet::model::JobState;
using faucet::submit::SubmitterOptions;
using faucet::submit::TransactionSubmitter;
using faucet::testing::FakeChainClient;

constexpr const char* kFundingKey = "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";

SubmitterOptions FastOptions() {
  SubmitterOptions options;
  options.max_attempts            = 3;
  options.backoff_initial         = std::chrono::milliseconds(1);
  options.backoff_max             = std::chrono::milliseconds(2);
  options.poll_interval           = std::chrono::milliseconds(2);
  options.confirmation_timeout    = std::chrono::milliseconds(500);
  options.ambiguous_requery_limit = 2;
  return options;
}

struct Harness {
  explicit Harness(std::uint64_t start_nonce = 0, SubmitterOptions options = FastOptions())
      : chain(std::make_shared<FakeChainClient>(start_nonce)),
        key(std::make_shared<const faucet::crypto::Secp256k1Key>(faucet::crypto::Secp256k1Key::FromHex(kFundingKey))),
        ledger(std::make_shared<faucet::ledger::LedgerStateCache>(chain, key->address(), std::chrono::minutes(10))),
        gauge(std::make_shared<faucet::dispatch::InFlightGauge>(100)),
        queue(gauge),
        submitter(chain, ledger, key, options) {
  }

  faucet::dispatch::JobHandle NextJob() {
    const bool acquired = gauge->TryAcquire();
    assert(acquired);
    (void)acquired;

    faucet::model::AdmissionDecision decision;
    decision.request.requester    = "requester-" + std::to_string(++counter);
    decision.request.destination  = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";
    decision.request.amount       = faucet::chain::kWeiPerEther;
    decision.request.submitted_at = faucet::util::Now();
    decision.verdict              = faucet::model::Verdict::kAccepted;
    decision.destination          = faucet::chain::ParseAddressOrThrow(decision.request.destination);
    queue.Enqueue(decision);

    auto cursor = queue.Drain();
    auto job    = cursor.Next();
    assert(job.has_value());
    return *job;
  }

  faucet::model::TransactionRecord Run(const faucet::dispatch::JobHandle& job) {
    auto record = submitter.Process(*job);
    queue.Complete(job, record);
    return record;
  }

  std::shared_ptr<FakeChainClient>                     chain;
  std::shared_ptr<const faucet::crypto::Secp256k1Key>  key;
  std::shared_ptr<faucet::ledger::LedgerStateCache>    ledger;
  std::shared_ptr<faucet::dispatch::InFlightGauge>     gauge;
  faucet::dispatch::DispatchQueue                      queue;
  TransactionSubmitter                                 submitter;
  int                                                  counter = 0;
};

template <typename Predicate>
void WaitUntil(Predicate predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!predicate()) {
    assert(std::chrono::steady_clock::now() < deadline && "condition not reached in time");
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void TestConfirmedOnFirstAttempt() {
  Harness h(5);
  h.chain->SetAutoMine(true);

  auto job    = h.NextJob();
  auto record = h.Run(job);

  assert(record.state == JobState::kConfirmed);
  assert(record.sequence == 5u);
  assert(record.attempts.size() == 1);
  assert(record.included_hash.has_value());
  assert(*record.included_hash == h.chain->sent().at(0).hash);
  assert(job->Current().state == JobState::kConfirmed);

  const auto snapshot = h.ledger->Snapshot();
  assert(snapshot.last_known == 6);
  assert(snapshot.reserved.empty());
  assert(h.gauge->in_flight() == 0);
}

void TestRetriesThenFailsAndReleasesSequence() {
  Harness h(0);
  h.chain->FailSubmissions(ChainErrorKind::kUnavailable, 3);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kFailed);
  assert(record.attempts.size() == 3);
  for (const auto& attempt : record.attempts) {
    assert(attempt.sequence == 0);
    assert(!attempt.accepted);
  }
  assert(h.chain->submit_calls() == 3);
  assert(h.chain->sent().empty());
  assert(h.ledger->Snapshot().reserved.empty());

  // The released sequence goes to the next job.
  h.chain->SetAutoMine(true);
  auto next = h.Run(h.NextJob());
  assert(next.state == JobState::kConfirmed);
  assert(next.sequence == 0u);
  assert(h.chain->included_nonces().size() == 1);
}

void TestAmbiguousSubmissionAlreadyIncluded() {
  Harness h(0);
  h.chain->SetAutoMine(true);
  h.chain->AcceptThenFail(ChainErrorKind::kTimeout);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kConfirmed);
  assert(record.attempts.size() == 1);
  assert(h.chain->submit_calls() == 1);
  assert(h.chain->sent().size() == 1);
  assert(h.ledger->Snapshot().last_known == 1);
}

void TestAmbiguousSubmissionNeverSeenFails() {
  Harness h(0);
  h.chain->FailSubmissions(ChainErrorKind::kTimeout, 1);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kFailed);
  assert(h.chain->submit_calls() == 1);

  const auto snapshot = h.ledger->Snapshot();
  assert(snapshot.reserved.empty());
  assert(snapshot.next_sequence == 0);
}

void TestUnavailableSendThatLandedIsPaidOnce() {
  Harness h(5);
  h.chain->SetAutoMine(true);
  // The node mines the payload but the caller only sees a gateway error.
  h.chain->AcceptThenFail(ChainErrorKind::kUnavailable);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kConfirmed);
  assert(record.sequence == 5u);
  assert(record.attempts.size() == 2);
  assert(record.included_hash.has_value());
  assert(*record.included_hash == record.attempts[0].hash);

  const auto included = h.chain->included_nonces();
  assert(included.size() == 1 && included[0] == 5);
  assert(h.chain->sent().size() == 1);

  const auto snapshot = h.ledger->Snapshot();
  assert(snapshot.last_known == 6);
  assert(snapshot.reserved.empty());
}

void TestUnavailableSendStillPendingIsReplacedNotResent() {
  auto options                 = FastOptions();
  options.max_attempts         = 50;
  options.confirmation_timeout = std::chrono::milliseconds(30);
  Harness h(5, options);
  h.chain->AcceptThenFail(ChainErrorKind::kUnavailable);

  auto job    = h.NextJob();
  auto result = std::async(std::launch::async, [&] { return h.Run(job); });

  WaitUntil([&] { return h.chain->sent().size() >= 2; });
  h.chain->MineAll();
  auto record = result.get();

  assert(record.state == JobState::kConfirmed);
  for (const auto& tx : h.chain->sent()) {
    assert(tx.nonce == 5);
  }
  assert(h.chain->included_nonces().size() == 1);
  assert(h.chain->pending_in_pool() == 0);
  assert(h.ledger->Snapshot().last_known == 6);
}

void TestRefusedSequenceIsReleasedWithOutcome() {
  Harness h(5);
  h.chain->FailSubmissions(ChainErrorKind::kNonceTooLow, 3);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kFailed);
  assert(record.attempts.size() == 3);
  assert(record.sequence == 5u);
  for (const auto& attempt : record.attempts) {
    assert(attempt.sequence == 5);
  }

  const auto snapshot = h.ledger->Snapshot();
  assert(snapshot.reserved.empty());
  assert(snapshot.next_sequence == 5);

  h.chain->SetAutoMine(true);
  auto next = h.Run(h.NextJob());
  assert(next.state == JobState::kConfirmed);
  assert(next.sequence == 5u);
}

void TestFeeTooLowBumpsPrice() {
  Harness h(0);
  h.chain->SetAutoMine(true);
  h.chain->SetGasPrice(U256(1000000000));
  h.chain->FailSubmissions(ChainErrorKind::kFeeTooLow, 1);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kConfirmed);
  assert(record.attempts.size() == 2);
  assert(record.attempts[0].gas_price == U256(1000000000));
  assert(h.chain->sent().at(0).gas_price == U256(1120000000));
}

void TestRejectedSubmissionFailsImmediately() {
  Harness h(0);
  h.chain->FailSubmissions(ChainErrorKind::kRejected, 1);

  auto record = h.Run(h.NextJob());
  assert(record.state == JobState::kFailed);
  assert(record.attempts.size() == 1);
  assert(!record.detail.empty());
  assert(h.ledger->Snapshot().next_sequence == 0);
}

void TestSlowInclusionIsReplacedOnSameSequence() {
  auto options                 = FastOptions();
  options.max_attempts         = 50;
  options.confirmation_timeout = std::chrono::milliseconds(30);
  Harness h(7, options);

  auto job    = h.NextJob();
  auto result = std::async(std::launch::async, [&] { return h.Run(job); });

  WaitUntil([&] { return h.chain->sent().size() >= 2; });
  h.chain->MineAll();
  auto record = result.get();

  assert(record.state == JobState::kConfirmed);
  const auto sent = h.chain->sent();
  for (const auto& tx : sent) {
    assert(tx.nonce == 7);
  }
  assert(sent[1].gas_price >= faucet::chain::Bump(sent[0].gas_price, 10));
  assert(h.chain->included_nonces().size() == 1);
  assert(h.ledger->Snapshot().last_known == 8);
}

void TestInterruptKeepsPinnedReservation() {
  auto options                 = FastOptions();
  options.confirmation_timeout = std::chrono::seconds(30);
  Harness h(0, options);

  auto job    = h.NextJob();
  auto result = std::async(std::launch::async, [&] { return h.Run(job); });

  WaitUntil([&] { return h.chain->sent().size() == 1; });
  h.submitter.Interrupt();
  auto record = result.get();

  assert(record.state == JobState::kAbandoned);
  assert(h.submitter.interrupted());

  // The payload may still be mined: the sequence stays reserved until the chain says otherwise.
  const auto snapshot = h.ledger->Snapshot();
  assert(snapshot.out_of_sync);
  assert(snapshot.reserved.size() == 1 && snapshot.reserved[0] == 0);
}

void TestBackoffDoublesUpToCap() {
  SubmitterOptions options;
  options.backoff_initial = std::chrono::milliseconds(100);
  options.backoff_max     = std::chrono::milliseconds(500);
  Harness h(0, options);

  assert(h.submitter.Backoff(0).count() == 0);
  assert(h.submitter.Backoff(1).count() == 100);
  assert(h.submitter.Backoff(2).count() == 200);
  assert(h.submitter.Backoff(3).count() == 400);
  assert(h.submitter.Backoff(4).count() == 500);
  assert(h.submitter.Backoff(30).count() == 500);
}

} // namespace

int main() {
  TestConfirmedOnFirstAttempt();
  TestRetriesThenFailsAndReleasesSequence();
  TestAmbiguousSubmissionAlreadyIncluded();
  TestAmbiguousSubmissionNeverSeenFails();
  TestUnavailableSendThatLandedIsPaidOnce();
  TestUnavailableSendStillPendingIsReplacedNotResent();
  TestRefusedSequenceIsReleasedWithOutcome();
  TestFeeTooLowBumpsPrice();
  TestRejectedSubmissionFailsImmediately();
  TestSlowInclusionIsReplacedOnSameSequence();
  TestInterruptKeepsPinnedReservation();
  TestBackoffDoublesUpToCap();

  std::cout << "faucet_unit_transaction_submitter: pass\n";
  return 0;
}
