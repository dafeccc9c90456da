#include "internal/factory.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/chain/units.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/fake_chain_client.hpp"

namespace {

using faucet::model::OutcomeStatus;
using faucet::testing::FakeChainClient;

constexpr const char* kDestination = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";

std::string ConfigYaml(const std::string& private_key, unsigned max_in_flight, const std::string& client_timeout) {
  return "chain:\n"
         "  rpc_url: \"http://127.0.0.1:8545\"\n"
         "funding:\n"
         "  private_key: \"" + private_key + "\"\n"
         "  grant_amount_ether: \"0.5\"\n"
         "  min_balance_ether: \"10\"\n"
         "admission:\n"
         "  cooldown: 1h\n"
         "  max_in_flight: " + std::to_string(max_in_flight) + "\n"
         "submission:\n"
         "  backoff_initial: 1ms\n"
         "  backoff_max: 2ms\n"
         "  poll_interval: 2ms\n"
         "  confirmation_timeout: 2s\n"
         "ledger:\n"
         "  reconcile_interval: 50ms\n"
         "facade:\n"
         "  client_timeout: " + client_timeout + "\n"
         "  shutdown_drain_timeout: 1s\n";
}

constexpr const char* kFundingKey = "0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";

faucet::factory::Application BuildApp(const std::shared_ptr<FakeChainClient>& chain,
                                      unsigned                                max_in_flight  = 16,
                                      const std::string&                      client_timeout = "5s",
                                      const std::string&                      private_key    = kFundingKey) {
  auto config = faucet::config::ConfigLoader::LoadFromYamlString(ConfigYaml(private_key, max_in_flight, client_timeout));
  return faucet::factory::Build(config, chain);
}

void StopApp(faucet::factory::Application& app) {
  if (app.worker) {
    app.worker->Stop(std::chrono::seconds(1));
  }
}

faucet::model::DisbursementOutcome AwaitOutcome(faucet::core::FaucetService& service, faucet::model::JobId job_id) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (true) {
    auto outcome = service.GetDisbursement(job_id);
    if (outcome.status != OutcomeStatus::kPending) {
      return outcome;
    }
    assert(std::chrono::steady_clock::now() < deadline && "job did not finish in time");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

void TestSequentialRequestsUseConsecutiveSequences() {
  auto chain = std::make_shared<FakeChainClient>(5);
  chain->SetAutoMine(true);
  auto app = BuildApp(chain);

  for (std::uint64_t i = 0; i < 3; ++i) {
    auto outcome = app.service->RequestDisbursement("user-" + std::to_string(i), kDestination);
    assert(outcome.status == OutcomeStatus::kConfirmed);
    assert(outcome.sequence && *outcome.sequence == 5 + i);
    assert(outcome.transaction_hash.has_value());
    assert(outcome.attempts == 1);
  }

  assert(chain->confirmed_nonce() == 8);
  assert((chain->included_nonces() == std::vector<std::uint64_t>{5, 6, 7}));
  StopApp(app);
}

void TestSameRequesterIsRateLimited() {
  auto chain = std::make_shared<FakeChainClient>();
  chain->SetAutoMine(true);
  auto app = BuildApp(chain);

  assert(app.service->RequestDisbursement("alice", kDestination).status == OutcomeStatus::kConfirmed);
  auto second = app.service->RequestDisbursement("alice", kDestination);
  assert(second.status == OutcomeStatus::kRateLimited);
  assert(second.retry_after.count() > 0);
  assert(!second.job_id.has_value());
  assert(chain->sent().size() == 1);
  StopApp(app);
}

void TestInvalidDestinationIsRejected() {
  auto chain = std::make_shared<FakeChainClient>();
  auto app   = BuildApp(chain);

  auto outcome = app.service->RequestDisbursement("bob", "not-an-address");
  assert(outcome.status == OutcomeStatus::kInvalidAddress);
  assert(!outcome.message.empty());

  // A rejected address does not start a cooldown.
  chain->SetAutoMine(true);
  assert(app.service->RequestDisbursement("bob", kDestination).status == OutcomeStatus::kConfirmed);
  StopApp(app);
}

void TestCeilingAppliesBackpressure() {
  auto chain = std::make_shared<FakeChainClient>();
  chain->SetStalled(true);
  auto app = BuildApp(chain, 2, "20ms");

  auto first  = app.service->RequestDisbursement("u1", kDestination);
  auto second = app.service->RequestDisbursement("u2", kDestination);
  auto third  = app.service->RequestDisbursement("u3", kDestination);

  assert(first.status == OutcomeStatus::kPending && first.job_id);
  assert(second.status == OutcomeStatus::kPending && second.job_id);
  assert(third.status == OutcomeStatus::kBackpressure);
  assert(third.retry_after.count() == 0);
  assert(!third.job_id.has_value());

  chain->SetAutoMine(true);
  chain->SetStalled(false);

  auto done_first  = AwaitOutcome(*app.service, *first.job_id);
  auto done_second = AwaitOutcome(*app.service, *second.job_id);
  assert(done_first.status == OutcomeStatus::kConfirmed);
  assert(done_second.status == OutcomeStatus::kConfirmed);
  assert(*done_first.sequence == 0 && *done_second.sequence == 1);

  // Capacity is back once the jobs finished.
  assert(app.service->RequestDisbursement("u3", kDestination).status == OutcomeStatus::kConfirmed);
  StopApp(app);
}

void TestConcurrentRequestsGetDistinctSequences() {
  constexpr int kRequests = 16;
  auto          chain     = std::make_shared<FakeChainClient>(100);
  chain->SetAutoMine(true);
  auto app = BuildApp(chain, 32);

  std::vector<faucet::model::DisbursementOutcome> outcomes(kRequests);
  std::vector<std::thread>                        threads;
  for (int i = 0; i < kRequests; ++i) {
    threads.emplace_back([&, i] { outcomes[i] = app.service->RequestDisbursement("parallel-" + std::to_string(i), kDestination); });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::set<std::uint64_t> sequences;
  for (const auto& outcome : outcomes) {
    assert(outcome.status == OutcomeStatus::kConfirmed);
    sequences.insert(*outcome.sequence);
  }
  assert(sequences.size() == kRequests);
  assert(*sequences.begin() == 100);
  assert(*sequences.rbegin() == 100 + kRequests - 1);
  assert(chain->sent().size() == kRequests);
  StopApp(app);
}

void TestHealthFollowsBalanceAndReachability() {
  auto chain = std::make_shared<FakeChainClient>();
  auto app   = BuildApp(chain);

  chain->SetBalance(faucet::chain::kWeiPerEther * 50);
  auto report = app.service->HealthStatus();
  assert(report.healthy());
  assert(report.credential_valid);
  assert(report.funding_address == "0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266");

  chain->SetBalance(faucet::chain::kWeiPerEther * 5);
  report = app.service->HealthStatus();
  assert(!report.healthy());
  assert(report.chain_reachable);
  assert(!report.balance_above_threshold);

  chain->SetBalance(faucet::chain::kWeiPerEther * 50);
  chain->SetReachable(false);
  report = app.service->HealthStatus();
  assert(!report.healthy());
  assert(!report.chain_reachable);

  chain->SetReachable(true);
  assert(app.service->HealthStatus().healthy());
  StopApp(app);
}

void TestLookupErrors() {
  auto chain = std::make_shared<FakeChainClient>();
  auto app   = BuildApp(chain);

  bool threw = false;
  try {
    app.service->GetDisbursement(4242);
  } catch (const faucet::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    app.service->RequestDisbursement("", kDestination);
  } catch (const faucet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  StopApp(app);
}

void TestInvalidCredentialDisablesDisbursements() {
  auto chain = std::make_shared<FakeChainClient>();
  auto app   = BuildApp(chain, 16, "5s", "0xnot-a-key");

  assert(app.worker == nullptr);

  bool threw = false;
  try {
    app.service->RequestDisbursement("carol", kDestination);
  } catch (const faucet::util::Unavailable&) {
    threw = true;
  }
  assert(threw);

  auto report = app.service->HealthStatus();
  assert(!report.credential_valid);
  assert(!report.healthy());
  assert(chain->submit_calls() == 0);
}

} // namespace

int main() {
  TestSequentialRequestsUseConsecutiveSequences();
  TestSameRequesterIsRateLimited();
  TestInvalidDestinationIsRejected();
  TestCeilingAppliesBackpressure();
  TestConcurrentRequestsGetDistinctSequences();
  TestHealthFollowsBalanceAndReachability();
  TestLookupErrors();
  TestInvalidCredentialDisablesDisbursements();

  std::cout << "faucet_unit_faucet_service: pass\n";
  return 0;
}
