#include "factory.hpp"

#include <memory>
#include <optional>
#include <string>

#include "internal/admission/admission_controller.hpp"
#include "internal/chain/address.hpp"
#include "internal/chain/http_transport.hpp"
#include "internal/chain/json_rpc_client.hpp"
#include "internal/chain/units.hpp"
#include "internal/core/health_monitor.hpp"
#include "internal/crypto/hd_key.hpp"
#include "internal/crypto/secp256k1.hpp"
#include "internal/dispatch/dispatch_queue.hpp"
#include "internal/dispatch/in_flight_gauge.hpp"
#include "internal/ledger/ledger_state_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/submit/transaction_submitter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if FAUCET_WITH_GRPC
#include "internal/grpc/faucet_server.hpp"
#endif

namespace faucet::factory {

using faucet::runtime::config::RuntimeConfig;

namespace {

submit::SubmitterOptions BuildSubmitterOptions(const RuntimeConfig& config) {
  const auto&              submission = config.submission();
  submit::SubmitterOptions options;
  options.max_attempts            = submission.max_attempts() > 0 ? submission.max_attempts() : options.max_attempts;
  options.backoff_initial         = util::ToMillisOr(submission.backoff_initial(), options.backoff_initial);
  options.backoff_max             = util::ToMillisOr(submission.backoff_max(), options.backoff_max);
  options.fee_bump_percent        = submission.fee_bump_percent() > 0 ? submission.fee_bump_percent() : options.fee_bump_percent;
  options.poll_interval           = util::ToMillisOr(submission.poll_interval(), options.poll_interval);
  options.confirmation_timeout    = util::ToMillisOr(submission.confirmation_timeout(), options.confirmation_timeout);
  options.ambiguous_requery_limit = submission.ambiguous_requery_limit() > 0 ? submission.ambiguous_requery_limit() : options.ambiguous_requery_limit;
  options.chain_id                = config.chain().chain_id();
  return options;
}

} // namespace

Application Build(const RuntimeConfig& config) {
  // ------------------------------------------------------------------
  // Chain access
  // ------------------------------------------------------------------
  const auto timeout   = util::ToMillisOr(config.chain().request_timeout(), util::Millis{10000});
  auto       transport = std::make_shared<chain::BeastHttpTransport>(config.chain().rpc_url(), timeout);
  auto       client    = std::make_shared<chain::JsonRpcClient>(std::move(transport), config.chain().gas_limit());

  return Build(config, std::move(client));
}

Application Build(const RuntimeConfig& config, std::shared_ptr<chain::ChainClient> chain) {
  Application app;
  app.chain                  = chain;
  app.shutdown_drain_timeout = util::ToMillisOr(config.facade().shutdown_drain_timeout(), app.shutdown_drain_timeout);

  // ------------------------------------------------------------------
  // Funding credential
  // ------------------------------------------------------------------
  std::shared_ptr<const crypto::Secp256k1Key> key;
  std::string                                 credential_error;
  try {
    const auto& funding = config.funding();
    key = std::make_shared<const crypto::Secp256k1Key>(funding.mnemonic().empty()
                                                           ? crypto::Secp256k1Key::FromHex(funding.private_key())
                                                           : crypto::DeriveAccountKey(funding.mnemonic(), funding.account_index()));
    FAUCET_LOG_INFO("funding account loaded", {observability::StringField("address", chain::ToChecksumAddress(key->address()))});
  } catch (const util::InvalidArgument& e) {
    credential_error = e.what();
    FAUCET_LOG_ERROR("funding credential invalid; disbursements disabled", {observability::ErrorField(credential_error)});
  }

  const auto grant_amount = chain::ParseEther(config.funding().grant_amount_ether());
  const auto min_balance  = chain::ParseEther(config.funding().min_balance_ether().empty() ? "0" : config.funding().min_balance_ether());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto gauge     = std::make_shared<dispatch::InFlightGauge>(config.admission().max_in_flight());
  auto admission = std::make_shared<admission::AdmissionController>(util::ToMillis(config.admission().cooldown()), gauge);
  app.queue      = std::make_shared<dispatch::DispatchQueue>(gauge);

  std::optional<chain::Address> funding_address;
  if (key) {
    funding_address = key->address();

    auto ledger = std::make_shared<ledger::LedgerStateCache>(chain, key->address(),
                                                             util::ToMillisOr(config.ledger().max_state_age(), util::Millis{60000}));
    auto submitter = std::make_shared<submit::TransactionSubmitter>(chain, ledger, key, BuildSubmitterOptions(config));

    app.worker = std::make_shared<dispatch::DispatchWorker>(app.queue, submitter, ledger,
                                                            util::ToMillisOr(config.ledger().reconcile_interval(), util::Millis{30000}));
    app.worker->Start();
  }

  auto health = std::make_shared<core::HealthMonitor>(chain, funding_address, min_balance, credential_error);

  core::FacadeOptions facade;
  facade.grant_amount     = grant_amount;
  facade.client_timeout   = util::ToMillisOr(config.facade().client_timeout(), facade.client_timeout);
  facade.result_retention = util::ToMillisOr(config.facade().result_retention(), facade.result_retention);

  app.service = std::make_shared<core::FaucetService>(admission, app.queue, health, facade, key != nullptr);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
#if FAUCET_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::FaucetServer>(app.service));
#endif

  return app;
}

} // namespace faucet::factory
