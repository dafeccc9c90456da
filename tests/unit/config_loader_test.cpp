#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using faucet::config::ConfigLoader;

constexpr const char* kHardhatKey = "0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "faucet_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

std::string MinimalYaml() {
  return std::string(R"(chain:
  rpc_url: "http://127.0.0.1:8545"
funding:
  private_key: ")") + kHardhatKey + R"("
  grant_amount_ether: 1.5
admission:
  cooldown: 24h
  max_in_flight: 16
)";
}

void TestMinimalFileGetsDefaults() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("minimal", MinimalYaml()).string());
  ConfigLoader::Validate(config);

  assert(config.chain().rpc_url() == "http://127.0.0.1:8545");
  assert(config.funding().private_key() == kHardhatKey);
  // An unquoted decimal still lands in the string field unchanged.
  assert(config.funding().grant_amount_ether() == "1.5");
  assert(faucet::util::ToMillis(config.admission().cooldown()).count() == 24LL * 3600 * 1000);
  assert(config.admission().max_in_flight() == 16);

  assert(config.server().port() == 8080);
  assert(config.chain().gas_limit() == 21000);
  assert(config.submission().max_attempts() == 5);
  assert(config.submission().fee_bump_percent() == 12);
  assert(faucet::util::ToMillis(config.submission().backoff_initial()).count() == 500);
  assert(faucet::util::ToMillis(config.facade().client_timeout()).count() == 30000);
  assert(config.logging().level() == "info");
}

void TestDurationSuffixes() {
  auto config = ConfigLoader::LoadFromYamlString(MinimalYaml() + R"(submission:
  backoff_initial: 250ms
  backoff_max: 2m
  poll_interval: 1.5s
  confirmation_timeout: 90
)");

  assert(faucet::util::ToMillis(config.submission().backoff_initial()).count() == 250);
  assert(faucet::util::ToMillis(config.submission().backoff_max()).count() == 120000);
  assert(faucet::util::ToMillis(config.submission().poll_interval()).count() == 1500);
  assert(faucet::util::ToMillis(config.submission().confirmation_timeout()).count() == 90000);
}

void TestHexKeyIsNotParsedAsNumber() {
  // strtod accepts hex; an unquoted key must still arrive as text.
  auto config = ConfigLoader::LoadFromYamlString(R"(chain:
  rpc_url: http://node:8545
funding:
  private_key: 0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d
  grant_amount_ether: "2"
admission:
  cooldown: 1h
  max_in_flight: 4
)");
  assert(config.funding().private_key() == "0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d");
  ConfigLoader::Validate(config);
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(MinimalYaml() + "unknown_field: 123\n");
  } catch (const faucet::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEnvironmentOverridesFile() {
  setenv("FAUCET_MAX_IN_FLIGHT", "3", 1);
  setenv("FAUCET_COOLDOWN", "90s", 1);
  setenv("FAUCET_RPC_URL", "https://rpc.example.org/v1", 1);

  auto config = ConfigLoader::LoadFromYamlString(MinimalYaml());

  unsetenv("FAUCET_MAX_IN_FLIGHT");
  unsetenv("FAUCET_COOLDOWN");
  unsetenv("FAUCET_RPC_URL");

  assert(config.admission().max_in_flight() == 3);
  assert(faucet::util::ToMillis(config.admission().cooldown()).count() == 90000);
  assert(config.chain().rpc_url() == "https://rpc.example.org/v1");
}

void TestEnvironmentOnly() {
  setenv("FAUCET_RPC_URL", "http://localhost:8545", 1);
  setenv("FAUCET_PRIVATE_KEY", kHardhatKey, 1);
  setenv("FAUCET_GRANT_AMOUNT_ETHER", "0.25", 1);
  setenv("FAUCET_COOLDOWN", "10m", 1);
  setenv("FAUCET_MAX_IN_FLIGHT", "8", 1);
  setenv("FAUCET_CHAIN_ID", "31337", 1);

  auto config = ConfigLoader::LoadFromEnvironment();

  for (const char* name : {"FAUCET_RPC_URL", "FAUCET_PRIVATE_KEY", "FAUCET_GRANT_AMOUNT_ETHER", "FAUCET_COOLDOWN", "FAUCET_MAX_IN_FLIGHT",
                           "FAUCET_CHAIN_ID"}) {
    unsetenv(name);
  }

  ConfigLoader::Validate(config);
  assert(config.funding().grant_amount_ether() == "0.25");
  assert(config.chain().chain_id() == 31337);
  assert(faucet::util::ToMillis(config.admission().cooldown()).count() == 600000);
}

void TestValidateReportsMissingRequiredFields() {
  auto config = ConfigLoader::LoadFromYamlString("server:\n  port: 9000\n");

  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const faucet::util::ConfigError& e) {
    threw = true;
    const std::string message = e.what();
    assert(message.find("chain.rpc_url") != std::string::npos);
    assert(message.find("funding.private_key") != std::string::npos);
    assert(message.find("funding.grant_amount_ether") != std::string::npos);
    assert(message.find("admission.cooldown") != std::string::npos);
    assert(message.find("admission.max_in_flight") != std::string::npos);
  }
  assert(threw);
}

void TestMnemonicCredential() {
  std::string yaml = MinimalYaml();
  yaml.replace(yaml.find("  private_key:"), yaml.find('\n', yaml.find("  private_key:")) - yaml.find("  private_key:"),
               "  mnemonic: \"test test test test test test test test test test test junk\"");

  setenv("FAUCET_ACCOUNT_INDEX", "2", 1);
  auto config = ConfigLoader::LoadFromYamlString(yaml);
  unsetenv("FAUCET_ACCOUNT_INDEX");

  ConfigLoader::Validate(config);
  assert(config.funding().private_key().empty());
  assert(config.funding().mnemonic() == "test test test test test test test test test test test junk");
  assert(config.funding().account_index() == 2);

  // Both credentials at once are ambiguous.
  setenv("FAUCET_PRIVATE_KEY", kHardhatKey, 1);
  auto both = ConfigLoader::LoadFromYamlString(yaml);
  unsetenv("FAUCET_PRIVATE_KEY");

  bool threw = false;
  try {
    ConfigLoader::Validate(both);
  } catch (const faucet::util::ConfigError& e) {
    threw = true;
    assert(std::string(e.what()).find("mutually exclusive") != std::string::npos);
  }
  assert(threw);
}

void TestValidateRejectsBadAmount() {
  auto yaml = MinimalYaml();
  yaml.replace(yaml.find("1.5"), 3, "abc");
  auto config = ConfigLoader::LoadFromYamlString(yaml);

  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const faucet::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalFileGetsDefaults();
  TestDurationSuffixes();
  TestHexKeyIsNotParsedAsNumber();
  TestUnknownFieldsAreRejected();
  TestEnvironmentOverridesFile();
  TestEnvironmentOnly();
  TestValidateReportsMissingRequiredFields();
  TestValidateRejectsBadAmount();
  TestMnemonicCredential();

  std::cout << "faucet_unit_config_loader: pass\n";
  return 0;
}
