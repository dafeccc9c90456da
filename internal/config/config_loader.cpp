#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "internal/chain/http_transport.hpp"
#include "internal/chain/units.hpp"
#include "internal/util/errors.hpp"

namespace faucet::config {

using faucet::runtime::config::RuntimeConfig;
using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

namespace {

struct EnvOverride {
  const char*              name;
  std::vector<std::string> path;
};

const std::vector<EnvOverride>& EnvOverrides() {
  static const std::vector<EnvOverride> kOverrides = {
      {"FAUCET_PORT", {"server", "port"}},
      {"FAUCET_BIND_HOST", {"server", "bind_host"}},
      {"FAUCET_GRPC_BIND_ADDRESS", {"server", "grpc_bind_address"}},
      {"FAUCET_RPC_URL", {"chain", "rpc_url"}},
      {"FAUCET_CHAIN_ID", {"chain", "chain_id"}},
      {"FAUCET_RPC_TIMEOUT", {"chain", "request_timeout"}},
      {"FAUCET_GAS_LIMIT", {"chain", "gas_limit"}},
      {"FAUCET_PRIVATE_KEY", {"funding", "private_key"}},
      {"FAUCET_MNEMONIC", {"funding", "mnemonic"}},
      {"FAUCET_ACCOUNT_INDEX", {"funding", "account_index"}},
      {"FAUCET_GRANT_AMOUNT_ETHER", {"funding", "grant_amount_ether"}},
      {"FAUCET_MIN_BALANCE_ETHER", {"funding", "min_balance_ether"}},
      {"FAUCET_COOLDOWN", {"admission", "cooldown"}},
      {"FAUCET_MAX_IN_FLIGHT", {"admission", "max_in_flight"}},
      {"FAUCET_MAX_ATTEMPTS", {"submission", "max_attempts"}},
      {"FAUCET_BACKOFF_INITIAL", {"submission", "backoff_initial"}},
      {"FAUCET_BACKOFF_MAX", {"submission", "backoff_max"}},
      {"FAUCET_FEE_BUMP_PERCENT", {"submission", "fee_bump_percent"}},
      {"FAUCET_POLL_INTERVAL", {"submission", "poll_interval"}},
      {"FAUCET_CONFIRMATION_TIMEOUT", {"submission", "confirmation_timeout"}},
      {"FAUCET_AMBIGUOUS_REQUERY_LIMIT", {"submission", "ambiguous_requery_limit"}},
      {"FAUCET_MAX_STATE_AGE", {"ledger", "max_state_age"}},
      {"FAUCET_CLIENT_TIMEOUT", {"facade", "client_timeout"}},
      {"FAUCET_LOG_LEVEL", {"logging", "level"}},
  };
  return kOverrides;
}

void SetPath(YAML::Node node, std::vector<std::string>::const_iterator begin, std::vector<std::string>::const_iterator end,
             const std::string& value) {
  if (begin + 1 == end) {
    node[*begin] = value;
    return;
  }
  SetPath(node[*begin], begin + 1, end, value);
}

void ApplyEnvironment(YAML::Node& root) {
  for (const auto& entry : EnvOverrides()) {
    if (const char* value = std::getenv(entry.name)) {
      SetPath(root, entry.path.begin(), entry.path.end(), value);
    }
  }
}

// "30s", "1.5s", "500ms", "2m", "1h" or a bare number of seconds -> protobuf JSON "<seconds>s".
std::string NormalizeDuration(const std::string& text) {
  auto convert = [&](std::size_t suffix_len, double scale) {
    const auto number = text.substr(0, text.size() - suffix_len);
    char*      end    = nullptr;
    const auto value  = std::strtod(number.c_str(), &end);
    if (number.empty() || !end || *end != '\0' || value < 0) {
      throw util::ConfigError("invalid duration: '" + text + "'");
    }
    const auto nanos = static_cast<std::int64_t>(value * scale * 1e9 + 0.5);
    return google::protobuf::util::TimeUtil::ToString(google::protobuf::util::TimeUtil::NanosecondsToDuration(nanos));
  };

  auto ends_with = [&](const char* suffix) {
    const std::string s(suffix);
    return text.size() > s.size() && text.compare(text.size() - s.size(), s.size(), s) == 0;
  };

  if (ends_with("ms")) return convert(2, 1e-3);
  if (ends_with("s")) return convert(1, 1.0);
  if (ends_with("m")) return convert(1, 60.0);
  if (ends_with("h")) return convert(1, 3600.0);
  return convert(0, 1.0);
}

bool LooksNumeric(const std::string& scalar) {
  if (scalar.empty() || scalar.rfind("0x", 0) == 0 || scalar.rfind("0X", 0) == 0) {
    return false;
  }
  char* endptr = nullptr;
  std::strtod(scalar.c_str(), &endptr);
  return endptr && *endptr == '\0';
}

void YamlToProtoValue(const YAML::Node& node, const Descriptor* message, const FieldDescriptor* field, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (field) {
    switch (field->cpp_type()) {
      case FieldDescriptor::CPPTYPE_STRING:
      case FieldDescriptor::CPPTYPE_ENUM:
        value->set_string_value(scalar);
        return;
      case FieldDescriptor::CPPTYPE_BOOL:
        if (scalar == "true" || scalar == "false") {
          value->set_bool_value(scalar == "true");
        } else {
          value->set_string_value(scalar);
        }
        return;
      case FieldDescriptor::CPPTYPE_MESSAGE:
        if (field->message_type()->full_name() == "google.protobuf.Duration") {
          value->set_string_value(NormalizeDuration(scalar));
        } else {
          value->set_string_value(scalar);
        }
        return;
      default:
        if (LooksNumeric(scalar)) {
          value->set_number_value(std::strtod(scalar.c_str(), nullptr));
        } else {
          value->set_string_value(scalar);
        }
        return;
    }
  }

  // Unknown key: the JSON parser reports it, the typing only has to be plausible.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
  } else if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
  } else if (LooksNumeric(scalar)) {
    value->set_number_value(std::strtod(scalar.c_str(), nullptr));
  } else {
    value->set_string_value(scalar);
  }
}

void YamlToProtoValue(const YAML::Node& node, const Descriptor* message, const FieldDescriptor* field, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], nullptr, field, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      const Descriptor* nested = message;
      if (field) {
        nested = field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE ? field->message_type() : nullptr;
      }
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const auto  key   = it.first.Scalar();
        const auto* child = nested ? nested->FindFieldByName(key) : nullptr;
        if (!child && nested) {
          for (int i = 0; i < nested->field_count(); ++i) {
            if (nested->field(i)->json_name() == key) {
              child = nested->field(i);
              break;
            }
          }
        }
        YamlToProtoValue(it.second, nullptr, child, &(*struct_value->mutable_fields())[key]);
      }
      break;
    }
  }
}

RuntimeConfig ParseTree(YAML::Node root) {
  if (!root || root.IsNull()) {
    root = YAML::Node(YAML::NodeType::Map);
  }
  if (!root.IsMap()) {
    throw util::ConfigError("configuration root must be a mapping");
  }
  ApplyEnvironment(root);

  google::protobuf::Value json_value;
  YamlToProtoValue(root, RuntimeConfig::descriptor(), nullptr, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

void DefaultDuration(google::protobuf::Duration* duration, std::int64_t millis) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    *duration = google::protobuf::util::TimeUtil::MillisecondsToDuration(millis);
  }
}

bool IsPositive(const google::protobuf::Duration& duration) {
  return duration.seconds() > 0 || (duration.seconds() == 0 && duration.nanos() > 0);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseTree(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseTree(root);
}

RuntimeConfig ConfigLoader::LoadFromEnvironment() {
  return ParseTree(YAML::Node(YAML::NodeType::Map));
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->port() == 0) server->set_port(8080);
  if (server->bind_host().empty()) server->set_bind_host("0.0.0.0");

  auto* chain = config.mutable_chain();
  DefaultDuration(chain->mutable_request_timeout(), 10000);
  if (chain->gas_limit() == 0) chain->set_gas_limit(21000);

  auto* funding = config.mutable_funding();
  if (funding->min_balance_ether().empty()) funding->set_min_balance_ether("0");

  auto* submission = config.mutable_submission();
  if (submission->max_attempts() == 0) submission->set_max_attempts(5);
  DefaultDuration(submission->mutable_backoff_initial(), 500);
  DefaultDuration(submission->mutable_backoff_max(), 8000);
  if (submission->fee_bump_percent() == 0) submission->set_fee_bump_percent(12);
  DefaultDuration(submission->mutable_poll_interval(), 1000);
  DefaultDuration(submission->mutable_confirmation_timeout(), 60000);
  if (submission->ambiguous_requery_limit() == 0) submission->set_ambiguous_requery_limit(3);

  auto* ledger = config.mutable_ledger();
  DefaultDuration(ledger->mutable_max_state_age(), 60000);
  DefaultDuration(ledger->mutable_reconcile_interval(), 30000);

  auto* facade = config.mutable_facade();
  DefaultDuration(facade->mutable_client_timeout(), 30000);
  DefaultDuration(facade->mutable_result_retention(), 3600000);
  DefaultDuration(facade->mutable_shutdown_drain_timeout(), 10000);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::vector<std::string> problems;

  if (config.chain().rpc_url().empty()) {
    problems.push_back("chain.rpc_url is required");
  } else {
    try {
      chain::ParseEndpoint(config.chain().rpc_url());
    } catch (const util::InvalidArgument& e) {
      problems.push_back(std::string("chain.rpc_url: ") + e.what());
    }
  }

  if (config.funding().private_key().empty() && config.funding().mnemonic().empty()) {
    problems.push_back("funding.private_key or funding.mnemonic is required");
  } else if (!config.funding().private_key().empty() && !config.funding().mnemonic().empty()) {
    problems.push_back("funding.private_key and funding.mnemonic are mutually exclusive");
  }

  if (config.funding().grant_amount_ether().empty()) {
    problems.push_back("funding.grant_amount_ether is required");
  } else {
    try {
      if (chain::ParseEther(config.funding().grant_amount_ether()) == 0) {
        problems.push_back("funding.grant_amount_ether must be greater than zero");
      }
    } catch (const util::InvalidArgument& e) {
      problems.push_back(std::string("funding.grant_amount_ether: ") + e.what());
    }
  }

  try {
    chain::ParseEther(config.funding().min_balance_ether().empty() ? "0" : config.funding().min_balance_ether());
  } catch (const util::InvalidArgument& e) {
    problems.push_back(std::string("funding.min_balance_ether: ") + e.what());
  }

  if (!config.admission().has_cooldown() || !IsPositive(config.admission().cooldown())) {
    problems.push_back("admission.cooldown is required and must be positive");
  }
  if (config.admission().max_in_flight() == 0) {
    problems.push_back("admission.max_in_flight is required and must be positive");
  }

  const auto& submission = config.submission();
  if (submission.max_attempts() == 0) {
    problems.push_back("submission.max_attempts must be at least 1");
  }
  if (google::protobuf::util::TimeUtil::DurationToMilliseconds(submission.backoff_max()) <
      google::protobuf::util::TimeUtil::DurationToMilliseconds(submission.backoff_initial())) {
    problems.push_back("submission.backoff_max must not be smaller than submission.backoff_initial");
  }
  if (submission.fee_bump_percent() > 1000) {
    problems.push_back("submission.fee_bump_percent must be at most 1000");
  }
  if (config.server().port() > 65535) {
    problems.push_back("server.port must be a valid TCP port");
  }

  if (!problems.empty()) {
    std::string message = "invalid configuration:";
    for (const auto& problem : problems) {
      message += "\n  - " + problem;
    }
    throw util::ConfigError(message);
  }
}

} // namespace faucet::config
