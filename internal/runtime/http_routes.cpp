#include "internal/runtime/http_routes.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <charconv>

#include "internal/chain/chain_error.hpp"
#include "internal/core/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace faucet::runtime {

namespace {

constexpr std::string_view kRequestPrefix = "/faucet/request/";
constexpr std::string_view kStatusPrefix  = "/faucet/status/";

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render response: " + std::string(status.message()));
  }
  return json;
}

HttpReply ErrorReply(unsigned status, std::string_view message) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["error"].set_string_value(std::string(message));
  return {status, ToJson(body), {}};
}

std::string_view StripQuery(std::string_view target) {
  const auto pos = target.find('?');
  return pos == std::string_view::npos ? target : target.substr(0, pos);
}

HttpReply OutcomeReply(const model::DisbursementOutcome& outcome) {
  HttpReply reply{HttpStatusFor(outcome.status), ToJson(core::ToProto(outcome)), {}};
  if (outcome.status == model::OutcomeStatus::kRateLimited) {
    const auto seconds = (outcome.retry_after.count() + 999) / 1000;
    reply.retry_after  = std::to_string(seconds);
  }
  return reply;
}

} // namespace

bool WaitsOnDisbursement(std::string_view method, std::string_view target) {
  const auto path = StripQuery(target);
  return method == "POST" && path.substr(0, kRequestPrefix.size()) == kRequestPrefix;
}

unsigned HttpStatusFor(model::OutcomeStatus status) {
  switch (status) {
    case model::OutcomeStatus::kConfirmed:
      return 200;
    case model::OutcomeStatus::kPending:
      return 202;
    case model::OutcomeStatus::kInvalidAddress:
      return 400;
    case model::OutcomeStatus::kRateLimited:
      return 429;
    case model::OutcomeStatus::kBackpressure:
    case model::OutcomeStatus::kAbandoned:
      return 503;
    case model::OutcomeStatus::kFailed:
      return 502;
  }
  return 500;
}

unsigned HttpStatusFor(const std::exception& e) {
  using namespace faucet::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) return 400;
  if (dynamic_cast<const NotFound*>(&e)) return 404;
  if (dynamic_cast<const InvalidState*>(&e)) return 409;
  if (dynamic_cast<const Unavailable*>(&e)) return 503;
  if (dynamic_cast<const faucet::chain::ChainError*>(&e)) return 502;
  return 500;
}

HttpReply Route(core::FaucetService& service, std::string_view method, std::string_view target, const std::string& peer) {
  const auto path = StripQuery(target);

  try {
    if (path == "/healthcheck") {
      if (method != "GET") return ErrorReply(405, "method not allowed");
      const auto report = service.HealthStatus();
      return {report.healthy() ? 200u : 503u, ToJson(core::ToProto(report)), {}};
    }

    if (path.substr(0, kRequestPrefix.size()) == kRequestPrefix) {
      if (method != "POST") return ErrorReply(405, "method not allowed");
      const auto destination = path.substr(kRequestPrefix.size());
      return OutcomeReply(service.RequestDisbursement(peer, std::string(destination)));
    }

    if (path.substr(0, kStatusPrefix.size()) == kStatusPrefix) {
      if (method != "GET") return ErrorReply(405, "method not allowed");
      const auto   text = path.substr(kStatusPrefix.size());
      model::JobId job_id = 0;
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), job_id);
      if (ec != std::errc() || ptr != text.data() + text.size()) {
        return ErrorReply(400, "invalid job id");
      }
      return OutcomeReply(service.GetDisbursement(job_id));
    }

    return ErrorReply(404, "not found");
  } catch (const std::exception& e) {
    const auto status = HttpStatusFor(e);
    if (status >= 500) {
      FAUCET_LOG_WARN("HTTP request failed",
                      {faucet::observability::StringField("target", path), faucet::observability::ErrorField(e)});
    }
    return ErrorReply(status, e.what());
  }
}

} // namespace faucet::runtime
