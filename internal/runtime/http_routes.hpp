#pragma once

#include <string>
#include <string_view>

#include "internal/core/faucet_service.hpp"

namespace faucet::runtime {

struct HttpReply {
  unsigned    status = 200;
  std::string body;
  // Seconds, set for rate limited replies.
  std::string retry_after;
};

/*
  Routes one HTTP request to the facade.

    GET  /healthcheck                 200 healthy, 503 otherwise
    POST /faucet/request/<address>    disbursement for the caller's peer address
    GET  /faucet/status/<job_id>      current outcome of a job

  Bodies are the faucet.v1 messages rendered as JSON.
*/
HttpReply Route(core::FaucetService& service, std::string_view method, std::string_view target, const std::string& peer);

// True for requests that may hold their handler until a disbursement settles.
bool WaitsOnDisbursement(std::string_view method, std::string_view target);

unsigned HttpStatusFor(model::OutcomeStatus status);
unsigned HttpStatusFor(const std::exception& e);

} // namespace faucet::runtime
