#pragma once

#include "api/faucet/v1.hpp"
#include "internal/core/health_monitor.hpp"
#include "internal/model/disbursement.hpp"

namespace faucet::core {

/*
  Model <-> faucet.v1 wire messages. Shared by the gRPC and HTTP surfaces.
*/

faucet::v1::DisbursementStatus   ToProto(model::OutcomeStatus status);
faucet::v1::DisbursementResponse ToProto(const model::DisbursementOutcome& outcome);
faucet::v1::GetHealthResponse    ToProto(const HealthReport& report);

} // namespace faucet::core
