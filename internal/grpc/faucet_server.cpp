#include "faucet_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/core/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace faucet::grpc {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

FaucetServer::FaucetServer(std::shared_ptr<faucet::core::FaucetService> svc) : service_(std::move(svc)) {
}

::grpc::Status FaucetServer::RequestDisbursement(::grpc::ServerContext*,
                                                 const faucet::v1::RequestDisbursementRequest* req,
                                                 faucet::v1::DisbursementResponse*               resp) {
  const auto start = std::chrono::steady_clock::now();
  auto&      metrics = faucet::observability::Metrics::Instance();
  try {
    *resp = faucet::core::ToProto(service_->RequestDisbursement(req->requester(), req->destination()));
    metrics.RecordRequest("grpc.request_disbursement", true, ElapsedMs(start));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    metrics.RecordRequest("grpc.request_disbursement", false, ElapsedMs(start));
    FAUCET_LOG_WARN("RequestDisbursement failed", {faucet::observability::ErrorField(e)});
    return ToStatus(e);
  }
}

::grpc::Status FaucetServer::GetDisbursement(::grpc::ServerContext*,
                                             const faucet::v1::GetDisbursementRequest* req,
                                             faucet::v1::DisbursementResponse*           resp) {
  const auto start = std::chrono::steady_clock::now();
  try {
    *resp = faucet::core::ToProto(service_->GetDisbursement(req->job_id()));
    faucet::observability::Metrics::Instance().RecordRequest("grpc.get_disbursement", true, ElapsedMs(start));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    faucet::observability::Metrics::Instance().RecordRequest("grpc.get_disbursement", false, ElapsedMs(start));
    return ToStatus(e);
  }
}

::grpc::Status FaucetServer::GetHealth(::grpc::ServerContext*, const faucet::v1::GetHealthRequest*, faucet::v1::GetHealthResponse* resp) {
  try {
    *resp = faucet::core::ToProto(service_->HealthStatus());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace faucet::grpc
