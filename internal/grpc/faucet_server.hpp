#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "api/faucet/v1.hpp"
#include "internal/core/faucet_service.hpp"

namespace faucet::grpc {

class FaucetServer final : public faucet::v1::FaucetService::Service {
 public:
  explicit FaucetServer(std::shared_ptr<faucet::core::FaucetService> svc);

  ::grpc::Status RequestDisbursement(::grpc::ServerContext*                          ctx,
                                     const faucet::v1::RequestDisbursementRequest* req,
                                     faucet::v1::DisbursementResponse*               resp) override;

  ::grpc::Status GetDisbursement(::grpc::ServerContext*                      ctx,
                                 const faucet::v1::GetDisbursementRequest* req,
                                 faucet::v1::DisbursementResponse*           resp) override;

  ::grpc::Status GetHealth(::grpc::ServerContext*                ctx,
                           const faucet::v1::GetHealthRequest* req,
                           faucet::v1::GetHealthResponse*        resp) override;

 private:
  std::shared_ptr<faucet::core::FaucetService> service_;
};

} // namespace faucet::grpc
