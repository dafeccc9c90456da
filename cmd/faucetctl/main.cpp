#include <grpcpp/grpcpp.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#include "api/faucet/v1.hpp"

using namespace faucet::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  faucetctl <addr> request <requester> <destination>\n"
            << "  faucetctl <addr> status <job_id>\n"
            << "  faucetctl <addr> health\n";
}

static std::string StatusName(DisbursementStatus status) {
  // DISBURSEMENT_STATUS_CONFIRMED -> confirmed
  std::string name = DisbursementStatus_Name(status);
  const std::string prefix = "DISBURSEMENT_STATUS_";
  if (name.rfind(prefix, 0) == 0) name = name.substr(prefix.size());
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

static void PrintDisbursement(const DisbursementResponse& resp) {
  std::cout << "status=" << StatusName(resp.status()) << "\n";
  if (resp.job_id() != 0) std::cout << "job_id=" << resp.job_id() << "\n";
  if (!resp.transaction_hash().empty()) std::cout << "tx=" << resp.transaction_hash() << "\n";
  if (resp.attempts() != 0) std::cout << "attempts=" << resp.attempts() << "\n";
  if (!resp.transaction_hash().empty()) std::cout << "sequence=" << resp.sequence() << "\n";
  if (resp.retry_after_ms() != 0) std::cout << "retry_after_ms=" << resp.retry_after_ms() << "\n";
  if (!resp.message().empty()) std::cout << "message=" << resp.message() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = FaucetService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RequestDisbursementRequest req;
    req.set_requester(argv[3]);
    req.set_destination(argv[4]);

    DisbursementResponse resp;

    auto status = stub->RequestDisbursement(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintDisbursement(resp);
    return resp.status() == DISBURSEMENT_STATUS_CONFIRMED || resp.status() == DISBURSEMENT_STATUS_PENDING ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetDisbursementRequest req;
    req.set_job_id(std::stoull(argv[3]));

    DisbursementResponse resp;

    auto status = stub->GetDisbursement(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintDisbursement(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    GetHealthRequest  req;
    GetHealthResponse resp;

    auto status = stub->GetHealth(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "healthy=" << (resp.healthy() ? "true" : "false") << "\n";
    std::cout << "chain_reachable=" << (resp.chain_reachable() ? "true" : "false") << "\n";
    std::cout << "balance_above_threshold=" << (resp.balance_above_threshold() ? "true" : "false") << "\n";
    std::cout << "credential_valid=" << (resp.credential_valid() ? "true" : "false") << "\n";
    std::cout << "balance_wei=" << resp.balance_wei() << "\n";
    std::cout << "funding_address=" << resp.funding_address() << "\n";
    std::cout << "queue_depth=" << resp.queue_depth() << "\n";
    return resp.healthy() ? 0 : 3;
  }

  Usage();
  return 1;
}
