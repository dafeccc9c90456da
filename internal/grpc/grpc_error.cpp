#include "grpc_error.hpp"

#include "internal/chain/chain_error.hpp"
#include "internal/util/errors.hpp"

namespace faucet::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace faucet::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (const auto* chain_error = dynamic_cast<const faucet::chain::ChainError*>(&e)) {
    if (chain_error->kind() == faucet::chain::ChainErrorKind::kTimeout) {
      return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
    }
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace faucet::grpc
