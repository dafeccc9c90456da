#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/chain/chain_client.hpp"
#include "internal/chain/http_transport.hpp"

namespace faucet::chain {

/*
  Ethereum JSON-RPC 2.0 client.

  Request and response documents are built and parsed with google.protobuf.Struct
  so the faucet shares one JSON stack with its configuration layer.
*/
class JsonRpcClient final : public ChainClient {
 public:
  JsonRpcClient(std::shared_ptr<HttpTransport> transport, uint64_t gas_limit);

  uint64_t GetChainId() override;
  uint64_t GetTransactionCount(const Address& account) override;
  U256     GetBalance(const Address& account) override;
  FeeQuote EstimateFees() override;
  Hash     SubmitTransaction(const SignedTransaction& tx) override;
  TxStatus GetTransactionStatus(const Hash& hash) override;

 private:
  // Returns the "result" member. A JSON-RPC error object is thrown as ChainError;
  // kinds other than those from ClassifyRpcError only apply to submissions.
  google::protobuf::Value Call(const std::string& method, const google::protobuf::ListValue& params, bool is_submission);

  std::shared_ptr<HttpTransport> transport_;
  uint64_t                       gas_limit_;
  std::atomic<uint64_t>          next_id_{1};
};

} // namespace faucet::chain
