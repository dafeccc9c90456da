#include "internal/chain/json_rpc_client.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/chain/address.hpp"
#include "internal/chain/units.hpp"
#include "internal/util/hex.hpp"
#include "tests/unit/support/scripted_transport.hpp"

namespace {

using faucet::chain::ChainError;
using faucet::chain::ChainErrorKind;
using faucet::chain::JsonRpcClient;
using faucet::chain::TxStatus;
using faucet::chain::U256;
using faucet::testing::ScriptedTransport;

const auto kAccount = faucet::chain::ParseAddressOrThrow("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");

std::string Result(const std::string& json_value) {
  return R"({"jsonrpc":"2.0","id":1,"result":)" + json_value + "}";
}

std::string Error(int code, const std::string& message) {
  return R"({"jsonrpc":"2.0","id":1,"error":{"code":)" + std::to_string(code) + R"(,"message":")" + message + R"("}})";
}

faucet::chain::SignedTransaction SampleTransaction() {
  faucet::chain::SignedTransaction tx;
  tx.nonce     = 3;
  tx.gas_price = U256(1000000000);
  tx.raw       = {0xf8, 0x6b, 0x01};
  tx.hash.fill(0xab);
  return tx;
}

template <typename Fn>
ChainErrorKind ExpectChainError(Fn&& fn) {
  try {
    fn();
  } catch (const ChainError& e) {
    return e.kind();
  }
  assert(false && "expected ChainError");
  return ChainErrorKind::kRejected;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestQueriesDecodeQuantities() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Reply(200, Result(R"("0x539")"));
  transport->Reply(200, Result(R"("0x2a")"));
  transport->Reply(200, Result(R"("0xde0b6b3a7640000")"));
  transport->Reply(200, Result(R"("0x3b9aca00")"));

  JsonRpcClient client(transport, 21000);
  assert(client.GetChainId() == 1337);
  assert(client.GetTransactionCount(kAccount) == 42);
  assert(client.GetBalance(kAccount) == faucet::chain::kWeiPerEther);

  const auto quote = client.EstimateFees();
  assert(quote.gas_price == U256(1000000000));
  assert(quote.gas_limit == 21000);

  const auto requests = transport->requests();
  assert(requests.size() == 4);
  assert(Contains(requests[0], R"("method":"eth_chainId")"));
  assert(Contains(requests[0], R"("jsonrpc":"2.0")"));
  assert(Contains(requests[1], R"("method":"eth_getTransactionCount")"));
  assert(Contains(requests[1], "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
  assert(Contains(requests[1], R"("pending")"));
  assert(Contains(requests[2], R"("latest")"));
}

void TestSubmissionReturnsNodeHash() {
  auto transport = std::make_shared<ScriptedTransport>();
  const auto tx  = SampleTransaction();
  transport->Reply(200, Result("\"" + faucet::util::ToHex(tx.hash) + "\""));
  transport->Reply(200, Result(R"("0x1234")"));

  JsonRpcClient client(transport, 21000);
  assert(client.SubmitTransaction(tx) == tx.hash);
  // An unreadable hash falls back to the local one.
  assert(client.SubmitTransaction(tx) == tx.hash);
  assert(Contains(transport->requests()[0], R"("0xf86b01")"));
}

void TestSubmissionErrorsAreClassified() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Reply(200, Error(-32000, "nonce too low"));
  transport->Reply(200, Error(-32000, "already known"));
  transport->Reply(200, Error(-32000, "replacement transaction underpriced"));
  transport->Reply(200, Error(-32000, "transaction underpriced"));
  transport->Reply(200, Error(-32000, "insufficient funds for gas * price + value"));
  transport->Reply(504, "gateway timeout");
  transport->Reply(502, "bad gateway");
  transport->Reply(200, "<html>oops</html>");
  transport->Fail(ChainErrorKind::kTimeout);

  JsonRpcClient client(transport, 21000);
  const auto    tx     = SampleTransaction();
  const auto    submit = [&] { client.SubmitTransaction(tx); };

  assert(ExpectChainError(submit) == ChainErrorKind::kNonceTooLow);
  assert(ExpectChainError(submit) == ChainErrorKind::kAlreadyKnown);
  assert(ExpectChainError(submit) == ChainErrorKind::kNonceConflict);
  assert(ExpectChainError(submit) == ChainErrorKind::kFeeTooLow);
  assert(ExpectChainError(submit) == ChainErrorKind::kRejected);
  assert(ExpectChainError(submit) == ChainErrorKind::kTimeout);
  assert(ExpectChainError(submit) == ChainErrorKind::kUnavailable);
  assert(ExpectChainError(submit) == ChainErrorKind::kTimeout);
  assert(ExpectChainError(submit) == ChainErrorKind::kTimeout);
}

void TestQueryErrorsAreUnavailable() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Reply(200, Error(-32000, "nonce too low"));
  transport->Reply(504, "gateway timeout");
  transport->Reply(429, "slow down");
  transport->Reply(200, "not json");
  transport->Reply(200, Result("12"));
  transport->Reply(200, Result(R"("0xzz")"));

  JsonRpcClient client(transport, 21000);
  const auto    chain_id = [&] { client.GetChainId(); };
  for (int i = 0; i < 6; ++i) {
    assert(ExpectChainError(chain_id) == ChainErrorKind::kUnavailable);
  }
}

void TestReceiptStatuses() {
  auto       transport = std::make_shared<ScriptedTransport>();
  const auto hash      = SampleTransaction().hash;

  transport->Reply(200, Result(R"({"blockNumber":"0x10","status":"0x1"})"));
  transport->Reply(200, Result(R"({"blockNumber":"0x10","status":"0x0"})"));
  transport->Reply(200, Result(R"({"blockNumber":"0x10"})"));
  transport->Reply(200, Result(R"({"blockNumber":null,"status":null})"));
  transport->Reply(200, Result("null"));
  transport->Reply(200, Result(R"({"hash":"0xabab","blockNumber":null})"));
  transport->Reply(200, Result("null"));
  transport->Reply(200, Result("null"));

  JsonRpcClient client(transport, 21000);
  assert(client.GetTransactionStatus(hash) == TxStatus::kIncluded);
  assert(client.GetTransactionStatus(hash) == TxStatus::kReverted);
  assert(client.GetTransactionStatus(hash) == TxStatus::kIncluded);
  assert(client.GetTransactionStatus(hash) == TxStatus::kPending);
  assert(client.GetTransactionStatus(hash) == TxStatus::kPending);
  assert(client.GetTransactionStatus(hash) == TxStatus::kUnknown);

  const auto requests = transport->requests();
  assert(requests.size() == 8);
  assert(Contains(requests[4], "eth_getTransactionReceipt"));
  assert(Contains(requests[5], "eth_getTransactionByHash"));
}

} // namespace

int main() {
  TestQueriesDecodeQuantities();
  TestSubmissionReturnsNodeHash();
  TestSubmissionErrorsAreClassified();
  TestQueryErrorsAreUnavailable();
  TestReceiptStatuses();

  std::cout << "faucet_unit_json_rpc_client: pass\n";
  return 0;
}
