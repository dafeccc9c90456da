#include "json_rpc_client.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <google/protobuf/util/json_util.h>

#include "internal/chain/units.hpp"
#include "internal/util/errors.hpp"

namespace faucet::chain {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

ListValue Params(std::initializer_list<std::string> values) {
  ListValue list;
  for (const auto& v : values) list.add_values()->set_string_value(v);
  return list;
}

const std::string& RequireString(const Value& value, const std::string& method) {
  if (value.kind_case() != Value::kStringValue) {
    throw ChainError(ChainErrorKind::kUnavailable, method + ": unexpected result type");
  }
  return value.string_value();
}

U256 RequireQuantity(const Value& value, const std::string& method) {
  try {
    return ParseQuantity(RequireString(value, method));
  } catch (const util::InvalidArgument& e) {
    throw ChainError(ChainErrorKind::kUnavailable, method + ": " + e.what());
  }
}

uint64_t RequireU64(const Value& value, const std::string& method) {
  const U256 quantity = RequireQuantity(value, method);
  if (quantity > U256(std::numeric_limits<uint64_t>::max())) {
    throw ChainError(ChainErrorKind::kUnavailable, method + ": value out of range");
  }
  return static_cast<uint64_t>(quantity);
}

bool IsNull(const Value& value) {
  return value.kind_case() == Value::kNullValue || value.kind_case() == Value::KIND_NOT_SET;
}

} // namespace

JsonRpcClient::JsonRpcClient(std::shared_ptr<HttpTransport> transport, uint64_t gas_limit)
    : transport_(std::move(transport)), gas_limit_(gas_limit) {
}

Value JsonRpcClient::Call(const std::string& method, const ListValue& params, bool is_submission) {
  Struct request;
  auto&  fields = *request.mutable_fields();
  fields["jsonrpc"].set_string_value("2.0");
  fields["id"].set_number_value(static_cast<double>(next_id_.fetch_add(1)));
  fields["method"].set_string_value(method);
  *fields["params"].mutable_list_value() = params;

  std::string body;
  auto        status = google::protobuf::util::MessageToJsonString(request, &body);
  if (!status.ok()) {
    throw ChainError(ChainErrorKind::kRejected, method + ": failed to encode request: " + std::string(status.message()));
  }

  const auto response = transport_->Post(body);
  if (response.status >= 500) {
    // A gateway timeout means the node may have received the call.
    const auto kind = response.status == 504 && is_submission ? ChainErrorKind::kTimeout : ChainErrorKind::kUnavailable;
    throw ChainError(kind, method + ": HTTP " + std::to_string(response.status));
  }
  if (response.status == 429) {
    throw ChainError(ChainErrorKind::kUnavailable, method + ": rate limited by node");
  }

  Struct                                  reply;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  status                        = google::protobuf::util::JsonStringToMessage(response.body, &reply, options);
  if (!status.ok()) {
    // A body we cannot read after a submission leaves its outcome unknown.
    const auto kind = is_submission ? ChainErrorKind::kTimeout : ChainErrorKind::kUnavailable;
    throw ChainError(kind, method + ": malformed response (HTTP " + std::to_string(response.status) + ")");
  }

  const auto& reply_fields = reply.fields();
  if (auto it = reply_fields.find("error"); it != reply_fields.end() && !IsNull(it->second)) {
    const auto& error   = it->second.struct_value().fields();
    int64_t     code    = 0;
    std::string message = "unknown error";
    if (auto c = error.find("code"); c != error.end()) code = static_cast<int64_t>(std::llround(c->second.number_value()));
    if (auto m = error.find("message"); m != error.end()) message = m->second.string_value();

    const auto kind = is_submission ? ClassifyRpcError(code, message) : ChainErrorKind::kUnavailable;
    throw ChainError(kind, method + ": " + message + " (code " + std::to_string(code) + ")");
  }

  if (auto it = reply_fields.find("result"); it != reply_fields.end()) {
    return it->second;
  }
  Value null_value;
  null_value.set_null_value(google::protobuf::NULL_VALUE);
  return null_value;
}

uint64_t JsonRpcClient::GetChainId() {
  return RequireU64(Call("eth_chainId", ListValue{}, false), "eth_chainId");
}

uint64_t JsonRpcClient::GetTransactionCount(const Address& account) {
  return RequireU64(Call("eth_getTransactionCount", Params({util::ToHex(account), "pending"}), false),
                    "eth_getTransactionCount");
}

U256 JsonRpcClient::GetBalance(const Address& account) {
  return RequireQuantity(Call("eth_getBalance", Params({util::ToHex(account), "latest"}), false), "eth_getBalance");
}

FeeQuote JsonRpcClient::EstimateFees() {
  FeeQuote quote;
  quote.gas_price = RequireQuantity(Call("eth_gasPrice", ListValue{}, false), "eth_gasPrice");
  quote.gas_limit = gas_limit_;
  return quote;
}

Hash JsonRpcClient::SubmitTransaction(const SignedTransaction& tx) {
  const auto  result = Call("eth_sendRawTransaction", Params({util::ToHex(tx.raw)}), true);
  const auto& text   = RequireString(result, "eth_sendRawTransaction");

  util::Bytes bytes;
  try {
    bytes = util::FromHex(text);
  } catch (const util::InvalidArgument&) {
    bytes.clear();
  }
  if (bytes.size() != tx.hash.size()) {
    // Accepted but unreadable: the locally computed hash is authoritative.
    return tx.hash;
  }
  Hash hash{};
  std::copy(bytes.begin(), bytes.end(), hash.begin());
  return hash;
}

TxStatus JsonRpcClient::GetTransactionStatus(const Hash& hash) {
  const auto hash_hex = util::ToHex(hash);

  const auto receipt = Call("eth_getTransactionReceipt", Params({hash_hex}), false);
  if (!IsNull(receipt)) {
    const auto& fields = receipt.struct_value().fields();
    auto        block  = fields.find("blockNumber");
    if (block == fields.end() || IsNull(block->second)) {
      return TxStatus::kPending;
    }
    auto status = fields.find("status");
    if (status == fields.end() || IsNull(status->second)) {
      // Pre-Byzantium receipts have no status; inclusion is success.
      return TxStatus::kIncluded;
    }
    return RequireQuantity(status->second, "eth_getTransactionReceipt") == 0 ? TxStatus::kReverted : TxStatus::kIncluded;
  }

  const auto tx = Call("eth_getTransactionByHash", Params({hash_hex}), false);
  return IsNull(tx) ? TxStatus::kUnknown : TxStatus::kPending;
}

} // namespace faucet::chain
