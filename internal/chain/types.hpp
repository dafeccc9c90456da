#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace faucet::chain {

using U256    = boost::multiprecision::uint256_t;
using Address = std::array<uint8_t, 20>;
using Hash    = std::array<uint8_t, 32>;

/*
  Inclusion state of a transaction as seen by the node.

  kUnknown  - the node does not know the hash (never received or dropped)
  kPending  - known to the node, no receipt yet
  kIncluded - receipt with status 1
  kReverted - receipt with status 0 (sequence consumed, no value moved)
*/
enum class TxStatus : uint8_t {
  kUnknown  = 0,
  kPending  = 1,
  kIncluded = 2,
  kReverted = 3,
};

inline const char* ToString(TxStatus status) {
  switch (status) {
    case TxStatus::kUnknown:
      return "unknown";
    case TxStatus::kPending:
      return "pending";
    case TxStatus::kIncluded:
      return "included";
    case TxStatus::kReverted:
      return "reverted";
  }
  return "unknown";
}

struct FeeQuote {
  U256     gas_price;
  uint64_t gas_limit = 21000;
};

} // namespace faucet::chain
