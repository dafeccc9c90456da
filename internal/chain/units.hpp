#pragma once

#include <string>
#include <string_view>

#include "internal/chain/types.hpp"
#include "internal/util/hex.hpp"

namespace faucet::chain {

/*
  Value conversions between wei, ether strings and JSON-RPC quantities.
*/

inline const U256 kWeiPerEther{"1000000000000000000"};

// "1.5" -> 1500000000000000000. At most 18 fractional digits.
U256        ParseEther(std::string_view text);
std::string FormatEther(const U256& wei);

U256        ParseDecimal(std::string_view text);
std::string ToDecimal(const U256& value);

// JSON-RPC QUANTITY: "0x" + hex without leading zeros, "0x0" for zero.
U256        ParseQuantity(std::string_view text);
std::string ToQuantity(const U256& value);

// Big-endian bytes without leading zeros, empty for zero.
util::Bytes ToBigEndian(const U256& value);

// value * (100 + percent) / 100
U256 Bump(const U256& value, uint32_t percent);

} // namespace faucet::chain
