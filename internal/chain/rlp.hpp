#pragma once

#include <cstdint>
#include <vector>

#include "internal/chain/types.hpp"
#include "internal/util/hex.hpp"

namespace faucet::chain::rlp {

/*
  Recursive-length-prefix encoding for the transaction payloads the faucet signs.
  Items are encoded individually then wrapped with EncodeList.
*/

util::Bytes EncodeBytes(const uint8_t* data, std::size_t size);

inline util::Bytes EncodeBytes(const util::Bytes& data) {
  return EncodeBytes(data.data(), data.size());
}

inline util::Bytes EncodeAddress(const Address& address) {
  return EncodeBytes(address.data(), address.size());
}

util::Bytes EncodeUint(const U256& value);

util::Bytes EncodeList(const std::vector<util::Bytes>& encoded_items);

} // namespace faucet::chain::rlp
