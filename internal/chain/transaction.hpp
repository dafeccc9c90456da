#pragma once

#include <cstdint>

#include "internal/chain/types.hpp"
#include "internal/util/hex.hpp"

namespace faucet::crypto {
class Secp256k1Key;
}

namespace faucet::chain {

/*
  Plain value transfer in the legacy (pre-typed) format with EIP-155 replay protection.
*/
struct LegacyTransfer {
  uint64_t nonce = 0;
  U256     gas_price;
  uint64_t gas_limit = 21000;
  Address  to{};
  U256     value;
  uint64_t chain_id = 0;
};

struct SignedTransaction {
  uint64_t    nonce = 0;
  U256        gas_price;
  Hash        hash{};
  util::Bytes raw;
};

// rlp([nonce, gasPrice, gas, to, value, data, chainId, 0, 0])
util::Bytes SigningPayload(const LegacyTransfer& tx);
Hash        SigningHash(const LegacyTransfer& tx);

// rlp([nonce, gasPrice, gas, to, value, data, v, r, s]) with v = recovery_id + chain_id * 2 + 35.
SignedTransaction SignTransfer(const LegacyTransfer& tx, const crypto::Secp256k1Key& key);

} // namespace faucet::chain
