#include "transaction.hpp"

#include "internal/chain/rlp.hpp"
#include "internal/crypto/keccak.hpp"
#include "internal/crypto/secp256k1.hpp"

namespace faucet::chain {
namespace {

std::vector<util::Bytes> BodyItems(const LegacyTransfer& tx) {
  std::vector<util::Bytes> items;
  items.reserve(9);
  items.push_back(rlp::EncodeUint(U256(tx.nonce)));
  items.push_back(rlp::EncodeUint(tx.gas_price));
  items.push_back(rlp::EncodeUint(U256(tx.gas_limit)));
  items.push_back(rlp::EncodeAddress(tx.to));
  items.push_back(rlp::EncodeUint(tx.value));
  items.push_back(rlp::EncodeBytes(util::Bytes{}));
  return items;
}

// Scalars are encoded as integers, so leading zero bytes are dropped.
util::Bytes EncodeScalar(const std::array<uint8_t, 32>& scalar) {
  std::size_t first = 0;
  while (first < scalar.size() && scalar[first] == 0) ++first;
  return rlp::EncodeBytes(scalar.data() + first, scalar.size() - first);
}

} // namespace

util::Bytes SigningPayload(const LegacyTransfer& tx) {
  auto items = BodyItems(tx);
  items.push_back(rlp::EncodeUint(U256(tx.chain_id)));
  items.push_back(rlp::EncodeUint(U256(0)));
  items.push_back(rlp::EncodeUint(U256(0)));
  return rlp::EncodeList(items);
}

Hash SigningHash(const LegacyTransfer& tx) {
  return crypto::Keccak(SigningPayload(tx));
}

SignedTransaction SignTransfer(const LegacyTransfer& tx, const crypto::Secp256k1Key& key) {
  const auto signature = key.Sign(SigningHash(tx));

  const U256 v = U256(tx.chain_id) * 2 + 35 + static_cast<unsigned>(signature.recovery_id);

  auto items = BodyItems(tx);
  items.push_back(rlp::EncodeUint(v));
  items.push_back(EncodeScalar(signature.r));
  items.push_back(EncodeScalar(signature.s));

  SignedTransaction signed_tx;
  signed_tx.nonce     = tx.nonce;
  signed_tx.gas_price = tx.gas_price;
  signed_tx.raw       = rlp::EncodeList(items);
  signed_tx.hash      = crypto::Keccak(signed_tx.raw);
  return signed_tx;
}

} // namespace faucet::chain
