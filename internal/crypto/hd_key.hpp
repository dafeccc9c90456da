#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/crypto/secp256k1.hpp"

namespace faucet::crypto {

using Seed = std::array<uint8_t, 64>;

inline constexpr std::uint32_t kHardenedIndex = 0x80000000;

// BIP-39 seed of a phrase: PBKDF2-HMAC-SHA512, 2048 rounds, salt "mnemonic" + passphrase.
// Words are split on any whitespace and rejoined with single spaces.
// Throws util::InvalidArgument unless the phrase has 12, 15, 18, 21 or 24 lowercase words.
Seed MnemonicToSeed(std::string_view phrase, std::string_view passphrase = "");

/*
  BIP-32 extended private key (HMAC-SHA512, secp256k1).

  Only private derivation is supported; the faucet never needs to derive
  from a public parent. The secret is cleansed on destruction.
*/
class ExtendedKey {
 public:
  static ExtendedKey FromSeed(const Seed& seed);

  ~ExtendedKey();
  ExtendedKey(const ExtendedKey&)            = default;
  ExtendedKey& operator=(const ExtendedKey&) = default;

  // index carries kHardenedIndex for hardened children.
  ExtendedKey Derive(std::uint32_t index) const;

  // "m/44'/60'/0'/0/3"; ' or h marks a hardened step. Throws util::InvalidArgument.
  ExtendedKey DerivePath(std::string_view path) const;

  Secp256k1Key ToKey() const;

  const std::array<uint8_t, 32>& secret() const { return secret_; }
  const std::array<uint8_t, 32>& chain_code() const { return chain_code_; }

 private:
  ExtendedKey() = default;

  std::array<uint8_t, 32> secret_{};
  std::array<uint8_t, 32> chain_code_{};
};

// Ethereum account key at m/44'/60'/0'/0/<account_index>.
Secp256k1Key DeriveAccountKey(std::string_view phrase, std::uint32_t account_index);

} // namespace faucet::crypto
