#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/chain/types.hpp"
#include "internal/crypto/keccak.hpp"

typedef struct evp_pkey_st EVP_PKEY;

namespace faucet::crypto {

using PublicKey = std::array<uint8_t, 65>;

struct RecoverableSignature {
  std::array<uint8_t, 32> r{};
  std::array<uint8_t, 32> s{};
  int                     recovery_id = 0;
};

/*
  secp256k1 signing key backed by the OpenSSL 3 EVP API.

  Signatures are low-S normalized and always carry a recovery id of 0 or 1.
*/
class Secp256k1Key {
 public:
  // Throws util::InvalidArgument if the hex text is not a valid 32 byte secret.
  static Secp256k1Key FromHex(std::string_view secret_hex);
  // Throws util::InvalidArgument if the secret is zero or not below the group order.
  static Secp256k1Key FromSecret(const std::array<uint8_t, 32>& secret);

  ~Secp256k1Key();
  Secp256k1Key(Secp256k1Key&&) noexcept;
  Secp256k1Key& operator=(Secp256k1Key&&) noexcept;

  Secp256k1Key(const Secp256k1Key&)            = delete;
  Secp256k1Key& operator=(const Secp256k1Key&) = delete;

  const PublicKey&      public_key() const { return public_key_; }
  const chain::Address& address() const { return address_; }

  RecoverableSignature Sign(const Digest256& hash) const;

  static std::optional<PublicKey> Recover(const Digest256& hash, const RecoverableSignature& signature);

  static chain::Address AddressOf(const PublicKey& public_key);

 private:
  struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const;
  };

  Secp256k1Key() = default;

  std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey_;
  PublicKey                              public_key_{};
  chain::Address                         address_{};
};

} // namespace faucet::crypto
