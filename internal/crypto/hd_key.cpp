#include "hd_key.hpp"

#include <algorithm>
#include <charconv>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "internal/util/errors.hpp"

namespace faucet::crypto {
namespace {

constexpr int kSeedRounds = 2048;

struct BnDeleter {
  void operator()(BIGNUM* p) const { BN_clear_free(p); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* p) const { BN_CTX_free(p); }
};

using BnPtr    = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// secp256k1 group order.
constexpr std::array<uint8_t, 32> kOrder = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B, 0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41,
};

struct HmacOutput {
  std::array<uint8_t, 64> bytes{};

  ~HmacOutput() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

void HmacSha512(const uint8_t* key, std::size_t key_len, const uint8_t* data, std::size_t data_len, HmacOutput& out) {
  unsigned int out_len = 0;
  if (!HMAC(EVP_sha512(), key, static_cast<int>(key_len), data, data_len, out.bytes.data(), &out_len) || out_len != out.bytes.size()) {
    throw std::runtime_error("bip32: HMAC-SHA512 failed");
  }
}

BnPtr ToBn(const uint8_t* bytes) {
  BnPtr bn{BN_bin2bn(bytes, 32, nullptr)};
  if (!bn) {
    throw std::runtime_error("bip32: BN_bin2bn failed");
  }
  return bn;
}

bool ValidScalar(const BIGNUM* value, const BIGNUM* order) {
  return !BN_is_zero(value) && BN_cmp(value, order) < 0;
}

// SEC1 compressed form of the key's public point.
std::array<uint8_t, 33> CompressedPublicKey(const std::array<uint8_t, 32>& secret) {
  const auto              key          = Secp256k1Key::FromSecret(secret);
  const auto&             uncompressed = key.public_key();
  std::array<uint8_t, 33> out{};
  out[0] = (uncompressed[64] & 1) ? 0x03 : 0x02;
  std::copy(uncompressed.begin() + 1, uncompressed.begin() + 33, out.begin() + 1);
  return out;
}

std::vector<std::string> SplitWords(std::string_view phrase) {
  std::vector<std::string> words;
  std::istringstream       in{std::string(phrase)};
  for (std::string word; in >> word;) {
    words.push_back(std::move(word));
  }
  return words;
}

} // namespace

Seed MnemonicToSeed(std::string_view phrase, std::string_view passphrase) {
  const auto words = SplitWords(phrase);
  if (words.size() < 12 || words.size() > 24 || words.size() % 3 != 0) {
    throw util::InvalidArgument("funding mnemonic must have 12, 15, 18, 21 or 24 words, got " + std::to_string(words.size()));
  }

  std::string normalized;
  for (const auto& word : words) {
    for (char c : word) {
      if (c < 'a' || c > 'z') {
        throw util::InvalidArgument("funding mnemonic words must be lowercase English words");
      }
    }
    if (!normalized.empty()) {
      normalized.push_back(' ');
    }
    normalized += word;
  }

  std::string salt = "mnemonic";
  salt.append(passphrase.data(), passphrase.size());

  Seed seed{};
  const int rc = PKCS5_PBKDF2_HMAC(normalized.data(), static_cast<int>(normalized.size()), reinterpret_cast<const unsigned char*>(salt.data()),
                                   static_cast<int>(salt.size()), kSeedRounds, EVP_sha512(), static_cast<int>(seed.size()), seed.data());
  OPENSSL_cleanse(normalized.data(), normalized.size());
  if (rc != 1) {
    throw std::runtime_error("bip39: PBKDF2 failed");
  }
  return seed;
}

ExtendedKey ExtendedKey::FromSeed(const Seed& seed) {
  static constexpr char kMasterKey[] = "Bitcoin seed";

  HmacOutput mac;
  HmacSha512(reinterpret_cast<const uint8_t*>(kMasterKey), sizeof(kMasterKey) - 1, seed.data(), seed.size(), mac);

  const auto order  = ToBn(kOrder.data());
  const auto secret = ToBn(mac.bytes.data());
  if (!ValidScalar(secret.get(), order.get())) {
    throw util::InvalidArgument("seed yields an invalid master key");
  }

  ExtendedKey master;
  std::copy(mac.bytes.begin(), mac.bytes.begin() + 32, master.secret_.begin());
  std::copy(mac.bytes.begin() + 32, mac.bytes.end(), master.chain_code_.begin());
  return master;
}

ExtendedKey::~ExtendedKey() {
  OPENSSL_cleanse(secret_.data(), secret_.size());
}

ExtendedKey ExtendedKey::Derive(std::uint32_t index) const {
  // Hardened: 0x00 || secret || index. Normal: compressed public key || index.
  std::array<uint8_t, 37> data{};
  if (index & kHardenedIndex) {
    std::copy(secret_.begin(), secret_.end(), data.begin() + 1);
  } else {
    const auto pub = CompressedPublicKey(secret_);
    std::copy(pub.begin(), pub.end(), data.begin());
  }
  data[33] = static_cast<uint8_t>(index >> 24);
  data[34] = static_cast<uint8_t>(index >> 16);
  data[35] = static_cast<uint8_t>(index >> 8);
  data[36] = static_cast<uint8_t>(index);

  HmacOutput mac;
  HmacSha512(chain_code_.data(), chain_code_.size(), data.data(), data.size(), mac);
  OPENSSL_cleanse(data.data(), data.size());

  const auto order  = ToBn(kOrder.data());
  const auto tweak  = ToBn(mac.bytes.data());
  const auto parent = ToBn(secret_.data());
  BnPtr      child{BN_new()};
  BnCtxPtr   ctx{BN_CTX_new()};
  if (!child || !ctx || !BN_mod_add(child.get(), tweak.get(), parent.get(), order.get(), ctx.get())) {
    throw std::runtime_error("bip32: child key arithmetic failed");
  }
  // Probability below 2^-127; BIP-32 says to move on to the next index.
  if (BN_cmp(tweak.get(), order.get()) >= 0 || BN_is_zero(child.get())) {
    throw util::InvalidArgument("derivation index " + std::to_string(index & ~kHardenedIndex) + " yields an invalid key");
  }

  ExtendedKey out;
  if (BN_bn2binpad(child.get(), out.secret_.data(), static_cast<int>(out.secret_.size())) != 32) {
    throw std::runtime_error("bip32: child key does not fit in 32 bytes");
  }
  std::copy(mac.bytes.begin() + 32, mac.bytes.end(), out.chain_code_.begin());
  return out;
}

ExtendedKey ExtendedKey::DerivePath(std::string_view path) const {
  if (path.empty() || (path[0] != 'm' && path[0] != 'M')) {
    throw util::InvalidArgument("derivation path must start with m: " + std::string(path));
  }

  ExtendedKey current = *this;
  std::size_t pos     = 1;
  while (pos < path.size()) {
    if (path[pos] != '/') {
      throw util::InvalidArgument("malformed derivation path: " + std::string(path));
    }
    ++pos;

    std::uint32_t index = 0;
    const auto [ptr, ec] = std::from_chars(path.data() + pos, path.data() + path.size(), index);
    if (ec != std::errc() || index >= kHardenedIndex) {
      throw util::InvalidArgument("malformed derivation path: " + std::string(path));
    }
    pos = static_cast<std::size_t>(ptr - path.data());

    if (pos < path.size() && (path[pos] == '\'' || path[pos] == 'h' || path[pos] == 'H')) {
      index |= kHardenedIndex;
      ++pos;
    }
    current = current.Derive(index);
  }
  return current;
}

Secp256k1Key ExtendedKey::ToKey() const {
  return Secp256k1Key::FromSecret(secret_);
}

Secp256k1Key DeriveAccountKey(std::string_view phrase, std::uint32_t account_index) {
  if (account_index >= kHardenedIndex) {
    throw util::InvalidArgument("funding account index out of range: " + std::to_string(account_index));
  }
  const auto master = ExtendedKey::FromSeed(MnemonicToSeed(phrase));
  return master.DerivePath("m/44'/60'/0'/0/" + std::to_string(account_index)).ToKey();
}

} // namespace faucet::crypto
