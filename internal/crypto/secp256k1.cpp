#include "secp256k1.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace faucet::crypto {
namespace {

struct BnDeleter {
  void operator()(BIGNUM* p) const { BN_free(p); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* p) const { BN_CTX_free(p); }
};
struct GroupDeleter {
  void operator()(EC_GROUP* p) const { EC_GROUP_free(p); }
};
struct PointDeleter {
  void operator()(EC_POINT* p) const { EC_POINT_free(p); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct ParamBldDeleter {
  void operator()(OSSL_PARAM_BLD* p) const { OSSL_PARAM_BLD_free(p); }
};
struct ParamDeleter {
  void operator()(OSSL_PARAM* p) const { OSSL_PARAM_free(p); }
};
struct EcdsaSigDeleter {
  void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); }
};

using BnPtr       = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr    = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr    = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr    = std::unique_ptr<EC_POINT, PointDeleter>;
using PkeyCtxPtr  = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
using ParamPtr    = std::unique_ptr<OSSL_PARAM, ParamDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

std::runtime_error OpenSslError(const std::string& context) {
  char buffer[256] = {0};
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return std::runtime_error(context + ": " + buffer);
}

const EC_GROUP* Group() {
  static GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
  return group.get();
}

const BIGNUM* Order() {
  static BnPtr order = [] {
    BnPtr n{BN_new()};
    EC_GROUP_get_order(Group(), n.get(), nullptr);
    return n;
  }();
  return order.get();
}

const BIGNUM* HalfOrder() {
  static BnPtr half = [] {
    BnPtr h{BN_dup(Order())};
    BN_rshift1(h.get(), h.get());
    return h;
  }();
  return half.get();
}

void ToFixed32(const BIGNUM* bn, std::array<uint8_t, 32>& out) {
  if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
    throw std::runtime_error("secp256k1: scalar does not fit in 32 bytes");
  }
}

PublicKey SerializeUncompressed(const EC_POINT* point, BN_CTX* ctx) {
  PublicKey out{};
  if (EC_POINT_point2oct(Group(), point, POINT_CONVERSION_UNCOMPRESSED, out.data(), out.size(), ctx) != out.size()) {
    throw OpenSslError("secp256k1: point serialization failed");
  }
  return out;
}

} // namespace

void Secp256k1Key::PkeyDeleter::operator()(EVP_PKEY* pkey) const {
  EVP_PKEY_free(pkey);
}

Secp256k1Key::~Secp256k1Key()                                = default;
Secp256k1Key::Secp256k1Key(Secp256k1Key&&) noexcept            = default;
Secp256k1Key& Secp256k1Key::operator=(Secp256k1Key&&) noexcept = default;

Secp256k1Key Secp256k1Key::FromHex(std::string_view secret_hex) {
  util::Bytes secret;
  try {
    secret = util::FromHex(secret_hex);
  } catch (const util::InvalidArgument&) {
    throw util::InvalidArgument("funding private key is not valid hex");
  }
  if (secret.size() != 32) {
    throw util::InvalidArgument("funding private key must be 32 bytes, got " + std::to_string(secret.size()));
  }

  std::array<uint8_t, 32> fixed{};
  std::memcpy(fixed.data(), secret.data(), fixed.size());
  OPENSSL_cleanse(secret.data(), secret.size());
  try {
    auto key = FromSecret(fixed);
    OPENSSL_cleanse(fixed.data(), fixed.size());
    return key;
  } catch (...) {
    OPENSSL_cleanse(fixed.data(), fixed.size());
    throw;
  }
}

Secp256k1Key Secp256k1Key::FromSecret(const std::array<uint8_t, 32>& secret) {
  BnPtr priv{BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr)};
  if (!priv || BN_is_zero(priv.get()) || BN_cmp(priv.get(), Order()) >= 0) {
    throw util::InvalidArgument("funding private key is out of range for secp256k1");
  }

  BnCtxPtr ctx{BN_CTX_new()};
  PointPtr pub{EC_POINT_new(Group())};
  if (!ctx || !pub || !EC_POINT_mul(Group(), pub.get(), priv.get(), nullptr, nullptr, ctx.get())) {
    throw OpenSslError("secp256k1: public key derivation failed");
  }

  Secp256k1Key key;
  key.public_key_ = SerializeUncompressed(pub.get(), ctx.get());
  key.address_    = AddressOf(key.public_key_);

  // OSSL_PARAM_BLD_push_BN keeps a pointer; priv must outlive to_param.
  ParamBldPtr bld{OSSL_PARAM_BLD_new()};
  if (!bld || !OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) ||
      !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv.get()) ||
      !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, key.public_key_.data(), key.public_key_.size())) {
    throw OpenSslError("secp256k1: building key params failed");
  }
  ParamPtr params{OSSL_PARAM_BLD_to_param(bld.get())};
  if (!params) {
    throw OpenSslError("secp256k1: building key params failed");
  }

  PkeyCtxPtr pctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
  EVP_PKEY*  raw = nullptr;
  if (!pctx || EVP_PKEY_fromdata_init(pctx.get()) <= 0 || EVP_PKEY_fromdata(pctx.get(), &raw, EVP_PKEY_KEYPAIR, params.get()) <= 0) {
    throw OpenSslError("secp256k1: EVP_PKEY_fromdata failed");
  }
  key.pkey_.reset(raw);
  return key;
}

chain::Address Secp256k1Key::AddressOf(const PublicKey& public_key) {
  const auto     digest = Keccak(public_key.data() + 1, public_key.size() - 1);
  chain::Address address{};
  std::memcpy(address.data(), digest.data() + 12, address.size());
  return address;
}

RecoverableSignature Secp256k1Key::Sign(const Digest256& hash) const {
  // A recovery id of 2 or 3 needs r >= p - n, which is negligible; re-sign if it happens.
  for (int round = 0; round < 4; ++round) {
    PkeyCtxPtr ctx{EVP_PKEY_CTX_new(pkey_.get(), nullptr)};
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) <= 0) {
      throw OpenSslError("secp256k1: sign init failed");
    }

    std::size_t der_len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &der_len, hash.data(), hash.size()) <= 0) {
      throw OpenSslError("secp256k1: sign length query failed");
    }
    std::vector<uint8_t> der(der_len);
    if (EVP_PKEY_sign(ctx.get(), der.data(), &der_len, hash.data(), hash.size()) <= 0) {
      throw OpenSslError("secp256k1: sign failed");
    }

    const unsigned char* cursor = der.data();
    EcdsaSigPtr          sig{d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_len))};
    if (!sig) {
      throw OpenSslError("secp256k1: DER decode failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    RecoverableSignature out;
    ToFixed32(r, out.r);

    BnPtr low_s{BN_dup(s)};
    if (BN_cmp(low_s.get(), HalfOrder()) > 0) {
      BN_sub(low_s.get(), Order(), low_s.get());
    }
    ToFixed32(low_s.get(), out.s);

    for (int id = 0; id < 2; ++id) {
      out.recovery_id = id;
      const auto recovered = Recover(hash, out);
      if (recovered && *recovered == public_key_) {
        return out;
      }
    }
  }
  throw std::runtime_error("secp256k1: could not derive recovery id");
}

std::optional<PublicKey> Secp256k1Key::Recover(const Digest256& hash, const RecoverableSignature& signature) {
  if (signature.recovery_id < 0 || signature.recovery_id > 3) return std::nullopt;

  const EC_GROUP* group = Group();
  BnCtxPtr        ctx{BN_CTX_new()};
  BnPtr           r{BN_bin2bn(signature.r.data(), 32, nullptr)};
  BnPtr           s{BN_bin2bn(signature.s.data(), 32, nullptr)};
  if (!ctx || !r || !s || BN_is_zero(r.get()) || BN_is_zero(s.get())) return std::nullopt;

  // R.x = r + (recovery_id / 2) * n
  BnPtr x{BN_dup(r.get())};
  if (signature.recovery_id & 2) {
    BN_add(x.get(), x.get(), Order());
  }

  PointPtr big_r{EC_POINT_new(group)};
  if (!EC_POINT_set_compressed_coordinates(group, big_r.get(), x.get(), signature.recovery_id & 1, ctx.get())) {
    ERR_clear_error();
    return std::nullopt;
  }

  // Q = r^-1 * (s*R - e*G)
  BnPtr e{BN_bin2bn(hash.data(), static_cast<int>(hash.size()), nullptr)};
  BnPtr r_inv{BN_mod_inverse(nullptr, r.get(), Order(), ctx.get())};
  if (!r_inv) return std::nullopt;

  BnPtr neg_e{BN_new()};
  BN_mod_sub(neg_e.get(), Order(), e.get(), Order(), ctx.get());

  BnPtr u1{BN_new()};
  BnPtr u2{BN_new()};
  BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), Order(), ctx.get());
  BN_mod_mul(u2.get(), s.get(), r_inv.get(), Order(), ctx.get());

  PointPtr q{EC_POINT_new(group)};
  if (!EC_POINT_mul(group, q.get(), u1.get(), big_r.get(), u2.get(), ctx.get()) || EC_POINT_is_at_infinity(group, q.get())) {
    return std::nullopt;
  }
  return SerializeUncompressed(q.get(), ctx.get());
}

} // namespace faucet::crypto
