#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/util/hex.hpp"

namespace faucet::crypto {

using Digest256 = std::array<uint8_t, 32>;

/*
  Keccak-256 as used by Ethereum (original Keccak padding 0x01, not FIPS-202 SHA3-256).
*/
class Keccak256 {
 public:
  Keccak256();

  Keccak256& Update(const uint8_t* data, std::size_t size);
  Keccak256& Update(const util::Bytes& data) {
    return Update(data.data(), data.size());
  }

  Digest256 Finalize();

 private:
  static constexpr std::size_t kRateBytes = 136;

  void AbsorbBlock();

  std::array<uint64_t, 25>        state_{};
  std::array<uint8_t, kRateBytes> buffer_{};
  std::size_t                     buffered_ = 0;
  bool                            finalized_ = false;
};

Digest256 Keccak(const uint8_t* data, std::size_t size);

inline Digest256 Keccak(const util::Bytes& data) {
  return Keccak(data.data(), data.size());
}

inline Digest256 Keccak(std::string_view text) {
  return Keccak(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace faucet::crypto
