#include "keccak.hpp"

#include <algorithm>
#include <cstring>

#include "internal/util/errors.hpp"

namespace faucet::crypto {
namespace {

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

// Rotation offsets and lane permutation for the combined rho/pi step.
constexpr std::array<int, 24> kRho = {1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};
constexpr std::array<int, 24> kPi  = {10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

inline uint64_t Rotl(uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

void KeccakF1600(std::array<uint64_t, 25>& a) {
  for (uint64_t round_constant : kRoundConstants) {
    // theta
    uint64_t c[5];
    for (int x = 0; x < 5; ++x) {
      c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
    }
    for (int x = 0; x < 5; ++x) {
      const uint64_t d = c[(x + 4) % 5] ^ Rotl(c[(x + 1) % 5], 1);
      for (int y = 0; y < 25; y += 5) a[y + x] ^= d;
    }

    // rho + pi
    uint64_t current = a[1];
    for (int i = 0; i < 24; ++i) {
      const int      j    = kPi[i];
      const uint64_t next = a[j];
      a[j]                = Rotl(current, kRho[i]);
      current             = next;
    }

    // chi
    for (int y = 0; y < 25; y += 5) {
      uint64_t row[5];
      for (int x = 0; x < 5; ++x) row[x] = a[y + x];
      for (int x = 0; x < 5; ++x) a[y + x] = row[x] ^ (~row[(x + 1) % 5] & row[(x + 2) % 5]);
    }

    // iota
    a[0] ^= round_constant;
  }
}

uint64_t LoadLittleEndian(const uint8_t* p) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
  return v;
}

} // namespace

Keccak256::Keccak256() = default;

void Keccak256::AbsorbBlock() {
  for (std::size_t i = 0; i < kRateBytes / 8; ++i) {
    state_[i] ^= LoadLittleEndian(buffer_.data() + i * 8);
  }
  KeccakF1600(state_);
  buffered_ = 0;
}

Keccak256& Keccak256::Update(const uint8_t* data, std::size_t size) {
  if (finalized_) {
    throw util::InvalidState("Keccak256::Update after Finalize");
  }
  while (size > 0) {
    const std::size_t take = std::min(size, kRateBytes - buffered_);
    std::memcpy(buffer_.data() + buffered_, data, take);
    buffered_ += take;
    data += take;
    size -= take;
    if (buffered_ == kRateBytes) AbsorbBlock();
  }
  return *this;
}

Digest256 Keccak256::Finalize() {
  if (finalized_) {
    throw util::InvalidState("Keccak256::Finalize called twice");
  }
  finalized_ = true;

  std::memset(buffer_.data() + buffered_, 0, kRateBytes - buffered_);
  buffer_[buffered_] ^= 0x01;
  buffer_[kRateBytes - 1] ^= 0x80;
  AbsorbBlock();

  Digest256 out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(state_[i / 8] >> (8 * (i % 8)));
  }
  return out;
}

Digest256 Keccak(const uint8_t* data, std::size_t size) {
  Keccak256 hasher;
  hasher.Update(data, size);
  return hasher.Finalize();
}

} // namespace faucet::crypto
