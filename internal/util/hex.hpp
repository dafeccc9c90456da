#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace faucet::util {

using Bytes = std::vector<uint8_t>;

std::string ToHex(const uint8_t* data, std::size_t size, bool prefix = true);

inline std::string ToHex(const Bytes& bytes, bool prefix = true) {
  return ToHex(bytes.data(), bytes.size(), prefix);
}

template <std::size_t N>
std::string ToHex(const std::array<uint8_t, N>& bytes, bool prefix = true) {
  return ToHex(bytes.data(), bytes.size(), prefix);
}

// Accepts an optional 0x prefix. Throws InvalidArgument on odd length or non-hex input.
Bytes FromHex(std::string_view hex);

int HexNibble(char c);

std::string_view StripHexPrefix(std::string_view hex);

} // namespace faucet::util
