#include "units.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace faucet::chain {

U256 ParseDecimal(std::string_view text) {
  if (text.empty()) {
    throw util::InvalidArgument("empty decimal value");
  }
  if (text.size() > 78) {
    throw util::InvalidArgument("decimal value out of range: " + std::string(text));
  }
  U256 value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw util::InvalidArgument("invalid decimal value: " + std::string(text));
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  return value;
}

std::string ToDecimal(const U256& value) {
  return value.str();
}

U256 ParseEther(std::string_view text) {
  const auto dot         = text.find('.');
  const auto whole_part  = text.substr(0, dot);
  auto       fraction    = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole_part.empty() && fraction.empty()) {
    throw util::InvalidArgument("invalid ether amount: '" + std::string(text) + "'");
  }
  if (fraction.size() > 18) {
    throw util::InvalidArgument("ether amount has more than 18 decimals: " + std::string(text));
  }

  U256 wei = whole_part.empty() ? U256(0) : ParseDecimal(whole_part) * kWeiPerEther;
  if (!fraction.empty()) {
    std::string padded(fraction);
    padded.append(18 - fraction.size(), '0');
    wei += ParseDecimal(padded);
  }
  return wei;
}

std::string FormatEther(const U256& wei) {
  const U256 whole = wei / kWeiPerEther;
  const U256 rest  = wei % kWeiPerEther;
  if (rest == 0) {
    return whole.str();
  }

  std::string fraction = rest.str();
  fraction.insert(0, 18 - fraction.size(), '0');
  while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
  return whole.str() + "." + fraction;
}

U256 ParseQuantity(std::string_view text) {
  const auto digits = util::StripHexPrefix(text);
  if (digits.size() == text.size()) {
    throw util::InvalidArgument("quantity missing 0x prefix: " + std::string(text));
  }
  if (digits.empty() || digits.size() > 64) {
    throw util::InvalidArgument("invalid quantity: " + std::string(text));
  }

  U256 value = 0;
  for (char c : digits) {
    const int nibble = util::HexNibble(c);
    if (nibble < 0) {
      throw util::InvalidArgument("invalid quantity: " + std::string(text));
    }
    value = (value << 4) | static_cast<unsigned>(nibble);
  }
  return value;
}

std::string ToQuantity(const U256& value) {
  if (value == 0) return "0x0";
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           digits;
  U256                  rest = value;
  while (rest > 0) {
    digits.push_back(kHex[static_cast<unsigned>(rest & 0x0F)]);
    rest >>= 4;
  }
  std::reverse(digits.begin(), digits.end());
  return "0x" + digits;
}

util::Bytes ToBigEndian(const U256& value) {
  util::Bytes out;
  U256        rest = value;
  while (rest > 0) {
    out.push_back(static_cast<uint8_t>(static_cast<unsigned>(rest & 0xFF)));
    rest >>= 8;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

U256 Bump(const U256& value, uint32_t percent) {
  return value * (100 + percent) / 100;
}

} // namespace faucet::chain
