#include "address.hpp"

#include <cctype>

#include "internal/crypto/keccak.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace faucet::chain {
namespace {

enum class ParseFailure { kNone, kFormat, kChecksum };

std::optional<Address> Parse(std::string_view text, ParseFailure* failure) {
  *failure = ParseFailure::kFormat;
  if (text.size() != 42 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
    return std::nullopt;
  }

  const auto digits    = text.substr(2);
  bool       has_lower = false;
  bool       has_upper = false;
  Address    address{};
  for (std::size_t i = 0; i < digits.size(); ++i) {
    const char c = digits[i];
    if (util::HexNibble(c) < 0) return std::nullopt;
    if (c >= 'a' && c <= 'f') has_lower = true;
    if (c >= 'A' && c <= 'F') has_upper = true;
    if (i % 2 == 1) {
      address[i / 2] = static_cast<uint8_t>((util::HexNibble(digits[i - 1]) << 4) | util::HexNibble(c));
    }
  }

  if (has_lower && has_upper && ToChecksumAddress(address).substr(2) != digits) {
    *failure = ParseFailure::kChecksum;
    return std::nullopt;
  }

  *failure = ParseFailure::kNone;
  return address;
}

} // namespace

std::optional<Address> ParseAddress(std::string_view text) {
  ParseFailure failure;
  return Parse(text, &failure);
}

Address ParseAddressOrThrow(std::string_view text) {
  ParseFailure failure;
  auto         address = Parse(text, &failure);
  if (address) return *address;

  if (failure == ParseFailure::kChecksum) {
    throw util::InvalidArgument("address checksum mismatch: " + std::string(text));
  }
  throw util::InvalidArgument("malformed address: " + std::string(text));
}

std::string ToChecksumAddress(const Address& address) {
  const auto lower = util::ToHex(address, false);
  const auto hash  = crypto::Keccak(lower);

  std::string out = "0x";
  out.reserve(42);
  for (std::size_t i = 0; i < lower.size(); ++i) {
    const uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
    const char    c      = lower[i];
    out.push_back(nibble >= 8 ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
  }
  return out;
}

} // namespace faucet::chain
