#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/chain/types.hpp"

namespace faucet::chain {

/*
  Parses a 0x-prefixed, 40 hex digit account address.

  All-lowercase and all-uppercase input carries no checksum and is accepted.
  Mixed-case input must match the EIP-55 checksum.
*/
std::optional<Address> ParseAddress(std::string_view text);

// Throws util::InvalidArgument with the reason.
Address ParseAddressOrThrow(std::string_view text);

// EIP-55 mixed-case rendering.
std::string ToChecksumAddress(const Address& address);

} // namespace faucet::chain
