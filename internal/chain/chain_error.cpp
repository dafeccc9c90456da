#include "chain_error.hpp"

#include <algorithm>
#include <cctype>

namespace faucet::chain {
namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

const char* ToString(ChainErrorKind kind) {
  switch (kind) {
    case ChainErrorKind::kFeeTooLow:
      return "fee_too_low";
    case ChainErrorKind::kNonceTooLow:
      return "nonce_too_low";
    case ChainErrorKind::kNonceConflict:
      return "nonce_conflict";
    case ChainErrorKind::kAlreadyKnown:
      return "already_known";
    case ChainErrorKind::kUnavailable:
      return "unavailable";
    case ChainErrorKind::kTimeout:
      return "timeout";
    case ChainErrorKind::kRejected:
      return "rejected";
  }
  return "rejected";
}

ChainErrorKind ClassifyRpcError(int64_t code, std::string_view message) {
  const auto text = Lower(message);

  if (Contains(text, "already known") || Contains(text, "known transaction") || Contains(text, "already imported")) {
    return ChainErrorKind::kAlreadyKnown;
  }
  if (Contains(text, "nonce too low") || Contains(text, "nonce has already been used")) {
    return ChainErrorKind::kNonceTooLow;
  }
  // Checked before the generic "underpriced": another transaction already holds the sequence.
  if (Contains(text, "replacement transaction underpriced") || Contains(text, "nonce too high")) {
    return ChainErrorKind::kNonceConflict;
  }
  if (Contains(text, "underpriced") || Contains(text, "fee too low") || Contains(text, "less than block base fee") ||
      Contains(text, "gas price too low") || Contains(text, "max fee per gas less than")) {
    return ChainErrorKind::kFeeTooLow;
  }
  // -32005 limit exceeded and "server busy" answers from overloaded nodes.
  if (Contains(text, "busy") || Contains(text, "try again") || Contains(text, "rate limit") || code == -32005) {
    return ChainErrorKind::kUnavailable;
  }
  return ChainErrorKind::kRejected;
}

} // namespace faucet::chain
