#include <cassert>
#include <iostream>
#include <string>

#include "internal/chain/address.hpp"
#include "internal/chain/chain_error.hpp"
#include "internal/chain/http_transport.hpp"
#include "internal/chain/units.hpp"
#include "internal/util/errors.hpp"

namespace {

using faucet::chain::ChainErrorKind;
using faucet::chain::ClassifyRpcError;
using faucet::chain::ParseAddress;
using faucet::chain::ToChecksumAddress;
using faucet::chain::U256;

void TestChecksumAddresses() {
  for (const char* address : {"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
                              "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB", "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb"}) {
    const auto parsed = ParseAddress(address);
    assert(parsed.has_value());
    assert(ToChecksumAddress(*parsed) == address);
  }
}

void TestUniformCaseCarriesNoChecksum() {
  assert(ParseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed").has_value());
  assert(ParseAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED").has_value());
}

void TestMalformedAddressesAreRejected() {
  assert(!ParseAddress("").has_value());
  assert(!ParseAddress("5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed").has_value());
  assert(!ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeA").has_value());
  assert(!ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAedaa").has_value());
  assert(!ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeg").has_value());
  // Last letter flipped to upper case breaks the checksum.
  assert(!ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD").has_value());

  bool threw = false;
  try {
    (void)faucet::chain::ParseAddressOrThrow("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD");
  } catch (const faucet::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("checksum") != std::string::npos;
  }
  assert(threw);
}

void TestEtherConversions() {
  assert(faucet::chain::ParseEther("1") == faucet::chain::kWeiPerEther);
  assert(faucet::chain::ParseEther("1.5") == U256("1500000000000000000"));
  assert(faucet::chain::ParseEther("0.000000000000000001") == U256(1));
  assert(faucet::chain::ParseEther(".25") == U256("250000000000000000"));
  assert(faucet::chain::FormatEther(U256("1500000000000000000")) == "1.5");
  assert(faucet::chain::FormatEther(U256(0)) == "0");
  assert(faucet::chain::FormatEther(U256(1)) == "0.000000000000000001");

  for (const char* bad : {"", ".", "1.2.3", "abc", "-1", "0.0000000000000000001"}) {
    bool threw = false;
    try {
      (void)faucet::chain::ParseEther(bad);
    } catch (const faucet::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestQuantities() {
  assert(faucet::chain::ToQuantity(U256(0)) == "0x0");
  assert(faucet::chain::ToQuantity(U256(1024)) == "0x400");
  assert(faucet::chain::ParseQuantity("0x400") == U256(1024));
  assert(faucet::chain::ParseQuantity("0x0") == U256(0));
  assert(faucet::chain::ToBigEndian(U256(0)).empty());
  assert(faucet::chain::ToBigEndian(U256(0x0400)).size() == 2);
  assert(faucet::chain::Bump(U256(100), 12) == U256(112));
  assert(faucet::chain::Bump(U256(1000000000), 10) == U256(1100000000));

  bool threw = false;
  try {
    (void)faucet::chain::ParseQuantity("400");
  } catch (const faucet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRpcErrorClassification() {
  assert(ClassifyRpcError(-32000, "already known") == ChainErrorKind::kAlreadyKnown);
  assert(ClassifyRpcError(-32000, "Known transaction: 0xabc") == ChainErrorKind::kAlreadyKnown);
  assert(ClassifyRpcError(-32000, "nonce too low") == ChainErrorKind::kNonceTooLow);
  assert(ClassifyRpcError(-32000, "replacement transaction underpriced") == ChainErrorKind::kNonceConflict);
  assert(ClassifyRpcError(-32000, "transaction underpriced") == ChainErrorKind::kFeeTooLow);
  assert(ClassifyRpcError(-32000, "max fee per gas less than block base fee") == ChainErrorKind::kFeeTooLow);
  assert(ClassifyRpcError(-32005, "limit exceeded") == ChainErrorKind::kUnavailable);
  assert(ClassifyRpcError(-32000, "server busy, try again later") == ChainErrorKind::kUnavailable);
  assert(ClassifyRpcError(-32000, "insufficient funds for gas * price + value") == ChainErrorKind::kRejected);
}

void TestEndpointParsing() {
  const auto plain = faucet::chain::ParseEndpoint("http://127.0.0.1:8545");
  assert(!plain.tls && plain.host == "127.0.0.1" && plain.port == "8545" && plain.target == "/");

  const auto tls = faucet::chain::ParseEndpoint("https://rpc.example.org/v1/key");
  assert(tls.tls && tls.host == "rpc.example.org" && tls.port == "443" && tls.target == "/v1/key");

  bool threw = false;
  try {
    (void)faucet::chain::ParseEndpoint("ftp://example.org");
  } catch (const faucet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestChecksumAddresses();
  TestUniformCaseCarriesNoChecksum();
  TestMalformedAddressesAreRejected();
  TestEtherConversions();
  TestQuantities();
  TestRpcErrorClassification();
  TestEndpointParsing();

  std::cout << "faucet_unit_chain_primitives: pass\n";
  return 0;
}
