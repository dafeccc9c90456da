#include "rlp.hpp"

#include "internal/chain/units.hpp"

namespace faucet::chain::rlp {
namespace {

void AppendLength(util::Bytes& out, std::size_t length, uint8_t short_offset, uint8_t long_offset) {
  if (length < 56) {
    out.push_back(static_cast<uint8_t>(short_offset + length));
    return;
  }

  const auto length_bytes = ToBigEndian(U256(length));
  out.push_back(static_cast<uint8_t>(long_offset + length_bytes.size()));
  out.insert(out.end(), length_bytes.begin(), length_bytes.end());
}

} // namespace

util::Bytes EncodeBytes(const uint8_t* data, std::size_t size) {
  util::Bytes out;
  if (size == 1 && data[0] < 0x80) {
    out.push_back(data[0]);
    return out;
  }

  out.reserve(size + 9);
  AppendLength(out, size, 0x80, 0xb7);
  out.insert(out.end(), data, data + size);
  return out;
}

util::Bytes EncodeUint(const U256& value) {
  return EncodeBytes(ToBigEndian(value));
}

util::Bytes EncodeList(const std::vector<util::Bytes>& encoded_items) {
  std::size_t payload_size = 0;
  for (const auto& item : encoded_items) payload_size += item.size();

  util::Bytes out;
  out.reserve(payload_size + 9);
  AppendLength(out, payload_size, 0xc0, 0xf7);
  for (const auto& item : encoded_items) {
    out.insert(out.end(), item.begin(), item.end());
  }
  return out;
}

} // namespace faucet::chain::rlp
