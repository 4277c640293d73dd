#include "rlp.hpp"

namespace mintgate::chain::rlp {

namespace {

util::Bytes BigEndianLength(std::size_t length) {
  util::Bytes out;
  while (length != 0) {
    out.insert(out.begin(), static_cast<std::uint8_t>(length & 0xFF));
    length >>= 8;
  }
  return out;
}

util::Bytes Prefixed(std::uint8_t short_base, std::uint8_t long_base, const util::Bytes& payload) {
  util::Bytes out;
  if (payload.size() <= 55) {
    out.push_back(static_cast<std::uint8_t>(short_base + payload.size()));
  } else {
    const auto length = BigEndianLength(payload.size());
    out.push_back(static_cast<std::uint8_t>(long_base + length.size()));
    out.insert(out.end(), length.begin(), length.end());
  }
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

} // namespace

util::Bytes EncodeBytes(const util::Bytes& value) {
  if (value.size() == 1 && value[0] < 0x80) {
    return value;
  }
  return Prefixed(0x80, 0xb7, value);
}

util::Bytes EncodeUint(std::uint64_t value) {
  return EncodeUint(util::Amount(value));
}

util::Bytes EncodeUint(const util::Amount& value) {
  return EncodeBytes(value.ToMinimalBigEndian());
}

util::Bytes EncodeList(const std::vector<util::Bytes>& items) {
  util::Bytes payload;
  for (const auto& item : items) {
    payload.insert(payload.end(), item.begin(), item.end());
  }
  return Prefixed(0xc0, 0xf7, payload);
}

} // namespace mintgate::chain::rlp
