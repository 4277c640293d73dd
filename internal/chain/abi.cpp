#include "abi.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/chain/keccak.hpp"

namespace mintgate::chain::abi {

namespace {

const std::uint8_t* Word(const util::Bytes& data, std::size_t index) {
  if (data.size() < (index + 1) * kWordSize) {
    throw std::invalid_argument("abi: return data too short for word " + std::to_string(index) + " (" + std::to_string(data.size()) + " bytes)");
  }
  return data.data() + index * kWordSize;
}

} // namespace

std::array<std::uint8_t, 4> Selector(std::string_view signature) {
  const auto                  hash = Keccak256(signature);
  std::array<std::uint8_t, 4> out{};
  std::copy(hash.begin(), hash.begin() + 4, out.begin());
  return out;
}

std::string EventTopic(std::string_view signature) {
  const auto hash = Keccak256(signature);
  return util::ToHex(hash.data(), hash.size());
}

util::Bytes EncodeAddress(std::string_view address) {
  auto raw = util::FromHex(address);
  if (!raw || raw->size() != 20) {
    throw std::invalid_argument("abi: invalid address '" + std::string(address) + "'");
  }
  util::Bytes word(kWordSize - raw->size(), 0);
  word.insert(word.end(), raw->begin(), raw->end());
  return word;
}

util::Bytes EncodeUint(const util::Amount& value) {
  return value.ToBigEndian(kWordSize);
}

util::Bytes EncodeUint(std::uint64_t value) {
  return EncodeUint(util::Amount(value));
}

util::Bytes EncodeCall(std::string_view signature, const std::vector<util::Bytes>& words) {
  const auto  selector = Selector(signature);
  util::Bytes out(selector.begin(), selector.end());
  for (const auto& word : words) {
    if (word.size() != kWordSize) {
      throw std::invalid_argument("abi: argument is not a 32-byte word");
    }
    out.insert(out.end(), word.begin(), word.end());
  }
  return out;
}

std::string DecodeAddress(const util::Bytes& data, std::size_t index) {
  const auto* word = Word(data, index);
  return util::ToHex(word + 12, 20);
}

util::Amount DecodeUint(const util::Bytes& data, std::size_t index) {
  return util::Amount::FromBigEndian(Word(data, index), kWordSize);
}

bool DecodeBool(const util::Bytes& data, std::size_t index) {
  return !DecodeUint(data, index).IsZero();
}

} // namespace mintgate::chain::abi
