#include "erc20.hpp"

#include "internal/chain/abi.hpp"
#include "internal/chain/address.hpp"
#include "internal/util/hex.hpp"

namespace mintgate::chain::erc20 {

const std::string& TransferTopic() {
  static const std::string topic = abi::EventTopic("Transfer(address,address,uint256)");
  return topic;
}

std::optional<Transfer> DecodeTransfer(const LogEvent& event) {
  // ERC-721 Transfer shares topic0 but indexes the token id (4 topics, no data).
  if (event.topics.size() != 3 || util::ToLower(event.topics[0]) != TransferTopic()) {
    return std::nullopt;
  }

  auto from = TopicToAddress(event.topics[1]);
  auto to   = TopicToAddress(event.topics[2]);
  auto data = util::FromHex(event.data);
  if (!from || !to || !data || data->size() != abi::kWordSize) {
    return std::nullopt;
  }

  return Transfer{util::ToLower(event.address), *from, *to, abi::DecodeUint(*data)};
}

} // namespace mintgate::chain::erc20
