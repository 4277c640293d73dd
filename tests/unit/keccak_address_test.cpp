#include <cassert>
#include <iostream>
#include <string>

#include "internal/chain/abi.hpp"
#include "internal/chain/address.hpp"
#include "internal/chain/erc20.hpp"
#include "internal/chain/keccak.hpp"
#include "internal/util/hex.hpp"

using namespace mintgate;

namespace {

std::string HashHex(std::string_view text) {
  const auto digest = chain::Keccak256(text);
  return util::ToHex(digest.data(), digest.size());
}

void TestKeccakKnownVectors() {
  assert(HashHex("") == "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  assert(chain::erc20::TransferTopic() == "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}

void TestKeccakSpansRateBoundary() {
  // 136-byte rate: make sure multi-block absorption differs from a single block.
  const std::string a(135, 'a');
  const std::string b(136, 'a');
  const std::string c(137, 'a');
  assert(HashHex(a) != HashHex(b));
  assert(HashHex(b) != HashHex(c));
}

void TestFunctionSelectors() {
  const auto hex = [](std::string_view sig) {
    const auto s = chain::abi::Selector(sig);
    return util::ToHex(s.data(), s.size());
  };
  assert(hex("owner()") == "0x8da5cb5b");
  assert(hex("mintAfterPayment(address,uint256)") == "0xe7f27457");
  assert(hex("mintEnabled()") == "0xd1239730");
  assert(hex("totalMinted()") == "0xa2309ff8");
  assert(hex("maxSupply()") == "0xd5abeb01");
}

void TestChecksumAddress() {
  assert(chain::ToChecksumAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed") == "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
  assert(chain::ToChecksumAddress("0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359") == "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
}

void TestParseAddress() {
  auto lower = chain::ParseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
  assert(lower && *lower == "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");

  auto checksummed = chain::ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
  assert(checksummed && *checksummed == "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");

  auto upper = chain::ParseAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED");
  assert(upper && *upper == "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");

  // One flipped letter breaks the checksum.
  assert(!chain::ParseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD"));
  assert(!chain::ParseAddress("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
  assert(!chain::ParseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea"));
  assert(!chain::ParseAddress("0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
}

void TestParseTxHash() {
  const std::string upper = "0xAB" + std::string(62, 'C');
  auto              hash  = chain::ParseTxHash(upper);
  assert(hash && *hash == "0xab" + std::string(62, 'c'));
  assert(!chain::ParseTxHash("0x1234"));
  assert(!chain::ParseTxHash(""));
}

void TestTopicRoundTrip() {
  const std::string address = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";
  const auto        topic   = chain::AddressToTopic("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
  assert(topic == "0x000000000000000000000000" + address.substr(2));
  assert(chain::TopicToAddress(topic) == address);
  assert(!chain::TopicToAddress("0x1" + topic.substr(3)));
  assert(chain::SameAddress(address, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
}

} // namespace

int main() {
  TestKeccakKnownVectors();
  TestKeccakSpansRateBoundary();
  TestFunctionSelectors();
  TestChecksumAddress();
  TestParseAddress();
  TestParseTxHash();
  TestTopicRoundTrip();

  std::cout << "mintgate_unit_keccak_address: pass\n";
  return 0;
}
