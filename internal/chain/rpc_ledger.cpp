#include "rpc_ledger.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/chain/erc20.hpp"
#include "internal/chain/address.hpp"
#include "internal/util/errors.hpp"

namespace mintgate::chain {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value& Field(const std::string& method, const Struct& object, const char* name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end()) {
    throw util::LedgerUnavailable(method + ": response is missing '" + name + "'");
  }
  return it->second;
}

const std::string& StringOf(const std::string& method, const Value& value) {
  if (value.kind_case() != Value::kStringValue) {
    throw util::LedgerUnavailable(method + ": expected a string in node response");
  }
  return value.string_value();
}

std::uint64_t QuantityOf(const std::string& method, const Value& value) {
  try {
    return util::ParseQuantity(StringOf(method, value));
  } catch (const std::invalid_argument&) {
    throw util::LedgerUnavailable(method + ": malformed quantity in node response");
  }
}

LogEvent ParseLog(const std::string& method, const Value& value) {
  if (!value.has_struct_value()) {
    throw util::LedgerUnavailable(method + ": malformed log entry");
  }
  const auto& log = value.struct_value();

  LogEvent event;
  event.address = util::ToLower(StringOf(method, Field(method, log, "address")));
  event.data    = util::ToLower(StringOf(method, Field(method, log, "data")));

  const auto& topics = Field(method, log, "topics");
  if (!topics.has_list_value()) {
    throw util::LedgerUnavailable(method + ": malformed log topics");
  }
  for (const auto& topic : topics.list_value().values()) {
    event.topics.push_back(util::ToLower(StringOf(method, topic)));
  }

  event.block_number     = QuantityOf(method, Field(method, log, "blockNumber"));
  event.transaction_hash = util::ToLower(StringOf(method, Field(method, log, "transactionHash")));
  event.log_index        = QuantityOf(method, Field(method, log, "logIndex"));
  return event;
}

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

} // namespace

RpcLedger::RpcLedger(std::shared_ptr<JsonRpcClient> rpc, std::uint64_t min_confirmations)
    : rpc_(std::move(rpc)), min_confirmations_(std::max<std::uint64_t>(min_confirmations, 1)) {
}

TransactionOutcome RpcLedger::GetTransactionOutcome(const std::string& tx_hash) {
  static const std::string kMethod = "eth_getTransactionReceipt";

  ListValue params;
  *params.add_values() = StringValue(tx_hash);
  const auto result    = rpc_->Call(kMethod, params);

  if (result.kind_case() == Value::kNullValue) {
    throw util::TransactionNotFound("transaction not found: " + tx_hash);
  }
  if (!result.has_struct_value()) {
    throw util::LedgerUnavailable(kMethod + ": malformed receipt");
  }
  const auto& receipt = result.struct_value();

  TransactionOutcome outcome;

  // Some clients answer with a pending receipt: no block yet, so nothing in it is final.
  const auto& block_number = Field(kMethod, receipt, "blockNumber");
  const auto  block_hash   = receipt.fields().find("blockHash");
  if (block_number.kind_case() == Value::kNullValue ||
      (block_hash != receipt.fields().end() && block_hash->second.kind_case() == Value::kNullValue)) {
    return outcome;
  }

  outcome.block_number = QuantityOf(kMethod, block_number);
  outcome.success      = QuantityOf(kMethod, Field(kMethod, receipt, "status")) == 1;

  const auto& logs = Field(kMethod, receipt, "logs");
  if (!logs.has_list_value()) {
    throw util::LedgerUnavailable(kMethod + ": malformed receipt logs");
  }
  for (const auto& log : logs.list_value().values()) {
    outcome.events.push_back(ParseLog(kMethod, log));
  }

  if (min_confirmations_ <= 1) {
    outcome.finalized = true;
  } else {
    const auto head   = GetCurrentHeight();
    outcome.finalized = head >= outcome.block_number && head - outcome.block_number + 1 >= min_confirmations_;
  }
  return outcome;
}

std::uint64_t RpcLedger::GetCurrentHeight() {
  static const std::string kMethod = "eth_blockNumber";
  return QuantityOf(kMethod, rpc_->Call(kMethod, ListValue{}));
}

std::vector<LogEvent> RpcLedger::ScanEvents(const std::string& asset, std::uint64_t from_height, std::uint64_t to_height,
                                            const TransferFilter& filter) {
  static const std::string kMethod = "eth_getLogs";

  Value query;
  auto& fields = *query.mutable_struct_value()->mutable_fields();
  fields["address"].set_string_value(asset);
  fields["fromBlock"].set_string_value(util::ToQuantity(from_height));
  fields["toBlock"].set_string_value(util::ToQuantity(to_height));

  auto* topics                   = fields["topics"].mutable_list_value();
  *topics->add_values()          = StringValue(erc20::TransferTopic());
  auto* from                     = topics->add_values();
  auto* to                       = topics->add_values();
  if (filter.from) {
    from->set_string_value(AddressToTopic(*filter.from));
  } else {
    from->set_null_value(google::protobuf::NULL_VALUE);
  }
  if (filter.to) {
    to->set_string_value(AddressToTopic(*filter.to));
  } else {
    to->set_null_value(google::protobuf::NULL_VALUE);
  }

  ListValue params;
  *params.add_values() = query;
  const auto result    = rpc_->Call(kMethod, params);
  if (!result.has_list_value()) {
    throw util::LedgerUnavailable(kMethod + ": expected an array of logs");
  }

  std::vector<LogEvent> events;
  events.reserve(static_cast<std::size_t>(result.list_value().values_size()));
  for (const auto& log : result.list_value().values()) {
    events.push_back(ParseLog(kMethod, log));
  }

  std::sort(events.begin(), events.end(), [](const LogEvent& a, const LogEvent& b) {
    return a.block_number != b.block_number ? a.block_number < b.block_number : a.log_index < b.log_index;
  });
  return events;
}

util::Bytes RpcLedger::Call(const std::string& contract, const util::Bytes& calldata) {
  static const std::string kMethod = "eth_call";

  Value call;
  auto& fields = *call.mutable_struct_value()->mutable_fields();
  fields["to"].set_string_value(contract);
  fields["data"].set_string_value(util::ToHex(calldata));

  ListValue params;
  *params.add_values() = call;
  *params.add_values() = StringValue("latest");

  auto bytes = util::FromHex(StringOf(kMethod, rpc_->Call(kMethod, params)));
  if (!bytes) {
    throw util::LedgerUnavailable(kMethod + ": malformed return data");
  }
  return *bytes;
}

bool RpcLedger::IsKnownTransaction(const std::string& tx_hash) {
  static const std::string kMethod = "eth_getTransactionByHash";

  ListValue params;
  *params.add_values() = StringValue(tx_hash);
  const auto result    = rpc_->Call(kMethod, params);

  if (result.kind_case() == Value::kNullValue) {
    return false;
  }
  if (!result.has_struct_value()) {
    throw util::LedgerUnavailable(kMethod + ": malformed transaction");
  }
  return true;
}

std::uint64_t RpcLedger::GetPendingNonce(const std::string& address) {
  static const std::string kMethod = "eth_getTransactionCount";

  ListValue params;
  *params.add_values() = StringValue(address);
  *params.add_values() = StringValue("pending");
  return QuantityOf(kMethod, rpc_->Call(kMethod, params));
}

util::Amount RpcLedger::GetGasPrice() {
  static const std::string kMethod = "eth_gasPrice";
  try {
    return util::Amount::FromQuantity(StringOf(kMethod, rpc_->Call(kMethod, ListValue{})));
  } catch (const std::invalid_argument&) {
    throw util::LedgerUnavailable(kMethod + ": malformed quantity in node response");
  }
}

std::string RpcLedger::SendRawTransaction(const util::Bytes& raw_transaction) {
  static const std::string kMethod = "eth_sendRawTransaction";

  ListValue params;
  *params.add_values() = StringValue(util::ToHex(raw_transaction));

  auto hash = ParseTxHash(StringOf(kMethod, rpc_->Call(kMethod, params)));
  if (!hash) {
    throw util::LedgerUnavailable(kMethod + ": malformed transaction hash");
  }
  return *hash;
}

} // namespace mintgate::chain
