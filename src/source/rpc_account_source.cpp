#include "source/rpc_account_source.hpp"
#include "common/alt_error.hpp"
#include "common/logger.hpp"
#include "encoding/base64.hpp"
#include "node_connection/rpc_client.hpp"
#include "utils/json_rpc.hpp"
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {
  // Account "data" comes back as ["<payload>", "base64"].
  AccountData DecodeAccountData(const json& account, const AccountKey& key) {
    if (!account.is_object() || !account.contains("data")) {
      throw std::runtime_error("account " + key.ToBase58() + " has no data field");
    }
    const json& data = account["data"];
    if (!data.is_array() || data.size() != 2 || !data[0].is_string() || !data[1].is_string()) {
      throw std::runtime_error("account " + key.ToBase58() + " has unexpected data layout");
    }
    if (data[1].get<std::string>() != "base64") {
      throw std::runtime_error("account " + key.ToBase58() + " uses encoding " + data[1].get<std::string>());
    }
    AccountData out;
    if (!Base64::Decode(data[0].get<std::string>(), out)) {
      throw std::runtime_error("account " + key.ToBase58() + " carries invalid base64");
    }
    return out;
  }
}

RpcAccountSource::RpcAccountSource(RpcClient& rpc, const RpcSourceConfig& config)
  : rpc_(rpc), config_(config) {
  if (config_.max_batch_size == 0) throw std::invalid_argument("max_batch_size must be positive");
  if (!IsValidCommitment(config_.commitment)) throw std::invalid_argument("invalid commitment: " + config_.commitment);
}

std::vector<KeyedAccount> RpcAccountSource::Fetch(const std::vector<AccountKey>& keys) {
  std::vector<KeyedAccount> result;
  if (keys.empty()) return result;
  if (keys.size() > config_.max_batch_size) {
    throw AltError(AltErrorKind::FetchFailed, "batch of " + std::to_string(keys.size()) +
                   " keys exceeds limit " + std::to_string(config_.max_batch_size));
  }
  std::vector<std::string> encoded;
  encoded.reserve(keys.size());
  for (const auto& k : keys) encoded.push_back(k.ToBase58());

  try {
    auto body = rpc_.GetMultipleAccounts(encoded, config_.commitment, config_.timeout_ms);
    json rpc_result = JsonRpcUtil::ExtractResult(body);
    if (!rpc_result.is_object() || !rpc_result.contains("value") || !rpc_result["value"].is_array()) {
      throw std::runtime_error("getMultipleAccounts result has no value array");
    }
    const json& values = rpc_result["value"];
    if (values.size() != keys.size()) {
      throw std::runtime_error("getMultipleAccounts returned " + std::to_string(values.size()) +
                               " entries for " + std::to_string(keys.size()) + " keys");
    }
    result.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
      if (values[i].is_null()) continue;
      result.push_back(KeyedAccount{keys[i], DecodeAccountData(values[i], keys[i])});
    }
  } catch (const std::exception& e) {
    ALT_LOG_ERROR(std::string("getMultipleAccounts failed: ") + e.what());
    throw AltError(AltErrorKind::FetchFailed, e.what());
  }
  ALT_LOG_DEBUG("getMultipleAccounts returned " + std::to_string(result.size()) + "/" +
                std::to_string(keys.size()) + " accounts");
  return result;
}
