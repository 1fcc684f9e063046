#pragma once
#include "source/account_source.hpp"
#include "config/alt_config.hpp"

class RpcClient;

// AccountSource over the getMultipleAccounts JSON-RPC method.
class RpcAccountSource : public AccountSource {
public:
  RpcAccountSource(RpcClient& rpc, const RpcSourceConfig& config);
  std::vector<KeyedAccount> Fetch(const std::vector<AccountKey>& keys) override;
  size_t MaxBatchSize() const override { return config_.max_batch_size; }
private:
  RpcClient& rpc_;
  RpcSourceConfig config_;
};
