#pragma once
#include <cstddef>
#include <string>
#include <optional>
#include "common/logger.hpp"

struct RpcSourceConfig {
  std::string rpc_url = "https://api.mainnet-beta.solana.com";
  std::optional<std::string> auth_header;
  std::string commitment = "finalized";
  size_t max_batch_size = 100; // getMultipleAccounts accepts at most 100 keys
  int timeout_ms = 10000;
};

struct AltConfig {
  RpcSourceConfig rpc;
  std::string store_path = "alt_store.bin";
  std::string log_path;
  LogLevel log_level = LogLevel::INFO;
};

// Builds the configuration from ConfigManager keys (ALT_RPC_URL, ALT_RPC_AUTH_HEADER,
// ALT_RPC_COMMITMENT, ALT_RPC_BATCH_SIZE, ALT_RPC_TIMEOUT_MS, ALT_STORE_PATH,
// ALT_LOG_PATH, ALT_LOG_LEVEL). Throws std::runtime_error on invalid values.
AltConfig LoadAltConfig();

bool IsValidCommitment(const std::string& commitment);
