#include "config/alt_config.hpp"
#include "common/config_manager.hpp"
#include <stdexcept>

static constexpr int kMaxRpcBatchSize = 100;

bool IsValidCommitment(const std::string& commitment) {
  return commitment == "processed" || commitment == "confirmed" || commitment == "finalized";
}

AltConfig LoadAltConfig() {
  AltConfig cfg;
  if (auto url = ConfigManager::Get("ALT_RPC_URL")) {
    if (url->empty()) throw std::runtime_error("ALT_RPC_URL is empty");
    cfg.rpc.rpc_url = *url;
  }
  if (auto a = ConfigManager::Get("ALT_RPC_AUTH_HEADER")) {
    if (!a->empty()) cfg.rpc.auth_header = *a;
  }
  cfg.rpc.commitment = ConfigManager::Get("ALT_RPC_COMMITMENT").value_or(cfg.rpc.commitment);
  if (!IsValidCommitment(cfg.rpc.commitment)) {
    throw std::runtime_error("Invalid ALT_RPC_COMMITMENT: " + cfg.rpc.commitment);
  }
  const int batch = ConfigManager::GetIntOr("ALT_RPC_BATCH_SIZE", kMaxRpcBatchSize);
  if (batch < 1 || batch > kMaxRpcBatchSize) {
    throw std::runtime_error("ALT_RPC_BATCH_SIZE must be between 1 and 100, got " + std::to_string(batch));
  }
  cfg.rpc.max_batch_size = static_cast<size_t>(batch);
  cfg.rpc.timeout_ms = ConfigManager::GetIntOr("ALT_RPC_TIMEOUT_MS", cfg.rpc.timeout_ms);
  if (cfg.rpc.timeout_ms <= 0) throw std::runtime_error("ALT_RPC_TIMEOUT_MS must be positive");

  cfg.store_path = ConfigManager::Get("ALT_STORE_PATH").value_or(cfg.store_path);
  cfg.log_path = ConfigManager::Get("ALT_LOG_PATH").value_or("");
  if (auto lvl = ConfigManager::Get("ALT_LOG_LEVEL")) cfg.log_level = ParseLogLevel(*lvl, LogLevel::INFO);
  return cfg;
}
