#pragma once
#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

class HttpClient;

// Thin JSON-RPC 2.0 client for a Solana node.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Posts a raw JSON-RPC payload and returns the response body.
  // Throws std::runtime_error on transport failure or a non-2xx status.
  std::string Send(const std::string& json_payload, int timeout_ms);

  // Returns the raw response body of getMultipleAccounts with base64 encoding.
  std::string GetMultipleAccounts(const std::vector<std::string>& base58_keys,
                                  const std::string& commitment,
                                  int timeout_ms);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::optional<std::string> auth_header_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::atomic<unsigned long long> next_id_{1};
  std::string BuildPayload(const std::string& method, const std::vector<std::string>& params);
};
