#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// Accepts either "Name: value" or a bare Authorization value.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty() && name.find(' ') == std::string::npos) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url), auth_header_(auth_header) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  if (auth_header_) {
    ApplyAuthHeader(default_headers_, auth_header_);
  }
}

std::string RpcClient::BuildPayload(const std::string& method, const std::vector<std::string>& params) {
  static const std::string prefix = "{\"jsonrpc\":\"2.0\",\"id\":";
  static const std::string mid_method = ",\"method\":\"";
  static const std::string mid_params = "\",\"params\":[";
  static const std::string suffix = "]}";
  const std::string id = std::to_string(next_id_.fetch_add(1));
  size_t total_params_len = 0; for (const auto& p : params) total_params_len += p.size();
  std::string out;
  out.reserve(prefix.size() + id.size() + mid_method.size() + method.size() + mid_params.size() +
              total_params_len + params.size() + suffix.size());
  out += prefix; out += id; out += mid_method; out += method; out += mid_params;
  for (size_t i = 0; i < params.size(); ++i) { out += params[i]; if (i + 1 < params.size()) out += ","; }
  out += suffix;
  return out;
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (!resp.error.empty()) {
    throw std::runtime_error("HTTP POST to " + endpoint_ + " failed: " + resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    ALT_LOG_ERROR("HTTP POST failed status=" + std::to_string(resp.status) + " endpoint=" + endpoint_);
    throw std::runtime_error("HTTP POST failed status=" + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::GetMultipleAccounts(const std::vector<std::string>& base58_keys,
                                           const std::string& commitment,
                                           int timeout_ms) {
  json keys = json::array();
  for (const auto& k : base58_keys) keys.push_back(k);
  json options = {{"encoding", "base64"}, {"commitment", commitment}};
  auto payload = BuildPayload("getMultipleAccounts", {keys.dump(), options.dump()});
  return Send(payload, timeout_ms);
}
