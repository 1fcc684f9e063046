#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // Parses a JSON-RPC response and returns its "result" member.
  // Throws std::runtime_error on an "error" member, a missing result or malformed JSON.
  nlohmann::json ExtractResult(const std::string& json_body);
}
