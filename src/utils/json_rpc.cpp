#include "utils/json_rpc.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace JsonRpcUtil {
  static json Parse(const std::string& body) {
    try {
      return json::parse(body);
    } catch (const json::parse_error& e) {
      throw std::runtime_error(std::string("malformed JSON-RPC response: ") + e.what());
    }
  }

  json ExtractResult(const std::string& body) {
    auto j = Parse(body);
    if (!j.is_object()) throw std::runtime_error("JSON-RPC response is not an object");
    if (j.contains("error") && !j["error"].is_null()) throw std::runtime_error("JSON-RPC error: " + j["error"].dump());
    if (!j.contains("result")) throw std::runtime_error("missing result");
    return j["result"];
  }
}
