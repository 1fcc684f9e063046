#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <mutex>

// KEY=VALUE settings read from a .env style file. Lines starting with '#' are ignored.
class ConfigManager {
public:
  // Replaces any previously loaded settings. A missing file leaves the cache empty.
  static void Initialize(const std::string& env_path = ".env");
  static void Clear();
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  // Missing key yields default_value; a value that is not a whole integer throws.
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static std::mutex mutex_;
  static void LoadEnvFile(const std::string& env_path);
};
