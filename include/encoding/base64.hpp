#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Base64 {
  std::string Encode(const std::vector<uint8_t>& data);
  // Returns false when the text holds characters outside the standard alphabet.
  bool Decode(const std::string& text, std::vector<uint8_t>& out);
}
