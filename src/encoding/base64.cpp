#include "encoding/base64.hpp"
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cctype>

namespace Base64 {
  std::string Encode(const std::vector<uint8_t>& data) {
    std::string out;
    CryptoPP::StringSource source(data.data(), data.size(), true,
                                  new CryptoPP::Base64Encoder(new CryptoPP::StringSink(out), false));
    return out;
  }

  bool Decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    // Base64Decoder skips unknown characters, so reject them up front.
    size_t padding = 0;
    for (char c : text) {
      unsigned char u = static_cast<unsigned char>(c);
      if (c == '=') { ++padding; continue; }
      if (padding != 0) return false;
      if (!std::isalnum(u) && c != '+' && c != '/') return false;
    }
    if (padding > 2 || text.size() % 4 != 0) return false;
    std::string decoded;
    CryptoPP::StringSource source(text, true,
                                  new CryptoPP::Base64Decoder(new CryptoPP::StringSink(decoded)));
    out.assign(decoded.begin(), decoded.end());
    return true;
  }
}
