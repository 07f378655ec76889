#include "utils/text_encoding.hpp"
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <stdexcept>

namespace {
  const char* kBase58Alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  int Base58Value(char c) {
    if (c >= '1' && c <= '9') return c - '1';
    if (c >= 'A' && c <= 'H') return 9 + (c - 'A');
    if (c >= 'J' && c <= 'N') return 17 + (c - 'J');
    if (c >= 'P' && c <= 'Z') return 22 + (c - 'P');
    if (c >= 'a' && c <= 'k') return 33 + (c - 'a');
    if (c >= 'm' && c <= 'z') return 44 + (c - 'm');
    return -1;
  }
}

namespace TextEncoding {
  std::string EncodeBase58(const unsigned char* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) ++zeros;
    // log(256) / log(58) ~= 1.37
    std::vector<unsigned char> digits((len - zeros) * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < len; ++i) {
      unsigned int carry = data[i];
      size_t j = 0;
      for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
        carry += 256u * (*it);
        *it = static_cast<unsigned char>(carry % 58);
        carry /= 58;
      }
      used = j;
    }
    auto it = digits.begin() + (digits.size() - used);
    while (it != digits.end() && *it == 0) ++it;
    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) out.push_back(kBase58Alphabet[*it]);
    return out;
  }

  std::string EncodeBase58(const std::vector<unsigned char>& data) {
    return EncodeBase58(data.data(), data.size());
  }

  std::vector<unsigned char> DecodeBase58(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;
    // log(58) / log(256) ~= 0.733
    std::vector<unsigned char> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
      int v = Base58Value(text[i]);
      if (v < 0) throw std::invalid_argument("invalid base58 character in: " + text);
      unsigned int carry = static_cast<unsigned int>(v);
      size_t j = 0;
      for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
        carry += 58u * (*it);
        *it = static_cast<unsigned char>(carry & 0xFF);
        carry >>= 8;
      }
      used = j;
    }
    auto it = bytes.begin() + (bytes.size() - used);
    while (it != bytes.end() && *it == 0) ++it;
    std::vector<unsigned char> out(zeros, 0);
    out.insert(out.end(), it, bytes.end());
    return out;
  }

  std::string EncodeBase64(const unsigned char* data, size_t len) {
    std::string out;
    CryptoPP::StringSource source(data, len, true,
      new CryptoPP::Base64Encoder(new CryptoPP::StringSink(out), false));
    return out;
  }

  std::string EncodeBase64(const std::vector<unsigned char>& data) {
    return EncodeBase64(data.data(), data.size());
  }

  std::vector<unsigned char> DecodeBase64(const std::string& text) {
    std::string decoded;
    CryptoPP::StringSource source(text, true,
      new CryptoPP::Base64Decoder(new CryptoPP::StringSink(decoded)));
    return std::vector<unsigned char>(decoded.begin(), decoded.end());
  }
}
