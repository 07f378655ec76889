#pragma once
#include <string>
#include <vector>

// Binary-to-text codecs used on the wire and for keys.
namespace TextEncoding {
  std::string EncodeBase58(const unsigned char* data, size_t len);
  std::string EncodeBase58(const std::vector<unsigned char>& data);
  // Throws std::invalid_argument on characters outside the alphabet.
  std::vector<unsigned char> DecodeBase58(const std::string& text);

  std::string EncodeBase64(const unsigned char* data, size_t len);
  std::string EncodeBase64(const std::vector<unsigned char>& data);
  std::vector<unsigned char> DecodeBase64(const std::string& text);
}
