#include "encoding.h"

#include <openssl/evp.h>

#include <algorithm>
#include <limits>

namespace ica::common {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

constexpr std::size_t kMaxBase64Input =
    static_cast<std::size_t>(std::numeric_limits<int>::max() / 2);

}  // namespace

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len) {
  static constexpr char kHex[] = "0123456789abcdef";
  if (!data || len == 0) {
    return {};
  }
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  if (hex.empty() || (hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0 || len > kMaxBase64Input) {
    return {};
  }
  std::string out;
  out.resize(4 * ((len + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data, static_cast<int>(len));
  if (n < 0) {
    return {};
  }
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string Base64Encode(const std::vector<std::uint8_t>& data) {
  return Base64Encode(data.data(), data.size());
}

bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out) {
  out.clear();
  if (text.empty() || (text.size() % 4) != 0 || text.size() > kMaxBase64Input) {
    return false;
  }
  out.resize(3 * (text.size() / 4));
  const int n = EVP_DecodeBlock(out.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0) {
    out.clear();
    return false;
  }
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  const std::size_t decoded = static_cast<std::size_t>(n);
  if (decoded < padding) {
    out.clear();
    return false;
  }
  out.resize(decoded - padding);
  return true;
}

std::string Base64UrlEncode(const std::vector<std::uint8_t>& data) {
  std::string out = Base64Encode(data);
  for (auto& ch : out) {
    if (ch == '+') {
      ch = '-';
    } else if (ch == '/') {
      ch = '_';
    }
  }
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  return out;
}

bool Base64UrlDecode(std::string_view text, std::vector<std::uint8_t>& out) {
  std::string std_text(text);
  for (auto& ch : std_text) {
    if (ch == '-') {
      ch = '+';
    } else if (ch == '_') {
      ch = '/';
    }
  }
  while ((std_text.size() % 4) != 0) {
    std_text.push_back('=');
  }
  return Base64Decode(std_text, out);
}

}  // namespace ica::common
