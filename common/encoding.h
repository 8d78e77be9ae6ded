#ifndef ICA_ENCODING_H
#define ICA_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ica::common {

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

std::string Base64Encode(const std::uint8_t* data, std::size_t len);
std::string Base64Encode(const std::vector<std::uint8_t>& data);
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

// RFC 4648 section 5 alphabet, no padding. Decoding accepts padded input.
std::string Base64UrlEncode(const std::vector<std::uint8_t>& data);
bool Base64UrlDecode(std::string_view text, std::vector<std::uint8_t>& out);

}  // namespace ica::common

#endif  // ICA_ENCODING_H
