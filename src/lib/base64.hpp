/**
 * @file base64.hpp
 * @author Ruan Formigoni
 * @brief Base64 encoding through OpenSSL
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <string_view>
#include <openssl/evp.h>

#include "../std/expected.hpp"
#include "../macro.hpp"

/**
 * @namespace ns_base64
 * @brief Standard base64 (RFC 4648, with padding) used for registry credentials
 */
namespace ns_base64
{

/**
 * @brief Encodes bytes into base64
 *
 * @param str_raw Input bytes
 * @return std::string The padded base64 text
 */
[[nodiscard]] inline std::string encode(std::string_view str_raw)
{
  return_if(str_raw.empty(), std::string{});
  // Four output characters for every three input bytes, plus the terminator
  std::string out(4 * ((str_raw.size() + 2) / 3) + 1, '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data())
    , reinterpret_cast<unsigned char const*>(str_raw.data())
    , static_cast<int>(str_raw.size())
  );
  out.resize(static_cast<size_t>(len));
  return out;
}

/**
 * @brief Decodes base64 text
 *
 * EVP_DecodeBlock does not account for padding, the trailing zero bytes it produces
 * for each '=' are removed here.
 *
 * @param str_encoded The base64 text
 * @return Value<std::string> The decoded bytes or the respective error
 */
[[nodiscard]] inline Value<std::string> decode(std::string_view str_encoded)
{
  std::string encoded = ns_string::trim(str_encoded);
  return_if(encoded.empty(), std::string{});
  return_if(encoded.size() % 4 != 0, Error("D::Invalid base64 length '{}'", encoded.size()));
  std::string out(3 * (encoded.size() / 4), '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data())
    , reinterpret_cast<unsigned char const*>(encoded.data())
    , static_cast<int>(encoded.size())
  );
  return_if(len < 0, Error("D::Invalid base64 data"));
  size_t padding = static_cast<size_t>(std::ranges::count(encoded | std::views::reverse | std::views::take(2), '='));
  out.resize(static_cast<size_t>(len) - padding);
  return out;
}

} // namespace ns_base64

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
