/**
 * @file keychain.hpp
 * @author Ruan Formigoni
 * @brief Registry credentials
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <format>
#include <string>

#include "../lib/base64.hpp"

namespace ns_auth
{

/**
 * @brief Username and password pair resolved for a registry
 *
 * A keychain with only a password carries a registry token.
 */
struct Keychain
{
  std::string username;
  std::string password;

  [[nodiscard]] bool empty() const
  {
    return username.empty() and password.empty();
  }

  [[nodiscard]] bool token_based() const
  {
    return username.empty() and not password.empty();
  }

  /**
   * @brief Encodes the pair as a basic authorization value
   *
   * @return std::string base64 of "username:password"
   */
  [[nodiscard]] std::string to_base64() const
  {
    return ns_base64::encode(std::format("{}:{}", username, password));
  }
};

} // namespace ns_auth

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
