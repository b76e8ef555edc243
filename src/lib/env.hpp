/**
 * @file env.hpp
 * @author Ruan Formigoni
 * @brief A library for reading environment variables
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include "../std/string.hpp"
#include "../std/expected.hpp"
#include "../macro.hpp"

namespace ns_env
{

enum class Replace
{
  Y,
  N,
};

/**
 * @brief Sets an environment variable
 *
 * @tparam T StringRepresentable
 * @tparam U StringRepresentable
 * @param name Variable name
 * @param value Variable value
 * @param replace Should it be replace if it exists?
 */
template<ns_concept::StringRepresentable T, ns_concept::StringRepresentable U>
void set(T&& name, U&& value, Replace replace)
{
  setenv(ns_string::to_string(name).c_str(), ns_string::to_string(value).c_str(), (replace == Replace::Y));
}

/**
 * @brief Get the value of an environment variable
 *
 * @param name The name of the variable
 * @return Value<std::string> The value of the variable or the respective error
 */
[[nodiscard]] inline Value<std::string> get_expected(std::string const& name)
{
  const char * var = std::getenv(name.c_str());
  return_if(var == nullptr, Error("D::Could not read variable '{}'", name));
  return std::string{var};
}

/**
 * @brief Get the value of an environment variable or a fallback when it is undefined
 *
 * A variable that is set to an empty string is returned as is.
 */
[[nodiscard]] inline std::string get_or(std::string const& name, std::string_view fallback)
{
  const char * var = std::getenv(name.c_str());
  return (var != nullptr)? std::string{var} : std::string{fallback};
}

/**
 * @brief Checks if variable exists and equals value
 *
 * @param name Name of the variable
 * @param value Expected value of the variable
 * @return True if it exists and matches the expected value, or false otherwise
 */
[[nodiscard]] inline bool exists(std::string const& name, std::string_view value)
{
  const char* value_real = std::getenv(name.c_str());
  return_if(not value_real, false);
  return std::string_view{value_real} == value;
}

} // namespace ns_env

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
