/**
 * @file string.hpp
 * @author Ruan Formigoni
 * @brief String helpers
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <format>
#include <ranges>

#include "concept.hpp"

namespace ns_string
{

template<size_t N>
struct static_string
{
  char data[N];
  // Functions
  constexpr static_string(const char (&str)[N])
  {
    std::copy_n(str, N, data);
  }
  constexpr static_string() = default;
  constexpr operator const char*() const { return data; }
  constexpr operator std::string_view() const { return std::string_view(data, N - 1); }
  constexpr size_t size() const { return N - 1; }
};

/**
 * @brief Converts a type to a string
 *
 * @tparam T A string representable or iterable type
 * @param t The value to convert to a string
 * @return std::string The type string representation
 */
template<typename T>
[[nodiscard]] inline std::string to_string(T&& t) noexcept
{
  if constexpr ( std::same_as<std::remove_cvref_t<T>, bool> )
  {
    return t? "true" : "false";
  } // if
  else if constexpr ( ns_concept::StringConvertible<T> )
  {
    return t;
  } // else if
  else if constexpr ( ns_concept::StringConstructible<T> )
  {
    return std::string{t};
  } // else if
  else if constexpr ( ns_concept::Numeric<T> )
  {
    return std::to_string(t);
  } // else if
  else if constexpr ( ns_concept::StreamInsertable<T> )
  {
    std::stringstream ss;
    ss << t;
    return ss.str();
  } // else if
  else if constexpr ( ns_concept::Iterable<T> )
  {
    std::stringstream ss;
    ss << '[';
    std::ranges::for_each(t, [&](auto&& e){ ss << std::format("'{}',", to_string(e)); });
    ss << ']';
    return ss.str();
  } // else if
  else
  {
    static_assert(false, "Cannot convert type to string");
  }
}

/**
 * @brief Lower-case copy of an ascii string
 */
[[nodiscard]] inline std::string to_lower(std::string_view str)
{
  return str
    | std::views::transform([](unsigned char c){ return static_cast<char>(std::tolower(c)); })
    | std::ranges::to<std::string>();
}

/**
 * @brief Splits a string on every occurrence of a delimiter, empty parts are kept
 */
[[nodiscard]] inline std::vector<std::string> split(std::string_view str, char delimiter)
{
  return str
    | std::views::split(delimiter)
    | std::views::transform([](auto&& e){ return std::string(e.begin(), e.end()); })
    | std::ranges::to<std::vector<std::string>>();
}

/**
 * @brief Joins strings with a separator
 */
[[nodiscard]] inline std::string join(std::vector<std::string> const& parts, std::string_view sep)
{
  std::string ret;
  for(auto it = parts.begin(); it != parts.end(); ++it)
  {
    ret += *it;
    if (std::next(it) != parts.end()) { ret += sep; }
  }
  return ret;
}

/**
 * @brief Removes leading and trailing whitespace
 */
[[nodiscard]] inline std::string trim(std::string_view str)
{
  auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
  auto begin = std::ranges::find_if_not(str, is_space);
  auto end = std::ranges::find_if_not(str | std::views::reverse, is_space).base();
  return (begin < end)? std::string(begin, end) : std::string{};
}

} // namespace ns_string

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
