/**
 * @file enum.hpp
 * @author Ruan Formigoni
 * @brief Enumerations with string conversion
 *
 * The ENUM macro declares a class wrapping a scoped enumeration. Every enumeration gets an
 * extra NONE value used as the default and as the result for names that are not part of
 * the closed set.
 *
 * @code
 * ENUM(Driver, FSCACHE, FUSEDEV);
 *
 * Driver driver = Pop(Driver::from_string("fusedev"));
 * switch(driver)
 * {
 *   case Driver::FSCACHE: ...
 *   case Driver::FUSEDEV: ...
 *   case Driver::NONE: ...
 * }
 * std::string name = driver;      // "FUSEDEV"
 * std::string wire = driver.lower(); // "fusedev"
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "expected.hpp"
#include "string.hpp"
#include "../macro.hpp"

namespace ns_enum
{

/**
 * @brief Counts the names in a stringified enumerator list
 */
consteval size_t count(std::string_view names)
{
  return 1 + std::ranges::count(names, ',');
}

/**
 * @brief Splits a stringified enumerator list into its trimmed names
 */
[[nodiscard]] inline std::vector<std::string> names(std::string_view names)
{
  return ns_string::split(names, ',')
    | std::views::transform([](auto&& e){ return ns_string::trim(e); })
    | std::ranges::to<std::vector<std::string>>();
}

} // namespace ns_enum

#define ENUM(name, ...)                                                              \
class name                                                                           \
{                                                                                    \
  public:                                                                            \
    enum class enum_t : int { __VA_ARGS__, NONE };                                   \
    using enum enum_t;                                                               \
    static constexpr size_t size = ::ns_enum::count(#__VA_ARGS__) + 1;               \
  private:                                                                           \
    enum_t m_value;                                                                  \
    static std::vector<std::string> const& names()                                   \
    {                                                                                \
      static std::vector<std::string> const names = ::ns_enum::names(#__VA_ARGS__ ", NONE"); \
      return names;                                                                  \
    }                                                                                \
  public:                                                                            \
    constexpr name() : m_value(enum_t::NONE) {}                                      \
    constexpr name(enum_t value) : m_value(value) {}                                 \
    [[nodiscard]] constexpr enum_t get() const { return m_value; }                   \
    constexpr operator enum_t() const { return m_value; }                            \
    operator std::string() const                                                     \
    {                                                                                \
      return names().at(static_cast<size_t>(m_value));                              \
    }                                                                                \
    [[nodiscard]] std::string lower() const                                          \
    {                                                                                \
      return ::ns_string::to_lower(std::string(*this));                              \
    }                                                                                \
    [[nodiscard]] static Value<name> from_string(std::string_view str)               \
    {                                                                                \
      std::string const str_lower = ::ns_string::to_lower(str);                      \
      auto const& list = names();                                                    \
      auto it = std::ranges::find_if(list, [&](auto&& e)                             \
      {                                                                              \
        return ::ns_string::to_lower(e) == str_lower;                                \
      });                                                                            \
      return_if(it == list.end() or *it == "NONE"                                    \
        , Error("D::Invalid value '{}' for " #name, str)                             \
      );                                                                             \
      return name{static_cast<enum_t>(std::distance(list.begin(), it))};             \
    }                                                                                \
};

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
