/**
 * @file error.hpp
 * @author Ruan Formigoni
 * @brief Typed errors of the daemon configuration layer
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <format>
#include <ostream>
#include <string>
#include <string_view>

#include "../std/enum.hpp"
#include "../std/expected.hpp"

/**
 * @namespace ns_daemonconfig::ns_error
 * @brief Failure kinds reported by the factory, the variants and the supplementer
 */
namespace ns_daemonconfig::ns_error
{

ENUM(Kind, UNSUPPORTED_DRIVER, TEMPLATE_LOAD, IMAGE_REFERENCE, MIRROR_UPDATE, UNSUPPORTED_BACKEND, SERIALIZATION);

/**
 * @brief A failure kind with the context of where it happened
 */
struct Failure
{
  Kind kind;
  std::string message;
};

inline std::ostream& operator<<(std::ostream& os, Failure const& failure)
{
  return os << std::string(failure.kind) << ": " << failure.message;
}

template<typename T>
using Result = Value<T, Failure>;

/**
 * @brief Lifts a string error into a typed failure
 *
 * @param kind The failure kind to report
 * @param value The result of a lower level operation
 * @param context Prepended to the lower level message
 * @return Result<T> The value, or the failure with kind and context
 */
template<typename T>
[[nodiscard]] Result<T> lift(Kind kind, Value<T>&& value, std::string_view context)
{
  if(not value)
  {
    return std::unexpected(Failure{kind, std::format("{}: {}", context, value.error())});
  }
  if constexpr (std::is_void_v<T>)
  {
    return Result<T>{};
  }
  else
  {
    return Result<T>(std::move(value).value());
  }
}

} // namespace ns_daemonconfig::ns_error

/**
 * @brief Create an unexpected typed failure with logging
 *
 * Same contract as Error(), the 3-character level prefix is stripped from the message.
 *
 * @code
 * return Fail(Kind::UNSUPPORTED_DRIVER, "E::Unsupported fs driver '{}'", driver);
 * @endcode
 */
#define Fail(kind, fmt, ...)                                                           \
({                                                                                     \
  logger(fmt __VA_OPT__(,) __VA_ARGS__);                                               \
  std::unexpected(::ns_daemonconfig::ns_error::Failure{kind                            \
    , ::ns_log::vformat(std::string_view(fmt).substr(3) __VA_OPT__(,) __VA_ARGS__)}    \
  );                                                                                   \
})

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
