/**
 * @file expected.hpp
 * @author Ruan Formigoni
 * @brief Error handling framework built on std::expected
 *
 * Fallible functions return Value<T,E>. The error travels unchanged through Pop, which
 * logs it at debug level on every frame it crosses, so the sink file shows the full path
 * of a failure while the console only shows what the caller chose to report.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <expected>
#include <string>
#include <optional>
#include <type_traits>

#include "string.hpp"
#include "../lib/log.hpp"

/**
 * @brief Expected type with integrated logging capabilities
 *
 * @tparam T The expected value type (can be void)
 * @tparam E The error type (defaults to std::string), must be string representable
 */
template<typename T, typename E = std::string>
struct Value : std::expected<T, E>
{
  using std::expected<T, E>::expected;

private:
  /**
   * @brief Logs the held error with the level of fmt, then the fmt message itself
   */
  template<ns_string::static_string fmt, typename... Args>
  void log_error(ns_log::Location const& loc, Args&&... args) const
  {
    constexpr std::optional<ns_log::Level> level = ns_log::prefix_level(fmt.data);
    if constexpr (level.has_value())
    {
      ns_log::write(*level, loc, "{}", this->error());
      ns_log::write(*level, loc, std::string_view{fmt.data}.substr(3), std::forward<Args>(args)...);
    }
  }

public:
  /**
   * @brief Log error and discard it if present
   *
   * The error is logged with the level of fmt, `Q::` drops it silently.
   *
   * @tparam fmt Format string with log level prefix (D::, I::, W::, E::, C::, Q::)
   * @param loc Source location for logging
   * @param args Additional arguments for the format string
   */
  template<ns_string::static_string fmt = "Q::", typename... Args>
  void discard_impl(ns_log::Location const& loc, Args&&... args)
  {
    if (not this->has_value())
    {
      log_error<fmt>(loc, std::forward<Args>(args)...);
    }
  }

  /**
   * @brief Forward error with logging or return value
   *
   * @tparam fmt Format string with log level prefix
   * @param loc Source location for logging
   * @param args Additional arguments for the format string
   * @return Value<T,E> Forwarded Value with same state
   */
  template<ns_string::static_string fmt = "Q::", typename... Args>
  Value<T,E> forward_impl(ns_log::Location const& loc, Args&&... args)
  {
    if (not this->has_value())
    {
      log_error<fmt>(loc, std::forward<Args>(args)...);
      return std::unexpected(std::move(this->error()));
    }
    if constexpr (std::is_void_v<T>)
    {
      return Value<T,E>{};
    }
    else
    {
      return Value<T,E>(std::move(this->value()));
    }
  }

  /**
   * @brief Get value or default-constructed T
   */
  T or_default() requires std::default_initializable<T>
  {
    if (!this->has_value()) {
      return T{};
    }
    return std::move(**this);
  }
};

/**
 * @brief Lambda helper for Pop macro error returns
 *
 * A function may shadow it with a local `__expected_fn` to map errors to another return
 * type, e.g. an exit code in main().
 * @internal
 */
constexpr auto __expected_fn = [](auto&& e) { return e; };

/**
 * @internal
 * @brief Helper macros for optional argument handling
 * @{
 */
#define NOPT(expr, ...) NOPT_IDENTITY(__VA_OPT__(NOPT_EAT) (expr))
#define NOPT_IDENTITY(...) __VA_ARGS__
#define NOPT_EAT(...)
/** @} */

/**
 * @brief Unwrap Value or return with error logging
 *
 * @param expr Expression returning Value<T,E> or std::expected<T,E>
 * @param ... Optional additional log message and arguments
 *
 * @code
 * Value<void> process() {
 *   ns_db::Db db = Pop(ns_db::read_file(path), "E::Could not read template");
 *   return {};
 * }
 * @endcode
 */
#define Pop(expr,...)                                                         \
({                                                                            \
  auto __expected_ret = (expr);                                               \
  if (!__expected_ret)                                                        \
  {                                                                           \
    NOPT(logger("D::{}", __expected_ret.error()) __VA_OPT__(,) __VA_ARGS__);  \
    __VA_OPT__(logger(__VA_ARGS__));                                          \
    return __expected_fn(std::unexpected(std::move(__expected_ret).error())); \
  }                                                                           \
  std::move(__expected_ret).value();                                          \
})

/**
 * @brief Discard error with logging
 *
 * @code
 * ns_db::write_file(path, db).discard("W::Could not write configuration");
 * @endcode
 */
#define discard(fmt,...) discard_impl<fmt>(ns_log::Location() __VA_OPT__(,) __VA_ARGS__)

/**
 * @brief Forward error with additional context
 */
#define forward(fmt,...) forward_impl<fmt>(ns_log::Location() __VA_OPT__(,) __VA_ARGS__)

/**
 * @brief Convert exceptions to Value errors
 *
 * @tparam Fn Callable type
 * @param f Function to execute with exception handling
 * @return Value containing result or error message
 *
 * @internal Used by Try and Catch macros
 */
template<typename Fn>
auto __except_impl(ns_log::Location const& loc, Fn&& f) -> Value<std::invoke_result_t<Fn>>
  requires (not ns_concept::IsInstanceOf<std::invoke_result_t<Fn>, Value>)
  and (not ns_concept::IsInstanceOf<std::invoke_result_t<Fn>, std::expected>)
{
  try
  {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>)
    {
      f();
      return {};
    }
    else
    {
      return f();
    }
  }
  catch (std::exception const& e)
  {
    logger_loc(loc, "E::{}::Exception was thrown", e.what());
    return std::unexpected(e.what());
  }
  catch (...)
  {
    logger_loc(loc, "E::Unknown exception was thrown");
    return std::unexpected("Unknown exception was thrown");
  }
}

/**
 * @brief Execute expression with exception handling and unwrapping
 *
 * @param expr Expression that might throw
 * @param ... Optional additional error context
 */
#define Try(expr,...) Pop(__except_impl(::ns_log::Location(), [&]{ return (expr); }), __VA_ARGS__)

/**
 * @brief Execute expression with exception handling, returns Value<T> directly
 */
#define Catch(expr) (__except_impl(::ns_log::Location(), [&]{ return (expr); }))

/**
 * @brief Create an unexpected error with logging
 *
 * The format string starts with a 3-character log level prefix (e.g., "E::") which is
 * stripped from the error message but used for logging.
 *
 * @code
 * return_if(host.empty(), Error("E::Empty registry host in '{}'", image));
 * @endcode
 */
#define Error(fmt,...)                                 \
({                                                     \
  logger(fmt __VA_OPT__(,) __VA_ARGS__);               \
  [&](auto&&... __fmt_args)                            \
  {                                                    \
    if constexpr (sizeof...(__fmt_args) > 0)           \
    {                                                  \
      return std::unexpected(                          \
          std::format(std::string_view(fmt).substr(3)  \
        , ns_string::to_string(__fmt_args)...)         \
      );                                               \
    }                                                  \
    else                                               \
    {                                                  \
      return std::unexpected(                          \
        std::format(std::string_view(fmt).substr(3))   \
      );                                               \
    }                                                  \
  }(__VA_ARGS__);                                      \
})

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
