/**
 * @file macro.hpp
 * @author Ruan Formigoni
 * @brief Control flow macros with optional logging
 *
 * The logging level is determined by the prefix in the format string itself
 * (D::, I::, W::, E::, C::) which is processed by the logger at compile time.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include "lib/log.hpp"

/**
 * @brief Conditionally return from function with optional logging
 *
 * @param condition The condition to evaluate
 * @param value The value to return (empty for void functions)
 * @param ... Optional format string and arguments for logging
 *
 * @code
 * return_if(mirrors.empty(), {}, "I::No mirrors for '{}'", host);
 * return_if(done,,"D::Nothing to do");
 * @endcode
 */
#define return_if(condition, value, ...) \
  if (condition) { \
    __VA_OPT__(logger(__VA_ARGS__);) \
    return value; \
  }

/**
 * @brief Conditionally continue to next iteration with optional logging
 *
 * @code
 * for(auto&& [key, value] : db.items()) {
 *   continue_if(key.empty(), "W::Skipping empty key");
 * }
 * @endcode
 */
#define continue_if(condition, ...) \
  if (condition) { \
    __VA_OPT__(logger(__VA_ARGS__);) \
    continue; \
  }

/**
 * @brief Conditionally log a message without affecting control flow
 *
 * @code
 * log_if(keychain.empty(), "I::No credentials found for '{}'", host);
 * @endcode
 */
#define log_if(condition, ...) \
  if (condition) { \
    logger(__VA_ARGS__); \
  }

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
