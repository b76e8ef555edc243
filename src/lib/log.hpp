/**
 * @file log.hpp
 * @author Ruan Formigoni
 * @brief A library for file and console logging
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 *
 * ## Thread-Local Logger
 *
 * Each thread owns an independent `Logger` (`thread_local`), so concurrent supplement
 * calls never share logger state and no locking is needed on the hot path. A thread
 * that wants its messages in a file sets its own sink with `ns_log::set_sink_file`.
 *
 * Messages carry a one-letter level prefix and the source location:
 * ```
 * I::supplement.hpp::142::Effective registry host is 'index.docker.io'
 * ```
 */

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>

#include "../std/concept.hpp"
#include "../std/string.hpp"

/**
 * @namespace ns_log
 * @brief Multi-level logging system with file and console sinks
 *
 * Every message goes to the sink file when one is set, and to the console when the
 * verbosity of the calling thread allows it. Debug and info go to stdout, the rest to
 * stderr.
 */
namespace ns_log
{

enum class Level : int
{
  CRITICAL,
  ERROR,
  WARN,
  INFO,
  DEBUG,
};

namespace
{

namespace fs = std::filesystem;

struct LevelInfo
{
  Level level;
  std::string_view name;
  char prefix;
};

constexpr std::array<LevelInfo,5> LEVELS
{{
  { Level::CRITICAL, "critical", 'C' },
  { Level::ERROR,    "error",    'E' },
  { Level::WARN,     "warn",     'W' },
  { Level::INFO,     "info",     'I' },
  { Level::DEBUG,    "debug",    'D' },
}};

class Logger
{
  private:
    std::ofstream m_sink;
    Level m_level;
  public:
    Logger();
    Logger(Logger const&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger const&) = delete;
    Logger& operator=(Logger&&) = delete;
    void set_level(Level level);
    [[nodiscard]] Level get_level() const;
    void set_sink_file(fs::path const& path_file_sink);
    void write(Level level, std::string const& line);
};

/**
 * @brief Thread-local logger instance
 */
thread_local Logger logger;

/**
 * @brief Construct a new Logger, critical messages only and no sink file
 */
inline Logger::Logger()
  : m_sink()
  , m_level(Level::CRITICAL)
{
}

/**
 * @brief Sets the sink file of the logger, the file is truncated
 *
 * @param path_file_sink The path to the logger sink file
 */
inline void Logger::set_sink_file(fs::path const& path_file_sink)
{
  m_sink = std::ofstream(path_file_sink, std::ios::out | std::ios::trunc);
  if(not m_sink.is_open())
  {
    std::println(std::cerr, "E::Could not open log file '{}'", path_file_sink.string());
  }
}

/**
 * @brief Writes a finished line to the sink and, if verbose enough, to the console
 */
inline void Logger::write(Level level, std::string const& line)
{
  if(m_sink.is_open())
  {
    m_sink << line;
    m_sink.flush();
  }
  if(m_level >= level)
  {
    std::ostream& os = (level >= Level::INFO)? std::cout : std::cerr;
    os << line;
  }
}

inline void Logger::set_level(Level level)
{
  m_level = level;
}

inline Level Logger::get_level() const
{
  return m_level;
}

} // namespace

/**
 * @brief Sets the console verbosity of the calling thread
 *
 * @param level Enumeration of the verbosity level
 */
inline void set_level(Level level)
{
  logger.set_level(level);
}

/**
 * @brief Get current console verbosity of the calling thread
 */
inline Level get_level()
{
  return logger.get_level();
}

/**
 * @brief Sets the sink file of the calling thread
 *
 * @param path_file_sink The path to the logger sink file
 */
inline void set_sink_file(fs::path const& path_file_sink)
{
  logger.set_sink_file(path_file_sink);
}

/**
 * @brief Parses a verbosity name, case-insensitive
 *
 * @param name One of debug, info, warn, error or critical
 * @return std::optional<Level> The level, or nothing for an unknown name
 */
[[nodiscard]] inline std::optional<Level> level_from_string(std::string_view name)
{
  std::string lower = name
    | std::views::transform([](unsigned char c){ return static_cast<char>(std::tolower(c)); })
    | std::ranges::to<std::string>();
  auto it = std::ranges::find(LEVELS, lower, &LevelInfo::name);
  if(it == LEVELS.end())
  {
    return std::nullopt;
  }
  return it->level;
}

/**
 * @brief Source code location information for log messages
 *
 * Captured at compile time with __builtin_FILE() and __builtin_LINE(); only the file
 * name is kept.
 */
struct Location
{
  std::string_view m_str_file; ///< Source file name (basename only)
  uint32_t m_line;             ///< Source line number

  consteval Location(const char* str_file = __builtin_FILE() , uint32_t str_line = __builtin_LINE())
    : m_str_file(str_file)
    , m_line(str_line)
  {
    m_str_file = m_str_file.substr(m_str_file.find_last_of("/")+1);
  }

  /**
   * @brief Formats location as "filename::line"
   */
  constexpr auto get() const
  {
    return std::format("{}::{}", m_str_file, m_line);
  }
};

/**
 * @brief Workaround make_format_args only taking references
 */
template<typename... Ts>
std::string vformat(std::string_view fmt, Ts&&... ts)
{
  return std::vformat(fmt, std::make_format_args(ts...));
}

/**
 * @brief Formats one message of a given level and hands it to the thread logger
 *
 * @param level The level of the message
 * @param loc Where the message was logged
 * @param format The format string, without the level prefix
 * @param args The format arguments
 */
template<ns_concept::StringRepresentable T, typename... Args>
requires ( ( ns_concept::StringRepresentable<Args> or ns_concept::Iterable<Args> ) and ... )
void write(Level level, Location const& loc, T&& format, Args&&... args)
{
  char prefix = LEVELS[static_cast<size_t>(level)].prefix;
  std::string line = std::format("{}::{}::", prefix, loc.get());
  line += vformat(ns_string::to_string(format), ns_string::to_string(args)...)
    // A new line would print without a prefix
    | std::views::filter([](char c){ return c != '\n'; })
    | std::ranges::to<std::string>();
  line += '\n';
  logger.write(level, line);
}

/**
 * @brief Maps the prefix of a format string to its level
 *
 * @return std::optional<Level> The level, or nothing for the discarding `Q::` prefix
 */
consteval std::optional<Level> prefix_level(std::string_view sv)
{
  if(sv.starts_with("Q::")) { return std::nullopt; }
  for(LevelInfo const& info : LEVELS)
  {
    if(sv.size() >= 3 and sv[0] == info.prefix and sv.substr(1,2) == "::")
    {
      return info.level;
    }
  }
  throw "Log format strings start with D::, I::, W::, E::, C:: or Q::";
}

/**
 * @def logger(fmt, ...)
 * @brief Compile-time log level dispatch with automatic location capture
 *
 * The level is the prefix of the format string: `D::`, `I::`, `W::`, `E::`, `C::`, or
 * `Q::` to discard the message.
 *
 * @code
 * logger("I::Effective registry host is '{}'", host);
 * logger("W::No mirrors configured for '{}'", host);
 * @endcode
 */
#define logger(fmt, ...) ::ns_log::impl_log<fmt>(::ns_log::Location{})(__VA_ARGS__)

/**
 * @def logger_loc(loc, fmt, ...)
 * @brief Like logger() with an explicit source location
 */
#define logger_loc(loc, fmt, ...) ::ns_log::impl_log<fmt>(loc)(__VA_ARGS__)

/**
 * @brief Implementation function for compile-time log level dispatch
 *
 * @tparam str Static string containing the log level prefix (D::, I::, W::, E::, C::, Q::)
 * @param loc Source location of the log call
 * @return Lambda that accepts variadic arguments and writes them with the selected level
 */
template<ns_string::static_string str>
constexpr decltype(auto) impl_log(Location loc)
{
  return [=]<typename... Ts>(Ts&&... ts)
  {
    constexpr std::string_view sv = str.data;
    constexpr std::optional<Level> level = prefix_level(sv);
    if constexpr (level.has_value())
    {
      ns_log::write(*level, loc, sv.substr(3), std::forward<Ts>(ts)...);
    }
  };
}

} // namespace ns_log

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
