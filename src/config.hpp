/**
 * @file config.hpp
 * @author Ruan Formigoni
 * @brief Process configuration of ndc
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "daemonconfig/supplement.hpp"
#include "lib/env.hpp"
#include "lib/log.hpp"
#include "macro.hpp"
#include "std/expected.hpp"

// Version
#ifndef NDC_VERSION
#error "NDC_VERSION is undefined"
#endif

/**
 * @namespace ns_config
 * @brief Settings read from the environment
 *
 * | Variable                 | Default                | Meaning                          |
 * |--------------------------|------------------------|----------------------------------|
 * | NDC_MIRRORS_CONFIG_DIR   | /etc/nydus/certs.d     | Mirrors directory, empty disables|
 * | DOCKER_CONFIG            | $HOME/.docker          | Docker credential store dir      |
 * | NDC_DEBUG                |                        | 1 enables debug messages         |
 * | NDC_LOG_LEVEL            | warn                   | Console verbosity                |
 * | NDC_LOG_FILE             |                        | Log sink file                    |
 */
namespace ns_config
{

namespace
{

namespace fs = std::filesystem;

} // namespace

inline constexpr std::string_view PATH_DIR_MIRRORS_DEFAULT = "/etc/nydus/certs.d";
inline constexpr std::string_view FILE_DOCKER_CONFIG = "config.json";

struct Config
{
  fs::path const path_dir_mirrors;
  fs::path const path_file_docker_config;
  bool const is_debug;
  ns_log::Level const log_level;
  std::optional<fs::path> const path_file_log;
};

/**
 * @brief Builds the configuration from the environment
 *
 * @return Value<Config> The configuration or the respective error
 */
[[nodiscard]] inline Value<Config> config()
{
  fs::path path_dir_mirrors = ns_env::get_or("NDC_MIRRORS_CONFIG_DIR", PATH_DIR_MIRRORS_DEFAULT);
  // Docker credential store
  fs::path path_dir_docker;
  if(auto docker_config = ns_env::get_expected("DOCKER_CONFIG"); docker_config and not docker_config->empty())
  {
    path_dir_docker = *docker_config;
  }
  else
  {
    path_dir_docker = fs::path{Pop(ns_env::get_expected("HOME"), "E::HOME and DOCKER_CONFIG are undefined")} / ".docker";
  }
  // Logging
  ns_log::Level log_level = ns_log::Level::WARN;
  if(auto name = ns_env::get_expected("NDC_LOG_LEVEL"); name and not name->empty())
  {
    auto level = ns_log::level_from_string(*name);
    return_if(not level, Error("E::Invalid value '{}' for NDC_LOG_LEVEL", *name));
    log_level = *level;
  }
  std::optional<fs::path> path_file_log;
  if(auto log_file = ns_env::get_expected("NDC_LOG_FILE"); log_file and not log_file->empty())
  {
    path_file_log = *log_file;
  }
  return Config
  {
    .path_dir_mirrors = std::move(path_dir_mirrors),
    .path_file_docker_config = path_dir_docker / FILE_DOCKER_CONFIG,
    .is_debug = ns_env::exists("NDC_DEBUG", "1"),
    .log_level = log_level,
    .path_file_log = std::move(path_file_log),
  };
}

/**
 * @brief Applies the logging settings to the calling thread
 *
 * @param config The process configuration
 * @param is_quiet Only critical messages reach the console, unless debugging
 */
inline void apply_logging(Config const& config, bool is_quiet = false)
{
  ns_log::set_level(config.is_debug? ns_log::Level::DEBUG
    : is_quiet? ns_log::Level::CRITICAL
    : config.log_level
  );
  if(config.path_file_log)
  {
    ns_log::set_sink_file(*config.path_file_log);
  }
}

/**
 * @brief Creates a supplementer with the default collaborators
 */
[[nodiscard]] inline std::unique_ptr<ns_daemonconfig::Supplementer> make_supplementer(Config const& config)
{
  return std::make_unique<ns_daemonconfig::Supplementer>(config.path_dir_mirrors
    , ns_auth::make_default(config.path_file_docker_config)
    , std::make_unique<ns_registry::DefaultHostPolicy>()
  );
}

} // namespace ns_config

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
