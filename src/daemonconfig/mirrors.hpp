/**
 * @file mirrors.hpp
 * @author Ruan Formigoni
 * @brief Registry mirrors read from the mirrors configuration directory
 *
 * Layout of the directory:
 * ```
 * <dir>/<host>/hosts.json      mirrors of a registry host
 * <dir>/_default/hosts.json    mirrors of hosts without a directory of their own
 * ```
 * A hosts.json file contains `{"mirrors": [{"host": ..., "headers": {...}, ...}]}`.
 * containerd style hosts.toml files are not read, a warning names the ones found.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "../db/db.hpp"
#include "backend.hpp"

namespace ns_daemonconfig::ns_mirrors
{

namespace
{

namespace fs = std::filesystem;

}

using ns_backend::MirrorConfig;
using ns_backend::BackendConfig;

inline constexpr std::string_view DIR_DEFAULT = "_default";
inline constexpr std::string_view FILE_HOSTS = "hosts.json";
inline constexpr std::string_view FILE_HOSTS_TOML = "hosts.toml";

/**
 * @brief Loads the mirrors of a registry host
 *
 * An empty directory path or a directory that does not exist yields no mirrors. A path
 * that is not a directory, a host that is not a single path component, or a hosts file
 * that cannot be read or parsed, is an error.
 *
 * @param path_dir_mirrors The mirrors configuration directory
 * @param host The effective registry host
 * @return Value<std::vector<MirrorConfig>> The mirrors in file order, or the respective error
 */
[[nodiscard]] inline Value<std::vector<MirrorConfig>> load_mirrors(fs::path const& path_dir_mirrors
  , std::string const& host)
{
  return_if(path_dir_mirrors.empty(), std::vector<MirrorConfig>{}, "D::Mirrors directory is disabled");
  return_if(not Try(fs::exists(path_dir_mirrors))
    , std::vector<MirrorConfig>{}
    , "D::Mirrors directory '{}' does not exist", path_dir_mirrors.string()
  );
  return_if(not Try(fs::is_directory(path_dir_mirrors))
    , Error("E::Mirrors path '{}' is not a directory", path_dir_mirrors.string())
  );
  // The host names a directory inside path_dir_mirrors
  return_if(host.empty() or host == "." or host == ".." or host.find('/') != std::string::npos
    , Error("E::Invalid registry host '{}' for the mirrors directory", host)
  );
  // Host specific file first, then the default one
  fs::path path_file_hosts = path_dir_mirrors / host / FILE_HOSTS;
  if(not Try(fs::exists(path_file_hosts)))
  {
    log_if(Try(fs::exists(path_dir_mirrors / host / FILE_HOSTS_TOML))
      , "W::Ignoring '{}', mirrors are read from {}", (path_dir_mirrors / host / FILE_HOSTS_TOML).string(), FILE_HOSTS
    );
    path_file_hosts = path_dir_mirrors / DIR_DEFAULT / FILE_HOSTS;
  }
  return_if(not Try(fs::exists(path_file_hosts))
    , std::vector<MirrorConfig>{}
    , "D::No mirrors configured for '{}'", host
  );
  ns_db::Db db = Pop(ns_db::read_file(path_file_hosts), "E::Could not read '{}'", path_file_hosts.string());
  return_if(not db.data().is_object()
    , Error("E::Mirrors file '{}' is not a json object", path_file_hosts.string())
  );
  std::vector<MirrorConfig> mirrors = Pop(ns_backend::deserialize_mirrors(db)
    , "E::Malformed mirrors file '{}'", path_file_hosts.string()
  );
  logger("D::Found {} mirrors for '{}' in '{}'", mirrors.size(), host, path_file_hosts.string());
  return mirrors;
}

/**
 * @brief Replaces the mirror list of a backend
 *
 * The list is replaced only when mirrors were found. On failure the backend is left
 * untouched.
 */
[[nodiscard]] inline Value<void> update_mirrors(BackendConfig& config
  , fs::path const& path_dir_mirrors
  , std::string const& host)
{
  std::vector<MirrorConfig> mirrors = Pop(load_mirrors(path_dir_mirrors, host));
  if(not mirrors.empty())
  {
    config.mirrors = std::move(mirrors);
  }
  return {};
}

} // namespace ns_daemonconfig::ns_mirrors

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
