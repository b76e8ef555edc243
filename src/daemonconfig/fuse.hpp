/**
 * @file fuse.hpp
 * @author Ruan Formigoni
 * @brief Configuration of the fusedev daemon
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "backend.hpp"
#include "error.hpp"
#include "mirrors.hpp"
#include "prefetch.hpp"

namespace ns_daemonconfig::ns_fuse
{

namespace
{

namespace fs = std::filesystem;

}

using ns_backend::BackendConfig;
using ns_backend::BackendType;
using ns_backend::DeviceConfig;
using ns_error::Kind;
using ns_error::Result;

/**
 * @brief Template of a FUSE daemon, a single device with its backend and cache
 */
struct FuseDaemonConfig
{
  std::optional<DeviceConfig> device;
  std::string mode;
  bool digest_validate = false;
  bool iostats_files = false;
  bool enable_xattr = false;
  bool access_pattern = false;
  bool latest_read_files = false;
  int amplify_io = 0;
  ns_prefetch::FsPrefetch fs_prefetch;

  /**
   * @brief Stores the registry location, the snapshot id and parameters are not used
   */
  void supplement(std::string const& host
    , std::string const& repo
    , [[maybe_unused]] std::string const& snapshot_id
    , [[maybe_unused]] std::map<std::string,std::string> const& params)
  {
    if(not device)
    {
      device.emplace();
    }
    device->backend.config.host = host;
    device->backend.config.repo = repo;
  }

  void fill_auth(ns_auth::Keychain const& keychain)
  {
    return_if(not device,);
    ns_backend::fill_auth(device->backend.config, keychain);
  }

  /**
   * @brief Backend kind and settings, NONE without a device
   */
  [[nodiscard]] std::pair<BackendType, BackendConfig*> storage_backend()
  {
    return_if(not device, std::make_pair(BackendType{}, nullptr));
    return { device->backend.type, &device->backend.config };
  }

  [[nodiscard]] Result<void> update_mirrors(fs::path const& path_dir_mirrors, std::string const& host)
  {
    return_if(not device, {});
    return ns_error::lift(Kind::MIRROR_UPDATE
      , ns_mirrors::update_mirrors(device->backend.config, path_dir_mirrors, host)
      , std::format("update mirrors of '{}'", host)
    );
  }
};

inline ns_field::Fields fields(FuseDaemonConfig const& config)
{
  using namespace ns_field;
  return {
      make("device", config.device, omitempty)
    , make("mode", config.mode, omitempty)
    , make("digest_validate", config.digest_validate)
    , make("iostats_files", config.iostats_files, omitempty)
    , make("enable_xattr", config.enable_xattr, omitempty)
    , make("access_pattern", config.access_pattern, omitempty)
    , make("latest_read_files", config.latest_read_files, omitempty)
    , make("amplify_io", config.amplify_io, omitempty)
    , make("fs_prefetch", config.fs_prefetch, omitempty)
  };
}

/**
 * @brief Reads a fusedev template
 */
[[nodiscard]] inline Value<FuseDaemonConfig> deserialize(ns_db::Db const& db)
{
  return_if(not db.data().is_object(), Error("D::Fusedev configuration is not a json object"));
  FuseDaemonConfig config;
  if(auto it = db.data().find("device"); it != db.data().end() and not it->is_null())
  {
    config.device = Pop(ns_backend::deserialize_device(Pop(db.child("device"))), "D::Invalid device section");
  }
  config.mode = Pop(db.value_or<std::string>("mode", ""));
  config.digest_validate = Pop(db.value_or("digest_validate", false));
  config.iostats_files = Pop(db.value_or("iostats_files", false));
  config.enable_xattr = Pop(db.value_or("enable_xattr", false));
  config.access_pattern = Pop(db.value_or("access_pattern", false));
  config.latest_read_files = Pop(db.value_or("latest_read_files", false));
  config.amplify_io = Pop(db.value_or("amplify_io", 0));
  config.fs_prefetch = Pop(ns_prefetch::deserialize(Pop(db.child("fs_prefetch"))), "D::Invalid fs_prefetch section");
  return config;
}

} // namespace ns_daemonconfig::ns_fuse

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
