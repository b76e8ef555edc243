/**
 * @file fscache.hpp
 * @author Ruan Formigoni
 * @brief Configuration of the fscache daemon
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

namespace ns_daemonconfig::ns_fscache
{

namespace
{

namespace fs = std::filesystem;

}

using ns_backend::BackendConfig;
using ns_backend::BackendType;
using ns_error::Kind;
using ns_error::Result;

// Request parameters read by supplement()
inline constexpr std::string_view PARAM_CACHE_DIR = "cache_dir";
inline constexpr std::string_view PARAM_BOOTSTRAP = "bootstrap";

struct CacheConfig
{
  std::string work_dir;
};

struct BlobConfig
{
  BackendType backend_type;
  // Discriminator as written in the template, kept for unknown backends
  std::string backend_type_name;
  BackendConfig backend_config;
  std::string cache_type;
  CacheConfig cache_config;
  std::string metadata_path;
};

/**
 * @brief Template of an fscache daemon, one blob per snapshot
 */
struct FscacheDaemonConfig
{
  std::string type;
  std::string id;
  std::string domain_id;
  std::optional<BlobConfig> config;
  ns_prefetch::FsPrefetch fs_prefetch;

  /**
   * @brief Stores the registry location and the snapshot paths
   *
   * Empty host or repo values keep the configured ones. The cache directory and the
   * bootstrap path come from the `cache_dir` and `bootstrap` parameters when present.
   */
  void supplement(std::string const& host
    , std::string const& repo
    , std::string const& snapshot_id
    , std::map<std::string,std::string> const& params)
  {
    if(not config)
    {
      config.emplace();
    }
    if(not host.empty())
    {
      config->backend_config.host = host;
    }
    if(not repo.empty())
    {
      config->backend_config.repo = repo;
    }
    id = snapshot_id;
    if(auto it = params.find(std::string{PARAM_CACHE_DIR}); it != params.end())
    {
      config->cache_config.work_dir = it->second;
    }
    if(auto it = params.find(std::string{PARAM_BOOTSTRAP}); it != params.end())
    {
      config->metadata_path = it->second;
    }
  }

  void fill_auth(ns_auth::Keychain const& keychain)
  {
    return_if(not config,);
    ns_backend::fill_auth(config->backend_config, keychain);
  }

  [[nodiscard]] std::pair<BackendType, BackendConfig*> storage_backend()
  {
    return_if(not config, std::make_pair(BackendType{}, nullptr));
    return { config->backend_type, &config->backend_config };
  }

  [[nodiscard]] Result<void> update_mirrors(fs::path const& path_dir_mirrors, std::string const& host)
  {
    return_if(not config, {});
    return ns_error::lift(Kind::MIRROR_UPDATE
      , ns_mirrors::update_mirrors(config->backend_config, path_dir_mirrors, host)
      , std::format("update mirrors of '{}'", host)
    );
  }
};

inline ns_field::Fields fields(CacheConfig const& config)
{
  using namespace ns_field;
  return { make("work_dir", config.work_dir) };
}

inline ns_field::Fields fields(BlobConfig const& config)
{
  using namespace ns_field;
  return {
      make("backend_type", config.backend_type_name)
    , make("backend_config", config.backend_config)
    , make("cache_type", config.cache_type)
    , make("cache_config", config.cache_config)
    , make("metadata_path", config.metadata_path)
  };
}

inline ns_field::Fields fields(FscacheDaemonConfig const& config)
{
  using namespace ns_field;
  return {
      make("type", config.type)
    , make("id", config.id)
    , make("domain_id", config.domain_id)
    , make("config", config.config)
    , make("fs_prefetch", config.fs_prefetch, omitempty)
  };
}

/**
 * @brief Reads an fscache template
 */
[[nodiscard]] inline Value<FscacheDaemonConfig> deserialize(ns_db::Db const& db)
{
  return_if(not db.data().is_object(), Error("D::Fscache configuration is not a json object"));
  FscacheDaemonConfig config;
  config.type = Pop(db.value_or<std::string>("type", ""));
  config.id = Pop(db.value_or<std::string>("id", ""));
  config.domain_id = Pop(db.value_or<std::string>("domain_id", ""));
  if(auto it = db.data().find("config"); it != db.data().end() and not it->is_null())
  {
    ns_db::Db db_config = Pop(db.child("config"));
    BlobConfig blob;
    blob.backend_type_name = Pop(db_config.value_or<std::string>("backend_type", ""));
    blob.backend_type = ns_backend::backend_type_from_string(blob.backend_type_name);
    blob.backend_config = Pop(ns_backend::deserialize_backend_config(Pop(db_config.child("backend_config")))
      , "D::Invalid backend configuration"
    );
    blob.cache_type = Pop(db_config.value_or<std::string>("cache_type", ""));
    blob.cache_config.work_dir = Pop(Pop(db_config.child("cache_config")).value_or<std::string>("work_dir", ""));
    blob.metadata_path = Pop(db_config.value_or<std::string>("metadata_path", ""));
    config.config = std::move(blob);
  }
  config.fs_prefetch = Pop(ns_prefetch::deserialize(Pop(db.child("fs_prefetch"))), "D::Invalid fs_prefetch section");
  return config;
}

} // namespace ns_daemonconfig::ns_fscache

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
