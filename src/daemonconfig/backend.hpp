/**
 * @file backend.hpp
 * @author Ruan Formigoni
 * @brief Storage backend and device configuration
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../auth/keychain.hpp"
#include "../db/db.hpp"
#include "../std/enum.hpp"
#include "field.hpp"

namespace ns_daemonconfig::ns_backend
{

ENUM(BackendType, LOCALFS, OSS, REGISTRY);

/**
 * @brief Parses the backend discriminator of a template
 *
 * Names are matched exactly against the lower-case wire names, anything else is NONE.
 */
[[nodiscard]] inline BackendType backend_type_from_string(std::string_view str)
{
  BackendType type = BackendType::from_string(str).value_or(BackendType::NONE);
  return_if(type.lower() != str, BackendType{}, "W::Unknown backend type '{}'", str);
  return type;
}

struct MirrorConfig
{
  std::string host;
  std::map<std::string,std::string> headers;
  int health_check_interval = 0;
  uint8_t failure_limit = 0;
  std::string ping_url;
};

struct ProxyConfig
{
  std::string url;
  bool fallback = false;
  std::string ping_url;
  int check_interval = 0;
  bool use_http = false;
};

struct BackendConfig
{
  // Localfs
  std::string blob_file;
  std::string dir;
  bool readahead = false;
  int readahead_sec = 0;
  // Registry
  std::string host;
  std::string repo;
  std::string auth;
  std::string registry_token;
  std::string blob_url_scheme;
  std::string blob_redirected_host;
  std::vector<MirrorConfig> mirrors;
  // Oss
  std::string endpoint;
  std::string access_key_id;
  std::string access_key_secret;
  std::string bucket_name;
  std::string object_prefix;
  // Registry and oss
  std::string scheme;
  bool skip_verify = false;
  // All backends
  ProxyConfig proxy;
  int timeout = 0;
  int connect_timeout = 0;
  int retry_limit = 0;
};

struct Backend
{
  BackendType type;
  // Discriminator as written in the template, kept for unknown backends
  std::string type_name;
  BackendConfig config;
};

struct CacheConfig
{
  std::string work_dir;
  bool disable_indexed_map = false;
};

struct Cache
{
  std::string type;
  bool compressed = false;
  CacheConfig config;
};

struct DeviceConfig
{
  Backend backend;
  Cache cache;
};

inline ns_field::Fields fields(MirrorConfig const& mirror)
{
  using namespace ns_field;
  return {
      make("host", mirror.host, omitempty)
    , make("headers", mirror.headers, omitempty)
    , make("health_check_interval", mirror.health_check_interval, omitempty)
    , make("failure_limit", mirror.failure_limit, omitempty)
    , make("ping_url", mirror.ping_url, omitempty)
  };
}

inline ns_field::Fields fields(ProxyConfig const& proxy)
{
  using namespace ns_field;
  return {
      make("url", proxy.url, omitempty)
    , make("fallback", proxy.fallback)
    , make("ping_url", proxy.ping_url, omitempty)
    , make("check_interval", proxy.check_interval, omitempty)
    , make("use_http", proxy.use_http, omitempty)
  };
}

inline ns_field::Fields fields(BackendConfig const& config)
{
  using namespace ns_field;
  return {
      make("blob_file", config.blob_file, omitempty)
    , make("dir", config.dir, omitempty)
    , make("readahead", config.readahead)
    , make("readahead_sec", config.readahead_sec, omitempty)
    , make("host", config.host, omitempty)
    , make("repo", config.repo, omitempty)
    , make("auth", config.auth, secret)
    , make("registry_token", config.registry_token, secret)
    , make("blob_url_scheme", config.blob_url_scheme, omitempty)
    , make("blob_redirected_host", config.blob_redirected_host, omitempty)
    , make("mirrors", config.mirrors, omitempty)
    , make("endpoint", config.endpoint, omitempty)
    , make("access_key_id", config.access_key_id, secret)
    , make("access_key_secret", config.access_key_secret, secret)
    , make("bucket_name", config.bucket_name, omitempty)
    , make("object_prefix", config.object_prefix, omitempty)
    , make("scheme", config.scheme, omitempty)
    , make("skip_verify", config.skip_verify, omitempty)
    , make("proxy", config.proxy, omitempty)
    , make("timeout", config.timeout, omitempty)
    , make("connect_timeout", config.connect_timeout, omitempty)
    , make("retry_limit", config.retry_limit, omitempty)
  };
}

inline ns_field::Fields fields(Backend const& backend)
{
  using namespace ns_field;
  return { make("type", backend.type_name), make("config", backend.config) };
}

inline ns_field::Fields fields(CacheConfig const& config)
{
  using namespace ns_field;
  return {
      make("work_dir", config.work_dir)
    , make("disable_indexed_map", config.disable_indexed_map)
  };
}

inline ns_field::Fields fields(Cache const& cache)
{
  using namespace ns_field;
  return {
      make("type", cache.type)
    , make("compressed", cache.compressed, omitempty)
    , make("config", cache.config)
  };
}

inline ns_field::Fields fields(DeviceConfig const& device)
{
  using namespace ns_field;
  return { make("backend", device.backend), make("cache", device.cache) };
}

/**
 * @brief Reads a mirror entry, every member is optional
 */
[[nodiscard]] inline Value<MirrorConfig> deserialize_mirror(ns_db::Db const& db)
{
  MirrorConfig mirror;
  mirror.host = Pop(db.value_or<std::string>("host", ""));
  mirror.headers = Pop(db.value_or<std::map<std::string,std::string>>("headers", {}));
  mirror.health_check_interval = Pop(db.value_or<int>("health_check_interval", 0));
  mirror.failure_limit = Pop(db.value_or<uint8_t>("failure_limit", 0));
  mirror.ping_url = Pop(db.value_or<std::string>("ping_url", ""));
  return mirror;
}

[[nodiscard]] inline Value<std::vector<MirrorConfig>> deserialize_mirrors(ns_db::Db const& db)
{
  std::vector<MirrorConfig> mirrors;
  for(ns_db::Db const& entry : Pop(db.children("mirrors")))
  {
    mirrors.push_back(Pop(deserialize_mirror(entry), "D::Invalid mirror #{}", mirrors.size()));
  }
  return mirrors;
}

[[nodiscard]] inline Value<ProxyConfig> deserialize_proxy(ns_db::Db const& db)
{
  ProxyConfig proxy;
  proxy.url = Pop(db.value_or<std::string>("url", ""));
  proxy.fallback = Pop(db.value_or("fallback", false));
  proxy.ping_url = Pop(db.value_or<std::string>("ping_url", ""));
  proxy.check_interval = Pop(db.value_or("check_interval", 0));
  proxy.use_http = Pop(db.value_or("use_http", false));
  return proxy;
}

[[nodiscard]] inline Value<BackendConfig> deserialize_backend_config(ns_db::Db const& db)
{
  BackendConfig config;
  config.blob_file = Pop(db.value_or<std::string>("blob_file", ""));
  config.dir = Pop(db.value_or<std::string>("dir", ""));
  config.readahead = Pop(db.value_or("readahead", false));
  config.readahead_sec = Pop(db.value_or("readahead_sec", 0));
  config.host = Pop(db.value_or<std::string>("host", ""));
  config.repo = Pop(db.value_or<std::string>("repo", ""));
  config.auth = Pop(db.value_or<std::string>("auth", ""));
  config.registry_token = Pop(db.value_or<std::string>("registry_token", ""));
  config.blob_url_scheme = Pop(db.value_or<std::string>("blob_url_scheme", ""));
  config.blob_redirected_host = Pop(db.value_or<std::string>("blob_redirected_host", ""));
  config.mirrors = Pop(deserialize_mirrors(db));
  config.endpoint = Pop(db.value_or<std::string>("endpoint", ""));
  config.access_key_id = Pop(db.value_or<std::string>("access_key_id", ""));
  config.access_key_secret = Pop(db.value_or<std::string>("access_key_secret", ""));
  config.bucket_name = Pop(db.value_or<std::string>("bucket_name", ""));
  config.object_prefix = Pop(db.value_or<std::string>("object_prefix", ""));
  config.scheme = Pop(db.value_or<std::string>("scheme", ""));
  config.skip_verify = Pop(db.value_or("skip_verify", false));
  config.proxy = Pop(deserialize_proxy(Pop(db.child("proxy"))), "D::Invalid proxy section");
  config.timeout = Pop(db.value_or("timeout", 0));
  config.connect_timeout = Pop(db.value_or("connect_timeout", 0));
  config.retry_limit = Pop(db.value_or("retry_limit", 0));
  return config;
}

[[nodiscard]] inline Value<DeviceConfig> deserialize_device(ns_db::Db const& db)
{
  DeviceConfig device;
  // Backend
  ns_db::Db db_backend = Pop(db.child("backend"));
  device.backend.type_name = Pop(db_backend.value_or<std::string>("type", ""));
  device.backend.type = backend_type_from_string(device.backend.type_name);
  device.backend.config = Pop(deserialize_backend_config(Pop(db_backend.child("config")))
    , "D::Invalid backend configuration"
  );
  // Cache
  ns_db::Db db_cache = Pop(db.child("cache"));
  device.cache.type = Pop(db_cache.value_or<std::string>("type", ""));
  device.cache.compressed = Pop(db_cache.value_or("compressed", false));
  ns_db::Db db_cache_config = Pop(db_cache.child("config"));
  device.cache.config.work_dir = Pop(db_cache_config.value_or<std::string>("work_dir", ""));
  device.cache.config.disable_indexed_map = Pop(db_cache_config.value_or("disable_indexed_map", false));
  return device;
}

/**
 * @brief Copies resolved credentials into the backend
 *
 * An empty keychain leaves the configured credentials untouched. A token keychain sets
 * the registry token, any other keychain sets the basic authorization value.
 */
inline void fill_auth(BackendConfig& config, ns_auth::Keychain const& keychain)
{
  return_if(keychain.empty(),, "D::Empty keychain, keeping configured credentials");
  if(keychain.token_based())
  {
    config.registry_token = keychain.password;
  }
  else
  {
    config.auth = keychain.to_base64();
  }
}

} // namespace ns_daemonconfig::ns_backend

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
