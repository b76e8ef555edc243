/**
 * @file provider.hpp
 * @author Ruan Formigoni
 * @brief Resolves registry credentials for an image
 *
 * Credentials come from the snapshot labels first, then from the docker credential store.
 * Providers never fail, a missing or unreadable source yields an empty keychain.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../db/db.hpp"
#include "../lib/base64.hpp"
#include "keychain.hpp"

namespace ns_auth
{

namespace
{

namespace fs = std::filesystem;

}

using Labels = std::map<std::string,std::string>;

inline constexpr std::string_view LABEL_USERNAME = "containerd.io/snapshot/pull-username";
inline constexpr std::string_view LABEL_SECRET = "containerd.io/snapshot/pull-secret";
inline constexpr std::string_view HOST_DOCKER_API = "index.docker.io";
inline constexpr std::string_view KEY_DOCKER_LEGACY = "https://index.docker.io/v1/";

class Provider
{
  public:
    virtual ~Provider() = default;
    [[nodiscard]] virtual Keychain get(std::string const& host
      , std::string const& image
      , Labels const& labels) const = 0;
};

/**
 * @brief Credentials passed by the container runtime as snapshot labels
 */
class LabelProvider final : public Provider
{
  public:
    [[nodiscard]] Keychain get([[maybe_unused]] std::string const& host
      , [[maybe_unused]] std::string const& image
      , Labels const& labels) const override
    {
      auto f_label = [&](std::string_view key)
      {
        auto it = labels.find(std::string{key});
        return (it != labels.end())? it->second : std::string{};
      };
      return Keychain{ .username = f_label(LABEL_USERNAME), .password = f_label(LABEL_SECRET) };
    }
};

/**
 * @brief Credentials of the docker credential store (config.json)
 *
 * Entries are matched by host, by https://host and, for the docker hub, by the legacy
 * https://index.docker.io/v1/ key. An entry holds either `auth` (base64 of user:pass) or
 * `username` and `password`.
 */
class DockerConfigProvider final : public Provider
{
  private:
    fs::path m_path_file_config;

    [[nodiscard]] Value<Keychain> read(std::string const& host) const
    {
      return_if(not Try(fs::exists(m_path_file_config)), Keychain{});
      ns_db::Db db = Pop(ns_db::read_file(m_path_file_config));
      ns_db::Db db_auths = Pop(db.child("auths"));
      std::vector<std::string> keys{ host, std::format("https://{}", host) };
      if(host == HOST_DOCKER_API)
      {
        keys.push_back(std::string{KEY_DOCKER_LEGACY});
      }
      for(std::string const& key : keys)
      {
        continue_if(not db_auths.contains(key));
        ns_db::Db db_entry = Pop(db_auths.child(key));
        std::string auth = Pop(db_entry.value_or<std::string>("auth", ""));
        if(not auth.empty())
        {
          std::string decoded = Pop(ns_base64::decode(auth), "D::Invalid auth value for '{}'", key);
          auto pos = decoded.find(':');
          return_if(pos == std::string::npos, Error("D::Auth value for '{}' is not user:pass", key));
          return Keychain{ .username = decoded.substr(0, pos), .password = decoded.substr(pos+1) };
        }
        return Keychain{
            .username = Pop(db_entry.value_or<std::string>("username", ""))
          , .password = Pop(db_entry.value_or<std::string>("password", ""))
        };
      }
      return Keychain{};
    }

  public:
    explicit DockerConfigProvider(fs::path path_file_config)
      : m_path_file_config(std::move(path_file_config))
    {}

    [[nodiscard]] Keychain get(std::string const& host
      , [[maybe_unused]] std::string const& image
      , [[maybe_unused]] Labels const& labels) const override
    {
      Value<Keychain> keychain = read(host);
      log_if(not keychain, "W::Ignoring credential store '{}': {}", m_path_file_config.string(), keychain.error());
      return keychain.or_default();
    }
};

/**
 * @brief Asks each provider in order, the first non-empty keychain wins
 */
class ChainProvider final : public Provider
{
  private:
    std::vector<std::unique_ptr<Provider>> m_providers;
  public:
    explicit ChainProvider(std::vector<std::unique_ptr<Provider>> providers)
      : m_providers(std::move(providers))
    {}

    [[nodiscard]] Keychain get(std::string const& host
      , std::string const& image
      , Labels const& labels) const override
    {
      for(auto const& provider : m_providers)
      {
        Keychain keychain = provider->get(host, image, labels);
        return_if(not keychain.empty(), keychain);
      }
      return Keychain{};
    }
};

/**
 * @brief Labels first, then the docker credential store
 */
[[nodiscard]] inline std::unique_ptr<Provider> make_default(fs::path const& path_file_docker_config)
{
  std::vector<std::unique_ptr<Provider>> providers;
  providers.push_back(std::make_unique<LabelProvider>());
  providers.push_back(std::make_unique<DockerConfigProvider>(path_file_docker_config));
  return std::make_unique<ChainProvider>(std::move(providers));
}

} // namespace ns_auth

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
