/**
 * @file supplement.hpp
 * @author Ruan Formigoni
 * @brief Completes a daemon configuration with data known at mount time
 *
 * The supplementer resolves the registry host of an image, rewrites it for private
 * network registries or the docker hub, loads the mirrors of that host and fills the
 * credentials. All calls of a supplementer run one at a time.
 *
 * @code
 * ns_daemonconfig::Supplementer supplementer("/etc/nydus/certs.d"
 *   , ns_auth::make_default(path_file_docker_config)
 *   , std::make_unique<ns_registry::DefaultHostPolicy>()
 * );
 * Pop(supplementer.supplement(config, SupplementInfo{ .image_id = "busybox:latest" }));
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "../auth/provider.hpp"
#include "../reference/reference.hpp"
#include "../registry/registry.hpp"
#include "daemonconfig.hpp"
#include "error.hpp"

namespace ns_daemonconfig
{

namespace
{

namespace fs = std::filesystem;

}

/**
 * @brief Data of a single mount or snapshot request
 */
struct SupplementInfo
{
  std::string image_id;
  std::string snapshot_id;
  bool vpc_registry = false;
  std::map<std::string,std::string> labels;
  std::map<std::string,std::string> params;
};

class Supplementer
{
  private:
    std::mutex m_mutex;
    // Only read inside the critical section
    fs::path m_path_dir_mirrors;
    std::unique_ptr<ns_auth::Provider> m_provider;
    std::unique_ptr<ns_registry::HostPolicy> m_policy;

    [[nodiscard]] std::string effective_host(std::string const& host, bool vpc_registry) const
    {
      return vpc_registry? m_policy->to_vpc(host) : m_policy->canonical(host);
    }

  public:
    Supplementer(fs::path path_dir_mirrors
      , std::unique_ptr<ns_auth::Provider> provider
      , std::unique_ptr<ns_registry::HostPolicy> policy)
      : m_mutex()
      , m_path_dir_mirrors(std::move(path_dir_mirrors))
      , m_provider(std::move(provider))
      , m_policy(std::move(policy))
    {}
    Supplementer(Supplementer const&) = delete;
    Supplementer& operator=(Supplementer const&) = delete;

    [[nodiscard]] fs::path const& path_dir_mirrors() const { return m_path_dir_mirrors; }

    /**
     * @brief Fills registry, mirror and credential data of a configuration
     *
     * Registry backends receive the effective host, its mirrors and the resolved
     * credentials. Localfs and oss backends are complete in the template and are left
     * untouched. Nothing is changed when the image cannot be parsed, the backend is unknown
     * or the mirrors cannot be loaded.
     *
     * @param config The configuration owned by the request
     * @param info The request data
     * @return Result<void> IMAGE_REFERENCE, UNSUPPORTED_BACKEND or MIRROR_UPDATE on failure
     */
    [[nodiscard]] Result<void> supplement(DaemonConfig& config, SupplementInfo const& info)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      // Registry host and repository of the image
      ns_reference::Reference reference = Pop(ns_error::lift(Kind::IMAGE_REFERENCE
        , ns_reference::parse(info.image_id)
        , std::format("parse image '{}'", info.image_id)
      ));
      BackendType type = config.storage_backend().first;
      switch(type)
      {
        case BackendType::REGISTRY:
        {
          std::string host = effective_host(reference.host, info.vpc_registry);
          logger("I::Effective registry host of '{}' is '{}'", info.image_id, host);
          Pop(config.update_mirrors(m_path_dir_mirrors, host));
          ns_auth::Keychain keychain = m_provider->get(host, info.image_id, info.labels);
          log_if(keychain.empty(), "I::No credentials found for '{}', keeping configured ones", host);
          config.supplement(host, reference.repo, info.snapshot_id, info.params);
          config.fill_auth(keychain);
        }
        break;
        case BackendType::LOCALFS:
        case BackendType::OSS:
        {
          logger("D::Backend '{}' is complete in the template", BackendType(type).lower());
        }
        break;
        case BackendType::NONE:
        {
          return Fail(Kind::UNSUPPORTED_BACKEND
            , "E::Unknown backend type '{}' for image '{}'"
            , config.backend_type_name()
            , info.image_id
          );
        }
      }
      return {};
    }
};

} // namespace ns_daemonconfig

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
