/**
 * @file registry.hpp
 * @author Ruan Formigoni
 * @brief Registry host rewriting policies
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <string_view>

#include "../std/string.hpp"

namespace ns_registry
{

inline constexpr std::string_view SUFFIX_VPC = "-vpc";
inline constexpr std::string_view HOST_DOCKER = "docker.io";
inline constexpr std::string_view HOST_DOCKER_API = "index.docker.io";

/**
 * @brief Maps a parsed registry host to the host used for mirrors and credentials
 */
class HostPolicy
{
  public:
    virtual ~HostPolicy() = default;
    /**
     * @brief Private network equivalent of a public registry host
     */
    [[nodiscard]] virtual std::string to_vpc(std::string_view host) const = 0;
    /**
     * @brief Host that serves the registry api for a user facing domain
     */
    [[nodiscard]] virtual std::string canonical(std::string_view host) const = 0;
};

/**
 * @brief Appends -vpc to the first dns label and serves docker.io from index.docker.io
 */
class DefaultHostPolicy final : public HostPolicy
{
  public:
    [[nodiscard]] std::string to_vpc(std::string_view host) const override
    {
      std::vector<std::string> labels = ns_string::split(host, '.');
      if(labels.empty() or labels.front().ends_with(SUFFIX_VPC))
      {
        return std::string{host};
      }
      labels.front() += SUFFIX_VPC;
      return ns_string::join(labels, ".");
    }

    [[nodiscard]] std::string canonical(std::string_view host) const override
    {
      return (host == HOST_DOCKER)? std::string{HOST_DOCKER_API} : std::string{host};
    }
};

} // namespace ns_registry

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
