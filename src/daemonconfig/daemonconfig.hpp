/**
 * @file daemonconfig.hpp
 * @author Ruan Formigoni
 * @brief Daemon configuration of either supported driver
 *
 * A DaemonConfig is created from a template file for a driver, mutated by the supplementer
 * and then written for the daemon with dump_string(). Diagnostics go through redact().
 *
 * @code
 * using namespace ns_daemonconfig;
 * DaemonConfig config = Pop(create("fusedev", "/etc/nydus/nydusd-config.json"));
 * auto [type, backend] = config.storage_backend();
 * logger("I::Configuration: {}", Pop(config.redact().dump(-1)));
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <variant>

#include "../db/db.hpp"
#include "../std/enum.hpp"
#include "backend.hpp"
#include "error.hpp"
#include "fscache.hpp"
#include "fuse.hpp"

namespace ns_daemonconfig
{

namespace
{

namespace fs = std::filesystem;

}

ENUM(Driver, FSCACHE, FUSEDEV);

using ns_backend::BackendConfig;
using ns_backend::BackendType;
using ns_error::Kind;
using ns_error::Result;
using ns_fscache::FscacheDaemonConfig;
using ns_fuse::FuseDaemonConfig;

class DaemonConfig
{
  public:
    using variant_t = std::variant<FuseDaemonConfig, FscacheDaemonConfig>;
  private:
    variant_t m_config;
  public:
    explicit DaemonConfig(FuseDaemonConfig config) : m_config(std::move(config)) {}
    explicit DaemonConfig(FscacheDaemonConfig config) : m_config(std::move(config)) {}

    [[nodiscard]] Driver driver() const
    {
      return std::holds_alternative<FuseDaemonConfig>(m_config)? Driver::FUSEDEV : Driver::FSCACHE;
    }

    [[nodiscard]] variant_t& get() { return m_config; }
    [[nodiscard]] variant_t const& get() const { return m_config; }

    /**
     * @brief Stores registry derived data, repeated calls with the same input are no-ops
     */
    void supplement(std::string const& host
      , std::string const& repo
      , std::string const& snapshot_id
      , std::map<std::string,std::string> const& params)
    {
      std::visit([&](auto& config){ config.supplement(host, repo, snapshot_id, params); }, m_config);
    }

    /**
     * @brief Copies credentials into the backend, an empty keychain changes nothing
     */
    void fill_auth(ns_auth::Keychain const& keychain)
    {
      std::visit([&](auto& config){ config.fill_auth(keychain); }, m_config);
    }

    [[nodiscard]] std::pair<BackendType, BackendConfig*> storage_backend()
    {
      return std::visit([](auto& config){ return config.storage_backend(); }, m_config);
    }

    [[nodiscard]] std::pair<BackendType, BackendConfig const*> storage_backend() const
    {
      auto [type, backend] = const_cast<DaemonConfig*>(this)->storage_backend();
      return { type, backend };
    }

    /**
     * @brief Backend discriminator as written in the template
     */
    [[nodiscard]] std::string backend_type_name() const
    {
      return std::visit([]<typename T>(T const& config) -> std::string
      {
        if constexpr (std::same_as<T, FuseDaemonConfig>)
        {
          return config.device? config.device->backend.type_name : std::string{};
        }
        else
        {
          return config.config? config.config->backend_type_name : std::string{};
        }
      }, m_config);
    }

    /**
     * @brief Replaces the mirror list, the previous one is kept on failure
     */
    [[nodiscard]] Result<void> update_mirrors(fs::path const& path_dir_mirrors, std::string const& host)
    {
      return std::visit([&](auto& config){ return config.update_mirrors(path_dir_mirrors, host); }, m_config);
    }

    /**
     * @brief Full json serialization for the daemon, secrets included
     *
     * Never log this value, use redact() instead.
     */
    [[nodiscard]] Result<std::string> dump_string() const
    {
      return ns_error::lift(Kind::SERIALIZATION
        , std::visit([](auto const& config){ return ns_field::to_json(config).dump(-1); }, m_config)
        , std::format("serialize {} configuration", driver().lower())
      );
    }

    /**
     * @brief Serialization safe for logs, secrets and empty optional members are left out
     */
    [[nodiscard]] ns_db::Db redact() const
    {
      return std::visit([](auto const& config){ return ns_field::redact(config); }, m_config);
    }
};

/**
 * @brief Creates the configuration of a driver from a template file
 *
 * @param str_driver Driver name, "fusedev" or "fscache"
 * @param path_file_template The json template
 * @return Result<DaemonConfig> The configuration, UNSUPPORTED_DRIVER or TEMPLATE_LOAD
 */
[[nodiscard]] inline Result<DaemonConfig> create(std::string_view str_driver, fs::path const& path_file_template)
{
  Driver driver = Driver::from_string(str_driver).value_or(Driver::NONE);
  if(driver == Driver::NONE or driver.lower() != str_driver)
  {
    return Fail(Kind::UNSUPPORTED_DRIVER, "E::Unsupported fs driver '{}'", str_driver);
  }
  auto f_load = [&] -> Value<DaemonConfig>
  {
    ns_db::Db db = Pop(ns_db::read_file(path_file_template));
    switch(driver)
    {
      case Driver::FUSEDEV: return DaemonConfig(Pop(ns_fuse::deserialize(db)));
      case Driver::FSCACHE: return DaemonConfig(Pop(ns_fscache::deserialize(db)));
      case Driver::NONE: break;
    }
    return Error("C::Unreachable driver");
  };
  DaemonConfig config = Pop(ns_error::lift(Kind::TEMPLATE_LOAD
    , f_load()
    , std::format("load {} template '{}'", driver.lower(), path_file_template.string())
  ));
  logger("D::Loaded {} template '{}'", driver.lower(), path_file_template.string());
  return config;
}

} // namespace ns_daemonconfig

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
