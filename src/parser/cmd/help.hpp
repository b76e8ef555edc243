/**
 * @file help.hpp
 * @author Ruan Formigoni
 * @brief Help strings for ndc commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <vector>
#include <algorithm>

/**
 * @namespace ns_cmd::ns_help
 * @brief Usage text of every ndc command
 */
namespace ns_cmd::ns_help
{

class HelpEntry
{
  private:
    std::string m_msg;
    std::string m_name;
  public:
    HelpEntry(std::string const& name)
      : m_msg("ndc - Nydus daemon configuration\n")
      , m_name(name)
    {};
  HelpEntry& with_usage(std::string_view usage)
  {
    m_msg.append("Usage: ").append(usage).append("\n");
    return *this;
  }
  HelpEntry& with_example(std::string_view example)
  {
    m_msg.append("Example: ").append(example).append("\n");
    return *this;
  }
  HelpEntry& with_note(std::string_view note)
  {
    m_msg.append("Note: ").append(note).append("\n");
    return *this;
  }
  HelpEntry& with_description(std::string_view description)
  {
    m_msg.append(m_name).append(" : ").append(description).append("\n");
    return *this;
  }
  HelpEntry& with_args(std::vector<std::pair<std::string,std::string>> args)
  {
    std::ranges::for_each(args, [&](auto&& e)
    {
      m_msg += std::string{"  <"} + e.first + "> : " + e.second + '\n';
    });
    return *this;
  }
  std::string get()
  {
    return m_msg;
  }
};

inline std::string help_usage()
{
  return HelpEntry{"help"}
    .with_description("See usage details for specified command")
    .with_usage("ndc help <cmd>")
    .with_args({
      { "cmd", "Name of the command to display help details" },
    })
    .with_note("Available commands: {help,redact,supplement,version}")
    .with_example(R"(ndc help supplement)")
    .get();
}

inline std::string redact_usage()
{
  return HelpEntry{"redact"}
    .with_description("Print a daemon configuration template without its credentials")
    .with_usage("ndc redact <driver> <template>")
    .with_args({
      { "driver", "fusedev or fscache" },
      { "template", "Path to the json template of the daemon" },
    })
    .with_example(R"(ndc redact fusedev /etc/nydus/nydusd-config.fusedev.json)")
    .get();
}

inline std::string supplement_usage()
{
  return HelpEntry{"supplement"}
    .with_description("Complete a daemon configuration template for an image")
    .with_usage("ndc supplement <driver> <template> <image> [options...]")
    .with_args({
      { "driver", "fusedev or fscache" },
      { "template", "Path to the json template of the daemon" },
      { "image", "Image reference, e.g., docker.io/library/busybox:latest" },
      { "--vpc", "The registry is reached through its private network host" },
      { "--snapshot id", "Snapshot identifier" },
      { "--label k=v", "Snapshot label, may be repeated" },
      { "--param k=v", "Request parameter, may be repeated" },
      { "--output file", "Write the full configuration, credentials included, to file" },
    })
    .with_note("The configuration printed to stdout never contains credentials")
    .with_note("Registry mirrors are read from $NDC_MIRRORS_CONFIG_DIR/<host>/hosts.json"
      ", or $NDC_MIRRORS_CONFIG_DIR/_default/hosts.json, default directory /etc/nydus/certs.d")
    .with_note(R"(hosts.json is {"mirrors": [{"host": "http://mirror", "headers": {}, "ping_url": "",)"
      R"( "health_check_interval": 0, "failure_limit": 0}]}, hosts.toml files are not read)")
    .with_example(R"(ndc supplement fscache config.json ghcr.io/org/app:v1 --snapshot 42 --param cache_dir=/var/cache)")
    .get();
}

inline std::string version_usage()
{
  return HelpEntry{"version"}
    .with_description("Print the version of ndc")
    .with_usage("ndc version")
    .get();
}

} // namespace ns_cmd::ns_help

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
