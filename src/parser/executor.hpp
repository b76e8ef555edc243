/**
 * @file executor.hpp
 * @author Ruan Formigoni
 * @brief Executes parsed ndc commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <print>
#include <string>

#include "../config.hpp"
#include "../daemonconfig/daemonconfig.hpp"
#include "../db/db.hpp"
#include "../daemonconfig/supplement.hpp"
#include "../macro.hpp"
#include "interface.hpp"
#include "parser.hpp"

namespace ns_parser
{

namespace
{

namespace fs = std::filesystem;

/**
 * @brief Converts a typed failure into the string error of the command line layer
 */
template<typename T>
Value<T> flatten(ns_daemonconfig::ns_error::Result<T>&& result)
{
  if(not result)
  {
    return std::unexpected(ns_string::to_string(result.error()));
  }
  if constexpr (std::is_void_v<T>)
  {
    return Value<T>{};
  }
  else
  {
    return Value<T>(std::move(result).value());
  }
}

// The full configuration holds credentials, only its owner may read it
constexpr fs::perms PERMS_DUMP = fs::perms::owner_read | fs::perms::owner_write;

} // namespace

using namespace ns_parser::ns_interface;

/**
 * @brief Executes a parsed ndc command
 *
 * @param supplementer The supplementer shared by the process
 * @param argc Argument count
 * @param argv Argument vector
 * @return Value<int> The exit code or the respective error
 */
[[nodiscard]] inline Value<int> execute_command(ns_daemonconfig::Supplementer& supplementer, int argc, char** argv)
{
  CmdType variant_cmd = Pop(ns_parser::parse(argc, argv), "C::Could not parse arguments");

  if(auto cmd = std::get_if<CmdRedact>(&variant_cmd))
  {
    ns_daemonconfig::DaemonConfig config = Pop(flatten(ns_daemonconfig::create(cmd->driver, cmd->path_file_template)));
    std::println("{}", Pop(config.redact().dump()));
  }
  else if(auto cmd = std::get_if<CmdSupplement>(&variant_cmd))
  {
    ns_daemonconfig::DaemonConfig config = Pop(flatten(ns_daemonconfig::create(cmd->driver, cmd->path_file_template)));
    Pop(flatten(supplementer.supplement(config, cmd->info)), "C::Could not supplement '{}'", cmd->info.image_id);
    if(cmd->path_file_output)
    {
      Pop(ns_db::write_file(*cmd->path_file_output, Pop(flatten(config.dump_string())), PERMS_DUMP));
      logger("I::Wrote daemon configuration to '{}'", cmd->path_file_output->string());
    }
    std::println("{}", Pop(config.redact().dump()));
  }
  else if(auto cmd = std::get_if<CmdHelp>(&variant_cmd))
  {
    std::print("{}", cmd->message);
  }
  else if(std::get_if<CmdVersion>(&variant_cmd))
  {
    std::println("{}", NDC_VERSION);
  }
  else
  {
    return Error("C::Unknown command");
  }

  return EXIT_SUCCESS;
}

} // namespace ns_parser

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
