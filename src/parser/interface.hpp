/**
 * @file interface.hpp
 * @author Ruan Formigoni
 * @brief Interfaces of ndc commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "../daemonconfig/supplement.hpp"

namespace ns_parser::ns_interface
{

namespace
{

namespace fs = std::filesystem;

}

struct CmdRedact
{
  std::string driver;
  fs::path path_file_template;
};

struct CmdSupplement
{
  std::string driver;
  fs::path path_file_template;
  ns_daemonconfig::SupplementInfo info;
  std::optional<fs::path> path_file_output;
};

struct CmdHelp
{
  std::string message;
};

struct CmdVersion
{
};

using CmdType = std::variant<CmdRedact, CmdSupplement, CmdHelp, CmdVersion>;

} // namespace ns_parser::ns_interface

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
