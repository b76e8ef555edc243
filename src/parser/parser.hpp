/**
 * @file parser.hpp
 * @author Ruan Formigoni
 * @brief Parses ndc commands
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <string>
#include <vector>

#include "../macro.hpp"
#include "../std/enum.hpp"
#include "interface.hpp"
#include "cmd/help.hpp"

/**
 * @namespace ns_parser
 * @brief ndc command parsing
 */
namespace ns_parser
{

ENUM(NdcCommand, HELP, REDACT, SUPPLEMENT, VERSION);

using namespace ns_parser::ns_interface;

/**
 * @brief Vector-based argument container with pop operations
 *
 * Wraps a vector of strings to provide convenient argument parsing
 * with formatted error messages.
 */
class VecArgs
{
  private:
    std::vector<std::string> m_data;
  public:
    /**
     * @brief Constructs a VecArgs from an iterator range
     * @param begin Beginning of the argument range
     * @param end End of the argument range
     */
    VecArgs(char** begin, char** end)
    {
      if(begin != end)
      {
        m_data = std::vector<std::string>(begin,end);
      }
    }

    /**
     * @brief Pops the front element with formatted error message
     * @tparam Format Error message format string
     * @tparam Ts Types of format arguments
     * @param ts Format arguments
     * @return Value containing the popped string or error
     */
    template<ns_string::static_string Format, typename... Ts>
    Value<std::string> pop_front(Ts&&... ts)
    {
      if(m_data.empty())
      {
        if constexpr (sizeof...(Ts) > 0)
        {
          return Error(Format, ns_string::to_string(ts)...);
        }
        else
        {
          return Error(Format.data);
        }
      }
      std::string item = m_data.front();
      m_data.erase(m_data.begin());
      return item;
    }

    std::vector<std::string> const& data()
    {
      return m_data;
    }

    bool empty()
    {
      return m_data.empty();
    }
};

/**
 * @brief Splits a key=value argument
 *
 * @param arg The argument, the key must not be empty
 * @return Value<std::pair<std::string,std::string>> Key and value or the respective error
 */
[[nodiscard]] inline Value<std::pair<std::string,std::string>> parse_key_value(std::string const& arg)
{
  auto pos = arg.find('=');
  return_if(pos == std::string::npos or pos == 0, Error("C::Expected key=value, got '{}'", arg));
  return std::make_pair(arg.substr(0, pos), arg.substr(pos+1));
}

/**
 * @brief Parses the command line
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return Value<CmdType> The parsed command or the respective error
 */
[[nodiscard]] inline Value<CmdType> parse(int argc, char** argv)
{
  VecArgs args(argv+1, argv+argc);

  NdcCommand cmd = Pop(NdcCommand::from_string(Pop(args.pop_front<"C::Missing command, see 'ndc help'">()))
    , "C::Invalid command"
  );

  switch(cmd)
  {
    case NdcCommand::REDACT:
    {
      CmdRedact cmd_redact;
      cmd_redact.driver = Pop(args.pop_front<"C::Missing driver for 'redact'">());
      cmd_redact.path_file_template = Pop(args.pop_front<"C::Missing template for 'redact'">());
      return_if(not args.empty(), Error("C::Trailing arguments for 'redact'"));
      return CmdType(cmd_redact);
    }

    case NdcCommand::SUPPLEMENT:
    {
      CmdSupplement cmd_supplement;
      cmd_supplement.driver = Pop(args.pop_front<"C::Missing driver for 'supplement'">());
      cmd_supplement.path_file_template = Pop(args.pop_front<"C::Missing template for 'supplement'">());
      cmd_supplement.info.image_id = Pop(args.pop_front<"C::Missing image for 'supplement'">());
      while(not args.empty())
      {
        std::string option = Pop(args.pop_front<"C::Missing option">());
        if(option == "--vpc")
        {
          cmd_supplement.info.vpc_registry = true;
        }
        else if(option == "--snapshot")
        {
          cmd_supplement.info.snapshot_id = Pop(args.pop_front<"C::Missing value for '--snapshot'">());
        }
        else if(option == "--label")
        {
          cmd_supplement.info.labels.insert(Pop(parse_key_value(Pop(args.pop_front<"C::Missing value for '--label'">()))));
        }
        else if(option == "--param")
        {
          cmd_supplement.info.params.insert(Pop(parse_key_value(Pop(args.pop_front<"C::Missing value for '--param'">()))));
        }
        else if(option == "--output")
        {
          cmd_supplement.path_file_output = Pop(args.pop_front<"C::Missing value for '--output'">());
        }
        else
        {
          return Error("C::Unknown option '{}' for 'supplement'", option);
        }
      }
      return CmdType(cmd_supplement);
    }

    case NdcCommand::HELP:
    {
      return_if(args.empty(), CmdType(CmdHelp{ns_cmd::ns_help::help_usage()}));
      NdcCommand topic = Pop(NdcCommand::from_string(Pop(args.pop_front<"C::Missing help topic">())), "C::Invalid help topic");
      switch(topic)
      {
        case NdcCommand::REDACT: return CmdType(CmdHelp{ns_cmd::ns_help::redact_usage()});
        case NdcCommand::SUPPLEMENT: return CmdType(CmdHelp{ns_cmd::ns_help::supplement_usage()});
        case NdcCommand::VERSION: return CmdType(CmdHelp{ns_cmd::ns_help::version_usage()});
        case NdcCommand::HELP: return CmdType(CmdHelp{ns_cmd::ns_help::help_usage()});
        case NdcCommand::NONE: return Error("C::Invalid help topic");
      }
      return Error("C::Invalid help topic");
    }

    case NdcCommand::VERSION:
    {
      return CmdType(CmdVersion{});
    }

    case NdcCommand::NONE: break;
  }

  return Error("C::Unknown command");
}

} // namespace ns_parser

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
