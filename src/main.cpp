/**
 * @file main.cpp
 * @author Ruan Formigoni
 * @brief The ndc program
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#include <memory>
#include <string_view>

#include "config.hpp"
#include "lib/log.hpp"
#include "macro.hpp"
#include "parser/executor.hpp"
#include "std/expected.hpp"

/**
 * @brief Checks if the command only prints its own output
 */
[[nodiscard]] bool is_quiet_command(int argc, char** argv)
{
  return argc < 2
    or std::string_view{argv[1]} == "help"
    or std::string_view{argv[1]} == "version";
}

/**
 * @brief Loads the process configuration and runs the requested command
 *
 * The environment is read once, the supplementer is built from that configuration.
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return The return code of the process or an internal error '125'
 */
[[nodiscard]] Value<int> boot(int argc, char** argv)
{
  ns_config::Config config = Pop(ns_config::config(), "C::Failed to initialize configuration");
  ns_config::apply_logging(config, is_quiet_command(argc, argv));
  logger("D::Mirrors directory: '{}'", config.path_dir_mirrors.string());
  logger("D::Docker credential store: '{}'", config.path_file_docker_config.string());
  std::unique_ptr<ns_daemonconfig::Supplementer> supplementer = ns_config::make_supplementer(config);
  return Pop(ns_parser::execute_command(*supplementer, argc, argv));
}

/**
 * @brief Set the logger level before the configuration is read
 *
 * @param argc Argument count
 * @param argv Argument vector
 */
void set_logger_level(int argc, char** argv)
{
  // Force debug mode
  if(ns_env::exists("NDC_DEBUG", "1"))
  {
    ns_log::set_level(ns_log::Level::DEBUG);
    return;
  }
  // Help and version print only their output, otherwise warnings are shown
  ns_log::set_level(is_quiet_command(argc, argv)? ns_log::Level::CRITICAL : ns_log::Level::WARN);
}

/**
 * @brief Entry point for the ndc program
 *
 * @param argc Argument count
 * @param argv Argument vector
 * @return int Exit code (0 for success, 125 for failure)
 */
int main(int argc, char** argv)
{
  auto __expected_fn = [](auto&&){ return 125; };
  // Configure logger
  set_logger_level(argc, argv);
  // Make the version available to child processes
  ns_env::set("NDC_VERSION", NDC_VERSION, ns_env::Replace::Y);
  // Launch ndc
  return Pop(boot(argc, argv), "C::The program exited with an error");
}

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
