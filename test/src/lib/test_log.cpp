/**
 * @file test_log.cpp
 * @brief Unit tests for log.hpp logging utilities
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include "../../../src/lib/log.hpp"
#include "../test.hpp"

namespace fs = std::filesystem;

using ns_test::LogCapture;

TEST_CASE("ns_log::set_level and get_level")
{
  ns_log::Level old = ns_log::get_level();
  ns_log::set_level(ns_log::Level::DEBUG);
  CHECK(ns_log::get_level() == ns_log::Level::DEBUG);
  ns_log::set_level(ns_log::Level::WARN);
  CHECK(ns_log::get_level() == ns_log::Level::WARN);
  ns_log::set_level(old);
}

TEST_CASE("ns_log::set_sink_file creates the sink")
{
  ns_test::TempDir dir("log_sink");
  fs::path log_file = dir.path() / "ndc.log";
  ns_log::set_sink_file(log_file);
  CHECK(fs::exists(log_file));
  ns_log::set_sink_file("/dev/null");
}

TEST_CASE("ns_log::Location formats as file::line")
{
  ns_log::Location loc;
  auto formatted = loc.get();
  CHECK(formatted.starts_with("test_log.cpp::"));
}

TEST_CASE("Sink receives every level regardless of console verbosity")
{
  LogCapture capture;

  logger("D::Debug message");
  logger("I::Info message");
  logger("W::Warning message");
  logger("E::Error message");
  logger("C::Critical message");

  auto logs = capture.read_logs();
  REQUIRE(logs.size() == 5);
  CHECK(LogCapture::extract_log_message(logs[0]) == "D::Debug message");
  CHECK(LogCapture::extract_log_message(logs[1]) == "I::Info message");
  CHECK(LogCapture::extract_log_message(logs[2]) == "W::Warning message");
  CHECK(LogCapture::extract_log_message(logs[3]) == "E::Error message");
  CHECK(LogCapture::extract_log_message(logs[4]) == "C::Critical message");
}

TEST_CASE("Logger formats arguments")
{
  LogCapture capture;

  logger("I::Effective registry host is '{}' with {} mirrors", "index.docker.io", 2);

  auto logs = capture.read_logs();
  REQUIRE(logs.size() == 1);
  CHECK(LogCapture::extract_log_message(logs[0]) == "I::Effective registry host is 'index.docker.io' with 2 mirrors");
}

TEST_CASE("Logger strips new lines from messages")
{
  LogCapture capture;

  logger("W::first\nsecond");

  auto logs = capture.read_logs();
  REQUIRE(logs.size() == 1);
  CHECK(LogCapture::extract_log_message(logs[0]) == "W::firstsecond");
}

TEST_CASE("Logger quiet mode discards messages")
{
  LogCapture capture;

  logger("Q::This should be discarded");

  CHECK(capture.read_logs().empty());
}

TEST_CASE("Logger state is thread local")
{
  LogCapture capture;

  std::thread worker([]
  {
    // No sink is configured on this thread
    CHECK(ns_log::get_level() == ns_log::Level::CRITICAL);
    logger("I::Message from worker");
  });
  worker.join();
  logger("I::Message from main");

  auto logs = capture.read_logs();
  REQUIRE(logs.size() == 1);
  CHECK(LogCapture::extract_log_message(logs[0]) == "I::Message from main");
}

TEST_CASE("ns_log::level_from_string accepts level names in any case")
{
  CHECK(ns_log::level_from_string("debug") == ns_log::Level::DEBUG);
  CHECK(ns_log::level_from_string("INFO") == ns_log::Level::INFO);
  CHECK(ns_log::level_from_string("Warn") == ns_log::Level::WARN);
  CHECK(ns_log::level_from_string("error") == ns_log::Level::ERROR);
  CHECK(ns_log::level_from_string("critical") == ns_log::Level::CRITICAL);
  CHECK_FALSE(ns_log::level_from_string("verbose").has_value());
  CHECK_FALSE(ns_log::level_from_string("").has_value());
}

TEST_CASE("Console verbosity does not filter the sink")
{
  LogCapture capture;
  ns_log::set_level(ns_log::Level::CRITICAL);

  logger("D::Only in the sink");

  auto logs = capture.read_logs();
  REQUIRE(logs.size() == 1);
  CHECK(logs[0].starts_with("D::test_log.cpp::"));
}
