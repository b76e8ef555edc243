/**
 * @file test_enum.cpp
 * @brief Unit tests for enum.hpp custom enumeration system
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "../../../src/std/enum.hpp"

ENUM(Backend, LOCALFS, OSS, REGISTRY);
ENUM(Mode, DIRECT, CACHED);

TEST_CASE("ENUM includes NONE as default value")
{
  Backend backend;

  CHECK(backend == Backend::NONE);
  CHECK(std::string(backend) == "NONE");
}

TEST_CASE("ENUM converts to upper and lower case strings")
{
  Backend registry = Backend::REGISTRY;

  CHECK(std::string(registry) == "REGISTRY");
  CHECK(registry.lower() == "registry");
  CHECK(Backend(Backend::LOCALFS).lower() == "localfs");
}

TEST_CASE("ENUM from_string is case-insensitive")
{
  auto lower = Backend::from_string("oss");
  auto mixed = Backend::from_string("OsS");

  REQUIRE(lower.has_value());
  REQUIRE(mixed.has_value());
  CHECK(lower.value() == Backend::OSS);
  CHECK(mixed.value() == Backend::OSS);
}

TEST_CASE("ENUM from_string rejects unknown names and NONE")
{
  auto unknown = Backend::from_string("s3");
  auto none = Backend::from_string("none");
  auto empty = Backend::from_string("");

  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error() == "Invalid value 's3' for Backend");
  CHECK_FALSE(none.has_value());
  CHECK_FALSE(empty.has_value());
}

TEST_CASE("ENUM size member reflects number of values")
{
  // LOCALFS, OSS, REGISTRY, NONE
  CHECK(Backend::size == 4);
  CHECK(Mode::size == 3);
}

TEST_CASE("ENUM supports ordering and switch")
{
  Backend localfs = Backend::LOCALFS;
  Backend registry = Backend::REGISTRY;
  CHECK(localfs < registry);

  auto f_name = [](Backend backend) -> std::string
  {
    switch(backend)
    {
      case Backend::LOCALFS: return "file";
      case Backend::OSS: return "object";
      case Backend::REGISTRY: return "http";
      case Backend::NONE: return "unknown";
    }
    return "";
  };
  CHECK(f_name(registry) == "http");
  CHECK(f_name(Backend{}) == "unknown");
}

TEST_CASE("ENUM copy and get")
{
  Mode original = Mode::CACHED;
  Mode copy = original;

  CHECK(copy.get() == Mode::enum_t::CACHED);
  Mode::enum_t underlying = copy;
  CHECK(underlying == Mode::CACHED);
}
