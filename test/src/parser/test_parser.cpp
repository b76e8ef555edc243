/**
 * @file test_parser.cpp
 * @brief Unit tests for the ndc command line parser and executor
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "../../../src/parser/executor.hpp"
#include "../../../src/parser/parser.hpp"
#include "../test.hpp"

using namespace ns_parser;
using namespace ns_parser::ns_interface;

namespace
{

// Owns the storage of an argv array
class Args
{
  private:
    std::vector<std::string> m_args;
    std::vector<char*> m_argv;
  public:
    Args(std::initializer_list<std::string> args)
      : m_args(args)
    {
      m_args.insert(m_args.begin(), "ndc");
      for(auto& arg : m_args) { m_argv.push_back(arg.data()); }
      m_argv.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(m_args.size()); }
    char** argv() { return m_argv.data(); }
};

Value<CmdType> parse_args(Args args)
{
  return ns_parser::parse(args.argc(), args.argv());
}

constexpr char const* TEMPLATE_REGISTRY = R"({
  "device": {"backend": {"type": "registry", "config": {"auth": "c3RhdGljOnNlY3JldA=="}}}
})";

} // namespace

TEST_CASE("parse_key_value splits on the first equal sign")
{
  ns_test::LogCapture capture;
  CHECK(parse_key_value("cache_dir=/var/cache").value() == std::make_pair(std::string{"cache_dir"}, std::string{"/var/cache"}));
  CHECK(parse_key_value("k=a=b").value().second == "a=b");
  CHECK(parse_key_value("empty=").value().second == "");
  CHECK_FALSE(parse_key_value("novalue").has_value());
  CHECK_FALSE(parse_key_value("=value").has_value());
}

TEST_CASE("parse redact")
{
  auto cmd = parse_args({"redact", "fusedev", "/etc/nydus/config.json"});
  REQUIRE(cmd.has_value());
  auto redact = std::get_if<CmdRedact>(&cmd.value());
  REQUIRE(redact != nullptr);
  CHECK(redact->driver == "fusedev");
  CHECK(redact->path_file_template == "/etc/nydus/config.json");
}

TEST_CASE("parse redact rejects missing and trailing arguments")
{
  ns_test::LogCapture capture;
  CHECK_FALSE(parse_args({"redact", "fusedev"}).has_value());
  CHECK_FALSE(parse_args({"redact", "fusedev", "a.json", "extra"}).has_value());
}

TEST_CASE("parse supplement with options")
{
  auto cmd = parse_args({"supplement", "fscache", "config.json", "ghcr.io/org/app:v1"
    , "--vpc"
    , "--snapshot", "42"
    , "--label", "containerd.io/snapshot/pull-username=alice"
    , "--param", "cache_dir=/var/cache"
    , "--param", "bootstrap=/snap/image.boot"
    , "--output", "/run/nydus/42.json"
  });
  REQUIRE(cmd.has_value());
  auto supplement = std::get_if<CmdSupplement>(&cmd.value());
  REQUIRE(supplement != nullptr);
  CHECK(supplement->driver == "fscache");
  CHECK(supplement->path_file_template == "config.json");
  CHECK(supplement->info.image_id == "ghcr.io/org/app:v1");
  CHECK(supplement->info.vpc_registry);
  CHECK(supplement->info.snapshot_id == "42");
  CHECK(supplement->info.labels.at("containerd.io/snapshot/pull-username") == "alice");
  CHECK(supplement->info.params.size() == 2);
  CHECK(supplement->info.params.at("bootstrap") == "/snap/image.boot");
  REQUIRE(supplement->path_file_output.has_value());
  CHECK(*supplement->path_file_output == "/run/nydus/42.json");
}

TEST_CASE("parse supplement defaults")
{
  auto cmd = parse_args({"supplement", "fusedev", "config.json", "busybox"});
  REQUIRE(cmd.has_value());
  auto supplement = std::get_if<CmdSupplement>(&cmd.value());
  REQUIRE(supplement != nullptr);
  CHECK_FALSE(supplement->info.vpc_registry);
  CHECK(supplement->info.labels.empty());
  CHECK_FALSE(supplement->path_file_output.has_value());
}

TEST_CASE("parse supplement rejects invalid options")
{
  ns_test::LogCapture capture;
  CHECK_FALSE(parse_args({"supplement", "fusedev", "config.json"}).has_value());
  CHECK_FALSE(parse_args({"supplement", "fusedev", "config.json", "busybox", "--unknown"}).has_value());
  CHECK_FALSE(parse_args({"supplement", "fusedev", "config.json", "busybox", "--snapshot"}).has_value());
  CHECK_FALSE(parse_args({"supplement", "fusedev", "config.json", "busybox", "--label", "novalue"}).has_value());
}

TEST_CASE("parse help and version")
{
  auto help = parse_args({"help"});
  REQUIRE(help.has_value());
  CHECK(std::get<CmdHelp>(help.value()).message == ns_cmd::ns_help::help_usage());

  auto help_supplement = parse_args({"help", "supplement"});
  REQUIRE(help_supplement.has_value());
  CHECK(std::get<CmdHelp>(help_supplement.value()).message.find("--snapshot") != std::string::npos);
  // The mirror file format is part of the usage
  CHECK(std::get<CmdHelp>(help_supplement.value()).message.find("<host>/hosts.json") != std::string::npos);
  CHECK(std::get<CmdHelp>(help_supplement.value()).message.find("hosts.toml files are not read") != std::string::npos);

  auto version = parse_args({"version"});
  REQUIRE(version.has_value());
  CHECK(std::holds_alternative<CmdVersion>(version.value()));
}

TEST_CASE("parse rejects unknown commands")
{
  ns_test::LogCapture capture;
  CHECK_FALSE(parse_args({}).has_value());
  CHECK_FALSE(parse_args({"mount"}).has_value());
  CHECK_FALSE(parse_args({"help", "mount"}).has_value());
}

TEST_CASE("execute_command writes the full configuration with --output")
{
  ns_test::LogCapture capture;
  ns_test::TempDir dir("executor");
  auto path_template = dir.write("config.json", TEMPLATE_REGISTRY);
  auto path_output = dir.path() / "out.json";
  ns_daemonconfig::Supplementer supplementer(dir.path() / "certs.d"
    , ns_auth::make_default(dir.path() / "docker.json")
    , std::make_unique<ns_registry::DefaultHostPolicy>()
  );

  Args args{"supplement", "fusedev", path_template.string(), "example.com/app", "--output", path_output.string()};
  auto ret = execute_command(supplementer, args.argc(), args.argv());
  REQUIRE(ret.has_value());
  CHECK(ret.value() == EXIT_SUCCESS);

  auto db = ns_db::read_file(path_output);
  REQUIRE(db.has_value());
  auto const& json = db->data();
  CHECK(json.at("device").at("backend").at("config").at("host") == "example.com");
  CHECK(json.at("device").at("backend").at("config").at("repo") == "app");
  CHECK(json.at("device").at("backend").at("config").at("auth") == "c3RhdGljOnNlY3JldA==");

  // Credentials are readable by the owner only
  auto perms = fs::status(path_output).permissions();
  CHECK((perms & fs::perms::owner_read) != fs::perms::none);
  CHECK((perms & fs::perms::owner_write) != fs::perms::none);
  CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
}

TEST_CASE("execute_command restricts an existing output file")
{
  ns_test::LogCapture capture;
  ns_test::TempDir dir("executor_existing");
  auto path_template = dir.write("config.json", TEMPLATE_REGISTRY);
  auto path_output = dir.write("out.json", "previous");
  fs::permissions(path_output, fs::perms::all, fs::perm_options::replace);
  ns_daemonconfig::Supplementer supplementer(dir.path() / "certs.d"
    , ns_auth::make_default(dir.path() / "docker.json")
    , std::make_unique<ns_registry::DefaultHostPolicy>()
  );

  Args args{"supplement", "fusedev", path_template.string(), "example.com/app", "--output", path_output.string()};
  REQUIRE(execute_command(supplementer, args.argc(), args.argv()).has_value());
  CHECK(fs::status(path_output).permissions() == (fs::perms::owner_read | fs::perms::owner_write));
  CHECK(ns_db::read_file(path_output).has_value());
}

TEST_CASE("execute_command propagates configuration errors")
{
  ns_test::LogCapture capture;
  ns_test::TempDir dir("executor_errors");
  ns_daemonconfig::Supplementer supplementer(dir.path()
    , ns_auth::make_default(dir.path() / "docker.json")
    , std::make_unique<ns_registry::DefaultHostPolicy>()
  );

  Args unsupported{"redact", "blockdev", (dir.path() / "config.json").string()};
  auto ret = execute_command(supplementer, unsupported.argc(), unsupported.argv());
  REQUIRE_FALSE(ret.has_value());
  CHECK(ret.error().starts_with("UNSUPPORTED_DRIVER"));

  Args missing{"redact", "fusedev", (dir.path() / "missing.json").string()};
  ret = execute_command(supplementer, missing.argc(), missing.argv());
  REQUIRE_FALSE(ret.has_value());
  CHECK(ret.error().starts_with("TEMPLATE_LOAD"));
}
