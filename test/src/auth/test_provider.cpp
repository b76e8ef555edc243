/**
 * @file test_provider.cpp
 * @brief Unit tests for the credential providers
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

#include "../../../src/auth/provider.hpp"
#include "../test.hpp"

using ns_auth::Keychain;
using ns_auth::Labels;

TEST_CASE("Keychain classifies credentials")
{
  CHECK(Keychain{}.empty());
  CHECK_FALSE(Keychain{}.token_based());
  CHECK(Keychain{"", "token"}.token_based());
  CHECK_FALSE(Keychain{"user", "pass"}.token_based());
  CHECK_FALSE(Keychain{"user", ""}.empty());
}

TEST_CASE("Keychain::to_base64 encodes user:pass")
{
  CHECK(Keychain{"user", "pass"}.to_base64() == "dXNlcjpwYXNz");
}

TEST_CASE("LabelProvider reads the snapshot labels")
{
  ns_auth::LabelProvider provider;
  Labels labels{
      {"containerd.io/snapshot/pull-username", "alice"}
    , {"containerd.io/snapshot/pull-secret", "s3cret"}
  };

  Keychain keychain = provider.get("example.com", "example.com/app:v1", labels);
  CHECK(keychain.username == "alice");
  CHECK(keychain.password == "s3cret");
  CHECK(provider.get("example.com", "example.com/app:v1", {}).empty());
}

TEST_CASE("DockerConfigProvider decodes the auth field")
{
  ns_test::TempDir dir("docker_auth");
  auto path = dir.write("config.json", R"({"auths":{"example.com":{"auth":"dXNlcjpwYXNz"}}})");

  ns_auth::DockerConfigProvider provider(path);
  Keychain keychain = provider.get("example.com", "example.com/app", {});
  CHECK(keychain.username == "user");
  CHECK(keychain.password == "pass");
  CHECK(provider.get("other.com", "other.com/app", {}).empty());
}

TEST_CASE("DockerConfigProvider reads username and password fields")
{
  ns_test::TempDir dir("docker_userpass");
  auto path = dir.write("config.json", R"({"auths":{"https://registry.example.com":{"username":"bob","password":"pw"}}})");

  ns_auth::DockerConfigProvider provider(path);
  Keychain keychain = provider.get("registry.example.com", "registry.example.com/app", {});
  CHECK(keychain.username == "bob");
  CHECK(keychain.password == "pw");
}

TEST_CASE("DockerConfigProvider accepts the legacy docker hub key")
{
  ns_test::TempDir dir("docker_legacy");
  auto path = dir.write("config.json", R"({"auths":{"https://index.docker.io/v1/":{"auth":"aHViOnRva2Vu"}}})");

  ns_auth::DockerConfigProvider provider(path);
  Keychain keychain = provider.get("index.docker.io", "docker.io/library/busybox", {});
  CHECK(keychain.username == "hub");
  CHECK(keychain.password == "token");
}

TEST_CASE("DockerConfigProvider yields no credentials on missing or broken stores")
{
  ns_test::LogCapture capture;
  ns_test::TempDir dir("docker_broken");

  ns_auth::DockerConfigProvider missing(dir.path() / "missing.json");
  CHECK(missing.get("example.com", "example.com/app", {}).empty());

  auto path_broken = dir.write("broken.json", "{");
  ns_auth::DockerConfigProvider broken(path_broken);
  CHECK(broken.get("example.com", "example.com/app", {}).empty());

  auto path_bad_auth = dir.write("bad_auth.json", R"({"auths":{"example.com":{"auth":"bm9jb2xvbg=="}}})");
  ns_auth::DockerConfigProvider bad_auth(path_bad_auth);
  CHECK(bad_auth.get("example.com", "example.com/app", {}).empty());
  CHECK(capture.contents().find("W::") != std::string::npos);
}

TEST_CASE("make_default prefers labels over the docker config")
{
  ns_test::TempDir dir("docker_chain");
  auto path = dir.write("config.json", R"({"auths":{"example.com":{"auth":"dXNlcjpwYXNz"}}})");
  std::unique_ptr<ns_auth::Provider> provider = ns_auth::make_default(path);

  Labels labels{
      {"containerd.io/snapshot/pull-username", "alice"}
    , {"containerd.io/snapshot/pull-secret", "s3cret"}
  };
  CHECK(provider->get("example.com", "example.com/app", labels).username == "alice");
  CHECK(provider->get("example.com", "example.com/app", {}).username == "user");
  CHECK(provider->get("none.com", "none.com/app", {}).empty());
}
