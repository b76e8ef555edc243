/**
 * @file test_supplement.cpp
 * @brief Unit tests for the supplementation of daemon configurations
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../../../src/daemonconfig/supplement.hpp"
#include "../test.hpp"

using namespace ns_daemonconfig;
using ns_backend::BackendType;

namespace
{

constexpr char const* TEMPLATE_REGISTRY = R"({
  "device": {
    "backend": {"type": "registry", "config": {"scheme": "https", "auth": "c3RhdGljOnNlY3JldA=="}},
    "cache": {"type": "blobcache"}
  }
})";

constexpr char const* TEMPLATE_FSCACHE = R"({
  "type": "bootstrap",
  "config": {"backend_type": "registry", "backend_config": {"scheme": "https"}, "cache_type": "fscache"}
})";

// Credentials keyed by host, records every lookup
class MapProvider final : public ns_auth::Provider
{
  private:
    std::map<std::string, ns_auth::Keychain> m_keychains;
  public:
    mutable std::vector<std::string> hosts;

    explicit MapProvider(std::map<std::string, ns_auth::Keychain> keychains)
      : m_keychains(std::move(keychains))
    {}

    ns_auth::Keychain get(std::string const& host
      , [[maybe_unused]] std::string const& image
      , [[maybe_unused]] ns_auth::Labels const& labels) const override
    {
      hosts.push_back(host);
      auto it = m_keychains.find(host);
      return (it != m_keychains.end())? it->second : ns_auth::Keychain{};
    }
};

struct Fixture
{
  ns_test::TempDir dir{"supplement"};
  MapProvider* provider = nullptr;
  std::unique_ptr<Supplementer> supplementer;

  explicit Fixture(std::map<std::string, ns_auth::Keychain> keychains = {})
  {
    auto ptr_provider = std::make_unique<MapProvider>(std::move(keychains));
    provider = ptr_provider.get();
    supplementer = std::make_unique<Supplementer>(dir.path() / "certs.d"
      , std::move(ptr_provider)
      , std::make_unique<ns_registry::DefaultHostPolicy>()
    );
  }

  DaemonConfig load(std::string const& driver, std::string const& contents)
  {
    auto path = dir.write("templates/" + driver + ".json", contents);
    return create(driver, path).value();
  }
};

ns_backend::BackendConfig const& backend_of(DaemonConfig const& config)
{
  return *config.storage_backend().second;
}

} // namespace

TEST_CASE("Docker hub images use the canonical api host and its mirrors")
{
  Fixture fixture;
  fixture.dir.write("certs.d/index.docker.io/hosts.json", R"({"mirrors": [{"host": "http://hub-mirror"}]})");
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);

  auto result = fixture.supplementer->supplement(config, SupplementInfo{.image_id = "busybox"});
  REQUIRE(result.has_value());

  CHECK(backend_of(config).host == "index.docker.io");
  CHECK(backend_of(config).repo == "library/busybox");
  REQUIRE(backend_of(config).mirrors.size() == 1);
  CHECK(backend_of(config).mirrors[0].host == "http://hub-mirror");
  CHECK(fixture.provider->hosts == std::vector<std::string>{"index.docker.io"});
}

TEST_CASE("Private registries keep their host")
{
  Fixture fixture;
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);

  REQUIRE(fixture.supplementer->supplement(config, {.image_id = "registry.example.com/team/app:v1"}).has_value());
  CHECK(backend_of(config).host == "registry.example.com");
  CHECK(backend_of(config).repo == "team/app");
}

TEST_CASE("VPC registries use the private network host")
{
  Fixture fixture;
  fixture.dir.write("certs.d/registry-vpc.example.com/hosts.json", R"({"mirrors": [{"host": "http://vpc-mirror"}]})");
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);

  SupplementInfo info{.image_id = "registry.example.com/team/app:v1", .vpc_registry = true};
  REQUIRE(fixture.supplementer->supplement(config, info).has_value());
  CHECK(backend_of(config).host == "registry-vpc.example.com");
  REQUIRE(backend_of(config).mirrors.size() == 1);
  CHECK(backend_of(config).mirrors[0].host == "http://vpc-mirror");
  CHECK(fixture.provider->hosts == std::vector<std::string>{"registry-vpc.example.com"});
}

TEST_CASE("Supplement is idempotent")
{
  Fixture fixture({{"example.com", ns_auth::Keychain{"user", "pass"}}});
  fixture.dir.write("certs.d/example.com/hosts.json", R"({"mirrors": [{"host": "http://m1"}, {"host": "http://m2"}]})");
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);
  SupplementInfo info{.image_id = "example.com/app:v1", .snapshot_id = "snap"};

  REQUIRE(fixture.supplementer->supplement(config, info).has_value());
  std::string first = config.dump_string().value();
  REQUIRE(fixture.supplementer->supplement(config, info).has_value());
  CHECK(config.dump_string().value() == first);
  CHECK(backend_of(config).mirrors.size() == 2);
}

TEST_CASE("Credentials are filled from the provider")
{
  Fixture fixture({
      {"example.com", ns_auth::Keychain{"user", "pass"}}
    , {"token.io", ns_auth::Keychain{"", "bearer"}}
  });

  DaemonConfig basic = fixture.load("fusedev", TEMPLATE_REGISTRY);
  REQUIRE(fixture.supplementer->supplement(basic, {.image_id = "example.com/app"}).has_value());
  CHECK(backend_of(basic).auth == "dXNlcjpwYXNz");

  DaemonConfig token = fixture.load("fusedev", TEMPLATE_REGISTRY);
  REQUIRE(fixture.supplementer->supplement(token, {.image_id = "token.io/app"}).has_value());
  CHECK(backend_of(token).registry_token == "bearer");
  // Configured basic credentials stay
  CHECK(backend_of(token).auth == "c3RhdGljOnNlY3JldA==");
}

TEST_CASE("Missing credentials keep the configured ones")
{
  Fixture fixture;
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);
  REQUIRE(fixture.supplementer->supplement(config, {.image_id = "example.com/app"}).has_value());
  CHECK(backend_of(config).auth == "c3RhdGljOnNlY3JldA==");
}

TEST_CASE("Label credentials through the default provider chain")
{
  ns_test::TempDir dir("supplement_labels");
  Supplementer supplementer(dir.path() / "certs.d"
    , ns_auth::make_default(dir.path() / "config.json")
    , std::make_unique<ns_registry::DefaultHostPolicy>()
  );
  auto config = create("fusedev", dir.write("template.json", TEMPLATE_REGISTRY)).value();

  SupplementInfo info{
      .image_id = "example.com/app"
    , .labels = {{"containerd.io/snapshot/pull-username", "alice"}, {"containerd.io/snapshot/pull-secret", "pw"}}
  };
  REQUIRE(supplementer.supplement(config, info).has_value());
  CHECK(config.storage_backend().second->auth == ns_base64::encode("alice:pw"));
}

TEST_CASE("Fscache configurations receive the snapshot parameters")
{
  Fixture fixture;
  DaemonConfig config = fixture.load("fscache", TEMPLATE_FSCACHE);

  SupplementInfo info{
      .image_id = "example.com/app:v1"
    , .snapshot_id = "42"
    , .params = {{"cache_dir", "/var/lib/cache"}, {"bootstrap", "/snapshots/42/image.boot"}}
  };
  REQUIRE(fixture.supplementer->supplement(config, info).has_value());

  auto& fscache = std::get<FscacheDaemonConfig>(config.get());
  CHECK(fscache.id == "42");
  CHECK(fscache.config->backend_config.host == "example.com");
  CHECK(fscache.config->backend_config.repo == "app");
  CHECK(fscache.config->cache_config.work_dir == "/var/lib/cache");
  CHECK(fscache.config->metadata_path == "/snapshots/42/image.boot");
}

TEST_CASE("Localfs and oss backends are left untouched")
{
  Fixture fixture;
  fixture.dir.write("certs.d/_default/hosts.json", R"({"mirrors": [{"host": "http://m"}]})");

  for(std::string type : {"localfs", "oss"})
  {
    DaemonConfig config = fixture.load("fusedev"
      , std::format(R"({{"device": {{"backend": {{"type": "{}", "config": {{"dir": "/blobs"}}}}}}}})", type)
    );
    std::string before = config.dump_string().value();
    REQUIRE(fixture.supplementer->supplement(config, {.image_id = "example.com/app"}).has_value());
    CHECK(config.dump_string().value() == before);
  }
  CHECK(fixture.provider->hosts.empty());
}

TEST_CASE("Unknown backends fail with UNSUPPORTED_BACKEND and change nothing")
{
  ns_test::LogCapture capture;
  Fixture fixture;
  DaemonConfig config = fixture.load("fusedev", R"({"device": {"backend": {"type": "s3", "config": {"host": "keep"}}}})");
  std::string before = config.dump_string().value();

  auto result = fixture.supplementer->supplement(config, {.image_id = "example.com/app"});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ns_error::Kind::UNSUPPORTED_BACKEND);
  CHECK(result.error().message == "Unknown backend type 's3' for image 'example.com/app'");
  CHECK(config.dump_string().value() == before);
}

TEST_CASE("Configurations without a backend fail with UNSUPPORTED_BACKEND")
{
  ns_test::LogCapture capture;
  Fixture fixture;
  DaemonConfig config{FuseDaemonConfig{}};

  auto result = fixture.supplementer->supplement(config, {.image_id = "example.com/app"});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ns_error::Kind::UNSUPPORTED_BACKEND);
  CHECK_FALSE(std::get<FuseDaemonConfig>(config.get()).device.has_value());
}

TEST_CASE("Invalid images fail with IMAGE_REFERENCE and change nothing")
{
  ns_test::LogCapture capture;
  Fixture fixture;
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);
  std::string before = config.dump_string().value();

  auto result = fixture.supplementer->supplement(config, {.image_id = "Example.com/App"});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ns_error::Kind::IMAGE_REFERENCE);
  CHECK(result.error().message.find("Example.com/App") != std::string::npos);
  CHECK(config.dump_string().value() == before);

  CHECK(fixture.supplementer->supplement(config, {.image_id = ""}).error().kind == ns_error::Kind::IMAGE_REFERENCE);
  CHECK(fixture.provider->hosts.empty());
}

TEST_CASE("Relative registry hosts never reach the mirrors directory")
{
  ns_test::LogCapture capture;
  Fixture fixture;
  // Would be read as certs.d/../hosts.json
  fixture.dir.write("hosts.json", R"({"mirrors": [{"host": "http://outside"}]})");
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);
  std::string before = config.dump_string().value();

  for(std::string image : {"../app:v1", "./app"})
  {
    auto result = fixture.supplementer->supplement(config, {.image_id = image});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ns_error::Kind::IMAGE_REFERENCE);
  }
  CHECK(config.dump_string().value() == before);
  CHECK(fixture.provider->hosts.empty());
}

TEST_CASE("Malformed mirrors fail with MIRROR_UPDATE and change nothing")
{
  ns_test::LogCapture capture;
  Fixture fixture;
  fixture.dir.write("certs.d/example.com/hosts.json", "{");
  DaemonConfig config = fixture.load("fusedev", TEMPLATE_REGISTRY);
  std::string before = config.dump_string().value();

  auto result = fixture.supplementer->supplement(config, {.image_id = "example.com/app"});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ns_error::Kind::MIRROR_UPDATE);
  CHECK(config.dump_string().value() == before);
  CHECK(fixture.provider->hosts.empty());
}

TEST_CASE("Concurrent supplements do not mix request data")
{
  Fixture fixture;
  for(int i = 0; i < 8; ++i)
  {
    fixture.dir.write(std::format("certs.d/registry{}.example.com/hosts.json", i)
      , std::format(R"({{"mirrors": [{{"host": "http://mirror-{}"}}]}})", i)
    );
  }
  DaemonConfig base = fixture.load("fusedev", TEMPLATE_REGISTRY);

  constexpr int threads = 8;
  constexpr int rounds = 20;
  std::vector<DaemonConfig> configs(threads, base);
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for(int i = 0; i < threads; ++i)
  {
    workers.emplace_back([&, i]
    {
      for(int round = 0; round < rounds; ++round)
      {
        SupplementInfo info{
            .image_id = std::format("registry{}.example.com/app{}:v{}", i, i, round)
          , .snapshot_id = std::to_string(i)
        };
        if(not fixture.supplementer->supplement(configs[i], info)) { ++failures; }
      }
    });
  }
  for(auto& worker : workers) { worker.join(); }

  CHECK(failures == 0);
  for(int i = 0; i < threads; ++i)
  {
    auto const& backend = backend_of(configs[i]);
    CHECK(backend.host == std::format("registry{}.example.com", i));
    CHECK(backend.repo == std::format("app{}", i));
    REQUIRE(backend.mirrors.size() == 1);
    CHECK(backend.mirrors[0].host == std::format("http://mirror-{}", i));
  }
  CHECK(fixture.provider->hosts.size() == static_cast<size_t>(threads * rounds));
}
