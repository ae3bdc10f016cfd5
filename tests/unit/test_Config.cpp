#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/exceptions.h>

using namespace sw::config;

namespace {

constexpr auto BASE = R"(
sync:
  equality_methods: [length, digest]
  retry_count: 5
  delete_files: true
source:
  provider: local
  path: /srv/data
target:
  provider: s3
  path: backups/data
  s3:
    access_key: AKIA
    secret_access_key: secret
    region: eu-west-1
    endpoint: https://s3.example.com
    bucket: archive
  encryption:
    - password: inner
      version: 1
    - password: outer
      encrypt_file_names: true
logging:
  log_dir: /var/log/syncwright
  console_log_level: warn
)";

}

TEST(ConfigTest, DecodesAllSections) {
    const auto cfg = loadConfigFromString(BASE);

    EXPECT_EQ(cfg.sync.equality_methods, (std::vector<std::string>{"length", "digest"}));
    EXPECT_EQ(cfg.sync.retry_count, 5u);
    EXPECT_TRUE(cfg.sync.delete_files);
    EXPECT_FALSE(cfg.sync.delete_directories);
    EXPECT_TRUE(cfg.sync.create_files);

    EXPECT_EQ(cfg.source.provider, "local");
    EXPECT_EQ(cfg.source.path, "/srv/data");
    EXPECT_TRUE(cfg.source.encryption.empty());

    EXPECT_EQ(cfg.target.provider, "s3");
    EXPECT_EQ(cfg.target.s3.bucket, "archive");
    EXPECT_EQ(cfg.target.s3.region, "eu-west-1");
    ASSERT_EQ(cfg.target.encryption.size(), 2u);
    EXPECT_EQ(cfg.target.encryption[0].version, 1u);
    EXPECT_EQ(cfg.target.encryption[1].version, 2u);
    EXPECT_TRUE(cfg.target.encryption[1].encrypt_file_names);
    EXPECT_FALSE(cfg.target.encryption[1].encrypt_directory_names);

    EXPECT_EQ(cfg.logging.log_dir, "/var/log/syncwright");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
}

TEST(ConfigTest, MethodListAsString) {
    const auto cfg = loadConfigFromString("sync: {equality_methods: 'length|mtime,digest'}\nsource: {path: /a}\ntarget: {path: /b}\n");
    EXPECT_EQ(cfg.sync.equality_methods, (std::vector<std::string>{"length", "mtime", "digest"}));
}

TEST(ConfigTest, OverridesReplaceAndCreateKeys) {
    const auto cfg = loadConfigFromString(BASE, {
        {"sync.retry_count", "0"},
        {"sync.update_files", "false"},
        {"source.path", "/mnt/other"},
        {"target.encryption.0.password", "changed"},
        {"target.encryption.kdf", "moderate"},
        {"sync.equality_methods", "[none]"},
    });

    EXPECT_EQ(cfg.sync.retry_count, 0u);
    EXPECT_FALSE(cfg.sync.update_files);
    EXPECT_EQ(cfg.source.path, "/mnt/other");
    EXPECT_EQ(cfg.target.encryption[0].password, "changed");
    EXPECT_EQ(cfg.target.encryption[1].kdf, "moderate");
    EXPECT_EQ(cfg.target.encryption[0].kdf, "interactive");
    EXPECT_EQ(cfg.sync.equality_methods, (std::vector<std::string>{"none"}));
}

TEST(ConfigTest, OverridesAloneAreEnough) {
    const auto cfg = loadConfigFromString("", {{"source.path", "/a"}, {"target.path", "/b"}});
    EXPECT_EQ(cfg.source.path, "/a");
    EXPECT_EQ(cfg.target.path, "/b");
    EXPECT_EQ(cfg.sync.retry_count, 3u);
}

TEST(ConfigTest, RejectsInvalidConfigurations) {
    EXPECT_THROW(loadConfigFromString("source: {path: /a}\n"), std::runtime_error);   // target.path missing
    EXPECT_THROW(loadConfigFromString("source: {path: /a}\ntarget: {provider: ftp, path: /b}\n"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("source: {path: /a}\ntarget: {provider: s3}\n"), std::runtime_error);
    EXPECT_THROW(loadConfigFromString("source: {path: /a, encryption: {version: 2}}\ntarget: {path: /b}\n"),
                 std::runtime_error);
    EXPECT_THROW(loadConfigFromString("source: {path: /a, encryption: {password: p, version: 3}}\ntarget: {path: /b}\n"),
                 std::runtime_error);
    EXPECT_ANY_THROW(loadConfigFromString("sync: {retry_count: -1}\nsource: {path: /a}\ntarget: {path: /b}\n"));
    EXPECT_ANY_THROW(loadConfigFromString(BASE, {{"target.encryption.7.password", "x"}}));
}

TEST(ConfigTest, JsonOmitsSecrets) {
    const auto cfg = loadConfigFromString(BASE);
    const nlohmann::json j = cfg.target;
    const auto dumped = j.dump();
    EXPECT_EQ(dumped.find("outer"), std::string::npos);
    EXPECT_EQ(dumped.find("secret"), std::string::npos);
    EXPECT_EQ(j.at("provider"), "s3");
}
