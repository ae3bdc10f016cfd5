#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sw::config {

struct S3Config {
    std::string access_key;
    std::string secret_access_key;
    std::string region = "us-east-1";
    std::string endpoint;                 // https://<host>[:port]
    std::string bucket;
};

struct EncryptionConfig {
    std::string password;
    unsigned int version = 2;             // scheme used for new content; reads follow the stored header
    bool encrypt_file_names = false;
    bool encrypt_directory_names = false;
    std::string salt = "syncwright";
    std::string kdf = "interactive";      // interactive | moderate | sensitive
};

struct RootConfig {
    std::string provider = "local";       // local | s3
    std::filesystem::path path;
    S3Config s3;
    std::vector<EncryptionConfig> encryption; // innermost layer first
};

struct SyncConfig {
    std::vector<std::string> equality_methods = {"length", "mtime"};
    unsigned int retry_count = 3;
    bool create_directories = true;
    bool delete_directories = false;
    bool create_files = true;
    bool update_files = true;
    bool delete_files = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum syncwright = spdlog::level::info;   // startup, run summary
    spdlog::level::level_enum sync       = spdlog::level::info;   // per-item decisions, retries
    spdlog::level::level_enum storage    = spdlog::level::warn;   // backend I/O failures
    spdlog::level::level_enum cloud      = spdlog::level::warn;   // S3 errors, not routine requests
    spdlog::level::level_enum crypto     = spdlog::level::warn;   // integrity failures, unsupported schemes
    spdlog::level::level_enum config     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;        // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    RootConfig source;
    RootConfig target;
    LoggingConfig logging;
};

using Override = std::pair<std::string, std::string>; // dotted key, YAML scalar/flow value

Config loadConfig(const std::filesystem::path& path, const std::vector<Override>& overrides = {});
Config loadConfigFromString(const std::string& yaml, const std::vector<Override>& overrides = {});

void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const EncryptionConfig& c);
void to_json(nlohmann::json& j, const RootConfig& c);

} // namespace sw::config
