#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <sstream>

namespace YAML {

using namespace sw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["equality_methods"] = rhs.equality_methods;
        node["retry_count"] = rhs.retry_count;
        node["create_directories"] = rhs.create_directories;
        node["delete_directories"] = rhs.delete_directories;
        node["create_files"] = rhs.create_files;
        node["update_files"] = rhs.update_files;
        node["delete_files"] = rhs.delete_files;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;

        if (const auto methods = node["equality_methods"]) {
            rhs.equality_methods.clear();
            if (methods.IsSequence()) {
                for (const auto& m : methods) rhs.equality_methods.push_back(m.as<std::string>());
            } else {
                // "length,mtime" or "length|mtime"
                std::string token;
                std::istringstream in(methods.as<std::string>());
                while (std::getline(in, token, ',')) {
                    std::istringstream inner(token);
                    std::string part;
                    while (std::getline(inner, part, '|'))
                        if (!part.empty()) rhs.equality_methods.push_back(part);
                }
            }
        }

        const auto retries = node["retry_count"].as<int>(3);
        if (retries < 0) throw std::invalid_argument("sync.retry_count must be >= 0");
        rhs.retry_count = static_cast<unsigned int>(retries);

        rhs.create_directories = node["create_directories"].as<bool>(true);
        rhs.delete_directories = node["delete_directories"].as<bool>(false);
        rhs.create_files = node["create_files"].as<bool>(true);
        rhs.update_files = node["update_files"].as<bool>(true);
        rhs.delete_files = node["delete_files"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<S3Config> {
    static Node encode(const S3Config& rhs) {
        Node node;
        node["access_key"] = rhs.access_key;
        node["region"] = rhs.region;
        node["endpoint"] = rhs.endpoint;
        node["bucket"] = rhs.bucket;
        return node;
    }

    static bool decode(const Node& node, S3Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.bucket = node["bucket"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<EncryptionConfig> {
    static Node encode(const EncryptionConfig& rhs) {
        Node node;
        node["version"] = rhs.version;
        node["encrypt_file_names"] = rhs.encrypt_file_names;
        node["encrypt_directory_names"] = rhs.encrypt_directory_names;
        node["salt"] = rhs.salt;
        node["kdf"] = rhs.kdf;
        return node;
    }

    static bool decode(const Node& node, EncryptionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.password = node["password"].as<std::string>("");
        rhs.version = node["version"].as<unsigned int>(2);
        rhs.encrypt_file_names = node["encrypt_file_names"].as<bool>(false);
        rhs.encrypt_directory_names = node["encrypt_directory_names"].as<bool>(false);
        rhs.salt = node["salt"].as<std::string>("syncwright");
        rhs.kdf = node["kdf"].as<std::string>("interactive");
        return true;
    }
};

template<>
struct convert<RootConfig> {
    static Node encode(const RootConfig& rhs) {
        Node node;
        node["provider"] = rhs.provider;
        node["path"] = rhs.path.string();
        if (rhs.provider == "s3") node["s3"] = rhs.s3;
        for (const auto& layer : rhs.encryption) node["encryption"].push_back(layer);
        return node;
    }

    static bool decode(const Node& node, RootConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.provider = node["provider"].as<std::string>("local");
        rhs.path = node["path"].as<std::string>("");
        if (const auto s3 = node["s3"]) rhs.s3 = s3.as<S3Config>();

        rhs.encryption.clear();
        if (const auto enc = node["encryption"]) {
            if (enc.IsSequence()) {
                for (const auto& layer : enc) rhs.encryption.push_back(layer.as<EncryptionConfig>());
            } else if (enc.IsMap()) {
                rhs.encryption.push_back(enc.as<EncryptionConfig>());
            }
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["syncwright"] = to_std_string(spdlog::level::to_string_view(rhs.syncwright));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["storage"]    = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]      = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["crypto"]     = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.syncwright = spdlog::level::from_str(node["syncwright"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    // Levels live flat under `logging:` next to log_dir.
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
