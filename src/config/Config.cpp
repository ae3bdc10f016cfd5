#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sw::config {

namespace {

bool isIndex(const std::string& s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c); });
}

// Walks `key` (a.b.c) from the document root and sets the value there. The
// walk uses Node::reset so the handle moves down the tree instead of
// overwriting the node it currently points at.
void applyOverride(YAML::Node& root, const Override& override) {
    const auto& [key, value] = override;
    if (key.empty()) throw std::invalid_argument("Empty configuration override key");

    YAML::Node cur;
    cur.reset(root);

    std::size_t start = 0;
    while (true) {
        const auto dot = key.find('.', start);
        const auto segment = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (segment.empty()) throw std::invalid_argument("Malformed configuration override key: " + key);

        YAML::Node next;
        if (cur.IsSequence()) {
            if (isIndex(segment)) {
                const auto idx = std::stoul(segment);
                if (idx >= cur.size()) throw std::out_of_range("Override index out of range: " + key);
                next.reset(cur[idx]);
            } else {
                // Non-numeric segment on a sequence addresses its last element
                if (cur.size() == 0) throw std::invalid_argument("Override addresses an empty list: " + key);
                YAML::Node last;
                last.reset(cur[cur.size() - 1]);
                next.reset(last[segment]);
            }
        } else {
            next.reset(cur[segment]);
        }
        cur.reset(next);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    cur = YAML::Load(value);
}

void validate(const RootConfig& root, const std::string& which) {
    if (root.provider == "local") {
        if (root.path.empty()) throw std::runtime_error(which + ".path is required for the local provider");
    } else if (root.provider == "s3") {
        if (root.s3.bucket.empty()) throw std::runtime_error(which + ".s3.bucket is required for the s3 provider");
        if (root.s3.endpoint.empty()) throw std::runtime_error(which + ".s3.endpoint is required for the s3 provider");
    } else {
        throw std::runtime_error("Unknown " + which + ".provider: " + root.provider);
    }

    for (const auto& layer : root.encryption) {
        if (layer.password.empty()) throw std::runtime_error(which + ".encryption.password is required");
        if (layer.version != 1 && layer.version != 2)
            throw std::runtime_error(which + ".encryption.version must be 1 or 2");
    }
}

Config decode(YAML::Node root, const std::vector<Override>& overrides) {
    if (!root || root.IsNull()) root = YAML::Node(YAML::NodeType::Map);
    for (const auto& o : overrides) applyOverride(root, o);

    Config cfg;
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["source"]) YAML::convert<RootConfig>::decode(node, cfg.source);
    if (auto node = root["target"]) YAML::convert<RootConfig>::decode(node, cfg.target);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    validate(cfg.source, "source");
    validate(cfg.target, "target");
    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path, const std::vector<Override>& overrides) {
    return decode(YAML::LoadFile(path.string()), overrides);
}

Config loadConfigFromString(const std::string& yaml, const std::vector<Override>& overrides) {
    return decode(YAML::Load(yaml), overrides);
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"equality_methods", c.equality_methods},
        {"retry_count", c.retry_count},
        {"create_directories", c.create_directories},
        {"delete_directories", c.delete_directories},
        {"create_files", c.create_files},
        {"update_files", c.update_files},
        {"delete_files", c.delete_files}
    };
}

void to_json(nlohmann::json& j, const EncryptionConfig& c) {
    j = {
        {"version", c.version},
        {"encrypt_file_names", c.encrypt_file_names},
        {"encrypt_directory_names", c.encrypt_directory_names},
        {"kdf", c.kdf}
    };
}

void to_json(nlohmann::json& j, const RootConfig& c) {
    j = {
        {"provider", c.provider},
        {"encryption", c.encryption}
    };
    if (c.provider == "s3") {
        j["endpoint"] = c.s3.endpoint;
        j["bucket"] = c.s3.bucket;
        j["prefix"] = c.path.string();
    } else {
        j["path"] = c.path.string();
    }
}

}
