#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sw::cli {

inline constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/syncwright/config.yaml";

struct Args {
    std::optional<std::filesystem::path> configPath;   // unset: the default, if it exists
    bool json = false;
    bool help = false;
    bool continueOnError = false;   // skip items whose retries ran out instead of failing the run
    std::vector<config::Override> overrides;
};

// Accepts --config FILE, --json, --continue-on-error, --help, and dotted-key overrides written as
// `--key value`, `--key=value` or `key=value`. Throws std::invalid_argument.
Args parseArgs(int argc, const char* const* argv);

// Explicit path, else the default when present, else empty (built-in defaults plus overrides).
config::Config loadFromArgs(const Args& args);

std::string usage(const std::string& program);

}
