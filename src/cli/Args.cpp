#include "cli/Args.hpp"

#include <cctype>
#include <stdexcept>
#include <fmt/core.h>

namespace sw::cli {

namespace {

bool isKey(const std::string& key) {
    if (key.empty() || key.front() == '.' || key.back() == '.') return false;
    for (const char c : key)
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') return false;
    return true;
}

config::Override splitAssignment(const std::string& arg, const size_t eq) {
    const auto key = arg.substr(0, eq);
    if (!isKey(key)) throw std::invalid_argument("Invalid option key: " + key);
    return {key, arg.substr(eq + 1)};
}

}

Args parseArgs(const int argc, const char* const* argv) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            continue;
        }

        if (arg == "--json") {
            args.json = true;
            continue;
        }

        if (arg == "--continue-on-error") {
            args.continueOnError = true;
            continue;
        }

        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a file path");
            args.configPath = argv[++i];
            continue;
        }

        if (arg.starts_with("--config=")) {
            args.configPath = arg.substr(9);
            continue;
        }

        if (arg.starts_with("--")) {
            const auto body = arg.substr(2);
            if (const auto eq = body.find('='); eq != std::string::npos) {
                args.overrides.push_back(splitAssignment(body, eq));
                continue;
            }
            if (!isKey(body)) throw std::invalid_argument("Invalid option: " + arg);
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
            args.overrides.emplace_back(body, argv[++i]);
            continue;
        }

        if (const auto eq = arg.find('='); eq != std::string::npos && eq > 0) {
            args.overrides.push_back(splitAssignment(arg, eq));
            continue;
        }

        throw std::invalid_argument("Unexpected argument: " + arg);
    }

    return args;
}

config::Config loadFromArgs(const Args& args) {
    if (args.configPath) return config::loadConfig(*args.configPath, args.overrides);
    if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) return config::loadConfig(DEFAULT_CONFIG_PATH, args.overrides);
    return config::loadConfigFromString("", args.overrides);
}

std::string usage(const std::string& program) {
    return fmt::format(
        "usage: {} [--config FILE] [--json] [--continue-on-error] [--key value | --key=value | key=value ...]\n"
        "\n"
        "  -c, --config FILE   configuration file (default: {} when present)\n"
        "      --json          print the run result as JSON\n"
        "      --continue-on-error\n"
        "                      skip an item once its retries are used up (default: fail the run)\n"
        "  -h, --help          show this help\n"
        "\n"
        "Keys are dotted configuration paths, e.g.\n"
        "  {} source.path=/data target.provider=s3 --target.s3.bucket backups --sync.delete_files=true\n",
        program, DEFAULT_CONFIG_PATH, program);
}

}
