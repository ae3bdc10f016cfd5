#include "cli/Args.hpp"
#include "cli/ConsoleObserver.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "sync/Controller.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace sw;
using namespace sw::config;
using namespace sw::sync::model;

namespace {

std::atomic<bool>* stopFlag = nullptr;

void signalHandler(const int) {
    if (stopFlag) stopFlag->store(true);
}

void printSummary(const Result& result) {
    const auto& s = result.stats;
    if (result.outcome == Outcome::Cancelled) fmt::print("Operation was cancelled\n");
    if (result.outcome == Outcome::Failed) fmt::print("Failed: {}\n", result.error);
    fmt::print("Directories: {}\n", s.directoriesSeen);
    fmt::print("  Created: {}\n", s.directoriesCreated);
    fmt::print("  Deleted: {}\n", s.directoriesDeleted);
    fmt::print("Files: {}\n", s.filesSeen);
    fmt::print("  Created: {}\n", s.filesCreated);
    fmt::print("  Updated: {}\n", s.filesUpdated);
    fmt::print("  Deleted: {}\n", s.filesDeleted);
}

int exitCode(const Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed: return 0;
        case Outcome::Cancelled: return 130;
        case Outcome::Failed: return 1;
    }
    return 1;
}

}

int main(const int argc, char** argv) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "syncwright";

    cli::Args args;
    try {
        args = cli::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}: {}\n\n{}", program, e.what(), cli::usage(program));
        return 2;
    }

    if (args.help) {
        fmt::print("{}", cli::usage(program));
        return 0;
    }

    try {
        ConfigRegistry::init(cli::loadFromArgs(args));
        log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}: configuration error: {}\n", program, e.what());
        return 2;
    }

    const auto& cfg = ConfigRegistry::get();
    log::Registry::syncwright()->info("[*] Starting sync: {} -> {}", cfg.source.path.string(), cfg.target.path.string());

    try {
        sync::Controller controller;
        stopFlag = controller.interruptHandle().flag().get();
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto observer = std::make_shared<cli::ConsoleObserver>(stderr, args.continueOnError);
        auto result = controller.runAsync(cfg, observer).get();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        stopFlag = nullptr;

        if (args.json) fmt::print("{}\n", nlohmann::json(result).dump(2));
        else printSummary(result);

        log::Registry::syncwright()->info("[✓] Sync finished: {}", to_string(result.outcome));
        return exitCode(result.outcome);
    } catch (const std::exception& e) {
        stopFlag = nullptr;
        log::Registry::syncwright()->error("[-] Sync could not run: {}", e.what());
        if (args.json) fmt::print("{}\n", nlohmann::json{{"outcome", "Failed"}, {"error", e.what()}}.dump(2));
        return 1;
    }
}
