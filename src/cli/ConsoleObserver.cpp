#include "cli/ConsoleObserver.hpp"
#include "util/cmdLineHelpers.hpp"

#include <unistd.h>
#include <fmt/core.h>

using namespace sw::sync::model;

namespace sw::cli {

ConsoleObserver::ConsoleObserver(std::FILE* out, const bool skipExhausted)
    : out_(out), skipExhausted_(skipExhausted), interactive_(isatty(fileno(out)) != 0) {}

std::string ConsoleObserver::describe(const ActionRecord& action) {
    std::string line = to_string(action.kind);
    if (action.method != EqualityMethod::None) line += " (" + to_string(action.method) + ")";
    line += ": ";

    if (!action.sourcePath.empty() && !action.targetPath.empty())
        line += action.sourcePath + " -> " + action.targetPath;
    else
        line += action.sourcePath.empty() ? action.targetPath : action.sourcePath;

    return line;
}

void ConsoleObserver::onAction(const ActionRecord& action) {
    endProgressLine();
    if (action.kind == ActionKind::Skip) return;
    fmt::print(out_, "{}\n", describe(action));
}

void ConsoleObserver::onError(ErrorRecord& error) {
    endProgressLine();
    if (!error.exhausted) {
        fmt::print(out_, "Retry ({}): {}: {}\n", error.attempt, error.operation, error.message);
        return;
    }

    fmt::print(out_, "Failed: {}: {}\n", error.operation, error.message);
    error.skip = skipExhausted_;
}

void ConsoleObserver::onProgress(const ProgressRecord& progress) {
    const int percent = progress.total
        ? static_cast<int>(progress.transferred * 100 / progress.total)
        : 100;

    const auto now = std::chrono::steady_clock::now();
    const bool done = progress.transferred >= progress.total;
    if (progress.sourcePath == lastPath_ && percent == lastPercent_) return;
    if (!done && progress.sourcePath == lastPath_ && now - lastDraw_ < std::chrono::milliseconds(100)) return;

    lastPath_ = progress.sourcePath;
    lastPercent_ = percent;
    lastDraw_ = now;

    const auto sizes = fmt::format("{} / {}", shell::human_bytes(progress.transferred),
                                   shell::human_bytes(progress.total));

    if (!interactive_) {
        if (done) fmt::print(out_, "  {:>3}% {} {}\n", percent, sizes, progress.sourcePath);
        return;
    }

    const auto width = static_cast<size_t>(shell::term_width(fileno(out_)));
    const auto prefix = fmt::format("  {:>3}% {} ", percent, sizes);
    const auto room = width > prefix.size() + 1 ? width - prefix.size() - 1 : 0;
    fmt::print(out_, "\r\033[K{}{}", prefix, shell::ellipsize_middle(progress.sourcePath, room));
    std::fflush(out_);
    progressLineOpen_ = !done;
    if (done) fmt::print(out_, "\n");
}

void ConsoleObserver::endProgressLine() {
    if (!progressLineOpen_) return;
    fmt::print(out_, "\n");
    progressLineOpen_ = false;
}

}
