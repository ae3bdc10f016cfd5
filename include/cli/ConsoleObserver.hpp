#pragma once

#include "sync/Observer.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace sw::cli {

// Reports each decided action, each failed attempt and transfer progress on a terminal stream.
// An item that fails after its last retry ends the run unless `skipExhausted` is set.
class ConsoleObserver final : public sync::Observer {
public:
    explicit ConsoleObserver(std::FILE* out = stderr, bool skipExhausted = false);

    void onAction(const sync::model::ActionRecord& action) override;
    void onError(sync::model::ErrorRecord& error) override;
    void onProgress(const sync::model::ProgressRecord& progress) override;

    static std::string describe(const sync::model::ActionRecord& action);

private:
    std::FILE* out_;
    bool skipExhausted_;
    bool interactive_;
    bool progressLineOpen_ = false;
    std::string lastPath_;
    int lastPercent_ = -1;
    std::chrono::steady_clock::time_point lastDraw_{};

    void endProgressLine();
};

}
