#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace sw::concurrency {

// Cooperative stop. Not a failure: callers unwind without starting new mutations.
struct Cancelled : std::runtime_error {
    Cancelled() : std::runtime_error("Operation was cancelled") {}
};

// Shared cancellation flag threaded through every recursive call and backend operation.
// Copies observe the same flag.
class Interrupt {
public:
    Interrupt() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    explicit Interrupt(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    void request() const { flag_->store(true); }
    [[nodiscard]] bool requested() const { return flag_->load(); }

    void check() const {
        if (requested()) throw Cancelled();
    }

    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& flag() const { return flag_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
