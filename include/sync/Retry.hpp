#pragma once

#include "sync/Observer.hpp"
#include "concurrency/Interrupt.hpp"
#include "log/Registry.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace sw::sync {

// Runs an operation up to bound + 1 times. Each failure inside the bound is
// reported to the observer, which may turn it into a cancellation; the
// failure after the bound is rethrown. Cancellation always wins.
class Retry {
public:
    Retry(const unsigned int bound, Observer& observer, const concurrency::Interrupt& interrupt)
        : bound_(bound), observer_(observer), interrupt_(interrupt) {}

    [[nodiscard]] unsigned int bound() const { return bound_; }

    template <typename Fn>
    std::invoke_result_t<Fn> invoke(const std::string& operation, Fn&& fn) const {
        for (unsigned int attempt = 1;; ++attempt) {
            interrupt_.check();
            try {
                return fn();
            } catch (const concurrency::Cancelled&) {
                throw;
            } catch (const std::exception& e) {
                interrupt_.check();
                if (attempt > bound_) throw;

                model::ErrorRecord record{
                    .error = std::current_exception(),
                    .message = e.what(),
                    .operation = operation,
                    .attempt = attempt
                };
                log::Registry::sync()->warn("[Retry] {} failed (attempt {}/{}): {}",
                                            operation, attempt, bound_ + 1, e.what());
                observer_.onError(record);
                if (record.cancel) throw concurrency::Cancelled();
            }
        }
    }

private:
    unsigned int bound_;
    Observer& observer_;
    const concurrency::Interrupt& interrupt_;
};

}
