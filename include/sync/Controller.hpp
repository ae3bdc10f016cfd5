#pragma once

#include "sync/Observer.hpp"
#include "sync/model/Policy.hpp"
#include "sync/model/Result.hpp"
#include "config/Config.hpp"
#include "storage/Engine.hpp"
#include "concurrency/Interrupt.hpp"
#include "concurrency/ThreadPool.hpp"

#include <future>
#include <memory>

namespace sw::sync {

// Runs syncs off the caller's thread. Every run started here shares one interrupt.
class Controller {
public:
    explicit Controller(unsigned int workers = 1);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // The observer, if any, is kept alive until the run finishes.
    std::future<model::Result> runAsync(storage::Root source, storage::Root target, model::Policy policy,
                                        std::shared_ptr<Observer> observer = nullptr);

    // Resolves both roots on the worker, then runs; resolution failures surface through the future.
    std::future<model::Result> runAsync(const config::Config& cfg, std::shared_ptr<Observer> observer = nullptr);

    void interrupt() const;

    [[nodiscard]] const concurrency::Interrupt& interruptHandle() const { return interrupt_; }

private:
    concurrency::Interrupt interrupt_;
    concurrency::ThreadPool pool_;
};

}
