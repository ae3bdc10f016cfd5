#pragma once

#include <future>
#include <stdexcept>

namespace sw::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<T> p) : promise(std::move(p)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
