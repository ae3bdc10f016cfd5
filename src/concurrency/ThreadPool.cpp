#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace sw::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    const auto n = std::max(1u, nThreads);
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }

    stopFlag.store(true);
    cv.notify_all();

    // Workers exit between tasks; a running task is expected to honor its own interrupt.
    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }

    threads_.clear();
    idleFlags_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

bool ThreadPool::hasIdleWorker() const {
    return std::ranges::any_of(idleFlags_, [](const auto& flag) { return flag->load(); });
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    auto flag = std::make_shared<std::atomic<bool>>(true); // idle at start
    idleFlags_.push_back(flag);

    threads_.emplace_back([this, flag] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] { return stopFlag.load() || !queue.empty(); });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                flag->store(false);
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    sw::log::Registry::syncwright()->error("[ThreadPool] Task threw: {}", e.what());
                }
                flag->store(true);
            }
        }
    });
}
