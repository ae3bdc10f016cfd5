#include "sync/Controller.hpp"
#include "sync/Synchronizer.hpp"
#include "storage/Manager.hpp"
#include "log/Registry.hpp"

using namespace sw::sync;
using namespace sw::sync::model;
using namespace sw::concurrency;

namespace {

struct SyncTask final : PromisedTask<Result> {
    sw::storage::Root source, target;
    Policy policy;
    std::shared_ptr<Observer> observer;
    Interrupt interrupt;

    SyncTask(sw::storage::Root s, sw::storage::Root t, Policy p, std::shared_ptr<Observer> o, Interrupt i)
        : source(std::move(s)), target(std::move(t)), policy(std::move(p)), observer(std::move(o)),
          interrupt(std::move(i)) {}

    void operator()() override {
        try {
            const auto sync = observer ? Synchronizer(policy, *observer) : Synchronizer(policy);
            promise.set_value(sync.run(source, target, interrupt));
        } catch (const std::exception& e) {
            sw::log::Registry::sync()->error("[Controller] Sync task failed: {}", e.what());
            promise.set_exception(std::current_exception());
        }
    }
};

struct ResolveAndSyncTask final : PromisedTask<Result> {
    sw::config::Config cfg;
    std::shared_ptr<Observer> observer;
    Interrupt interrupt;

    ResolveAndSyncTask(sw::config::Config c, std::shared_ptr<Observer> o, Interrupt i)
        : cfg(std::move(c)), observer(std::move(o)), interrupt(std::move(i)) {}

    void operator()() override {
        try {
            const auto source = sw::storage::Manager::resolve(cfg.source, interrupt);
            const auto target = sw::storage::Manager::resolve(cfg.target, interrupt);
            const auto policy = Policy::fromConfig(cfg.sync);
            const auto sync = observer ? Synchronizer(policy, *observer) : Synchronizer(policy);
            promise.set_value(sync.run(source, target, interrupt));
        } catch (const Cancelled& e) {
            Result r;
            r.outcome = Outcome::Cancelled;
            r.error = e.what();
            promise.set_value(std::move(r));
        } catch (const std::exception& e) {
            sw::log::Registry::sync()->error("[Controller] Failed to set up sync: {}", e.what());
            promise.set_exception(std::current_exception());
        }
    }
};

}

Controller::Controller(const unsigned int workers) : pool_(workers) {}

Controller::~Controller() {
    interrupt_.request();
    pool_.stop();
}

std::future<Result> Controller::runAsync(storage::Root source, storage::Root target, Policy policy,
                                         std::shared_ptr<Observer> observer) {
    auto task = std::make_shared<SyncTask>(std::move(source), std::move(target), std::move(policy),
                                           std::move(observer), interrupt_);
    auto future = task->getFuture();
    pool_.submit(task);
    return future;
}

std::future<Result> Controller::runAsync(const config::Config& cfg, std::shared_ptr<Observer> observer) {
    auto task = std::make_shared<ResolveAndSyncTask>(cfg, std::move(observer), interrupt_);
    auto future = task->getFuture();
    pool_.submit(task);
    return future;
}

void Controller::interrupt() const {
    log::Registry::sync()->info("[Controller] Interrupt requested");
    interrupt_.request();
}
