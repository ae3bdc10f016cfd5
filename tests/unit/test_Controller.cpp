#include <gtest/gtest.h>
#include "sync/Controller.hpp"
#include "storage/Manager.hpp"
#include "support/MemoryEngine.hpp"
#include "support/RecordingObserver.hpp"
#include "support/TempDir.hpp"

#include <chrono>

using namespace sw::sync;
using namespace sw::sync::model;
using sw::storage::Manager;
using sw::test::MemoryEngine;

TEST(ControllerTest, RunsOffThreadAndDeliversResult) {
    const auto src = std::make_shared<MemoryEngine>();
    const auto dst = std::make_shared<MemoryEngine>();
    src->putFile("/a/x.txt", "x");

    Controller controller;
    const sw::concurrency::Interrupt setup;
    auto observer = std::make_shared<sw::test::RecordingObserver>();
    auto future = controller.runAsync(Manager::resolve(src, "/", setup), Manager::resolve(dst, "/", setup),
                                      Policy{}, observer);

    ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    const auto result = future.get();
    EXPECT_TRUE(result.completed());
    EXPECT_EQ(result.stats.filesCreated, 1u);
    EXPECT_EQ(observer->count(ActionKind::Create), 2u);
    EXPECT_EQ(dst->content("/a/x.txt"), "x");
}

TEST(ControllerTest, InterruptCancelsRunningSync) {
    const auto src = std::make_shared<MemoryEngine>();
    const auto dst = std::make_shared<MemoryEngine>();
    for (int i = 0; i < 20; ++i) src->putFile("/f" + std::to_string(i), "data");

    Controller controller;
    std::promise<void> started;
    auto startedFuture = started.get_future();
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    // hold the worker inside the first copy until the interrupt is raised
    dst->onCall = [&, first = true](const MemoryEngine::Op op) mutable {
        if (op != MemoryEngine::Op::CreateFile || !first) return;
        first = false;
        started.set_value();
        releaseFuture.wait();
    };

    const sw::concurrency::Interrupt setup;
    auto future = controller.runAsync(Manager::resolve(src, "/", setup), Manager::resolve(dst, "/", setup), Policy{});

    ASSERT_EQ(startedFuture.wait_for(std::chrono::seconds(30)), std::future_status::ready);
    controller.interrupt();
    release.set_value();

    const auto result = future.get();
    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_LT(result.stats.filesCreated, 20u);
    EXPECT_EQ(dst->size(), 0u);
}

TEST(ControllerTest, ResolvesRootsFromConfiguration) {
    sw::test::TempDir srcDir{"sw-ctl-src"}, dstDir{"sw-ctl-dst"};
    srcDir.write("one/two.txt", "2");

    sw::config::Config cfg;
    cfg.source.path = srcDir.path;
    cfg.target.path = dstDir.path;
    cfg.sync.delete_files = true;

    Controller controller;
    const auto result = controller.runAsync(cfg).get();

    ASSERT_TRUE(result.completed()) << result.error;
    EXPECT_EQ(dstDir.read("one/two.txt"), "2");
}

TEST(ControllerTest, SetupFailuresSurfaceThroughTheFuture) {
    sw::config::Config cfg;
    cfg.source.provider = "carrier-pigeon";
    cfg.target.path = "/tmp";

    Controller controller;
    auto future = controller.runAsync(cfg);
    EXPECT_THROW(future.get(), std::invalid_argument);
}
