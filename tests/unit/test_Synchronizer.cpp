#include <gtest/gtest.h>
#include "sync/Synchronizer.hpp"
#include "storage/Manager.hpp"
#include "storage/LocalEngine.hpp"
#include "storage/EncryptedEngine.hpp"
#include "storage/model/Directory.hpp"
#include "support/MemoryEngine.hpp"
#include "support/RecordingObserver.hpp"
#include "support/TempDir.hpp"
#include "support/Keys.hpp"

#include <algorithm>

using namespace sw::sync;
using namespace sw::sync::model;
using namespace sw::concurrency;
using sw::storage::Manager;
using sw::test::MemoryEngine;
using Op = MemoryEngine::Op;

class SynchronizerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryEngine> src = std::make_shared<MemoryEngine>();
    std::shared_ptr<MemoryEngine> dst = std::make_shared<MemoryEngine>();
    sw::test::RecordingObserver observer;
    Interrupt interrupt;
    Policy policy;

    Result run() {
        const auto source = Manager::resolve(src, "/", interrupt);
        const auto target = Manager::resolve(dst, "/", interrupt);
        return Synchronizer(policy, observer).run(source, target, interrupt);
    }
};

TEST_F(SynchronizerTest, CreatesMissingTree) {
    src->putFile("/a/x.txt", "hello", 1234);

    const auto result = run();

    ASSERT_TRUE(result.completed()) << result.error;
    ASSERT_TRUE(dst->isDirectory("/a"));
    EXPECT_EQ(dst->content("/a/x.txt"), "hello");
    EXPECT_EQ(dst->modified("/a/x.txt"), 1234);

    EXPECT_EQ(result.stats.directoriesSeen, 1u);
    EXPECT_EQ(result.stats.directoriesCreated, 1u);
    EXPECT_EQ(result.stats.filesSeen, 1u);
    EXPECT_EQ(result.stats.filesCreated, 1u);
    EXPECT_EQ(observer.lines(), (std::vector<std::string>{"Create /a", "Create /a/x.txt"}));
    EXPECT_EQ(observer.actions[1].method, EqualityMethod::None);
}

TEST_F(SynchronizerTest, ActionsAreReportedBeforeTheyHappen) {
    src->putFile("/a/x.txt", "hello");
    observer.onActionHook = [&](const ActionRecord& a) {
        EXPECT_FALSE(dst->exists(a.targetPath)) << a.targetPath;
    };
    EXPECT_TRUE(run().completed());
}

TEST_F(SynchronizerTest, ReportsCopyProgress) {
    src->putFile("/big.bin", std::string(200'000, 'b'));
    ASSERT_TRUE(run().completed());

    ASSERT_FALSE(observer.progress.empty());
    EXPECT_EQ(observer.progress.back().transferred, 200'000u);
    EXPECT_EQ(observer.progress.back().total, 200'000u);
    EXPECT_EQ(observer.progress.back().sourcePath, "/big.bin");
    for (size_t i = 1; i < observer.progress.size(); ++i)
        EXPECT_GE(observer.progress[i].transferred, observer.progress[i - 1].transferred);
}

TEST_F(SynchronizerTest, DigestEqualityIgnoresModificationTime) {
    src->putFile("/a/x.txt", "same", 100);
    dst->putFile("/a/x.txt", "same", 999);
    policy.equality = EqualityMethod::ContentHash;

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.stats.filesUpdated, 0u);
    ASSERT_EQ(observer.count(ActionKind::Skip), 1u);
    EXPECT_EQ(observer.actions.back().kind, ActionKind::Skip);
    EXPECT_EQ(observer.actions.back().method, EqualityMethod::ContentHash);
    EXPECT_EQ(dst->modified("/a/x.txt"), 999);
}

TEST_F(SynchronizerTest, UpdatesDifferingFiles) {
    src->putFile("/x.txt", "longer content", 100);
    dst->putFile("/x.txt", "short", 100);

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.stats.filesUpdated, 1u);
    EXPECT_EQ(dst->content("/x.txt"), "longer content");
    ASSERT_EQ(observer.actions.size(), 1u);
    EXPECT_EQ(observer.actions[0].kind, ActionKind::Update);
    EXPECT_EQ(observer.actions[0].method, EqualityMethod::Length);
}

TEST_F(SynchronizerTest, ModificationTimeDifferenceTriggersUpdate) {
    src->putFile("/x.txt", "abc", 200);
    dst->putFile("/x.txt", "abc", 100);

    ASSERT_TRUE(run().completed());
    ASSERT_EQ(observer.actions.size(), 1u);
    EXPECT_EQ(observer.actions[0].kind, ActionKind::Update);
    EXPECT_EQ(observer.actions[0].method, EqualityMethod::LastWriteTime);
    EXPECT_EQ(dst->modified("/x.txt"), 200);
}

TEST_F(SynchronizerTest, UpdateDisallowedSkips) {
    src->putFile("/x.txt", "new!", 200);
    dst->putFile("/x.txt", "old", 100);
    policy.updateFiles = false;

    const auto result = run();
    EXPECT_EQ(result.stats.filesUpdated, 0u);
    EXPECT_EQ(dst->content("/x.txt"), "old");
    ASSERT_EQ(observer.actions.size(), 1u);
    EXPECT_EQ(observer.actions[0].kind, ActionKind::Skip);
}

TEST_F(SynchronizerTest, EmptyMethodSetMatchesByNameOnly) {
    src->putFile("/x.txt", "one", 1);
    dst->putFile("/x.txt", "different", 2);
    policy.equality = EqualityMethod::None;

    ASSERT_TRUE(run().completed());
    EXPECT_EQ(dst->content("/x.txt"), "different");
    ASSERT_EQ(observer.actions.size(), 1u);
    EXPECT_EQ(observer.actions[0].kind, ActionKind::Skip);
    EXPECT_EQ(observer.actions[0].method, EqualityMethod::None);
    EXPECT_EQ(src->calls(Op::OpenRead), 0u);
}

TEST_F(SynchronizerTest, AlwaysRecopiesEverything) {
    src->putFile("/x.txt", "same", 1);
    dst->putFile("/x.txt", "same", 1);
    policy.equality = EqualityMethod::Always;

    const auto result = run();
    EXPECT_EQ(result.stats.filesUpdated, 1u);
    EXPECT_EQ(observer.actions[0].method, EqualityMethod::Always);
}

TEST_F(SynchronizerTest, DeletesTargetOnlyTreeWhenAllowed) {
    src->putFile("/keep.txt", "k");
    dst->putFile("/b/old.txt", "o");
    policy.deleteFiles = true;
    policy.deleteDirectories = true;

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_FALSE(dst->exists("/b"));
    EXPECT_FALSE(dst->exists("/b/old.txt"));
    EXPECT_EQ(result.stats.filesDeleted, 1u);
    EXPECT_EQ(result.stats.directoriesDeleted, 1u);
    EXPECT_EQ(observer.lines(), (std::vector<std::string>{"Delete /b/old.txt", "Delete /b", "Create /keep.txt"}));
}

TEST_F(SynchronizerTest, DeleteFilesFlag) {
    dst->putFile("/old.txt", "o");

    policy.deleteFiles = false;
    auto result = run();
    EXPECT_TRUE(dst->exists("/old.txt"));
    EXPECT_EQ(result.stats.filesDeleted, 0u);
    EXPECT_EQ(observer.lines(), (std::vector<std::string>{"Skip /old.txt"}));

    policy.deleteFiles = true;
    result = run();
    EXPECT_FALSE(dst->exists("/old.txt"));
    EXPECT_EQ(result.stats.filesDeleted, 1u);
}

TEST_F(SynchronizerTest, DirectoryKeptWhenSomethingInsideIsKept) {
    dst->putFile("/b/old.txt", "o");
    policy.deleteDirectories = true;
    policy.deleteFiles = false;

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_TRUE(dst->exists("/b/old.txt"));
    EXPECT_EQ(result.stats.directoriesDeleted, 0u);
    EXPECT_EQ(dst->calls(Op::Remove), 0u);
}

TEST_F(SynchronizerTest, CreateFlagsAreHonored) {
    src->putFile("/d/x.txt", "x");
    src->putFile("/y.txt", "y");
    policy.createFiles = false;

    auto result = run();
    EXPECT_TRUE(dst->isDirectory("/d"));
    EXPECT_FALSE(dst->exists("/d/x.txt"));
    EXPECT_FALSE(dst->exists("/y.txt"));
    EXPECT_EQ(result.stats.filesCreated, 0u);
    EXPECT_EQ(result.stats.filesSeen, 2u);
    EXPECT_EQ(observer.count(ActionKind::Skip), 2u);

    policy.createFiles = true;
    policy.createDirectories = false;
    observer.actions.clear();
    dst = std::make_shared<MemoryEngine>();
    result = run();
    EXPECT_FALSE(dst->exists("/d"));
    EXPECT_TRUE(dst->exists("/y.txt"));
    EXPECT_EQ(result.stats.directoriesCreated, 0u);
    // the skipped directory's contents are never visited
    EXPECT_EQ(result.stats.filesSeen, 1u);
}

TEST_F(SynchronizerTest, KindCollisionReplacesWhenDeleteAllowed) {
    src->putFile("/k", "now a file");
    dst->putFile("/k/inner.txt", "i");
    policy.deleteDirectories = true;
    policy.deleteFiles = true;

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_FALSE(dst->isDirectory("/k"));
    EXPECT_EQ(dst->content("/k"), "now a file");
    EXPECT_EQ(result.stats.directoriesDeleted, 1u);
    EXPECT_EQ(result.stats.filesDeleted, 1u);
    EXPECT_EQ(result.stats.filesCreated, 1u);
    EXPECT_EQ(result.stats.filesSeen, 1u);
}

TEST_F(SynchronizerTest, KindCollisionSkipsWhenDeleteDisallowed) {
    src->putDirectory("/k");
    dst->putFile("/k", "file");

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_EQ(dst->content("/k"), "file");
    EXPECT_EQ(result.stats.directoriesCreated, 0u);
    EXPECT_EQ(observer.count(ActionKind::Skip), 2u);   // the refused delete, then the pair
}

TEST_F(SynchronizerTest, SecondRunIsQuiet) {
    src->putFile("/a/b/c.txt", "c", 10);
    src->putFile("/a/d.txt", "dd", 20);
    src->putFile("/e.txt", "eee", 30);

    ASSERT_TRUE(run().completed());
    observer.actions.clear();

    const auto again = run();
    ASSERT_TRUE(again.completed());
    EXPECT_EQ(again.stats.filesCreated + again.stats.filesUpdated + again.stats.directoriesCreated, 0u);
    EXPECT_EQ(observer.count(ActionKind::Skip), 3u);
    EXPECT_EQ(again.stats.filesSeen, 3u);
    EXPECT_EQ(again.stats.directoriesSeen, 2u);
}

TEST_F(SynchronizerTest, TransientFailuresAreRetried) {
    src->putFile("/x.txt", "x");
    dst->failNext(Op::CreateFile, 2);
    policy.retryCount = 3;

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_EQ(result.stats.filesCreated, 1u);
    EXPECT_EQ(dst->calls(Op::CreateFile), 3u);
    ASSERT_EQ(observer.errors.size(), 2u);
    EXPECT_EQ(observer.errors[0].attempt, 1u);
    EXPECT_EQ(observer.errors[1].attempt, 2u);
    EXPECT_FALSE(observer.errors[1].exhausted);
    EXPECT_EQ(src->calls(Op::OpenRead), 3u);   // each attempt starts from a fresh source stream
}

TEST_F(SynchronizerTest, ExhaustedItemCanBeSkipped) {
    src->putFile("/a.txt", "a");
    src->putFile("/b.txt", "b");
    src->putFile("/c.txt", "c");
    policy.retryCount = 1;

    int failures = 0;
    dst->onCall = [&](const Op op) {
        if (op == Op::CreateFile && dst->calls(Op::CreateFile) <= 3 && dst->calls(Op::CreateFile) >= 2) {
            ++failures;
            throw sw::storage::BackendError("disk full");
        }
    };
    observer.onErrorHook = [](ErrorRecord& e) { if (e.exhausted) e.skip = true; };

    const auto result = run();

    ASSERT_TRUE(result.completed()) << result.error;
    EXPECT_EQ(failures, 2);
    EXPECT_TRUE(dst->exists("/a.txt"));
    EXPECT_FALSE(dst->exists("/b.txt"));
    EXPECT_TRUE(dst->exists("/c.txt"));
    EXPECT_EQ(result.stats.filesCreated, 2u);
    ASSERT_EQ(observer.errors.size(), 2u);
    EXPECT_TRUE(observer.errors[1].exhausted);
    EXPECT_EQ(observer.errors[1].attempt, 2u);
}

TEST_F(SynchronizerTest, ExhaustedItemFailsRunByDefault) {
    src->putFile("/a.txt", "a");
    src->putFile("/b.txt", "b");
    dst->failNext(Op::CreateFile, 100, "disk full");
    policy.retryCount = 2;

    const auto result = run();

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_NE(result.error.find("disk full"), std::string::npos);
    EXPECT_EQ(dst->calls(Op::CreateFile), 3u);
    EXPECT_FALSE(dst->exists("/b.txt"));
}

TEST_F(SynchronizerTest, ObserverCanCancelOnError) {
    src->putFile("/a.txt", "a");
    dst->failNext(Op::CreateFile, 1);
    observer.onErrorHook = [](ErrorRecord& e) { e.cancel = true; };

    const auto result = run();

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(dst->calls(Op::CreateFile), 1u);
}

TEST_F(SynchronizerTest, ListingFailureIsRetriedAndCanBeSkipped) {
    src->putFile("/a/x.txt", "x");
    src->putFile("/b/y.txt", "y");
    policy.retryCount = 0;

    // the root listing succeeds; /a's listing fails once
    src->onCall = [&](const Op op) {
        if (op == Op::List && src->calls(Op::List) == 2) throw sw::storage::BackendError("listing timed out");
    };
    observer.onErrorHook = [](ErrorRecord& e) { e.skip = true; };

    const auto result = run();

    ASSERT_TRUE(result.completed());
    EXPECT_TRUE(dst->isDirectory("/a"));
    EXPECT_FALSE(dst->exists("/a/x.txt"));
    EXPECT_TRUE(dst->exists("/b/y.txt"));
}

TEST_F(SynchronizerTest, CancelAfterTwoOfFiveFiles) {
    for (const auto* name : {"/1.txt", "/2.txt", "/3.txt", "/4.txt", "/5.txt"}) src->putFile(name, "content");

    observer.onActionHook = [&](const ActionRecord& a) {
        if (a.kind == ActionKind::Create && observer.count(ActionKind::Create) == 2) interrupt.request();
    };

    const auto result = run();

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(result.stats.filesCreated, 2u);
    EXPECT_EQ(dst->size(), 2u);
    EXPECT_TRUE(dst->exists("/1.txt"));
    EXPECT_TRUE(dst->exists("/2.txt"));
    EXPECT_FALSE(dst->exists("/3.txt"));
}

TEST_F(SynchronizerTest, PreCancelledRunDoesNothing) {
    src->putFile("/x.txt", "x");
    interrupt.request();

    const auto source = Manager::resolve(src, "/", Interrupt());
    const auto target = Manager::resolve(dst, "/", Interrupt());
    const auto result = Synchronizer(policy, observer).run(source, target, interrupt);

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(dst->size(), 0u);
    EXPECT_TRUE(observer.actions.empty());
}

TEST_F(SynchronizerTest, UnresolvedRootsAreRejected) {
    EXPECT_THROW(Synchronizer(policy).run({}, {}, interrupt), std::invalid_argument);
}

TEST(SynchronizerLocalTest, CancelledCopyLeavesNoPartialFile) {
    sw::test::TempDir srcDir{"sw-src"}, dstDir{"sw-dst"};
    srcDir.write("small.txt", "tiny");
    srcDir.write("zbig.bin", std::string(4 * sw::storage::LocalEngine::COPY_CHUNK_SIZE, 'z'));

    Interrupt interrupt;
    sw::test::RecordingObserver observer;
    observer.onProgressHook = [&](const ProgressRecord& p) {
        if (p.sourcePath.ends_with("zbig.bin")) interrupt.request();
    };

    const auto engine = std::make_shared<sw::storage::LocalEngine>();
    const auto result = Synchronizer(Policy{}, observer).run(Manager::resolve(engine, srcDir.path, interrupt),
                                                             Manager::resolve(engine, dstDir.path, interrupt),
                                                             interrupt);

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(dstDir.read("small.txt"), "tiny");
    std::vector<std::string> left;
    for (const auto& e : std::filesystem::directory_iterator(dstDir.path)) left.push_back(e.path().filename().string());
    EXPECT_EQ(left, (std::vector<std::string>{"small.txt"}));
}

TEST(SynchronizerLocalTest, MirrorsIntoEncryptedTargetAndStaysIdempotent) {
    sw::test::TempDir srcDir{"sw-src"};
    srcDir.write("docs/a.txt", "alpha");
    srcDir.write("docs/deep/b.txt", std::string(70'000, 'b'));
    srcDir.write("c.txt", "");

    Interrupt interrupt;
    const auto memory = std::make_shared<MemoryEngine>();
    const auto encrypted = std::make_shared<sw::storage::EncryptedEngine>(
        memory, sw::test::keyRing(), sw::storage::EncryptedEngine::Options{.encryptFileNames = true});

    const auto source = Manager::resolve(std::make_shared<sw::storage::LocalEngine>(), srcDir.path, interrupt);
    const auto target = Manager::resolve(encrypted, "/backup", interrupt);

    sw::test::RecordingObserver first;
    const auto created = Synchronizer(Policy{}, first).run(source, target, interrupt);
    ASSERT_TRUE(created.completed()) << created.error;
    EXPECT_EQ(created.stats.filesCreated, 3u);
    EXPECT_EQ(created.stats.directoriesCreated, 2u);
    EXPECT_TRUE(memory->isDirectory("/backup/docs"));
    EXPECT_FALSE(memory->exists("/backup/c.txt"));

    sw::test::RecordingObserver second;
    const auto again = Synchronizer(Policy{}, second).run(source, target, interrupt);
    ASSERT_TRUE(again.completed()) << again.error;
    EXPECT_EQ(again.stats.filesCreated + again.stats.filesUpdated, 0u);
    EXPECT_EQ(second.count(ActionKind::Skip), 3u);

    srcDir.write("docs/a.txt", "alpha, revised");
    sw::test::RecordingObserver third;
    Policy digest;
    digest.equality = EqualityMethod::ContentHash;
    const auto updated = Synchronizer(digest, third).run(source, target, interrupt);
    ASSERT_TRUE(updated.completed()) << updated.error;
    EXPECT_EQ(updated.stats.filesUpdated, 1u);
}

class SynchronizerDiskTest : public ::testing::Test {
protected:
    sw::test::TempDir srcDir{"sw-src"}, dstDir{"sw-dst"};
    std::shared_ptr<sw::storage::LocalEngine> engine = std::make_shared<sw::storage::LocalEngine>();
    sw::test::RecordingObserver observer;
    Interrupt interrupt;
    Policy policy;

    Result run() {
        observer.actions.clear();
        observer.errors.clear();
        observer.progress.clear();
        return Synchronizer(policy, observer).run(Manager::resolve(engine, srcDir.path, interrupt),
                                                  Manager::resolve(engine, dstDir.path, interrupt), interrupt);
    }

    [[nodiscard]] std::vector<std::string> targetNames(const std::filesystem::path& rel = {}) const {
        std::vector<std::string> out;
        for (const auto& e : std::filesystem::directory_iterator(dstDir / rel))
            out.push_back(e.path().filename().string());
        std::ranges::sort(out);
        return out;
    }
};

TEST_F(SynchronizerDiskTest, TempPrefixedNamesAreSyncedLikeAnyOther) {
    srcDir.write(".swtmp-x", "user data");
    srcDir.write(".swtmp-dir/y.txt", "nested");
    dstDir.write(".swtmp-stale", "left by a crash");
    policy.deleteFiles = true;

    const auto result = run();

    ASSERT_TRUE(result.completed()) << result.error;
    EXPECT_EQ(dstDir.read(".swtmp-x"), "user data");
    EXPECT_EQ(dstDir.read(".swtmp-dir/y.txt"), "nested");
    EXPECT_EQ(targetNames(), (std::vector<std::string>{".swtmp-dir", ".swtmp-x"}));
    EXPECT_EQ(result.stats.filesSeen, 2u);
    EXPECT_EQ(result.stats.filesCreated, 2u);
    EXPECT_EQ(result.stats.filesDeleted, 1u);
    EXPECT_EQ(observer.count(ActionKind::Delete), 1u);

    const auto again = run();
    ASSERT_TRUE(again.completed()) << again.error;
    EXPECT_EQ(again.stats.filesCreated + again.stats.filesUpdated + again.stats.filesDeleted, 0u);
}

TEST_F(SynchronizerDiskTest, LongNamesAreCopiedAndUpdated) {
    const std::string name = std::string(245, 'n') + ".txt";
    srcDir.write(name, "first");

    const auto created = run();
    ASSERT_TRUE(created.completed()) << created.error;
    EXPECT_EQ(created.stats.filesCreated, 1u);
    EXPECT_EQ(dstDir.read(name), "first");

    srcDir.write(name, "second, longer");
    const auto updated = run();
    ASSERT_TRUE(updated.completed()) << updated.error;
    EXPECT_EQ(updated.stats.filesUpdated, 1u);
    EXPECT_EQ(dstDir.read(name), "second, longer");
    EXPECT_EQ(targetNames(), (std::vector<std::string>{name}));
}

TEST_F(SynchronizerDiskTest, ZeroLengthFileIsCreatedAndUpdated) {
    srcDir.write("empty.txt", "");

    const auto created = run();
    ASSERT_TRUE(created.completed()) << created.error;
    EXPECT_EQ(created.stats.filesCreated, 1u);
    ASSERT_TRUE(std::filesystem::is_regular_file(dstDir / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(dstDir / "empty.txt"), 0u);

    const auto quiet = run();
    ASSERT_TRUE(quiet.completed()) << quiet.error;
    EXPECT_EQ(quiet.stats.filesUpdated, 0u);
    EXPECT_EQ(observer.count(ActionKind::Skip), 1u);

    srcDir.write("empty.txt", "now has content");
    const auto filled = run();
    ASSERT_TRUE(filled.completed()) << filled.error;
    EXPECT_EQ(filled.stats.filesUpdated, 1u);
    EXPECT_EQ(dstDir.read("empty.txt"), "now has content");

    srcDir.write("empty.txt", "");
    const auto emptied = run();
    ASSERT_TRUE(emptied.completed()) << emptied.error;
    EXPECT_EQ(emptied.stats.filesUpdated, 1u);
    EXPECT_EQ(observer.actions.back().method, EqualityMethod::Length);
    EXPECT_EQ(std::filesystem::file_size(dstDir / "empty.txt"), 0u);
}
