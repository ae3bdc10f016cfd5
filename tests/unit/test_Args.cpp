#include <gtest/gtest.h>
#include "cli/Args.hpp"
#include "cli/ConsoleObserver.hpp"
#include "storage/model/File.hpp"

#include <cstdio>

using namespace sw::cli;

namespace {

Args parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "syncwright");
    return parseArgs(static_cast<int>(argv.size()), argv.data());
}

}

TEST(ArgsTest, AllOverrideSpellings) {
    const auto args = parse({"--config", "/tmp/c.yaml", "--sync.delete_files", "true",
                             "--target.path=/b", "source.path=/a", "--json"});

    ASSERT_TRUE(args.configPath);
    EXPECT_EQ(*args.configPath, "/tmp/c.yaml");
    EXPECT_TRUE(args.json);
    ASSERT_EQ(args.overrides.size(), 3u);
    EXPECT_EQ(args.overrides[0], (sw::config::Override{"sync.delete_files", "true"}));
    EXPECT_EQ(args.overrides[1], (sw::config::Override{"target.path", "/b"}));
    EXPECT_EQ(args.overrides[2], (sw::config::Override{"source.path", "/a"}));
}

TEST(ArgsTest, ValuesMayContainEquals) {
    const auto args = parse({"target.encryption.password=a=b"});
    ASSERT_EQ(args.overrides.size(), 1u);
    EXPECT_EQ(args.overrides[0].second, "a=b");
}

TEST(ArgsTest, RejectsMalformedInput) {
    EXPECT_THROW(parse({"--config"}), std::invalid_argument);
    EXPECT_THROW(parse({"--sync.retry_count"}), std::invalid_argument);
    EXPECT_THROW(parse({"stray"}), std::invalid_argument);
    EXPECT_THROW(parse({"bad key=1"}), std::invalid_argument);
    EXPECT_THROW(parse({".sync=1"}), std::invalid_argument);
}

TEST(ArgsTest, ContinueOnErrorIsOptIn) {
    EXPECT_FALSE(parse({"source.path=/a"}).continueOnError);

    const auto args = parse({"--continue-on-error", "source.path=/a"});
    EXPECT_TRUE(args.continueOnError);
    ASSERT_EQ(args.overrides.size(), 1u);
    EXPECT_NE(usage("syncwright").find("--continue-on-error"), std::string::npos);
}

TEST(ArgsTest, Help) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_NE(usage("syncwright").find("--config"), std::string::npos);
}

TEST(ArgsTest, LoadsExplicitFileWithOverrides) {
    const auto path = std::filesystem::temp_directory_path() / "syncwright_args_test.yaml";
    {
        std::FILE* f = std::fopen(path.c_str(), "w");
        ASSERT_NE(f, nullptr);
        std::fputs("source: {path: /a}\ntarget: {path: /b}\n", f);
        std::fclose(f);
    }

    Args args;
    args.configPath = path;
    args.overrides = {{"target.path", "/c"}};
    const auto cfg = loadFromArgs(args);
    EXPECT_EQ(cfg.source.path, "/a");
    EXPECT_EQ(cfg.target.path, "/c");
    std::filesystem::remove(path);
}

TEST(ConsoleObserverTest, DescribesActions) {
    sw::sync::model::ActionRecord create{
        .kind = sw::sync::model::ActionKind::Create,
        .method = sw::sync::model::EqualityMethod::None,
        .sourcePath = "/src/a/x.txt",
        .targetPath = "/dst/a/x.txt"
    };
    EXPECT_EQ(ConsoleObserver::describe(create), "Create: /src/a/x.txt -> /dst/a/x.txt");

    sw::sync::model::ActionRecord update = create;
    update.kind = sw::sync::model::ActionKind::Update;
    update.method = sw::sync::model::EqualityMethod::Length;
    EXPECT_EQ(ConsoleObserver::describe(update), "Update (Length): /src/a/x.txt -> /dst/a/x.txt");

    sw::sync::model::ActionRecord del{.kind = sw::sync::model::ActionKind::Delete, .targetPath = "/dst/old.txt"};
    EXPECT_EQ(ConsoleObserver::describe(del), "Delete: /dst/old.txt");
}

TEST(ConsoleObserverTest, SkipsExhaustedErrorsWhenAsked) {
    std::FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);

    ConsoleObserver observer(sink, true);
    sw::sync::model::ErrorRecord retry{.message = "boom", .operation = "copy x", .attempt = 1};
    observer.onError(retry);
    EXPECT_FALSE(retry.skip);

    sw::sync::model::ErrorRecord exhausted{.message = "boom", .operation = "copy x", .attempt = 4, .exhausted = true};
    observer.onError(exhausted);
    EXPECT_TRUE(exhausted.skip);
    EXPECT_FALSE(exhausted.cancel);

    std::fclose(sink);
}

TEST(ConsoleObserverTest, ExhaustedErrorsEndTheRunByDefault) {
    std::FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);

    ConsoleObserver observer(sink);
    sw::sync::model::ErrorRecord exhausted{.message = "boom", .operation = "copy x", .attempt = 4, .exhausted = true};
    observer.onError(exhausted);
    EXPECT_FALSE(exhausted.skip);
    EXPECT_FALSE(exhausted.cancel);

    std::fclose(sink);
}
