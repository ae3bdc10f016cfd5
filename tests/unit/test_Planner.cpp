#include <gtest/gtest.h>
#include "sync/Planner.hpp"
#include "storage/model/File.hpp"
#include "storage/model/Directory.hpp"

using namespace sw::sync;
using namespace sw::storage::model;

namespace {

std::shared_ptr<Entry> f(const std::string& name) {
    auto e = std::make_shared<File>();
    e->name = name;
    return e;
}

std::shared_ptr<Entry> d(const std::string& name) {
    auto e = std::make_shared<Directory>();
    e->name = name;
    return e;
}

}

TEST(PlannerTest, PairsByNameInSortedOrder) {
    const auto plan = Planner::build({f("b"), d("a"), f("c")}, {f("c"), f("z"), f("a")});

    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0].name, "a");
    EXPECT_EQ(plan[1].name, "b");
    EXPECT_EQ(plan[2].name, "c");
    EXPECT_EQ(plan[3].name, "z");

    EXPECT_FALSE(plan[0].sameKind());
    EXPECT_TRUE(plan[1].sourceOnly());
    EXPECT_TRUE(plan[2].sameKind());
    EXPECT_TRUE(plan[3].targetOnly());
}

TEST(PlannerTest, NamesAreCaseSensitive) {
    const auto plan = Planner::build({f("Readme")}, {f("README")});
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_TRUE(plan[0].targetOnly());
    EXPECT_TRUE(plan[1].sourceOnly());
}

TEST(PlannerTest, DuplicateNamesKeepTheFirst) {
    const auto first = f("x");
    const auto plan = Planner::build({first, d("x")}, {});
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].source, first);
}

TEST(PlannerTest, EmptySides) {
    EXPECT_TRUE(Planner::build({}, {}).empty());
}
