#include <gtest/gtest.h>
#include "sync/Comparator.hpp"
#include "storage/model/File.hpp"

using namespace sw::sync;
using namespace sw::sync::model;
using sw::storage::model::File;

namespace {

File file(const uintmax_t size, const std::time_t mtime) {
    File f;
    f.name = "x.txt";
    f.size_bytes = size;
    f.updated_at = mtime;
    return f;
}

struct CountingHasher {
    std::string digest;
    int* calls;
    std::string operator()() const { ++*calls; return digest; }
};

}

class ComparatorTest : public ::testing::Test {
protected:
    int hashes = 0;

    Comparator::Hasher hasher(const std::string& digest) { return CountingHasher{digest, &hashes}; }
};

TEST_F(ComparatorTest, IdenticalFilesAreEqualUnderEveryRealMethodSet) {
    const auto a = file(10, 100);
    for (const auto set : {EqualityMethod::Length, EqualityMethod::LastWriteTime, EqualityMethod::ContentHash,
                           EqualityMethod::Length | EqualityMethod::LastWriteTime | EqualityMethod::ContentHash}) {
        EXPECT_TRUE(Comparator(set).compare(a, a, hasher("d"), hasher("d")).equal) << to_string(set);
    }
}

TEST_F(ComparatorTest, LengthMismatchNeverReadsContent) {
    const auto v = Comparator(EqualityMethod::Length | EqualityMethod::ContentHash)
        .compare(file(10, 100), file(11, 100), hasher("a"), hasher("a"));
    EXPECT_FALSE(v.equal);
    EXPECT_EQ(v.method, EqualityMethod::Length);
    EXPECT_EQ(hashes, 0);
}

TEST_F(ComparatorTest, ModificationTimeMismatch) {
    const auto v = Comparator(DefaultEqualityMethods).compare(file(10, 100), file(10, 101), hasher("a"), hasher("a"));
    EXPECT_FALSE(v.equal);
    EXPECT_EQ(v.method, EqualityMethod::LastWriteTime);
}

TEST_F(ComparatorTest, DigestDecidesWhenCheaperChecksPass) {
    const Comparator c(EqualityMethod::Length | EqualityMethod::ContentHash);

    const auto same = c.compare(file(10, 100), file(10, 999), hasher("abc"), hasher("abc"));
    EXPECT_TRUE(same.equal);
    EXPECT_EQ(same.method, EqualityMethod::ContentHash);

    const auto differ = c.compare(file(10, 100), file(10, 100), hasher("abc"), hasher("abd"));
    EXPECT_FALSE(differ.equal);
    EXPECT_EQ(differ.method, EqualityMethod::ContentHash);
    EXPECT_EQ(hashes, 4);
}

TEST_F(ComparatorTest, EmptySetIsNameOnly) {
    const auto v = Comparator(EqualityMethod::None).compare(file(1, 1), file(2, 2), hasher("a"), hasher("b"));
    EXPECT_TRUE(v.equal);
    EXPECT_EQ(v.method, EqualityMethod::None);
    EXPECT_EQ(hashes, 0);
}

TEST_F(ComparatorTest, AlwaysIsNeverEqual) {
    const auto a = file(10, 100);
    const auto v = Comparator(EqualityMethod::Always | EqualityMethod::Length).compare(a, a, hasher("a"), hasher("a"));
    EXPECT_FALSE(v.equal);
    EXPECT_EQ(v.method, EqualityMethod::Always);
}
