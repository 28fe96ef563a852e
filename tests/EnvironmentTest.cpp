#include <gtest/gtest.h>

#include "../src/core/Environment.hpp"

using Pairs = std::vector<std::pair<std::string, std::string>>;

TEST(Environment, CaptureParsesNameValuePairs) {
    const char* envp[] = {"B=2", "A=1", "EMPTY=", "EQ=a=b", nullptr};
    Environment env = Environment::capture(envp);

    EXPECT_EQ(env.list(), (Pairs{{"A", "1"}, {"B", "2"}, {"EMPTY", ""}, {"EQ", "a=b"}}));
}

TEST(Environment, CaptureSkipsEntriesWithoutEquals) {
    const char* envp[] = {"NOEQUALS", "OK=1", nullptr};
    EXPECT_EQ(Environment::capture(envp).list(), (Pairs{{"OK", "1"}}));
}

TEST(Environment, CaptureKeepsEmptyName) {
    const char* envp[] = {"=weird", "A=1", nullptr};
    EXPECT_EQ(Environment::capture(envp).list(), (Pairs{{"", "weird"}, {"A", "1"}}));
}

TEST(Environment, CaptureKeepsFirstDuplicate) {
    const char* envp[] = {"X=first", "X=second", nullptr};
    EXPECT_EQ(Environment::capture(envp).list(), (Pairs{{"X", "first"}}));
}

TEST(Environment, CaptureOfNullIsEmpty) {
    EXPECT_EQ(Environment::capture(nullptr).size(), 0u);
}

TEST(Environment, ListIsSortedCaseSensitive) {
    Environment env(Pairs{{"b", "1"}, {"Z", "2"}, {"A", "3"}, {"a", "4"}});

    auto pairs = env.list();
    ASSERT_EQ(pairs.size(), 4u);
    EXPECT_EQ(pairs[0].first, "A");
    EXPECT_EQ(pairs[1].first, "Z");
    EXPECT_EQ(pairs[2].first, "a");
    EXPECT_EQ(pairs[3].first, "b");
}

TEST(Environment, PairConstructorKeepsFirstDuplicate) {
    Environment env(Pairs{{"K", "old"}, {"K", "new"}});
    EXPECT_EQ(env.list(), (Pairs{{"K", "old"}}));
}
