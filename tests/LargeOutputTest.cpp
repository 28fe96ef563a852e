#include <gtest/gtest.h>

#include "TestSupport.hpp"

TEST(LargeOutput, HasExactlyOneThousandOrderedLines) {
    auto r = run_probe({"cgiprobe", "large_output"});
    ASSERT_EQ(r.rc, 0);
    EXPECT_EQ(count_occurrences(r.out, "<p>Line "), 1000u);

    size_t last = 0;
    for (int i = 0; i < 1000; ++i) {
        std::string line = "<p>Line " + std::to_string(i) + ": This is a large CGI response test.</p>\n";
        auto pos = r.out.find(line);
        ASSERT_NE(pos, std::string::npos) << "missing line " << i;
        EXPECT_EQ(count_occurrences(r.out, line), 1u);
        if (i > 0) EXPECT_GT(pos, last);
        last = pos;
    }
}

TEST(LargeOutput, FramedByFixedBoilerplate) {
    auto r = run_probe({"cgiprobe", "large_output"});
    EXPECT_EQ(r.out.rfind("<!DOCTYPE html>\n<html><body>\n<h1>Huge CGI Response</h1>\n", 0), 0u);
    const std::string tail = "</body></html>\n";
    ASSERT_GE(r.out.size(), tail.size());
    EXPECT_EQ(r.out.compare(r.out.size() - tail.size(), tail.size(), tail), 0);
}

TEST(LargeOutput, IgnoresEnvironmentAndIsDeterministic) {
    Environment env(Pairs{{"QUERY_STRING", "a=1"}});
    auto first = run_probe({"cgiprobe", "large_output"});
    auto second = run_probe({"cgiprobe", "large_output"}, env);
    EXPECT_EQ(first.out, second.out);
}
