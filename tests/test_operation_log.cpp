#include <gtest/gtest.h>
#include <core/operation_log.hpp>

TEST(OperationLog, KeepsBoundedTail) {
    OperationLog log(3);
    for (int i = 1; i <= 5; ++i) log.append_line("line " + std::to_string(i));

    auto lines = log.lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines.front(), "line 3");
    EXPECT_EQ(lines.back(), "line 5");
}

TEST(OperationLog, Clear) {
    OperationLog log;
    log.append_line("a");
    log.clear();
    EXPECT_TRUE(log.lines().empty());
}

TEST(OperationLog, SubscribersSeeEachLine) {
    OperationLog log;
    std::vector<std::string> first, second;
    int a = log.subscribe([&](const std::string& l) { first.push_back(l); });
    log.subscribe([&](const std::string& l) { second.push_back(l); });

    log.append_line("one");
    log.unsubscribe(a);
    log.append_line("two");

    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], "one");
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[1], "two");
}

TEST(OperationLog, ListenerCanReadLog) {
    OperationLog log;
    size_t seen = 0;
    log.subscribe([&](const std::string&) { seen = log.lines().size(); });

    log.append_line("x");
    log.append_line("y");
    EXPECT_EQ(seen, 2u);
}
