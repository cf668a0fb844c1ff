#include "PropSync/CollectionUtil.hpp"
#include "PropSync/ObservableCollections.hpp"

#include <gtest/gtest.h>

#include <list>
#include <set>
#include <string>
#include <vector>

using namespace propsync;

TEST(AddRangeTest, AppendsInOrder) {
    std::vector<int> values{1};
    add_range(values, std::list<int>{2, 3});

    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));
}

TEST(AddRangeTest, UsesInsertWithoutPushBack) {
    std::set<std::string> names{"b"};
    add_range(names, std::vector<std::string>{"a", "c", "b"});

    EXPECT_EQ(names, (std::set<std::string>{"a", "b", "c"}));
}

TEST(AddRangeTest, AppendingToItselfDoublesContents) {
    std::vector<int> values{1, 2};
    add_range(values, values);

    EXPECT_EQ(values, (std::vector<int>{1, 2, 1, 2}));
}

TEST(AddRangeTest, ObservableListRaisesOneAddPerElement) {
    ObservableList<int> list;
    int adds = 0;
    list.subscribe([&](const CollectionChange& change) {
        if (change.action == CollectionAction::Add) ++adds;
    });

    add_range(list, std::vector<int>{4, 5, 6});

    EXPECT_EQ(list.items(), (std::vector<int>{4, 5, 6}));
    EXPECT_EQ(adds, 3);
}

TEST(ForEachTest, AppliesInOrderAndReturnsRange) {
    std::vector<int> values{1, 2, 3};
    std::vector<int> seen;

    auto& result = for_each(values, [&](int& value) {
        seen.push_back(value);
        value *= 10;
    });

    EXPECT_EQ(&result, &values);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(values, (std::vector<int>{10, 20, 30}));
}
