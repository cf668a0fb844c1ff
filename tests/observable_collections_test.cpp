#include "PropSync/ObservableCollections.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace propsync;

// ==================== ObservableList ====================

TEST(ObservableListTest, ElementOperationsRaiseMatchingChanges) {
    ObservableList<int> list;
    std::vector<CollectionChange> changes;
    list.subscribe([&](const CollectionChange& change) { changes.push_back(change); });

    list.add(1);
    list.push_back(3);
    list.insert(1, 2);
    list.set(0, 10);
    list.remove_at(2);

    EXPECT_EQ(list.items(), (std::vector<int>{10, 2}));

    ASSERT_EQ(changes.size(), 5u);
    EXPECT_EQ(changes[0].action, CollectionAction::Add);
    EXPECT_EQ(changes[0].index, 0u);
    EXPECT_EQ(changes[1].action, CollectionAction::Add);
    EXPECT_EQ(changes[1].index, 1u);
    EXPECT_EQ(changes[2].action, CollectionAction::Add);
    EXPECT_EQ(changes[2].index, 1u);
    EXPECT_EQ(changes[3].action, CollectionAction::Replace);
    EXPECT_EQ(changes[3].index, 0u);
    EXPECT_EQ(changes[4].action, CollectionAction::Remove);
    EXPECT_EQ(changes[4].index, 2u);
}

TEST(ObservableListTest, ClearRaisesSingleReset) {
    ObservableList<std::string> list{"a", "b", "c"};
    std::vector<CollectionChange> changes;
    list.subscribe([&](const CollectionChange& change) { changes.push_back(change); });

    list.clear();

    EXPECT_TRUE(list.empty());
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].action, CollectionAction::Reset);
    EXPECT_EQ(changes[0].index, CollectionChange::npos);
}

TEST(ObservableListTest, OutOfRangeThrows) {
    ObservableList<int> list{1};

    EXPECT_THROW(list.insert(3, 0), std::out_of_range);
    EXPECT_THROW(list.remove_at(1), std::out_of_range);
    EXPECT_THROW(list.set(5, 0), std::out_of_range);
    EXPECT_THROW((void)list.at(1), std::out_of_range);
}

TEST(ObservableListTest, UnsubscribeStopsNotifications) {
    ObservableList<int> list;
    int calls = 0;
    auto id = list.subscribe([&](const CollectionChange&) { ++calls; });

    list.add(1);
    EXPECT_TRUE(list.unsubscribe(id));
    EXPECT_FALSE(list.unsubscribe(id));
    list.add(2);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(list.subscriber_count(), 0u);
}

TEST(ObservableListTest, HandlerMayUnsubscribeItself) {
    ObservableList<int> list;
    int calls = 0;
    ObservableList<int>::Subscription id = 0;
    id = list.subscribe([&](const CollectionChange&) {
        ++calls;
        list.unsubscribe(id);
    });

    list.add(1);
    list.add(2);

    EXPECT_EQ(calls, 1);
}

TEST(ObservableListTest, CopyTakesElementsNotSubscribers) {
    ObservableList<int> original{1, 2};
    original.subscribe([](const CollectionChange&) {});

    ObservableList<int> copy = original;

    EXPECT_EQ(copy, original);
    EXPECT_EQ(copy.subscriber_count(), 0u);
    EXPECT_EQ(original.subscriber_count(), 1u);
}

TEST(ObservableListTest, AssignmentKeepsSubscribersAndRaisesReset) {
    ObservableList<int> target{1};
    std::vector<CollectionAction> actions;
    target.subscribe([&](const CollectionChange& change) { actions.push_back(change.action); });

    const ObservableList<int> source{4, 5};
    target = source;

    EXPECT_EQ(target.items(), (std::vector<int>{4, 5}));
    EXPECT_EQ(target.subscriber_count(), 1u);
    EXPECT_EQ(actions, (std::vector<CollectionAction>{CollectionAction::Reset}));
}

TEST(ObservableListTest, BuildsFromIteratorRange) {
    const std::vector<std::string> source{"x", "y"};
    ObservableList<std::string> list(source.begin(), source.end());

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "x");
    EXPECT_EQ(list[1], "y");
}

// ==================== BindingList ====================

TEST(BindingListTest, ElementOperationsRaiseListChanged) {
    BindingList<int> list;
    std::vector<ListChange> changes;
    list.subscribe([&](const ListChange& change) { changes.push_back(change); });

    list.add(1);
    list.set(0, 2);
    list.remove_at(0);
    list.clear();

    ASSERT_EQ(changes.size(), 4u);
    EXPECT_EQ(changes[0].type, ListChangeType::ItemAdded);
    EXPECT_EQ(changes[1].type, ListChangeType::ItemChanged);
    EXPECT_EQ(changes[2].type, ListChangeType::ItemDeleted);
    EXPECT_EQ(changes[3].type, ListChangeType::Reset);
}

TEST(BindingListTest, SuspendedEventsAreReplayedAsReset) {
    BindingList<int> list;
    std::vector<ListChangeType> types;
    list.subscribe([&](const ListChange& change) { types.push_back(change.type); });

    list.raise_list_changed_events(false);
    EXPECT_FALSE(list.raise_list_changed_events());
    list.add(1);
    list.add(2);
    EXPECT_TRUE(types.empty());

    list.raise_list_changed_events(true);
    list.reset_bindings();

    EXPECT_EQ(types, (std::vector<ListChangeType>{ListChangeType::Reset}));
    EXPECT_EQ(list.size(), 2u);
}

TEST(BindingListTest, CopyTakesElementsNotSubscribers) {
    BindingList<std::string> original{"a"};
    original.subscribe([](const ListChange&) {});

    const BindingList<std::string> copy(original);

    EXPECT_EQ(copy, original);
    EXPECT_EQ(copy.subscriber_count(), 0u);
}

TEST(CollectionActionTest, Names) {
    EXPECT_EQ(to_string(CollectionAction::Add), "Add");
    EXPECT_EQ(to_string(CollectionAction::Reset), "Reset");
}
