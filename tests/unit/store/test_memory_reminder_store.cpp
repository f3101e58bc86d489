#include <gtest/gtest.h>

#include <future>

#include "rem/store/memory_reminder_store.hpp"
#include "test_helpers.hpp"

using namespace rem::store;
using rem::ErrorCode;
using rem::core::Reminder;
using rem::core::ReminderList;
using rem::test::makeReminder;

class MemoryReminderStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    home_ = store_.addList("Home");
    work_ = store_.addList("Work");
    shared_ = store_.addList("Shared", false);
  }

  std::optional<std::vector<Reminder>> fetch(const std::vector<ReminderList>& lists) {
    std::promise<std::optional<std::vector<Reminder>>> promise;
    auto future = promise.get_future();
    store_.fetchReminders(store_.predicateForReminders(lists),
                          [&promise](std::optional<std::vector<Reminder>> reminders) {
                            promise.set_value(std::move(reminders));
                          });
    return future.get();
  }

  std::pair<bool, std::optional<rem::Error>> requestAccess() {
    std::promise<std::pair<bool, std::optional<rem::Error>>> promise;
    auto future = promise.get_future();
    store_.requestAccess([&promise](bool granted, std::optional<rem::Error> error) {
      promise.set_value({granted, std::move(error)});
    });
    return future.get();
  }

  MemoryReminderStore store_;
  ReminderList home_;
  ReminderList work_;
  ReminderList shared_;
};

TEST_F(MemoryReminderStoreTest, ListsKeepStoreOrder) {
  auto lists = store_.lists();
  ASSERT_OK(lists);
  ASSERT_EQ(lists->size(), 3u);
  EXPECT_EQ((*lists)[0].title(), "Home");
  EXPECT_EQ((*lists)[1].title(), "Work");
  EXPECT_EQ((*lists)[2].title(), "Shared");
  EXPECT_FALSE((*lists)[2].allowsContentModifications());
}

TEST_F(MemoryReminderStoreTest, AccessGrantedByDefault) {
  auto [granted, error] = requestAccess();
  EXPECT_TRUE(granted);
  EXPECT_FALSE(error.has_value());
}

TEST_F(MemoryReminderStoreTest, AccessCanBeDenied) {
  store_.setAccessGranted(false);
  auto [granted, error] = requestAccess();
  EXPECT_FALSE(granted);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code(), ErrorCode::kAccessDenied);
}

TEST_F(MemoryReminderStoreTest, FetchReturnsOnlyPredicateLists) {
  store_.addReminder(makeReminder(home_, "A"));
  store_.addReminder(makeReminder(work_, "B"));
  store_.addReminder(makeReminder(home_, "C", std::nullopt, true));

  auto home = fetch({home_});
  ASSERT_TRUE(home.has_value());
  ASSERT_EQ(home->size(), 2u);
  EXPECT_EQ((*home)[0].title().value_or(""), "A");
  EXPECT_EQ((*home)[1].title().value_or(""), "C");
  EXPECT_TRUE((*home)[1].isCompleted());

  auto both = fetch({work_, home_});
  ASSERT_TRUE(both.has_value());
  ASSERT_EQ(both->size(), 3u);
  EXPECT_EQ((*both)[1].title().value_or(""), "B");
}

TEST_F(MemoryReminderStoreTest, FetchFailureDeliversNullopt) {
  store_.setFetchFailure(true);
  EXPECT_FALSE(fetch({home_}).has_value());
}

TEST_F(MemoryReminderStoreTest, SaveWithCommitIsVisibleImmediately) {
  auto reminder = makeReminder(home_, "Water plants");
  ASSERT_OK(store_.save(reminder, true));

  EXPECT_EQ(store_.reminderCount(), 1u);
  EXPECT_EQ(store_.stagedChanges(), 0u);

  reminder.setCompleted(true);
  ASSERT_OK(store_.save(reminder, true));
  EXPECT_EQ(store_.reminderCount(), 1u);

  auto fetched = fetch({home_});
  ASSERT_TRUE(fetched.has_value());
  ASSERT_EQ(fetched->size(), 1u);
  EXPECT_TRUE(fetched->front().isCompleted());
}

TEST_F(MemoryReminderStoreTest, SaveWithoutCommitIsStaged) {
  ASSERT_OK(store_.save(makeReminder(home_, "one"), false));
  ASSERT_OK(store_.save(makeReminder(home_, "two"), false));

  EXPECT_EQ(store_.stagedChanges(), 2u);
  EXPECT_EQ(store_.reminderCount(), 0u);

  ASSERT_OK(store_.commit());
  EXPECT_EQ(store_.stagedChanges(), 0u);
  EXPECT_EQ(store_.reminderCount(), 2u);
}

TEST_F(MemoryReminderStoreTest, SaveRejectsUnknownAndReadOnlyLists) {
  auto stray = ReminderList::create("Elsewhere");
  EXPECT_ERROR(store_.save(makeReminder(stray, "x"), true), ErrorCode::kNotFound);
  EXPECT_ERROR(store_.save(makeReminder(shared_, "x"), true), ErrorCode::kPermissionDenied);
  EXPECT_EQ(store_.reminderCount(), 0u);
}

TEST_F(MemoryReminderStoreTest, InjectedSaveFailureIsReturned) {
  store_.setSaveFailure(rem::makeError(ErrorCode::kStoreError, "disk on fire"));

  auto result = store_.save(makeReminder(home_, "x"), true);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "disk on fire");
  EXPECT_EQ(store_.reminderCount(), 0u);
}

TEST_F(MemoryReminderStoreTest, CreateListAppendsWritableList) {
  auto created = store_.createList("Errands");
  ASSERT_OK(created);
  EXPECT_EQ(created->title(), "Errands");
  EXPECT_TRUE(created->allowsContentModifications());

  auto lists = store_.lists();
  ASSERT_OK(lists);
  ASSERT_EQ(lists->size(), 4u);
  EXPECT_EQ(lists->back().id(), created->id());
}

TEST_F(MemoryReminderStoreTest, CreateListRejectsDuplicatesAndEmptyTitles) {
  EXPECT_ERROR(store_.createList("HOME"), ErrorCode::kValidationError);
  EXPECT_ERROR(store_.createList(""), ErrorCode::kInvalidArgument);

  auto lists = store_.lists();
  ASSERT_OK(lists);
  EXPECT_EQ(lists->size(), 3u);
}
