#include <gtest/gtest.h>

#include <fstream>
#include <future>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "rem/store/filesystem_reminder_store.hpp"
#include "rem/util/filesystem.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace rem::store;
using rem::ErrorCode;
using rem::core::Reminder;
using rem::test::makeReminder;

class FilesystemReminderStoreTest : public ::testing::Test {
 protected:
  std::filesystem::path storeFile() const { return temp_dir_.path() / "data" / "reminders.json"; }

  std::unique_ptr<FilesystemReminderStore> openStore() {
    auto store = std::make_unique<FilesystemReminderStore>(
        FilesystemReminderStore::Config{storeFile(), "Inbox"});
    auto loaded = store->load();
    EXPECT_TRUE(loaded.has_value()) << loaded.error().message();
    return store;
  }

  nlohmann::json readDocument() const {
    auto content = rem::util::FileSystem::readFile(storeFile());
    EXPECT_TRUE(content.has_value());
    return nlohmann::json::parse(content.value_or("{}"));
  }

  rem::test::TempDirectory temp_dir_;
};

TEST_F(FilesystemReminderStoreTest, MissingDocumentStartsWithDefaultList) {
  auto store = openStore();

  auto lists = store->lists();
  ASSERT_OK(lists);
  ASSERT_EQ(lists->size(), 1u);
  EXPECT_EQ(lists->front().title(), "Inbox");
  EXPECT_TRUE(lists->front().allowsContentModifications());

  EXPECT_FALSE(std::filesystem::exists(storeFile()));
}

TEST_F(FilesystemReminderStoreTest, CommitWritesDocument) {
  auto store = openStore();
  auto inbox = store->lists()->front();

  ASSERT_OK(store->save(makeReminder(inbox, "Buy milk"), true));
  ASSERT_TRUE(std::filesystem::exists(storeFile()));

  auto document = readDocument();
  EXPECT_EQ(document["version"], FilesystemReminderStore::kFormatVersion);
  ASSERT_EQ(document["lists"].size(), 1u);
  EXPECT_EQ(document["lists"][0]["title"], "Inbox");
  ASSERT_EQ(document["reminders"].size(), 1u);
  EXPECT_EQ(document["reminders"][0]["title"], "Buy milk");
  EXPECT_EQ(document["reminders"][0]["list"], inbox.id().toString());
}

TEST_F(FilesystemReminderStoreTest, StagedChangesAreNotWrittenUntilCommit) {
  auto store = openStore();
  auto inbox = store->lists()->front();

  ASSERT_OK(store->save(makeReminder(inbox, "Later"), false));
  EXPECT_FALSE(std::filesystem::exists(storeFile()));

  ASSERT_OK(store->commit());
  EXPECT_EQ(readDocument()["reminders"].size(), 1u);
}

TEST_F(FilesystemReminderStoreTest, ReopenedStoreSeesPersistedState) {
  rem::core::ObjectId completed_id;
  {
    auto store = openStore();
    auto inbox = store->lists()->front();
    auto errands = store->createList("Errands");
    ASSERT_OK(errands);

    auto done = makeReminder(*errands, "Post letter",
                             rem::core::DateComponents{2025, 1, 2, std::nullopt, std::nullopt,
                                                       std::nullopt});
    done.setCompleted(true);
    completed_id = done.id();
    ASSERT_OK(store->save(done, true));
    ASSERT_OK(store->save(makeReminder(inbox, "Call mum"), true));
  }

  auto store = openStore();
  auto lists = store->lists();
  ASSERT_OK(lists);
  ASSERT_EQ(lists->size(), 2u);
  EXPECT_EQ((*lists)[1].title(), "Errands");
  EXPECT_EQ(store->reminderCount(), 2u);

  std::promise<std::optional<std::vector<Reminder>>> promise;
  auto future = promise.get_future();
  store->fetchReminders(store->predicateForReminders({(*lists)[1]}),
                        [&promise](std::optional<std::vector<Reminder>> reminders) {
                          promise.set_value(std::move(reminders));
                        });
  auto fetched = future.get();
  ASSERT_TRUE(fetched.has_value());
  ASSERT_EQ(fetched->size(), 1u);
  EXPECT_EQ(fetched->front().id(), completed_id);
  EXPECT_TRUE(fetched->front().isCompleted());
  ASSERT_TRUE(fetched->front().dueDateComponents().has_value());
  EXPECT_FALSE(fetched->front().dueDateComponents()->hasTime());
}

TEST_F(FilesystemReminderStoreTest, CorruptDocumentIsParseError) {
  temp_dir_.createSubdir("data");
  temp_dir_.createFile("data/reminders.json", "{ not json");

  FilesystemReminderStore store(FilesystemReminderStore::Config{storeFile(), "Inbox"});
  EXPECT_ERROR(store.load(), ErrorCode::kParseError);
}

TEST_F(FilesystemReminderStoreTest, UnknownVersionIsRejected) {
  temp_dir_.createSubdir("data");
  temp_dir_.createFile("data/reminders.json", R"({"version": 7, "lists": [], "reminders": []})");

  FilesystemReminderStore store(FilesystemReminderStore::Config{storeFile(), "Inbox"});
  EXPECT_ERROR(store.load(), ErrorCode::kStoreError);
}

TEST_F(FilesystemReminderStoreTest, AccessGrantedForWritableDirectory) {
  auto store = openStore();

  std::promise<bool> promise;
  auto future = promise.get_future();
  store->requestAccess([&promise](bool granted, std::optional<rem::Error>) {
    promise.set_value(granted);
  });

  EXPECT_TRUE(future.get());
  EXPECT_TRUE(std::filesystem::is_directory(storeFile().parent_path()));
}
