#include <gtest/gtest.h>

#include "../IOManager.hpp"
#include "../Organizer.hpp"
#include "TestTree.hpp"

class IOManagerTest : public TestTree {};

TEST_F(IOManagerTest, LoadsEverySetting) {
  const fs::path configPath = CreateDummyFile("config.json", R"({
    "scan": { "older_than_days": 14, "max_depth": 5 },
    "delete": { "older_than_days": 120 },
    "archive": { "destination": "/srv/archive" },
    "log_file": "custom.log",
    "journal_file": "custom_journal.json"
  })");

  auto config = IOManager::load_config(configPath);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->scan_older_than_days, 14u);
  EXPECT_EQ(config->scan_max_depth, 5);
  EXPECT_EQ(config->delete_older_than_days, 120u);
  EXPECT_EQ(config->archive_destination, fs::path("/srv/archive"));
  EXPECT_EQ(config->log_file, fs::path("custom.log"));
  EXPECT_EQ(config->journal_file, fs::path("custom_journal.json"));
}

TEST_F(IOManagerTest, MissingKeysKeepDefaults) {
  const fs::path configPath =
      CreateDummyFile("config.json", R"({ "scan": { "older_than_days": 7 } })");

  auto config = IOManager::load_config(configPath);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->scan_older_than_days, 7u);
  EXPECT_EQ(config->scan_max_depth, kDefaultTreeDepth);
  EXPECT_EQ(config->delete_older_than_days, 90u);
  EXPECT_TRUE(config->archive_destination.empty());
}

TEST_F(IOManagerTest, RejectsMalformedJson) {
  const fs::path configPath =
      CreateDummyFile("config.json", R"({ "scan": { "older_than_days": )");

  EXPECT_FALSE(IOManager::load_config(configPath).has_value());
}

TEST_F(IOManagerTest, RejectsWrongTypes) {
  const fs::path configPath = CreateDummyFile(
      "config.json", R"({ "scan": { "older_than_days": "thirty" } })");

  EXPECT_FALSE(IOManager::load_config(configPath).has_value());
}

TEST_F(IOManagerTest, RejectsNegativeDepth) {
  const fs::path configPath =
      CreateDummyFile("config.json", R"({ "scan": { "max_depth": -1 } })");

  EXPECT_FALSE(IOManager::load_config(configPath).has_value());
}

TEST_F(IOManagerTest, MissingFileReturnsNothing) {
  EXPECT_FALSE(IOManager::load_config(test_dir / "nope.json").has_value());
}

TEST_F(IOManagerTest, UndoRestoresOrganizedFiles) {
  CreateDummyFile("inbox/report.pdf", "pdf");
  CreateDummyFile("inbox/setup.deb", "deb");
  const fs::path journalPath = test_dir / "journal.json";
  Organizer organizer(test_dir / "inbox");
  std::vector<JournalEntry> journal;
  organizer.organize(false, journal);
  ASSERT_EQ(journal.size(), 2u);

  IOManager::save_journal(journalPath, journal);
  ASSERT_TRUE(fs::exists(journalPath));
  IOManager::run_undo(journalPath);

  EXPECT_EQ(ReadFile(test_dir / "inbox" / "report.pdf"), "pdf");
  EXPECT_EQ(ReadFile(test_dir / "inbox" / "setup.deb"), "deb");
  EXPECT_FALSE(fs::exists(test_dir / "inbox" / "Documents" / "report.pdf"));
  EXPECT_FALSE(fs::exists(journalPath));
}

TEST_F(IOManagerTest, LogHandlerReceivesTimestampedLines) {
  std::vector<std::string> lines;
  IOManager::set_log_handler(
      [&lines](std::string_view line) { lines.emplace_back(line); });
  IOManager::log("hello from the test");
  IOManager::set_log_handler(nullptr);

  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find(" | hello from the test"), std::string::npos);
}

TEST_F(IOManagerTest, LinesLoggedBeforeInitializeGoToTheConfiguredFile) {
  const fs::path logPath = test_dir / "custom.log";
  IOManager::close_logger();

  IOManager::log("found config");
  IOManager::initialize_logger(logPath);
  IOManager::log("started");
  IOManager::close_logger();

  const std::string contents = ReadFile(logPath);
  const auto early = contents.find(" | found config\n");
  const auto late = contents.find(" | started\n");
  ASSERT_NE(early, std::string::npos);
  ASSERT_NE(late, std::string::npos);
  EXPECT_LT(early, late);
  EXPECT_EQ(contents.find(" | hello from the test"), std::string::npos);
}
