#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "../Archiver.hpp"
#include "../BackgroundOps.hpp"
#include "../StaleScanner.hpp"
#include "TestTree.hpp"

class RunThenRescanTest : public TestTree {};

TEST_F(RunThenRescanTest, FailedArchiveRunStillRefreshesTheListing) {
  CreateDummyFile("first/a.txt");
  CreateDummyFile("second/b.txt");
  Backdate(test_dir / "first", 100);
  Backdate(test_dir / "second", 90);
  const fs::path root = test_dir;
  const fs::path dest = test_dir.parent_path() /
                        (test_dir.filename().string() + "_archive");
  ScanReport before = StaleScanner::scan(root, 30);
  ASSERT_EQ(before.stale.size(), 2u);
  // The second move fails because its source vanished after the scan.
  before.stale[1].path = root / "vanished";

  OperationOutcome outcome = run_then_rescan(
      [&] {
        Archiver::apply_plan(Archiver::build_plan(before, dest));
        return std::string("Archived.");
      },
      [&] { return StaleScanner::scan(root, 30); });

  EXPECT_TRUE(outcome.failed);
  EXPECT_EQ(outcome.status.rfind("Failed: ", 0), 0u);
  ASSERT_TRUE(outcome.report.has_value());
  ASSERT_EQ(outcome.report->stale.size(), 1u);
  EXPECT_EQ(outcome.report->stale[0].path, root / "second");
  std::error_code ec;
  fs::remove_all(dest, ec);
}

TEST_F(RunThenRescanTest, SuccessKeepsWorkStatus) {
  OperationOutcome outcome = run_then_rescan(
      [] { return std::string("Done."); },
      [&] { return StaleScanner::scan(test_dir, 30); });

  EXPECT_FALSE(outcome.failed);
  EXPECT_EQ(outcome.status, "Done.");
  ASSERT_TRUE(outcome.report.has_value());
  EXPECT_EQ(outcome.report->scanned_count, 0u);
}

TEST_F(RunThenRescanTest, FailedRescanDropsTheReport) {
  OperationOutcome outcome = run_then_rescan(
      [] { return std::string("Done."); },
      [&] { return StaleScanner::scan(test_dir / "gone", 30); });

  EXPECT_TRUE(outcome.failed);
  EXPECT_EQ(outcome.status.rfind("Failed: ", 0), 0u);
  EXPECT_FALSE(outcome.report.has_value());
}

TEST_F(RunThenRescanTest, WorkErrorWinsOverRescanError) {
  OperationOutcome outcome = run_then_rescan(
      []() -> std::string {
        throw SweepError(ErrorKind::Move, "first failure");
      },
      [&] { return StaleScanner::scan(test_dir / "gone", 30); });

  EXPECT_TRUE(outcome.failed);
  EXPECT_EQ(outcome.status, "Failed: first failure");
  EXPECT_FALSE(outcome.report.has_value());
}

namespace {

// Reaps until the set is empty or about five seconds have passed.
void ReapUntilEmpty(WorkerSet& workers) {
  for (int i = 0; i < 500 && workers.size() > 0; ++i) {
    workers.reap_finished();
    if (workers.size() > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
}

}  // namespace

TEST(WorkerSetTest, FinishedWorkersAreJoinedAndDropped) {
  WorkerSet workers;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  workers.start([](const std::stop_token&) {});
  workers.start([released](const std::stop_token&) { released.wait(); });
  ASSERT_EQ(workers.size(), 2u);

  for (int i = 0; i < 500 && workers.size() > 1; ++i) {
    workers.reap_finished();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(workers.size(), 1u);

  release.set_value();
  ReapUntilEmpty(workers);
  EXPECT_EQ(workers.size(), 0u);
}

TEST(WorkerSetTest, RequestStopReachesRunningWorkers) {
  WorkerSet workers;
  workers.start([](const std::stop_token& stoken) {
    while (!stoken.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  });

  workers.reap_finished();
  EXPECT_EQ(workers.size(), 1u);

  workers.request_stop_all();
  ReapUntilEmpty(workers);
  EXPECT_EQ(workers.size(), 0u);
}
