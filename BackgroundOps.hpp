#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "types.hpp"

// Result of one UI operation followed by a rescan of the root.
struct OperationOutcome {
  // Empty when the rescan failed as well; the old report must not be shown.
  std::optional<ScanReport> report;
  std::string status;
  bool failed = false;
};

// Runs `work`, then `rescan`, whether or not `work` threw. A failed archive or
// trash run may have moved some items already, so the listing is always
// rebuilt. Errors are logged and reported in `status`. Never throws.
OperationOutcome run_then_rescan(const std::function<std::string()>& work,
                                 const std::function<ScanReport()>& rescan);

// Worker threads of the UI. Finished workers are joined and dropped by
// reap_finished(); the rest are joined on destruction.
class WorkerSet {
 public:
  void start(std::function<void(const std::stop_token&)> task);
  void reap_finished();
  void request_stop_all();
  std::size_t size() const { return m_workers.size(); }

 private:
  struct Worker {
    std::shared_ptr<std::atomic<bool>> done;
    std::jthread thread;
  };
  std::vector<Worker> m_workers;
};
