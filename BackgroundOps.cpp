#include "BackgroundOps.hpp"

#include <format>
#include <utility>

#include "IOManager.hpp"

namespace {

std::string failure_status(const std::exception& e) {
  if (const auto* sweep = dynamic_cast<const SweepError*>(&e)) {
    IOManager::log(std::format("ERROR ({}): {}", to_string(sweep->kind()),
                               sweep->what()));
  } else {
    IOManager::log(std::format("CRITICAL ERROR: {}", e.what()));
  }
  return std::format("Failed: {}", e.what());
}

}  // namespace

OperationOutcome run_then_rescan(const std::function<std::string()>& work,
                                 const std::function<ScanReport()>& rescan) {
  OperationOutcome outcome;
  try {
    outcome.status = work();
  } catch (const std::exception& e) {
    outcome.status = failure_status(e);
    outcome.failed = true;
  }

  try {
    outcome.report = rescan();
  } catch (const std::exception& e) {
    const std::string rescan_status = failure_status(e);
    if (!outcome.failed) {
      outcome.status = rescan_status;
      outcome.failed = true;
    }
  }
  return outcome;
}

void WorkerSet::start(std::function<void(const std::stop_token&)> task) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::jthread thread([done, task = std::move(task)](
                          const std::stop_token& stoken) {
    task(stoken);
    *done = true;
  });
  m_workers.push_back(Worker{std::move(done), std::move(thread)});
}

void WorkerSet::reap_finished() {
  for (auto& worker : m_workers) {
    if (*worker.done && worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  std::erase_if(m_workers,
                [](const Worker& w) { return !w.thread.joinable(); });
}

void WorkerSet::request_stop_all() {
  for (auto& worker : m_workers) {
    worker.thread.request_stop();
  }
}
