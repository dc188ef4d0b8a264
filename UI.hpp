#pragma once

#include <atomic>
#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "BackgroundOps.hpp"
#include "types.hpp"

class UI : public std::enable_shared_from_this<UI> {
 public:
  UI(const Config& config, const fs::path& rootDir, const fs::path& destDir);
  void run();

 private:
  void start_scan();
  void archive_selected();
  void trash_selected();
  void run_operation(
      std::string status, std::vector<ProjectItem> items,
      std::function<std::string(const std::vector<ProjectItem>&)> work);
  std::vector<ProjectItem> selected_items() const;
  void update_ui_from_report();

  void AddLogMessage(std::string_view message);
  std::mutex m_log_mutex;
  std::deque<std::string> m_log_messages;

  ftxui::ScreenInteractive m_screen;
  const Config m_config;
  const fs::path m_rootDir;
  const fs::path m_destDir;

  std::optional<ScanReport> m_report;
  std::vector<std::string> m_entries;
  std::vector<bool> m_selections;
  std::string m_status_text;
  int m_selected_entry = 0;
  WorkerSet m_workers;
  std::atomic<bool> m_is_operation_in_progress = false;

  std::string m_scan_button_label;

  ftxui::Component m_list_component;
  ftxui::Component m_log_component;
  ftxui::Component m_main_container;
};
