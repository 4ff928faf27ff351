#pragma once

#include <atomic>
#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "ImportSession.hpp"

class UI : public std::enable_shared_from_this<UI> {
 public:
  UI(const Config& config, std::shared_ptr<const MetadataProbe> probe);
  void run();

 private:
  void start_import();
  void launch_import(std::optional<DateWindow> window);
  std::string ask_identity(const std::stop_token& stoken);
  void answer_identity(std::string answer);
  void cleanup_finished_threads();

  void AddLogMessage(std::string_view message);
  std::mutex m_log_mutex;
  std::deque<std::string> m_log_messages;

  ftxui::ScreenInteractive m_screen;
  Config m_config;
  ImportSession m_session;

  std::string m_source_text;
  std::string m_event_text;
  std::string m_user_text;
  std::string m_date_text;
  std::string m_status_text;

  std::atomic<std::size_t> m_files_done = 0;
  std::atomic<std::size_t> m_files_total = 0;

  bool m_show_date_dialog = false;
  std::string m_date_error_text;
  bool m_show_identity_dialog = false;
  std::string m_identity_text;
  std::shared_ptr<std::promise<std::string>> m_identity_promise;

  std::vector<std::jthread> m_worker_threads;
  std::atomic<bool> m_is_operation_in_progress = false;

  std::string m_start_button_label;

  ftxui::Component m_log_component;
};
