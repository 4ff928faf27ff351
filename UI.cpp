#include "UI.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "DateFilter.hpp"
#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(const Config& config, std::shared_ptr<const MetadataProbe> probe)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_config(config),
      m_session(m_config, std::move(probe)),
      m_status_text("Fill in the folders and press 'Start'."),
      m_start_button_label("  Start  ") {
  IOManager::log("Initializing UI components...");

  try {
    m_log_component = Renderer([&] {
      Elements logs;
      {
        std::scoped_lock lock(m_log_mutex);
        for (const auto& msg : m_log_messages) {
          logs.push_back(text(msg));
        }
      }
      return vbox(logs) | vscroll_indicator | frame | flex;
    });
  } catch (const std::exception& e) {
    IOManager::log(std::format(
        "CRITICAL: Failed to initialize UI components: {}", e.what()));
    throw;
  }
}

void UI::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 200) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::cleanup_finished_threads() {
  std::erase_if(m_worker_threads,
                [](const std::jthread& t) { return !t.joinable(); });
}

void UI::start_import() {
  if (m_is_operation_in_progress) return;

  if (trim_ascii(m_source_text).empty() || trim_ascii(m_event_text).empty() ||
      trim_ascii(m_user_text).empty()) {
    m_status_text = "Source folder, event folder and name are all required.";
    return;
  }

  const std::string date_input = trim_ascii(m_date_text);
  if (date_input.empty()) {
    launch_import(std::nullopt);
    return;
  }

  auto window = DateFilter::parse(date_input);
  if (!window) {
    IOManager::log(std::format("Error parsing date input: {}", window.error()));
    m_date_error_text = window.error();
    m_show_date_dialog = true;
    return;
  }
  launch_import(*window);
}

void UI::launch_import(std::optional<DateWindow> window) {
  cleanup_finished_threads();

  ImportRequest request{utf8_to_path(trim_ascii(m_source_text)),
                        utf8_to_path(trim_ascii(m_event_text)),
                        trim_ascii(m_user_text), window};

  m_files_done = 0;
  m_files_total = 0;
  m_status_text = "Import in progress...";
  m_is_operation_in_progress = true;

  m_worker_threads.emplace_back([self = shared_from_this(),
                                 request = std::move(request)](
                                    const std::stop_token& stoken) {
    try {
      TransferSummary summary = self->m_session.run(
          request, [self, stoken] { return self->ask_identity(stoken); },
          [self](const TransferOutcome&, std::size_t done, std::size_t total) {
            self->m_files_total = total;
            self->m_files_done = done;
            self->m_screen.Post(Event::Custom);
          },
          stoken);

      self->m_screen.Post([self, succeeded = summary.succeeded,
                           skipped = summary.failed.size()] {
        self->m_status_text = std::format(
            "Transfer complete. {} files transferred, {} skipped.", succeeded,
            skipped);
      });
    } catch (const fs::filesystem_error& e) {
      IOManager::log(std::format("ERROR during import: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_status_text = "Import failed: " + error_msg;
      });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR during import: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_status_text = "Import aborted: " + error_msg;
      });
    }
    self->m_is_operation_in_progress = false;
    self->m_screen.Post(Event::Custom);
  });
}

// Runs on the import thread; blocks until the dialog is answered or the
// import is stopped, in which case the answer is empty.
std::string UI::ask_identity(const std::stop_token& stoken) {
  auto promise = std::make_shared<std::promise<std::string>>();
  auto answer = promise->get_future();
  m_screen.Post([self = shared_from_this(), promise] {
    self->m_identity_promise = promise;
    self->m_identity_text.clear();
    self->m_show_identity_dialog = true;
  });
  while (answer.wait_for(std::chrono::milliseconds(100)) !=
         std::future_status::ready) {
    if (stoken.stop_requested()) return {};
  }
  return answer.get();
}

void UI::answer_identity(std::string answer) {
  m_show_identity_dialog = false;
  if (m_identity_promise) {
    m_identity_promise->set_value(std::move(answer));
    m_identity_promise.reset();
  }
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { this->AddLogMessage(message); });

    auto source_input = Input(&m_source_text, "/path/to/memory/card");
    auto event_input = Input(&m_event_text, "/path/to/event");
    auto user_input = Input(&m_user_text, "Your name");
    auto date_input =
        Input(&m_date_text, "DD/MM/YYYY or DD/MM/YYYY - DD/MM/YYYY (optional)");

    auto start_button =
        Button(&m_start_button_label, [this] { start_import(); });

    auto quit_button = Button("  Quit  ", [this] {
      IOManager::log("Quit requested. Stopping worker threads...");
      for (auto& t : m_worker_threads) {
        t.request_stop();
      }
      answer_identity("");
      m_screen.Exit();
    });

    auto form = Container::Vertical({
        source_input,
        event_input,
        user_input,
        date_input,
        Container::Horizontal({start_button, quit_button}),
    });

    auto main_renderer = Renderer(form, [&] {
      const bool is_busy = m_is_operation_in_progress;
      m_start_button_label = is_busy ? "  Busy...  " : "  Start  ";

      const std::size_t done = m_files_done;
      const std::size_t total = m_files_total;
      const float ratio =
          total == 0 ? 0.0f
                     : static_cast<float>(done) / static_cast<float>(total);

      auto field = [](const std::string& label, Component input) {
        return hbox({text(label) | size(WIDTH, EQUAL, 16), input->Render()});
      };

      Element start_element = start_button->Render();
      if (is_busy) start_element = start_element | dim;

      auto top_pane = vbox(
          {hbox({text(" Camera Sorter ") | bold, filler(),
                 text(std::format("{} photo / {} video extensions ",
                                  m_config.photo_extensions.size(),
                                  m_config.video_extensions.size()))}) |
               color(Color::White) | bgcolor(Color::Blue),
           field(" Source folder:", source_input),
           field(" Event folder:", event_input),
           field(" Your name:", user_input),
           field(" Date filter:", date_input), separator(),
           hbox({start_element, quit_button->Render()}), separator(),
           hbox({text(" Processing Files "),
                 gauge(ratio) | flex,
                 text(std::format(" {}/{} ", done, total))}),
           text(" " + m_status_text)});

      auto log_pane =
          vbox({text("Log Output") | bold, m_log_component->Render() | flex});

      return vbox({top_pane, separator(), log_pane | flex}) | border;
    });

    auto continue_button = Button(" Continue without date filter ", [this] {
      m_show_date_dialog = false;
      IOManager::log("Continuing without date filtering due to input error.");
      launch_import(std::nullopt);
    });
    auto abort_button = Button(" Abort ", [this] {
      m_show_date_dialog = false;
      m_status_text = "Import aborted.";
    });
    auto date_dialog_buttons =
        Container::Horizontal({continue_button, abort_button});
    auto date_dialog = Renderer(date_dialog_buttons, [&] {
      return vbox({text("Invalid date filter") | bold,
                   text(m_date_error_text), separator(),
                   date_dialog_buttons->Render()}) |
             border;
    });

    auto identity_input = Input(&m_identity_text, "e.g. EOS R5");
    auto identity_ok =
        Button(" OK ", [this] { answer_identity(m_identity_text); });
    auto identity_container =
        Container::Vertical({identity_input, identity_ok});
    auto identity_dialog = Renderer(identity_container, [&] {
      return vbox({text("No camera model found.") | bold,
                   text("Enter the camera model to tag the files:"),
                   identity_input->Render() | border, identity_ok->Render()}) |
             size(WIDTH, GREATER_THAN, 40) | border;
    });

    auto final_component = main_renderer;
    final_component = Modal(final_component, date_dialog, &m_show_date_dialog);
    final_component =
        Modal(final_component, identity_dialog, &m_show_identity_dialog);

    IOManager::log("Starting UI event loop...");
    m_screen.Loop(final_component);
    IOManager::log("UI event loop exited. Waiting for threads to join...");

    answer_identity("");
    m_worker_threads.clear();

    IOManager::log("All threads joined. Exiting.");
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  }
}
