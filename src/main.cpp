#include "ConsoleShell.h"
#include "CoreSettings.h"
#include "LocalStorageBackend.h"
#include "WxScheduler.h"
#include "Workspace.h"

#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/config.h>
#include <wx/fileconf.h>
#include <wx/log.h>

#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

constexpr auto kIdlePoll = std::chrono::milliseconds(50);

class MosaicApp final : public wxAppConsole {
public:
  void OnInitCmdLine(wxCmdLineParser& parser) override {
    wxAppConsole::OnInitCmdLine(parser);

    parser.AddParam("PATH", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddParam("PATH", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddOption("l", "layout", "grid layout as RxC, e.g. 2x2");
    parser.AddOption("c", "config", "settings file (defaults to the user config)");

    parser.SetLogo("Usage: mosaic [PATH] [PATH] [--layout RxC] [--config FILE]\n\n"
                   "If 1 path is provided, every panel opens it.\n"
                   "If 2 paths are provided, the first panel opens the first and the rest open the second.\n");
  }

  bool OnCmdLineParsed(wxCmdLineParser& parser) override {
    if (!wxAppConsole::OnCmdLineParsed(parser)) return false;

    for (size_t i = 0; i < parser.GetParamCount(); i++) {
      m_paths.push_back(parser.GetParam(i).ToStdString());
    }

    wxString layout;
    if (parser.Found("layout", &layout)) {
      const auto x = layout.Lower().Find('x');
      long rows = 0;
      long cols = 0;
      if (x == wxNOT_FOUND || !layout.Left(x).ToLong(&rows) || !layout.Mid(x + 1).ToLong(&cols) ||
          rows < 1 || cols < 1) {
        wxLogError("Invalid layout '%s', expected RxC", layout);
        return false;
      }
      m_rows = static_cast<int>(rows);
      m_cols = static_cast<int>(cols);
    }

    parser.Found("config", &m_configPath);
    return true;
  }

  bool OnInit() override {
    if (!wxAppConsole::OnInit()) return false;

    std::unique_ptr<wxConfigBase> cfg;
    if (!m_configPath.empty()) {
      cfg = std::make_unique<wxFileConfig>("Mosaic", wxEmptyString, m_configPath, wxEmptyString,
                                           wxCONFIG_USE_LOCAL_FILE);
    } else {
      cfg = std::make_unique<wxConfig>("Mosaic");
    }
    auto settings = mosaic::LoadCoreSettings(*cfg);
    if (!cfg->HasGroup("/core")) mosaic::SaveCoreSettings(*cfg, settings);
    if (m_rows > 0) {
      settings.defaultLayout = {.rows = m_rows, .cols = m_cols, .name = mosaic::LayoutName(m_rows, m_cols)};
    }

    m_scheduler = std::make_unique<mosaic::WxScheduler>();
    auto* scheduler = m_scheduler.get();
    m_backend = std::make_unique<mosaic::LocalStorageBackend>(
        [scheduler](std::function<void()> fn) { scheduler->Post(std::move(fn)); });
    m_dialogs = std::make_unique<mosaic::ConsoleDialogService>(std::cout);
    m_workspace = std::make_unique<mosaic::Workspace>(*m_backend, *m_dialogs, *m_scheduler, settings);
    m_shell = std::make_unique<mosaic::ConsoleShell>(*m_workspace, *m_dialogs, std::cout);

    m_workspace->LoadPanels(m_paths);
    m_shell->PrintHelp();
    StartReader();
    ScheduleExitCheck();
    return true;
  }

  int OnExit() override {
    if (m_reader.joinable()) m_reader.join();
    m_shell.reset();
    m_workspace.reset();
    m_dialogs.reset();
    m_backend.reset();
    m_scheduler.reset();
    return wxAppConsole::OnExit();
  }

private:
  // stdin is read on its own thread; each line is handed to the main thread
  // and the reader waits until it has been handled, so input stays ordered
  // and the thread ends as soon as it sees "quit" or end of input.
  void StartReader() {
    m_reader = std::thread([this]() {
      std::string line;
      while (std::getline(std::cin, line)) {
        auto handled = std::make_shared<std::promise<bool>>();
        auto result = handled->get_future();
        CallAfter([this, line, handled]() { handled->set_value(m_shell->HandleLine(line)); });
        if (!result.get()) return;
      }
      CallAfter([this]() {
        m_inputClosed = true;
        // Nobody is left to answer an open prompt.
        if (m_dialogs->HasPending()) m_dialogs->Answer(".");
      });
    });
  }

  void ScheduleExitCheck() {
    m_scheduler->CallLater(kIdlePoll, [this]() {
      const bool done = m_inputClosed || m_shell->QuitRequested();
      if (done && !m_workspace->IsBusy()) {
        ExitMainLoop();
        return;
      }
      ScheduleExitCheck();
    });
  }

  std::vector<std::string> m_paths;
  int m_rows{0};
  int m_cols{0};
  wxString m_configPath;
  bool m_inputClosed{false};

  std::unique_ptr<mosaic::WxScheduler> m_scheduler;
  std::unique_ptr<mosaic::LocalStorageBackend> m_backend;
  std::unique_ptr<mosaic::ConsoleDialogService> m_dialogs;
  std::unique_ptr<mosaic::Workspace> m_workspace;
  std::unique_ptr<mosaic::ConsoleShell> m_shell;
  std::thread m_reader;
};

wxIMPLEMENT_APP_CONSOLE(MosaicApp);
