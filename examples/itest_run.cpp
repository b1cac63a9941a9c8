/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file itest_run.cpp
 * @brief itest-run: load settings, select cases, run them one by one.
 *
 * Usage: itest-run [-c config] [-v] [-q] [selector...]
 *
 *   -c FILE  settings file (INI / JSON / YAML by extension), default
 *            ./itest.ini when it exists
 *   -v       more output; twice echoes every case log to stdout
 *   -q       only the summary
 *
 * Selectors are case files, directories, components, "!component",
 * "a&&b" intersections or [suites] aliases. Without a selector the whole
 * cases root is run. The exit status is 0 only when no case failed or
 * errored. Ctrl-C stops the current case and skips the rest.
 */

#include "itest/case_runner.hpp"
#include "itest/fs.hpp"
#include "itest/interrupt.hpp"
#include "itest/loader.hpp"
#include "itest/log.hpp"
#include "itest/result.hpp"
#include "itest/settings.hpp"
#include "itest/workspace.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

static constexpr const char* kDefaultConfigPath = "itest.ini";
static constexpr const char* kDefaultWorkspace = "/tmp/itest-workspace";

static void PrintUsage(const char* prog) {
  std::fprintf(stderr, "Usage: %s [-c config] [-v] [-q] [selector...]\n", prog);
}

int main(int argc, char* argv[]) {
  itest::log::Init();

  const char* config_path = nullptr;
  int verbose_delta = 0;
  bool quiet = false;
  int opt;
  while ((opt = ::getopt(argc, argv, "c:vqh")) != -1) {
    switch (opt) {
      case 'c': config_path = optarg; break;
      case 'v': ++verbose_delta; break;
      case 'q': quiet = true; break;
      case 'h': PrintUsage(argv[0]); return 0;
      default: PrintUsage(argv[0]); return 2;
    }
  }

  // ---- 1. Settings ----
  itest::Settings settings;
  if (config_path == nullptr && itest::detail::IsRegularFile(kDefaultConfigPath)) {
    config_path = kDefaultConfigPath;
  }
  if (config_path != nullptr) {
    auto loaded = itest::LoadSettings(config_path);
    if (!loaded.has_value()) {
      std::fprintf(stderr, "itest-run: bad settings file %s: %s\n", config_path,
                   itest::ErrorName(loaded.get_error()));
      return 2;
    }
    settings = loaded.value();
  }
  itest::log::SetLevel(settings.log_level);
  int verbose = quiet ? 0 : settings.verbose + verbose_delta;

  // ---- 2. Interrupt handling ----
  itest::InterruptMonitor monitor;
  auto installed = monitor.InstallSignalHandlers();
  if (!installed.has_value()) {
    ITEST_LOG_WARN("main", "Ctrl-C handling unavailable, continuing without it");
  }

  // ---- 3. Select cases ----
  std::vector<std::string> selectors;
  for (int i = optind; i < argc; ++i) selectors.emplace_back(argv[i]);

  itest::TestLoader loader(settings);
  auto suite = loader.LoadArgs(selectors);
  if (!suite.has_value()) {
    std::fprintf(stderr, "itest-run: cannot load tests\n");
    return 2;
  }
  ITEST_LOG_INFO("main", "%zu case(s) selected", suite.value().size());

  // ---- 4. Run ----
  itest::TempWorkspace workspace(settings.workspace.empty() ? kDefaultWorkspace
                                                            : settings.workspace);
  itest::CaseRunner runner(settings, workspace, installed.has_value() ? &monitor : nullptr);
  itest::TextResult result(stdout, verbose);

  for (auto& kv : suite.value()) {
    auto r = runner.Run(kv.second, result, settings.machine_labels, verbose);
    if (!r.has_value()) {
      std::fprintf(stderr, "\nitest-run: interrupted, remaining cases skipped\n");
      break;
    }
  }

  result.PrintSummary();
  itest::log::Shutdown();
  return result.WasSuccessful() ? 0 : 1;
}
