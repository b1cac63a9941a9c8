/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file case_runner.hpp
 * @brief Run lifecycle of one test case.
 *
 * States:
 * @verbatim
 *   Init -> ConditionsChecked -> WorkspaceAcquired -> LoggingOpen
 *        -> Setup -> Steps -> Teardown -> Done
 *
 *   ConditionsChecked -> Skipped      (condition predicate rejects machine)
 *   any later state   -> Exception    (workspace, log or script failure)
 *   Setup/Steps/Teardown -> Failure   (operator interrupt, returned as error)
 * @endverbatim
 *
 * Every run reports TestStart(), exactly one Add*() and TestStop(), in that
 * order. The run log is closed and cleaned before TestStop().
 *
 * Only the steps exit status decides Success/Failure. A phase that cannot
 * be driven (spawn/io error, timeout) is logged and counts as status -1.
 * Teardown runs whenever setup returned, whatever steps did.
 */

#ifndef ITEST_CASE_RUNNER_HPP_
#define ITEST_CASE_RUNNER_HPP_

#include "itest/expect.hpp"
#include "itest/fs.hpp"
#include "itest/interrupt.hpp"
#include "itest/log.hpp"
#include "itest/result.hpp"
#include "itest/run_log.hpp"
#include "itest/script.hpp"
#include "itest/settings.hpp"
#include "itest/sudo.hpp"
#include "itest/test_case.hpp"
#include "itest/vocabulary.hpp"
#include "itest/workspace.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace itest {

enum class RunState : uint8_t {
  kInit = 0,
  kConditionsChecked,
  kWorkspaceAcquired,
  kLoggingOpen,
  kSetup,
  kSteps,
  kTeardown,
  kDone,
  kSkipped,
  kException,
  kFailure,
};

inline const char* RunStateName(RunState s) {
  switch (s) {
    case RunState::kInit:              return "Init";
    case RunState::kConditionsChecked: return "ConditionsChecked";
    case RunState::kWorkspaceAcquired: return "WorkspaceAcquired";
    case RunState::kLoggingOpen:       return "LoggingOpen";
    case RunState::kSetup:             return "Setup";
    case RunState::kSteps:             return "Steps";
    case RunState::kTeardown:          return "Teardown";
    case RunState::kDone:              return "Done";
    case RunState::kSkipped:           return "Skipped";
    case RunState::kException:         return "Exception";
    case RunState::kFailure:           return "Failure";
  }
  return "Unknown";
}

/// Exit status reported for a phase the automaton could not drive.
static constexpr int kPhaseErrorStatus = -1;

class CaseRunner final {
 public:
  /**
   * @param settings  Credential, deadlines and coverage switches.
   * @param workspace Source of run directories; must outlive the runner.
   * @param interrupt Operator interrupt source, may be nullptr.
   */
  CaseRunner(const Settings& settings, WorkspaceProvider& workspace,
             const InterruptMonitor* interrupt = nullptr)
      : settings_(settings), workspace_(workspace), interrupt_(interrupt) {}

  CaseRunner(const CaseRunner&) = delete;
  CaseRunner& operator=(const CaseRunner&) = delete;

  /**
   * @brief Run @p tc once and report it to @p result.
   * @param labels  Labels of the machine, matched against the conditions.
   * @param verbose Above 1 the run log is echoed to stdout.
   * @return The outcome reported to @p result, or RunError::kCancelled
   *         after an operator interrupt (reported as a failure). The caller
   *         must not start further runs after kCancelled.
   */
  expected<RunOutcome, RunError> Run(TestCase& tc, ResultSink& result,
                                     const std::set<std::string>& labels,
                                     int verbose = 1) {
    result.TestStart(tc);
    tc.run = CaseRunState();
    char ts[32];
    FormatNow(ts, sizeof(ts));
    tc.run.start_time = ts;
    state_ = RunState::kInit;

    RunLog log;
    RunOutcome outcome;
    bool cancelled = false;
    Execute(tc, labels, verbose, log, outcome, cancelled);

    if (cancelled) {
      state_ = RunState::kFailure;
      outcome.kind = OutcomeKind::kFailure;
      outcome.reason = "interrupted";
    }
    tc.run.was_successful = outcome.kind == OutcomeKind::kSuccess;
    tc.run.was_skipped = outcome.kind == OutcomeKind::kSkipped;

    switch (outcome.kind) {
      case OutcomeKind::kSuccess:   result.AddSuccess(tc); break;
      case OutcomeKind::kFailure:   result.AddFailure(tc); break;
      case OutcomeKind::kSkipped:   result.AddSkipped(tc, outcome.reason); break;
      case OutcomeKind::kException: result.AddException(tc, outcome.reason); break;
    }

    if (log.IsOpen()) {
      log.Close();
      if (!StripEscapeSequencesInFile(tc.run.logname)) {
        ITEST_LOG_WARN("runner", "cannot clean log %s", tc.run.logname.c_str());
      }
    }
    result.TestStop(tc);

    ITEST_LOG_DEBUG("runner", "%s: %s (%s)", tc.filename.c_str(),
                    OutcomeName(outcome.kind), RunStateName(state_));
    if (cancelled) {
      return expected<RunOutcome, RunError>::error(RunError::kCancelled);
    }
    return expected<RunOutcome, RunError>::success(outcome);
  }

  /// @brief State reached by the last Run().
  RunState State() const { return state_; }

 private:
  void Execute(TestCase& tc, const std::set<std::string>& labels, int verbose,
               RunLog& log, RunOutcome& outcome, bool& cancelled) {
    optional<std::string> skip = CheckConditions(tc.conditions, labels);
    state_ = RunState::kConditionsChecked;
    if (skip.has_value()) {
      state_ = RunState::kSkipped;
      outcome.kind = OutcomeKind::kSkipped;
      outcome.reason = skip.value();
      return;
    }

    auto rundir = workspace_.NewRunDirectory(tc.version, tc.Dirname(), tc.fixtures);
    if (!rundir.has_value()) {
      Fail(outcome, std::string("cannot create run directory: ") +
                        ErrorName(rundir.get_error()));
      return;
    }
    // Phase scripts run with the run directory as cwd: keep paths absolute.
    tc.run.rundir = detail::RealPath(rundir.value());
    if (tc.run.rundir.empty()) {
      Fail(outcome, "cannot resolve run directory " + rundir.value());
      return;
    }
    state_ = RunState::kWorkspaceAcquired;

    const std::string meta = detail::JoinPath(tc.run.rundir, kMetaDir);
    if (::mkdir(meta.c_str(), 0755) != 0) {
      Fail(outcome, "cannot create " + meta + ": " + std::strerror(errno));
      return;
    }
    tc.run.logname = detail::JoinPath(meta, "log");
    if (!log.Open(tc.run.logname, verbose > 1 ? stdout : nullptr)) {
      Fail(outcome, "cannot open log " + tc.run.logname);
      return;
    }

    const PhaseScripts scripts = SynthesizeScripts(
        tc, tc.run.rundir, MakeCoverageOptions(settings_, meta));
    if (!WritePhaseScripts(tc, meta, scripts)) {
      Fail(outcome, "cannot write phase scripts under " + meta);
      return;
    }
    state_ = RunState::kLoggingOpen;
    log.Line("INFO: case start to run!");

    // Setup
    if (!tc.run.setup_script.empty()) {
      state_ = RunState::kSetup;
      log.Line("INFO: setup start");
      auto status = RunPhase(tc, tc.run.setup_script, {}, log, interrupt_);
      if (!status.has_value()) {
        cancelled = true;
        return;
      }
      log.Line("INFO: setup finish");
    }

    // Steps, with teardown guaranteed once setup has returned
    int exit_status = kPhaseErrorStatus;
    {
      ScopeGuard teardown([this, &tc, &log, &cancelled]() {
        RunTeardown(tc, log, cancelled);
        log.Line("INFO: case is finished!");
      });

      state_ = RunState::kSteps;
      log.Line("INFO: steps start");
      auto status = RunPhase(tc, tc.run.steps_script, tc.qa, log, interrupt_);
      if (!status.has_value()) {
        cancelled = true;
        return;
      }
      exit_status = status.value();
      log.Line("INFO: steps finish");
    }

    state_ = RunState::kDone;
    outcome.kind = (exit_status == 0) ? OutcomeKind::kSuccess : OutcomeKind::kFailure;
  }

  /// An interrupt during teardown sets @p cancelled like any other phase.
  void RunTeardown(TestCase& tc, RunLog& log, bool& cancelled) {
    if (tc.run.teardown_script.empty()) return;
    state_ = RunState::kTeardown;
    log.Line("INFO: teardown start");
    // After an interrupt the cleanup still runs, bounded by the deadlines.
    auto status = RunPhase(tc, tc.run.teardown_script, {}, log,
                           cancelled ? nullptr : interrupt_);
    if (!status.has_value()) {
      cancelled = true;
      return;
    }
    log.Line("INFO: teardown finish");
  }

  /**
   * @brief Drive one phase script through the automaton.
   * @return Exit status, kPhaseErrorStatus when the automaton failed, or
   *         RunError::kCancelled on operator interrupt.
   */
  expected<int, RunError> RunPhase(const TestCase& tc, const std::string& script,
                                   const std::vector<ExpectRule>& qa, RunLog& log,
                                   const InterruptMonitor* interrupt) {
    PcallOptions opts;
    opts.absolute_timeout_ms = SecondsToMs(settings_.run_case_timeout_s);
    opts.idle_timeout_ms = SecondsToMs(settings_.hanging_timeout_s);
    opts.working_dir = tc.run.rundir.c_str();
    opts.interrupt = interrupt;

    auto r = Pcall("/bin/bash", {script}, SudoRules(settings_.sudo_password, qa),
                   log.AsSink(), opts);
    if (r.has_value()) return expected<int, RunError>::success(r.value());

    const ExpectFailure& err = r.get_error();
    if (err.code == ExpectError::kCancelled) {
      ITEST_LOG_WARN("runner", "interrupted: %s", script.c_str());
      return expected<int, RunError>::error(RunError::kCancelled);
    }
    log.Line("ERROR: pcall error:" + script + "\n" + err.message);
    ITEST_LOG_ERROR("runner", "%s: %s", script.c_str(), err.message.c_str());
    return expected<int, RunError>::success(kPhaseErrorStatus);
  }

  static bool WritePhaseScripts(TestCase& tc, const std::string& meta,
                                const PhaseScripts& scripts) {
    if (!scripts.setup.empty()) {
      auto path = WriteScript(meta, "setup", scripts.setup);
      if (!path.has_value()) return false;
      tc.run.setup_script = path.value();
    }
    auto steps = WriteScript(meta, "steps", scripts.steps);
    if (!steps.has_value()) return false;
    tc.run.steps_script = steps.value();
    if (!scripts.teardown.empty()) {
      auto path = WriteScript(meta, "teardown", scripts.teardown);
      if (!path.has_value()) return false;
      tc.run.teardown_script = path.value();
    }
    return true;
  }

  void Fail(RunOutcome& outcome, const std::string& error) {
    state_ = RunState::kException;
    outcome.kind = OutcomeKind::kException;
    outcome.reason = error;
    ITEST_LOG_ERROR("runner", "%s", error.c_str());
  }

  static uint32_t SecondsToMs(uint32_t s) {
    const uint64_t ms = static_cast<uint64_t>(s) * 1000U;
    return ms > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(ms);
  }

  const Settings& settings_;
  WorkspaceProvider& workspace_;
  const InterruptMonitor* interrupt_;
  RunState state_ = RunState::kInit;
};

}  // namespace itest

#endif  // ITEST_CASE_RUNNER_HPP_
