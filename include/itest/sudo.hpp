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
 * @file sudo.hpp
 * @brief Elevated-privilege responder: answers password prompts with the
 *        configured credential.
 *
 * Prompt forms seen on the supported distributions:
 *   fedora16-64   [sudo] password for itestuser5707:
 *   suse121-32b   root's password:
 *   suse122-32b   itestuser23794's password:
 *   u1110-32b     [sudo] password for itester:
 */

#ifndef ITEST_SUDO_HPP_
#define ITEST_SUDO_HPP_

#include "itest/expect.hpp"
#include "itest/log.hpp"
#include "itest/settings.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace itest {

static constexpr const char* kSudoPromptPattern =
    R"(\[sudo\] password for .*?:|root's password:|.*?'s password:)";

/// Absolute deadline of the Sudo() helper.
static constexpr uint32_t kSudoTimeoutMs = 10U * 1000U;

/**
 * @brief Rule list for a phase: the password rule first, then @p extra in
 *        declaration order.
 */
inline std::vector<ExpectRule> SudoRules(
    const std::string& password, const std::vector<ExpectRule>& extra = {}) {
  std::vector<ExpectRule> rules;
  rules.reserve(extra.size() + 1U);
  rules.push_back(ExpectRule{kSudoPromptPattern, password});
  rules.insert(rules.end(), extra.begin(), extra.end());
  return rules;
}

/**
 * @brief Run "sudo <cmd>" through /bin/sh, typing the password when asked.
 *
 * Output is echoed to stdout; the command gets 10 seconds.
 */
inline expected<int, ExpectFailure> Sudo(const std::string& cmd,
                                         const Settings& settings,
                                         const InterruptMonitor* interrupt = nullptr) {
  const std::string line = "sudo " + cmd;
  ITEST_LOG_INFO("sudo", "%s", line.c_str());

  OutputSink out;
  out.fn = &StreamOutput;
  out.ctx = stdout;

  PcallOptions opts;
  opts.absolute_timeout_ms = kSudoTimeoutMs;
  opts.interrupt = interrupt;
  return Pcall("/bin/sh", {"-c", line}, SudoRules(settings.sudo_password), out,
               opts);
}

}  // namespace itest

#endif  // ITEST_SUDO_HPP_
