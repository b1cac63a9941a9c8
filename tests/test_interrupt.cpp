/**
 * @file test_interrupt.cpp
 * @brief Tests for interrupt.hpp
 */

#include "itest/interrupt.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>

#include <poll.h>

static bool Readable(int fd) {
  struct pollfd p;
  p.fd = fd;
  p.events = POLLIN;
  p.revents = 0;
  return ::poll(&p, 1, 0) == 1 && (p.revents & POLLIN) != 0;
}

TEST_CASE("InterruptMonitor starts quiet", "[interrupt]") {
  itest::InterruptMonitor monitor;
  REQUIRE(monitor.IsValid());
  REQUIRE_FALSE(monitor.IsInterrupted());
  REQUIRE(monitor.WaitFd() >= 0);
  REQUIRE_FALSE(Readable(monitor.WaitFd()));
}

TEST_CASE("InterruptMonitor Trigger wakes the wait fd", "[interrupt]") {
  itest::InterruptMonitor monitor;
  monitor.Trigger();
  REQUIRE(monitor.IsInterrupted());
  REQUIRE(monitor.Signal() == 0);
  REQUIRE(Readable(monitor.WaitFd()));
  // stays readable: the cancellation covers the rest of the session
  REQUIRE(Readable(monitor.WaitFd()));
}

TEST_CASE("InterruptMonitor only one instance at a time", "[interrupt]") {
  itest::InterruptMonitor first;
  itest::InterruptMonitor second;
  REQUIRE(first.IsValid());
  REQUIRE_FALSE(second.IsValid());
  auto r = second.InstallSignalHandlers();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == itest::InterruptError::kAlreadyInstantiated);
}

TEST_CASE("InterruptMonitor catches SIGINT", "[interrupt]") {
  itest::InterruptMonitor monitor;
  REQUIRE(monitor.InstallSignalHandlers().has_value());
  REQUIRE(::raise(SIGINT) == 0);
  REQUIRE(monitor.IsInterrupted());
  REQUIRE(monitor.Signal() == SIGINT);
  REQUIRE(Readable(monitor.WaitFd()));
}

TEST_CASE("InterruptMonitor restores previous handlers", "[interrupt]") {
  struct sigaction before;
  REQUIRE(::sigaction(SIGTERM, nullptr, &before) == 0);
  {
    itest::InterruptMonitor monitor;
    REQUIRE(monitor.InstallSignalHandlers().has_value());
  }
  struct sigaction after;
  REQUIRE(::sigaction(SIGTERM, nullptr, &after) == 0);
  REQUIRE(after.sa_handler == before.sa_handler);
}
