#include <catch2/catch.hpp>

#include "common/cancellation.h"

#include <chrono>
#include <string>
#include <thread>

using namespace sweepflux;
using namespace std::chrono_literals;

TEST_CASE("CancellationFlag starts clear", "[cancellation]") {
  CancellationFlag flag;
  REQUIRE_FALSE(flag.IsCancelled());
  REQUIRE(flag.Reason() == CancelReason::kNone);
  REQUIRE_FALSE(flag.WaitFor(10ms));
}

TEST_CASE("First cancellation reason wins", "[cancellation]") {
  CancellationFlag flag;
  REQUIRE(flag.Cancel(CancelReason::kCriticalFailure));
  REQUIRE_FALSE(flag.Cancel(CancelReason::kInterrupted));
  REQUIRE(flag.IsCancelled());
  REQUIRE(flag.Reason() == CancelReason::kCriticalFailure);
  REQUIRE(std::string(CancelReasonName(flag.Reason())) == "critical_failure");
}

TEST_CASE("WaitFor wakes up as soon as another thread cancels",
          "[cancellation]") {
  CancellationFlag flag;
  std::thread canceller([&] {
    std::this_thread::sleep_for(50ms);
    flag.Cancel(CancelReason::kInterrupted);
  });
  auto start = std::chrono::steady_clock::now();
  REQUIRE(flag.WaitFor(10s));
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();
  REQUIRE(elapsed < 5s);
}
