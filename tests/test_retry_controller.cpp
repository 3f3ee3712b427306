/**
 * @file test_retry_controller.cpp
 * @brief Tests for retry_controller.hpp.
 */

#include "vigil/retry_controller.hpp"

#include "test_probes.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using Catch::Approx;
using vigil::Status;
using vigil_test::MakeProbe;
using vigil_test::Pass;
using vigil_test::Script;
using vigil_test::Step;
using vigil_test::WithStatus;

namespace {

vigil::RetryConfig FastRetry() {
  vigil::RetryConfig cfg;
  cfg.max_retries = 3U;
  cfg.retry_delay = 0.001;
  cfg.jitter = false;
  return cfg;
}

std::shared_ptr<Script> ScriptOf(std::vector<Step> steps) {
  return std::make_shared<Script>(std::move(steps));
}

}  // namespace

// ============================================================================
// Attempt accounting
// ============================================================================

TEST_CASE("Retry exhausts max_retries + 1 attempts", "[retry]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({WithStatus(Status::kError, "still down")});
  auto probe = MakeProbe("flaky", script);

  vigil::Result r = rc.ExecuteWithRetry(probe, "https://example.com",
                                        vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 4U);
  REQUIRE(r.IsFailed());
  REQUIRE(r.GetData("retries_exhausted") == true);
  REQUIRE(r.GetData("retry_attempts") == 4);
  REQUIRE(r.GetData("retry_history").size() == 4U);
  REQUIRE(r.message == "probe failed after 4 attempts: still down");
}

TEST_CASE("Retry stops at the first non-retryable result", "[retry]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({WithStatus(Status::kError), WithStatus(Status::kError),
                          Pass("recovered")});
  auto probe = MakeProbe("flaky", script);

  vigil::Result r = rc.ExecuteWithRetry(probe, "x", vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 3U);
  REQUIRE(r.IsPassed());
  REQUIRE(r.GetData("retry_attempts") == 3);
  REQUIRE(r.message == "recovered (succeeded after 3 attempts)");

  auto stats = rc.GetProbeStatistics("flaky");
  REQUIRE(stats.has_value());
  REQUIRE(stats->successful_retries == 1U);
  REQUIRE(stats->total_attempts == 3U);
}

TEST_CASE("First-attempt success carries no retry data", "[retry]") {
  vigil::RetryController rc(FastRetry());
  auto probe = MakeProbe("steady", ScriptOf({Pass()}));
  vigil::Result r = rc.ExecuteWithRetry(probe, "x", vigil::ProbeContext{});
  REQUIRE(r.IsPassed());
  REQUIRE_FALSE(r.data.contains("retry_attempts"));
  REQUIRE(r.message == "ok");
}

TEST_CASE("Fail status is not retried by default", "[retry]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({WithStatus(Status::kFail, "expired")});
  vigil::Result r =
      rc.ExecuteWithRetry(MakeProbe("cert", script), "x", vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 1U);
  REQUIRE(r.IsFailed());
  REQUIRE(r.message == "expired");
}

TEST_CASE("Retryable status set can be changed", "[retry][policy]") {
  vigil::RetryController rc(FastRetry());
  rc.AddRetryableStatus(Status::kWarning);
  rc.RemoveRetryableStatus(Status::kError);

  auto warn = ScriptOf({WithStatus(Status::kWarning), Pass()});
  REQUIRE(rc.ExecuteWithRetry(MakeProbe("w", warn), "x", vigil::ProbeContext{})
              .IsPassed());
  REQUIRE(warn->calls.load() == 2U);

  auto err = ScriptOf({WithStatus(Status::kError)});
  REQUIRE(rc.ExecuteWithRetry(MakeProbe("e", err), "x", vigil::ProbeContext{})
              .IsError());
  REQUIRE(err->calls.load() == 1U);
}

TEST_CASE("Custom retry conditions force a retry", "[retry][policy]") {
  vigil::RetryController rc(FastRetry());
  rc.AddRetryCondition([](const vigil::Result& r, uint32_t attempt) {
    return r.message == "partial" && attempt < 2U;
  });
  auto script = ScriptOf({WithStatus(Status::kPass, "partial")});
  vigil::Result r =
      rc.ExecuteWithRetry(MakeProbe("p", script), "x", vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 2U);
  REQUIRE(r.IsPassed());

  rc.ClearRetryConditions();
  auto again = ScriptOf({WithStatus(Status::kPass, "partial")});
  (void)rc.ExecuteWithRetry(MakeProbe("p", again), "x", vigil::ProbeContext{});
  REQUIRE(again->calls.load() == 1U);
}

TEST_CASE("Explicit max_retries overrides the config", "[retry]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({WithStatus(Status::kTimeout)});
  vigil::Result r = rc.ExecuteWithRetry(MakeProbe("t", script), "x",
                                        vigil::ProbeContext{}, 0U);
  REQUIRE(script->calls.load() == 1U);
  REQUIRE(r.IsFailed());
  REQUIRE(r.GetData("retries_exhausted") == true);
}

// ============================================================================
// Faults
// ============================================================================

TEST_CASE("Retryable faults are retried then exhausted", "[retry][fault]") {
  vigil::RetryController rc(FastRetry());
  auto script =
      ScriptOf({vigil_test::Fault(vigil::FaultKind::kNetwork, "reset")});
  vigil::Result r =
      rc.ExecuteWithRetry(MakeProbe("net", script), "x", vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 4U);
  REQUIRE(r.IsFailed());
  REQUIRE(r.GetData("fault_kind") == "network");
  REQUIRE(r.message == "probe failed after 4 attempts: reset");
}

TEST_CASE("Non-retryable faults end the call as an error", "[retry][fault]") {
  vigil::RetryController rc(FastRetry());
  rc.RemoveRetryableFault(vigil::FaultKind::kTls);
  auto script = ScriptOf({vigil_test::Fault(vigil::FaultKind::kTls, "bad cert")});
  vigil::Result r =
      rc.ExecuteWithRetry(MakeProbe("tls", script), "x", vigil::ProbeContext{});
  REQUIRE(script->calls.load() == 1U);
  REQUIRE(r.IsError());
  REQUIRE(r.GetData("fault_kind") == "tls");
  REQUIRE(r.message == "probe failed: bad cert");

  rc.AddRetryableFault(vigil::FaultKind::kTls);
  auto again = ScriptOf({vigil_test::Fault(vigil::FaultKind::kTls, "bad cert"),
                         Pass()});
  REQUIRE(rc.ExecuteWithRetry(MakeProbe("tls", again), "x", vigil::ProbeContext{})
              .IsPassed());
  REQUIRE(again->calls.load() == 2U);
}

TEST_CASE("Exceptions count as internal faults", "[retry][fault]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({vigil_test::Throws("boom"), Pass()});
  vigil::Result r =
      rc.ExecuteWithRetry(MakeProbe("t", script), "x", vigil::ProbeContext{});
  REQUIRE(r.IsPassed());
  REQUIRE(r.GetData("retry_history")[0]["fault"] == "internal");
}

// ============================================================================
// Delay policy
// ============================================================================

TEST_CASE("Exponential backoff is capped", "[retry][delay]") {
  vigil::RetryConfig cfg = FastRetry();
  cfg.retry_delay = 1.0;
  cfg.max_retry_delay = 5.0;
  vigil::RetryController rc(cfg);
  REQUIRE(rc.ComputeDelay(1.0, 1U) == Approx(1.0));
  REQUIRE(rc.ComputeDelay(1.0, 2U) == Approx(2.0));
  REQUIRE(rc.ComputeDelay(1.0, 3U) == Approx(4.0));
  REQUIRE(rc.ComputeDelay(1.0, 4U) == Approx(5.0));

  cfg.exponential_backoff = false;
  vigil::RetryController linear(cfg);
  REQUIRE(linear.ComputeDelay(1.0, 4U) == Approx(1.0));
}

TEST_CASE("Jitter adds at most jitter_max of the delay", "[retry][delay]") {
  vigil::RetryConfig cfg = FastRetry();
  cfg.jitter = true;
  cfg.jitter_max = 0.1;
  vigil::RetryController rc(cfg);
  for (int i = 0; i < 50; ++i) {
    const double d = rc.ComputeDelay(1.0, 1U);
    REQUIRE(d >= 1.0);
    REQUIRE(d <= 1.1);
  }
}

TEST_CASE("Retry stops once the next delay would pass the deadline",
          "[retry][delay]") {
  vigil::RetryConfig cfg = FastRetry();
  cfg.retry_delay = 0.1;
  vigil::RetryController rc(cfg);
  auto script = ScriptOf({WithStatus(Status::kError, "still down")});

  vigil::ProbeContext ctx;
  ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
  const auto start = std::chrono::steady_clock::now();
  vigil::Result r = rc.ExecuteWithRetry(MakeProbe("flaky", script),
                                        "https://example.com", ctx);

  // 0.1s after attempt 1 fits; the 0.2s backoff after attempt 2 does not.
  REQUIRE(script->calls.load() == 2U);
  REQUIRE(r.IsTimeout());
  REQUIRE(r.GetData("deadline_reached") == true);
  REQUIRE(r.GetData("timeout_type") == "deadline");
  REQUIRE(r.GetData("retry_attempts") == 2);
  REQUIRE_FALSE(r.data.contains("retries_exhausted"));
  REQUIRE(std::chrono::steady_clock::now() - start <
          std::chrono::milliseconds(200));
  REQUIRE(rc.GetProbeStatistics("flaky")->failed_retries == 1U);
}

// ============================================================================
// Smart retry
// ============================================================================

TEST_CASE("Smart retry tunes from failure history", "[retry][smart]") {
  vigil::RetryConfig cfg = FastRetry();
  cfg.retry_delay = 1.0;
  vigil::RetryController rc(cfg);

  SECTION("empty history keeps the defaults") {
    auto plan = rc.CalculateSmartRetryConfig({});
    REQUIRE(plan.max_retries == 3U);
    REQUIRE(plan.base_delay == Approx(1.0));
  }

  SECTION("mostly errors add two retries") {
    auto plan = rc.CalculateSmartRetryConfig(
        {{Status::kError, 0.0}, {Status::kError, 0.0}, {Status::kTimeout, 0.0}});
    REQUIRE(plan.max_retries == 5U);
    REQUIRE(plan.base_delay == Approx(1.0));
  }

  SECTION("mostly timeouts double the delay") {
    auto plan = rc.CalculateSmartRetryConfig(
        {{Status::kTimeout, 0.0}, {Status::kTimeout, 0.0}, {Status::kError, 0.0}});
    REQUIRE(plan.max_retries == 3U);
    REQUIRE(plan.base_delay == Approx(2.0));
  }

  SECTION("recovery time sets a delay floor") {
    auto plan = rc.CalculateSmartRetryConfig({{Status::kFail, 50.0}});
    REQUIRE(plan.base_delay == Approx(5.0));
  }

  SECTION("only the last ten failures count") {
    std::vector<vigil::FailureRecord> history(20U, {Status::kError, 0.0});
    for (size_t i = 10U; i < 20U; ++i) history[i].status = Status::kTimeout;
    auto plan = rc.CalculateSmartRetryConfig(history);
    REQUIRE(plan.max_retries == 3U);
    REQUIRE(plan.base_delay == Approx(2.0));
  }
}

TEST_CASE("Smart retry execution uses the tuned retry count", "[retry][smart]") {
  vigil::RetryController rc(FastRetry());
  auto script = ScriptOf({WithStatus(Status::kError)});
  auto probe = MakeProbe("s", script);
  vigil::Result r = rc.ExecuteWithSmartRetry(
      "s", "x", vigil::BindProbe(probe, "x"), vigil::ProbeContext{},
      {{Status::kError, 0.0}});
  REQUIRE(script->calls.load() == 6U);
  REQUIRE(r.IsFailed());
}

TEST_CASE("Retry statistics aggregate per probe", "[retry][stats]") {
  vigil::RetryController rc(FastRetry());
  (void)rc.ExecuteWithRetry(MakeProbe("a", ScriptOf({Pass()})), "x",
                            vigil::ProbeContext{});
  (void)rc.ExecuteWithRetry(
      MakeProbe("b", ScriptOf({WithStatus(Status::kError)})), "x",
      vigil::ProbeContext{});

  auto s = rc.GetStatistics();
  REQUIRE(s.total_executions == 2U);
  REQUIRE(s.total_attempts == 5U);
  REQUIRE(s.failed_retries == 1U);
  REQUIRE(s.overall_retry_rate == Approx(50.0));
  REQUIRE(s.overall_success_rate == Approx(50.0));
  REQUIRE(s.per_probe.at("b").average_attempts == Approx(4.0));

  rc.ResetStatistics();
  REQUIRE(rc.GetStatistics().total_executions == 0U);
  REQUIRE_FALSE(rc.GetProbeStatistics("a").has_value());
}
