/**
 * @file test_settings.cpp
 * @brief Tests for settings.hpp: EngineConfig loading.
 */

#include "vigil/settings.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <string>

using Catch::Approx;

namespace {

vigil::EngineConfig LoadJson(const std::string& text) {
  vigil::JsonConfig cfg;
  auto r = cfg.LoadBuffer(text, vigil::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  return vigil::LoadEngineConfig(cfg);
}

}  // namespace

TEST_CASE("Empty config keeps every default", "[settings]") {
  vigil::EngineConfig c = LoadJson("{}");
  REQUIRE_FALSE(c.parallel_execution);
  REQUIRE(c.max_parallel_tests == 4U);
  REQUIRE(c.enable_timeouts);
  REQUIRE(c.enable_retries);
  REQUIRE(c.enable_result_inversion);
  REQUIRE_FALSE(c.fail_fast);
  REQUIRE(c.execution_timeout == Approx(300.0));
  REQUIRE(c.pool.max_connections == 10U);
  REQUIRE(c.pool.pool_size == 20U);
  REQUIRE(c.timeout.strategy == vigil::TimeoutStrategy::kInterrupt);
  REQUIRE(c.retry.max_retries == 3U);
  REQUIRE(c.retry.retryable_statuses.size() == 2U);
  REQUIRE(c.aggregator.weight_security == Approx(0.4));
}

TEST_CASE("Every section is read", "[settings]") {
  vigil::EngineConfig c = LoadJson(R"({
    "engine": {"parallel_execution": true, "max_parallel_tests": 8,
               "fail_fast": true, "execution_timeout": 60,
               "adaptive_timeouts": true, "smart_retries": true,
               "history_size": 10},
    "pool": {"pool_size": 4, "max_connections": 6, "acquire_timeout": 2.5,
             "poll_interval_ms": 50, "user_agent": "probe/2",
             "verify_peer": false},
    "timeout": {"default_timeout": 12, "min_timeout": 0.5,
                "strategy": "Polling"},
    "retry": {"max_retries": 1, "retry_delay": 0.25, "jitter": false,
              "retryable_statuses": ["error", "FAIL"]},
    "scheduler": {"load_balancing": false},
    "aggregator": {"weight_security": 0.5, "generate_recommendations": false}
  })");

  REQUIRE(c.parallel_execution);
  REQUIRE(c.max_parallel_tests == 8U);
  REQUIRE(c.fail_fast);
  REQUIRE(c.execution_timeout == Approx(60.0));
  REQUIRE(c.adaptive_timeouts);
  REQUIRE(c.smart_retries);
  REQUIRE(c.history_size == 10U);

  REQUIRE(c.pool.pool_size == 4U);
  REQUIRE(c.pool.max_connections == 6U);
  REQUIRE(c.pool.acquire_timeout == Approx(2.5));
  REQUIRE(c.pool.poll_interval == Approx(0.05));
  REQUIRE(c.pool.connection.user_agent == "probe/2");
  REQUIRE_FALSE(c.pool.connection.verify_peer);

  REQUIRE(c.timeout.default_timeout == Approx(12.0));
  REQUIRE(c.timeout.min_timeout == Approx(0.5));
  REQUIRE(c.timeout.strategy == vigil::TimeoutStrategy::kPolling);

  REQUIRE(c.retry.max_retries == 1U);
  REQUIRE(c.retry.retry_delay == Approx(0.25));
  REQUIRE_FALSE(c.retry.jitter);
  REQUIRE(c.retry.retryable_statuses ==
          std::set<vigil::Status>{vigil::Status::kError, vigil::Status::kFail});

  REQUIRE_FALSE(c.scheduler.load_balancing);
  REQUIRE(c.scheduler.priority_scheduling);
  REQUIRE(c.aggregator.weight_security == Approx(0.5));
  REQUIRE_FALSE(c.aggregator.generate_recommendations);
}

TEST_CASE("Invalid values fall back or clamp", "[settings]") {
  vigil::EngineConfig c = LoadJson(R"({
    "engine": {"max_parallel_tests": 0},
    "timeout": {"strategy": "sideways"},
    "retry": {"max_retries": -4, "retryable_statuses": ["timeout", "meh"]}
  })");
  REQUIRE(c.max_parallel_tests == 1U);
  REQUIRE(c.timeout.strategy == vigil::TimeoutStrategy::kInterrupt);
  REQUIRE(c.retry.max_retries == 0U);
  REQUIRE(c.retry.retryable_statuses ==
          std::set<vigil::Status>{vigil::Status::kTimeout});
}

TEST_CASE("Log level is applied", "[settings][log]") {
  const vigil::log::Level saved = vigil::log::GetLevel();
  (void)LoadJson(R"({"log": {"level": "ERROR"}})");
  REQUIRE(vigil::log::GetLevel() == vigil::log::Level::kError);

  (void)LoadJson(R"({"log": {"level": "chatty"}})");
  REQUIRE(vigil::log::GetLevel() == vigil::log::Level::kError);
  vigil::log::SetLevel(saved);
}
