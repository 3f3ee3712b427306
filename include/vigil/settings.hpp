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
 * @file settings.hpp
 * @brief EngineConfig and its mapping from a loaded ConfigStore.
 *
 * Every key is optional; a missing or unparsable value keeps the default.
 * Sections: engine, pool, timeout, retry, scheduler, aggregator, log.
 */

#ifndef VIGIL_SETTINGS_HPP_
#define VIGIL_SETTINGS_HPP_

#include "vigil/config.hpp"
#include "vigil/log.hpp"
#include "vigil/resource_pool.hpp"
#include "vigil/result_aggregator.hpp"
#include "vigil/retry_controller.hpp"
#include "vigil/scheduler.hpp"
#include "vigil/timeout_controller.hpp"

#include <cstdint>

#include <set>
#include <string>

namespace vigil {

struct EngineConfig {
  bool parallel_execution{false};
  uint32_t max_parallel_tests{4U};
  bool enable_timeouts{true};
  bool enable_retries{true};
  bool enable_result_inversion{true};
  bool fail_fast{false};
  double execution_timeout{300.0};  ///< Default batch budget; 0 disables.
  bool resource_pooling{true};
  bool adaptive_timeouts{false};
  bool smart_retries{false};
  uint32_t history_size{50U};  ///< Samples kept per (probe, target).

  ResourcePoolConfig pool;
  TimeoutConfig timeout;
  RetryConfig retry;
  SchedulerConfig scheduler;
  AggregatorConfig aggregator;
};

namespace detail {

inline uint32_t ClampU32(int32_t v, uint32_t floor_val) noexcept {
  return v < static_cast<int32_t>(floor_val) ? floor_val
                                             : static_cast<uint32_t>(v);
}

}  // namespace detail

/**
 * @brief Builds an EngineConfig from @p store.
 *
 * A present [log] level is also applied to the logger.
 */
inline EngineConfig LoadEngineConfig(const ConfigStore& store) {
  EngineConfig c;

  // [engine]
  c.parallel_execution =
      store.GetBool("engine", "parallel_execution", c.parallel_execution);
  c.max_parallel_tests = detail::ClampU32(
      store.GetInt("engine", "max_parallel_tests",
                   static_cast<int32_t>(c.max_parallel_tests)),
      1U);
  c.enable_timeouts =
      store.GetBool("engine", "enable_timeouts", c.enable_timeouts);
  c.enable_retries = store.GetBool("engine", "enable_retries", c.enable_retries);
  c.enable_result_inversion = store.GetBool("engine", "enable_result_inversion",
                                            c.enable_result_inversion);
  c.fail_fast = store.GetBool("engine", "fail_fast", c.fail_fast);
  c.execution_timeout =
      store.GetDouble("engine", "execution_timeout", c.execution_timeout);
  c.resource_pooling =
      store.GetBool("engine", "resource_pooling", c.resource_pooling);
  c.adaptive_timeouts =
      store.GetBool("engine", "adaptive_timeouts", c.adaptive_timeouts);
  c.smart_retries = store.GetBool("engine", "smart_retries", c.smart_retries);
  c.history_size = detail::ClampU32(
      store.GetInt("engine", "history_size",
                   static_cast<int32_t>(c.history_size)),
      1U);

  // [pool]
  ResourcePoolConfig& p = c.pool;
  p.pool_size = detail::ClampU32(
      store.GetInt("pool", "pool_size", static_cast<int32_t>(p.pool_size)), 0U);
  p.max_connections = detail::ClampU32(
      store.GetInt("pool", "max_connections",
                   static_cast<int32_t>(p.max_connections)),
      1U);
  p.idle_timeout = store.GetDouble("pool", "idle_timeout", p.idle_timeout);
  p.max_age = store.GetDouble("pool", "max_age", p.max_age);
  p.acquire_timeout =
      store.GetDouble("pool", "acquire_timeout", p.acquire_timeout);
  p.poll_interval =
      store.GetDouble("pool", "poll_interval_ms", p.poll_interval * 1000.0) /
      1000.0;
  p.connection.timeout =
      store.GetDouble("pool", "connection_timeout", p.connection.timeout);
  p.connection.user_agent =
      store.GetString("pool", "user_agent", p.connection.user_agent);
  p.connection.max_redirects = detail::ClampU32(
      store.GetInt("pool", "max_redirects",
                   static_cast<int32_t>(p.connection.max_redirects)),
      0U);
  p.connection.verify_peer =
      store.GetBool("pool", "verify_peer", p.connection.verify_peer);
  p.connection.follow_redirects =
      store.GetBool("pool", "follow_redirects", p.connection.follow_redirects);

  // [timeout]
  TimeoutConfig& t = c.timeout;
  t.default_timeout =
      store.GetDouble("timeout", "default_timeout", t.default_timeout);
  t.min_timeout = store.GetDouble("timeout", "min_timeout", t.min_timeout);
  t.max_timeout = store.GetDouble("timeout", "max_timeout", t.max_timeout);
  t.soft_timeout_warning = store.GetDouble("timeout", "soft_timeout_warning",
                                           t.soft_timeout_warning);
  if (store.HasKey("timeout", "strategy")) {
    const std::string s = detail::ToLower(store.GetString("timeout", "strategy"));
    if (s == "interrupt") {
      t.strategy = TimeoutStrategy::kInterrupt;
    } else if (s == "polling") {
      t.strategy = TimeoutStrategy::kPolling;
    } else {
      VIGIL_LOG_WARN("Config", "unknown timeout strategy '%s', keeping %s",
                     s.c_str(), TimeoutStrategyName(t.strategy));
    }
  }

  // [retry]
  RetryConfig& r = c.retry;
  r.max_retries = detail::ClampU32(
      store.GetInt("retry", "max_retries", static_cast<int32_t>(r.max_retries)),
      0U);
  r.retry_delay = store.GetDouble("retry", "retry_delay", r.retry_delay);
  r.exponential_backoff =
      store.GetBool("retry", "exponential_backoff", r.exponential_backoff);
  r.backoff_multiplier =
      store.GetDouble("retry", "backoff_multiplier", r.backoff_multiplier);
  r.max_retry_delay =
      store.GetDouble("retry", "max_retry_delay", r.max_retry_delay);
  r.jitter = store.GetBool("retry", "jitter", r.jitter);
  r.jitter_max = store.GetDouble("retry", "jitter_max", r.jitter_max);
  if (store.HasKey("retry", "retryable_statuses")) {
    std::set<Status> statuses;
    for (const auto& name : store.GetList("retry", "retryable_statuses")) {
      auto st = ParseStatus(detail::ToLower(name));
      if (st.has_value()) {
        statuses.insert(st.value());
      } else {
        VIGIL_LOG_WARN("Config", "ignoring unknown retryable status '%s'",
                       name.c_str());
      }
    }
    r.retryable_statuses = statuses;
  }

  // [scheduler]
  SchedulerConfig& s = c.scheduler;
  s.priority_scheduling =
      store.GetBool("scheduler", "priority_scheduling", s.priority_scheduling);
  s.load_balancing =
      store.GetBool("scheduler", "load_balancing", s.load_balancing);
  s.adaptive_batching =
      store.GetBool("scheduler", "adaptive_batching", s.adaptive_batching);

  // [aggregator]
  AggregatorConfig& a = c.aggregator;
  a.weight_security =
      store.GetDouble("aggregator", "weight_security", a.weight_security);
  a.weight_performance =
      store.GetDouble("aggregator", "weight_performance", a.weight_performance);
  a.weight_availability = store.GetDouble("aggregator", "weight_availability",
                                          a.weight_availability);
  a.calculate_trends =
      store.GetBool("aggregator", "calculate_trends", a.calculate_trends);
  a.generate_recommendations = store.GetBool(
      "aggregator", "generate_recommendations", a.generate_recommendations);

  // [log]
  if (store.HasKey("log", "level")) {
    const std::string lv = detail::ToLower(store.GetString("log", "level"));
    log::Level level = log::GetLevel();
    if (log::ParseLevel(lv.c_str(), level)) {
      log::SetLevel(level);
    } else {
      VIGIL_LOG_WARN("Config", "unknown log level '%s'", lv.c_str());
    }
  }

  VIGIL_LOG_DEBUG("Config",
                  "engine config: parallel=%d max_parallel=%u timeouts=%d "
                  "retries=%d inversion=%d fail_fast=%d",
                  c.parallel_execution ? 1 : 0, c.max_parallel_tests,
                  c.enable_timeouts ? 1 : 0, c.enable_retries ? 1 : 0,
                  c.enable_result_inversion ? 1 : 0, c.fail_fast ? 1 : 0);
  return c;
}

}  // namespace vigil

#endif  // VIGIL_SETTINGS_HPP_
