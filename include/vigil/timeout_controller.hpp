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
 * @file timeout_controller.hpp
 * @brief Per-call time budgets with interchangeable enforcement strategies.
 *
 * Strategies:
 *   - kInterrupt: the probe runs on its own thread while the caller waits on
 *     the deadline. On expiry the probe's CancelToken is tripped, the call is
 *     abandoned and a synthetic Timeout Result is returned immediately. The
 *     abandoned thread keeps the probe alive until it observes cancellation;
 *     finished ones are reaped on the next call and the rest are joined when
 *     the controller is destroyed.
 *   - kPolling: the probe runs inline and elapsed time is checked after it
 *     returns. A probe that blocks past its limit cannot be stopped, only
 *     reported, so probes used this way must bound their own I/O by
 *     ProbeContext::deadline.
 *
 * Both strategies set ProbeContext::deadline so a well-behaved probe can
 * enforce the budget itself.
 */

#ifndef VIGIL_TIMEOUT_CONTROLLER_HPP_
#define VIGIL_TIMEOUT_CONTROLLER_HPP_

#include "vigil/log.hpp"
#include "vigil/probe.hpp"
#include "vigil/result.hpp"

#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

// ============================================================================
// Configuration
// ============================================================================

enum class TimeoutStrategy : uint8_t {
  kInterrupt = 0,
  kPolling,
};

inline const char* TimeoutStrategyName(TimeoutStrategy s) noexcept {
  return s == TimeoutStrategy::kInterrupt ? "interrupt" : "polling";
}

struct TimeoutConfig {
  double default_timeout{30.0};
  double min_timeout{1.0};
  double max_timeout{300.0};
  TimeoutStrategy strategy{TimeoutStrategy::kInterrupt};
  double soft_timeout_warning{0.8};  ///< Fraction of the limit that warns.
};

/// Duration histogram bucket labels, in order.
static constexpr const char* kTimeoutBuckets[] = {"<5s", "5-15s", "15-30s",
                                                  "30-60s", ">60s"};

struct TimeoutStats {
  uint64_t total_executions{0U};
  uint64_t timeouts_occurred{0U};
  double average_execution_time{0.0};
  double timeout_rate{0.0};  ///< Percent.
  std::map<std::string, uint64_t> distribution;
};

// ============================================================================
// TimeoutController
// ============================================================================

class TimeoutController {
 public:
  explicit TimeoutController(const TimeoutConfig& cfg = TimeoutConfig{})
      : cfg_(cfg) {
    for (const char* bucket : kTimeoutBuckets) distribution_[bucket] = 0U;
  }

  ~TimeoutController() {
    std::vector<Abandoned> pending;
    {
      std::lock_guard<std::mutex> lk(abandoned_mtx_);
      pending.swap(abandoned_);
    }
    for (auto& a : pending) {
      a.token.Cancel();
      if (a.thread.joinable()) a.thread.join();
    }
  }

  TimeoutController(const TimeoutController&) = delete;
  TimeoutController& operator=(const TimeoutController&) = delete;

  /// Clamps a requested timeout into [min_timeout, max_timeout].
  double ValidateTimeout(double timeout) const noexcept {
    return std::max(cfg_.min_timeout, std::min(timeout, cfg_.max_timeout));
  }

  // --------------------------------------------------------------------------
  // Execution
  // --------------------------------------------------------------------------

  /**
   * @brief Runs @p probe against @p target within a validated time budget.
   *
   * Without an explicit @p timeout the per-probe override or the default
   * applies. Probe faults pass through unchanged.
   */
  ProbeOutcome ExecuteWithTimeout(const std::shared_ptr<Probe>& probe,
                                  const std::string& target,
                                  const ProbeContext& ctx,
                                  std::optional<double> timeout = std::nullopt) {
    const std::string name = probe->Name();
    const double limit = ValidateTimeout(timeout.value_or(TimeoutFor(name)));
    return Execute(name, target, BindProbe(probe, target), ctx, limit);
  }

  /**
   * @brief Runs an arbitrary probe call with an already validated limit.
   *
   * A tighter ctx.deadline shortens the limit, and the shortened value is
   * the one reported in a Timeout result.
   *
   * This is the building block the engine and the retry controller compose.
   */
  ProbeOutcome Execute(const std::string& probe_name, const std::string& target,
                       const ProbeCall& call, ProbeContext ctx, double limit) {
    ReapAbandoned();
    const auto start = std::chrono::steady_clock::now();
    const SteadyTime own_deadline = start + SecondsToDuration(limit);
    if (ctx.deadline < own_deadline) {
      // A caller deadline (the batch budget) is tighter than the limit.
      limit = std::max(
          0.0, std::chrono::duration<double>(ctx.deadline - start).count());
    } else {
      ctx.deadline = own_deadline;
    }

    if (cfg_.strategy == TimeoutStrategy::kPolling) {
      ProbeOutcome out = InvokeGuarded(call, probe_name, target, ctx);
      const double elapsed = ElapsedSince(start);
      if (elapsed > limit) {
        Record(elapsed, true);
        return ProbeOutcome::success(MakeTimeoutResult(
            probe_name, target, limit, elapsed, TimeoutStrategy::kPolling));
      }
      Record(elapsed, false);
      WarnIfSlow(probe_name, elapsed, limit);
      return out;
    }

    // Interrupt strategy: run off-thread, wait for completion or deadline.
    auto state = std::make_shared<CallState>();
    std::thread runner([state, call, probe_name, target, ctx]() {
      ProbeOutcome out = InvokeGuarded(call, probe_name, target, ctx);
      {
        std::lock_guard<std::mutex> lk(state->mtx);
        state->outcome.emplace(std::move(out));
        state->done = true;
      }
      state->cv.notify_all();
    });

    bool finished = false;
    {
      std::unique_lock<std::mutex> lk(state->mtx);
      finished = state->cv.wait_until(lk, ctx.deadline,
                                      [&state] { return state->done; });
    }

    if (finished) {
      runner.join();
      const double elapsed = ElapsedSince(start);
      Record(elapsed, false);
      WarnIfSlow(probe_name, elapsed, limit);
      return std::move(*state->outcome);
    }

    const double elapsed = ElapsedSince(start);
    ctx.cancel.Cancel();
    {
      std::lock_guard<std::mutex> lk(abandoned_mtx_);
      abandoned_.push_back(Abandoned{std::move(runner), state, ctx.cancel});
    }
    Record(elapsed, true);
    return ProbeOutcome::success(MakeTimeoutResult(
        probe_name, target, limit, elapsed, TimeoutStrategy::kInterrupt));
  }

  // --------------------------------------------------------------------------
  // Adaptive and escalating variants
  // --------------------------------------------------------------------------

  /**
   * @brief 1.5x the mean of positive historical durations, clamped.
   *
   * Falls back to @p base (or the default) when there is no usable history.
   */
  double AdaptiveTimeout(const std::vector<double>& history,
                         std::optional<double> base = std::nullopt) const {
    double sum = 0.0;
    uint32_t n = 0U;
    for (double t : history) {
      if (t > 0.0) {
        sum += t;
        ++n;
      }
    }
    if (n == 0U) return ValidateTimeout(base.value_or(cfg_.default_timeout));
    return ValidateTimeout(1.5 * (sum / n));
  }

  ProbeOutcome ExecuteWithAdaptiveTimeout(const std::shared_ptr<Probe>& probe,
                                          const std::string& target,
                                          const ProbeContext& ctx,
                                          const std::vector<double>& history) {
    const std::string name = probe->Name();
    const double limit = AdaptiveTimeout(history, TimeoutFor(name));
    VIGIL_LOG_DEBUG("Timeout", "adaptive timeout for %s: %.2fs", name.c_str(),
                    limit);
    return Execute(name, target, BindProbe(probe, target), ctx, limit);
  }

  /**
   * @brief Retries timed-out calls with the limit scaled by attempt number.
   *
   * Returns on the first non-timeout outcome or after @p max_attempts.
   */
  ProbeOutcome ExecuteWithEscalatingTimeout(
      const std::shared_ptr<Probe>& probe, const std::string& target,
      const ProbeContext& ctx, uint32_t max_attempts = 3U,
      std::optional<double> base = std::nullopt) {
    const std::string name = probe->Name();
    const double base_limit = base.value_or(TimeoutFor(name));
    const uint32_t attempts = std::max(max_attempts, 1U);
    const ProbeCall call = BindProbe(probe, target);

    for (uint32_t attempt = 1U;; ++attempt) {
      const double limit = ValidateTimeout(base_limit * attempt);
      ProbeContext attempt_ctx = ctx;
      attempt_ctx.cancel = CancelToken();
      attempt_ctx.attempt = attempt;
      ProbeOutcome out = Execute(name, target, call, attempt_ctx, limit);
      if (!out.has_value()) return out;

      Result& r = out.value();
      if (!r.IsTimeout()) {
        r.AddData("timeout_attempts", attempt);
        r.AddData("timeout_used", limit);
        return out;
      }
      if (attempt >= attempts) {
        r.AddData("timeout_attempts", attempt);
        r.AddData("max_attempts_reached", true);
        return out;
      }
      VIGIL_LOG_INFO("Timeout", "%s timed out at %.2fs, escalating (attempt %u/%u)",
                     name.c_str(), limit, attempt + 1U, attempts);
    }
  }

  /**
   * @brief Runs probes in order under one shared time budget.
   *
   * Each probe gets min(remaining budget, its own timeout). Once the budget
   * is spent the remaining probes are reported as Timeout without running.
   * Faults become Error results.
   */
  std::vector<Result> ExecuteBatchWithTimeouts(
      const std::vector<std::shared_ptr<Probe>>& probes,
      const std::string& target, const ProbeContext& ctx,
      double total_timeout) {
    std::vector<Result> results;
    results.reserve(probes.size());
    const auto start = std::chrono::steady_clock::now();

    for (const auto& probe : probes) {
      const std::string name = probe->Name();
      const double elapsed = ElapsedSince(start);
      const double remaining = total_timeout - elapsed;
      if (remaining <= 0.0) {
        Result r(name, Status::kTimeout,
                 "batch time budget exhausted before execution");
        r.target = target;
        r.AddData("timeout_limit", total_timeout);
        r.AddData("actual_execution_time", 0.0);
        r.AddData("timeout_type", "batch");
        r.AddData("exceeded_by", elapsed - total_timeout);
        results.push_back(std::move(r));
        continue;
      }
      const double limit =
          std::min(remaining, ValidateTimeout(TimeoutFor(name)));
      ProbeContext probe_ctx = ctx;
      probe_ctx.cancel = CancelToken();
      ProbeOutcome out =
          Execute(name, target, BindProbe(probe, target), probe_ctx, limit);
      if (out.has_value()) {
        results.push_back(std::move(out).value());
      } else {
        Result r(name, Status::kError,
                 "probe failed: " + out.get_error().message);
        r.target = target;
        r.AddData("fault_kind", FaultKindName(out.get_error().kind));
        results.push_back(std::move(r));
      }
    }
    return results;
  }

  /// Builds the synthetic Timeout result.
  static Result MakeTimeoutResult(const std::string& probe_name,
                                  const std::string& target, double limit,
                                  double actual, TimeoutStrategy strategy) {
    char msg[96];
    (void)std::snprintf(msg, sizeof(msg),
                        "probe timed out after %.2fs (limit: %.2fs)", actual,
                        limit);
    Result r(probe_name, Status::kTimeout, msg);
    r.target = target;
    r.execution_time = actual;
    r.AddData("timeout_limit", limit);
    r.AddData("actual_execution_time", actual);
    r.AddData("timeout_type", TimeoutStrategyName(strategy));
    r.AddData("exceeded_by", actual - limit);
    VIGIL_LOG_WARN("Timeout", "%s on %s timed out after %.2fs (limit %.2fs)",
                   probe_name.c_str(), target.c_str(), actual, limit);
    return r;
  }

  // --------------------------------------------------------------------------
  // Per-probe overrides
  // --------------------------------------------------------------------------

  void SetProbeTimeout(const std::string& probe_name, double timeout) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    custom_timeouts_[probe_name] = ValidateTimeout(timeout);
  }

  /// Per-probe override if set, otherwise the default.
  double TimeoutFor(const std::string& probe_name) const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    auto it = custom_timeouts_.find(probe_name);
    return (it != custom_timeouts_.end()) ? it->second : cfg_.default_timeout;
  }

  // --------------------------------------------------------------------------
  // Statistics
  // --------------------------------------------------------------------------

  TimeoutStats GetStatistics() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    TimeoutStats s;
    s.total_executions = total_executions_;
    s.timeouts_occurred = timeouts_occurred_;
    if (total_executions_ > 0U) {
      s.average_execution_time = total_time_ / total_executions_;
      s.timeout_rate =
          static_cast<double>(timeouts_occurred_) / total_executions_ * 100.0;
    }
    s.distribution = distribution_;
    return s;
  }

  void ResetStatistics() {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    total_executions_ = 0U;
    timeouts_occurred_ = 0U;
    total_time_ = 0.0;
    for (auto& kv : distribution_) kv.second = 0U;
  }

  /// Abandoned calls whose threads have not finished yet.
  uint32_t AbandonedCount() {
    ReapAbandoned();
    std::lock_guard<std::mutex> lk(abandoned_mtx_);
    return static_cast<uint32_t>(abandoned_.size());
  }

  const TimeoutConfig& Config() const noexcept { return cfg_; }

 private:
  struct CallState {
    std::mutex mtx;
    std::condition_variable cv;
    bool done{false};
    std::optional<ProbeOutcome> outcome;
  };

  struct Abandoned {
    std::thread thread;
    std::shared_ptr<CallState> state;
    CancelToken token;
  };

  static double ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start)
        .count();
  }

  static const char* BucketFor(double seconds) noexcept {
    if (seconds < 5.0) return kTimeoutBuckets[0];
    if (seconds < 15.0) return kTimeoutBuckets[1];
    if (seconds < 30.0) return kTimeoutBuckets[2];
    if (seconds < 60.0) return kTimeoutBuckets[3];
    return kTimeoutBuckets[4];
  }

  void Record(double elapsed, bool timed_out) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    ++total_executions_;
    total_time_ += elapsed;
    if (timed_out) ++timeouts_occurred_;
    ++distribution_[BucketFor(elapsed)];
  }

  void WarnIfSlow(const std::string& probe_name, double elapsed,
                  double limit) const {
    if (elapsed > limit * cfg_.soft_timeout_warning) {
      VIGIL_LOG_WARN("Timeout", "%s used %.0f%% of its %.2fs budget",
                     probe_name.c_str(), elapsed / limit * 100.0, limit);
    }
  }

  void ReapAbandoned() {
    std::vector<Abandoned> finished;
    {
      std::lock_guard<std::mutex> lk(abandoned_mtx_);
      for (auto it = abandoned_.begin(); it != abandoned_.end();) {
        bool done = false;
        {
          std::lock_guard<std::mutex> slk(it->state->mtx);
          done = it->state->done;
        }
        if (done) {
          finished.push_back(std::move(*it));
          it = abandoned_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& a : finished) {
      if (a.thread.joinable()) a.thread.join();
    }
  }

  const TimeoutConfig cfg_;

  mutable std::mutex stats_mtx_;
  uint64_t total_executions_{0U};
  uint64_t timeouts_occurred_{0U};
  double total_time_{0.0};
  std::map<std::string, uint64_t> distribution_;
  std::map<std::string, double> custom_timeouts_;

  std::mutex abandoned_mtx_;
  std::vector<Abandoned> abandoned_;
};

}  // namespace vigil

#endif  // VIGIL_TIMEOUT_CONTROLLER_HPP_
