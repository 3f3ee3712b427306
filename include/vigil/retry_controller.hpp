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
 * @file retry_controller.hpp
 * @brief Bounded retries with exponential backoff, jitter and history tuning.
 *
 * A call is attempted up to max_retries + 1 times. A returned Result is
 * retried when its status is in the retryable set or a registered condition
 * asks for it; a ProbeFault is retried when its kind is in the retryable
 * fault set. Faults outside that set end the call at once as an Error
 * Result. Exhaustion always becomes a Fail Result, never a raised fault.
 *
 * The inter-attempt delay is a plain sleep on the calling worker thread, so
 * it only ever holds back the job being retried. A bounded ctx.deadline is
 * shared by all attempts: when it leaves no room for the delay, the loop
 * stops with a Timeout Result instead of starting another attempt.
 */

#ifndef VIGIL_RETRY_CONTROLLER_HPP_
#define VIGIL_RETRY_CONTROLLER_HPP_

#include "vigil/log.hpp"
#include "vigil/probe.hpp"
#include "vigil/result.hpp"

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

// ============================================================================
// Configuration
// ============================================================================

inline std::set<FaultKind> AllFaultKinds() {
  std::set<FaultKind> kinds;
  for (uint32_t i = 0U; i < kFaultKindCount; ++i) {
    kinds.insert(static_cast<FaultKind>(i));
  }
  return kinds;
}

struct RetryConfig {
  uint32_t max_retries{3U};
  double retry_delay{1.0};  ///< Base delay in seconds.
  bool exponential_backoff{true};
  double backoff_multiplier{2.0};
  double max_retry_delay{60.0};
  bool jitter{true};
  double jitter_max{0.1};  ///< Jitter up to this fraction of the delay.
  std::set<Status> retryable_statuses{Status::kError, Status::kTimeout};
  std::set<FaultKind> retryable_faults{AllFaultKinds()};
};

/// Custom predicate; returning true forces a retry of this result.
using RetryCondition = std::function<bool(const Result&, uint32_t attempt)>;

/// Historical failure used by smart retry tuning.
struct FailureRecord {
  Status status{Status::kError};
  double recovery_time{0.0};  ///< Seconds until the target recovered.
};

struct SmartRetryPlan {
  uint32_t max_retries{0U};
  double base_delay{0.0};
};

struct ProbeRetryStats {
  uint64_t total_executions{0U};
  uint64_t total_attempts{0U};
  uint64_t successful_retries{0U};
  uint64_t failed_retries{0U};
  double average_attempts{0.0};
};

struct RetryStats {
  uint64_t total_executions{0U};
  uint64_t total_attempts{0U};
  uint64_t successful_retries{0U};
  uint64_t failed_retries{0U};
  double overall_retry_rate{0.0};    ///< Percent of calls needing >1 attempt.
  double overall_success_rate{0.0};  ///< Percent of calls not exhausted.
  std::map<std::string, ProbeRetryStats> per_probe;
};

// ============================================================================
// RetryController
// ============================================================================

class RetryController {
 public:
  explicit RetryController(const RetryConfig& cfg = RetryConfig{})
      : cfg_(cfg), rng_(std::random_device{}()) {}

  RetryController(const RetryController&) = delete;
  RetryController& operator=(const RetryController&) = delete;

  // --------------------------------------------------------------------------
  // Execution
  // --------------------------------------------------------------------------

  Result ExecuteWithRetry(const std::shared_ptr<Probe>& probe,
                          const std::string& target, const ProbeContext& ctx,
                          std::optional<uint32_t> max_retries = std::nullopt,
                          std::optional<double> base_delay = std::nullopt) {
    return Execute(probe->Name(), target, BindProbe(probe, target), ctx,
                   max_retries, base_delay);
  }

  /**
   * @brief Runs @p call with retries; always yields a Result.
   *
   * Each attempt receives a fresh CancelToken and its attempt number.
   */
  Result Execute(const std::string& probe_name, const std::string& target,
                 const ProbeCall& call, const ProbeContext& ctx,
                 std::optional<uint32_t> max_retries = std::nullopt,
                 std::optional<double> base_delay = std::nullopt) {
    const uint32_t retries = max_retries.value_or(cfg_.max_retries);
    const double delay_base = base_delay.value_or(cfg_.retry_delay);
    const uint32_t max_attempts = retries + 1U;

    Json history = Json::array();
    std::optional<Result> last_result;
    std::optional<ProbeFault> last_fault;

    for (uint32_t attempt = 1U; attempt <= max_attempts; ++attempt) {
      ProbeContext attempt_ctx = ctx;
      attempt_ctx.attempt = attempt;
      attempt_ctx.cancel = CancelToken();
      const double started = SteadyNowSec();
      ProbeOutcome out = InvokeGuarded(call, probe_name, target, attempt_ctx);
      const double elapsed = SteadyNowSec() - started;

      if (out.has_value()) {
        Result& r = out.value();
        history.push_back({{"attempt", attempt},
                           {"execution_time", r.execution_time},
                           {"status", StatusName(r.status)},
                           {"message", r.message}});
        if (!ShouldRetryResult(r, attempt)) {
          if (attempt > 1U) {
            r.AddData("retry_attempts", attempt);
            r.AddData("retry_history", history);
            r.message += " (succeeded after " + std::to_string(attempt) +
                         " attempts)";
          }
          RecordExecution(probe_name, attempt, attempt > 1U, false);
          return std::move(r);
        }
        last_result = std::move(r);
        last_fault.reset();
      } else {
        const ProbeFault& fault = out.get_error();
        history.push_back({{"attempt", attempt},
                           {"execution_time", elapsed},
                           {"fault", FaultKindName(fault.kind)},
                           {"message", fault.message}});
        if (!IsRetryableFault(fault.kind)) {
          RecordExecution(probe_name, attempt, false, false);
          return MakeFaultResult(probe_name, target, fault, attempt, history);
        }
        last_fault = fault;
        last_result.reset();
      }

      if (attempt < max_attempts) {
        const double delay = ComputeDelay(delay_base, attempt);
        if (ctx.RemainingSeconds() <= delay) {
          RecordExecution(probe_name, attempt, false, true);
          return MakeDeadlineResult(probe_name, target, attempt, history,
                                    last_result, last_fault);
        }
        VIGIL_LOG_INFO("Retry", "%s on %s: attempt %u/%u failed, retrying in %.3fs",
                       probe_name.c_str(), target.c_str(), attempt,
                       max_attempts, delay);
        std::this_thread::sleep_for(SecondsToDuration(delay));
      }
    }

    RecordExecution(probe_name, max_attempts, false, true);
    VIGIL_LOG_WARN("Retry", "%s on %s exhausted %u attempts",
                   probe_name.c_str(), target.c_str(), max_attempts);
    return MakeExhaustedResult(probe_name, target, max_attempts, history,
                               last_result, last_fault);
  }

  // --------------------------------------------------------------------------
  // Smart retry
  // --------------------------------------------------------------------------

  /**
   * @brief Derives retry settings from the last 10 failures of a target.
   *
   * Errors outnumbering timeouts allow two extra retries (capped at 8);
   * timeouts making up more than half double the delay (capped at 10s);
   * the delay never drops below 10% of the mean recovery time.
   */
  SmartRetryPlan CalculateSmartRetryConfig(
      const std::vector<FailureRecord>& history) const {
    SmartRetryPlan plan{cfg_.max_retries, cfg_.retry_delay};
    if (history.empty()) return plan;

    const size_t begin = history.size() > 10U ? history.size() - 10U : 0U;
    uint32_t errors = 0U;
    uint32_t timeouts = 0U;
    double recovery_sum = 0.0;
    uint32_t recovery_n = 0U;
    for (size_t i = begin; i < history.size(); ++i) {
      if (history[i].status == Status::kError) ++errors;
      if (history[i].status == Status::kTimeout) ++timeouts;
      if (history[i].recovery_time > 0.0) {
        recovery_sum += history[i].recovery_time;
        ++recovery_n;
      }
    }
    const size_t window = history.size() - begin;

    if (errors > timeouts) {
      plan.max_retries = std::min(cfg_.max_retries + 2U, 8U);
    }
    if (static_cast<double>(timeouts) > static_cast<double>(window) / 2.0) {
      plan.base_delay = std::min(cfg_.retry_delay * 2.0, 10.0);
    }
    if (recovery_n > 0U) {
      plan.base_delay =
          std::max(plan.base_delay, (recovery_sum / recovery_n) * 0.1);
    }
    return plan;
  }

  Result ExecuteWithSmartRetry(const std::string& probe_name,
                               const std::string& target,
                               const ProbeCall& call, const ProbeContext& ctx,
                               const std::vector<FailureRecord>& history) {
    const SmartRetryPlan plan = CalculateSmartRetryConfig(history);
    VIGIL_LOG_DEBUG("Retry", "smart retry for %s: max_retries=%u delay=%.2fs",
                    probe_name.c_str(), plan.max_retries, plan.base_delay);
    return Execute(probe_name, target, call, ctx, plan.max_retries,
                   plan.base_delay);
  }

  // --------------------------------------------------------------------------
  // Policy
  // --------------------------------------------------------------------------

  /// Delay after failed attempt @p attempt (1-based), capped, plus jitter.
  double ComputeDelay(double base, uint32_t attempt) {
    double delay = base;
    if (cfg_.exponential_backoff && attempt > 1U) {
      delay = base * std::pow(cfg_.backoff_multiplier,
                              static_cast<double>(attempt - 1U));
    }
    delay = std::min(delay, cfg_.max_retry_delay);
    if (cfg_.jitter && delay > 0.0) {
      std::lock_guard<std::mutex> lk(rng_mtx_);
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      delay += delay * cfg_.jitter_max * dist(rng_);
    }
    return delay;
  }

  bool ShouldRetryResult(const Result& r, uint32_t attempt) const {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    if (cfg_.retryable_statuses.count(r.status) > 0U) return true;
    for (const auto& cond : conditions_) {
      if (cond(r, attempt)) return true;
    }
    return false;
  }

  bool IsRetryableFault(FaultKind kind) const {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    return cfg_.retryable_faults.count(kind) > 0U;
  }

  void AddRetryCondition(RetryCondition cond) {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    conditions_.push_back(std::move(cond));
  }

  void ClearRetryConditions() {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    conditions_.clear();
  }

  void AddRetryableStatus(Status s) {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    cfg_.retryable_statuses.insert(s);
  }

  void RemoveRetryableStatus(Status s) {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    cfg_.retryable_statuses.erase(s);
  }

  void AddRetryableFault(FaultKind kind) {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    cfg_.retryable_faults.insert(kind);
  }

  void RemoveRetryableFault(FaultKind kind) {
    std::lock_guard<std::mutex> lk(policy_mtx_);
    cfg_.retryable_faults.erase(kind);
  }

  // --------------------------------------------------------------------------
  // Statistics
  // --------------------------------------------------------------------------

  std::optional<ProbeRetryStats> GetProbeStatistics(
      const std::string& probe_name) const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    auto it = stats_.find(probe_name);
    if (it == stats_.end()) return std::nullopt;
    return WithAverage(it->second);
  }

  RetryStats GetStatistics() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    RetryStats s;
    uint64_t retried = 0U;
    for (const auto& kv : stats_) {
      s.per_probe[kv.first] = WithAverage(kv.second);
      s.total_executions += kv.second.total_executions;
      s.total_attempts += kv.second.total_attempts;
      s.successful_retries += kv.second.successful_retries;
      s.failed_retries += kv.second.failed_retries;
    }
    retried = s.successful_retries + s.failed_retries;
    if (s.total_executions > 0U) {
      s.overall_retry_rate =
          static_cast<double>(retried) / s.total_executions * 100.0;
      s.overall_success_rate =
          static_cast<double>(s.total_executions - s.failed_retries) /
          s.total_executions * 100.0;
    }
    return s;
  }

  void ResetStatistics() {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    stats_.clear();
  }

 private:
  static ProbeRetryStats WithAverage(ProbeRetryStats s) {
    s.average_attempts =
        s.total_executions > 0U
            ? static_cast<double>(s.total_attempts) / s.total_executions
            : 0.0;
    return s;
  }

  void RecordExecution(const std::string& probe_name, uint32_t attempts,
                       bool recovered, bool exhausted) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    ProbeRetryStats& s = stats_[probe_name];
    ++s.total_executions;
    s.total_attempts += attempts;
    if (recovered) ++s.successful_retries;
    if (exhausted) ++s.failed_retries;
  }

  static Result MakeFaultResult(const std::string& probe_name,
                                const std::string& target,
                                const ProbeFault& fault, uint32_t attempt,
                                const Json& history) {
    Result r(probe_name, Status::kError, "probe failed: " + fault.message);
    r.target = target;
    r.AddData("fault_kind", FaultKindName(fault.kind));
    r.AddData("fault_message", fault.message);
    if (attempt > 1U) {
      r.AddData("retry_attempts", attempt);
      r.AddData("retry_history", history);
    }
    return r;
  }

  static Result MakeExhaustedResult(const std::string& probe_name,
                                    const std::string& target,
                                    uint32_t attempts, const Json& history,
                                    const std::optional<Result>& last_result,
                                    const std::optional<ProbeFault>& last_fault) {
    std::string last_msg;
    if (last_result.has_value()) {
      last_msg = last_result->message;
    } else if (last_fault.has_value()) {
      last_msg = last_fault->message;
    }
    Result r(probe_name, Status::kFail,
             "probe failed after " + std::to_string(attempts) +
                 " attempts: " + last_msg);
    r.target = target;
    r.AddData("retry_attempts", attempts);
    r.AddData("retry_history", history);
    r.AddData("retries_exhausted", true);
    if (last_result.has_value()) {
      r.AddData("last_result_data", last_result->data);
      r.score = last_result->score;
      r.execution_time = last_result->execution_time;
    } else {
      r.AddData("last_result_data", Json::object());
      r.AddData("fault_kind", FaultKindName(last_fault->kind));
    }
    return r;
  }

  static Result MakeDeadlineResult(const std::string& probe_name,
                                   const std::string& target,
                                   uint32_t attempts, const Json& history,
                                   const std::optional<Result>& last_result,
                                   const std::optional<ProbeFault>& last_fault) {
    Result r = MakeExhaustedResult(probe_name, target, attempts, history,
                                   last_result, last_fault);
    const std::string last_msg =
        last_result.has_value() ? last_result->message : last_fault->message;
    r.status = Status::kTimeout;
    r.message = "deadline reached after " + std::to_string(attempts) +
                " attempts: " + last_msg;
    r.data.erase("retries_exhausted");
    r.AddData("deadline_reached", true);
    r.AddData("timeout_type", "deadline");
    VIGIL_LOG_WARN("Retry", "%s on %s: deadline reached after %u attempts",
                   probe_name.c_str(), target.c_str(), attempts);
    return r;
  }

  RetryConfig cfg_;
  std::vector<RetryCondition> conditions_;
  mutable std::mutex policy_mtx_;

  std::mt19937_64 rng_;
  std::mutex rng_mtx_;

  mutable std::mutex stats_mtx_;
  std::map<std::string, ProbeRetryStats> stats_;
};

}  // namespace vigil

#endif  // VIGIL_RETRY_CONTROLLER_HPP_
