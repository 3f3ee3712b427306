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
 * @file execution_engine.hpp
 * @brief ExecutionEngine - drives a batch of jobs from analysis to results.
 *
 * Pipeline per batch:
 *   DependencyGraph::Analyze (fatal on cycle)
 *     -> Scheduler::Optimize (optionally pruned to a deadline)
 *     -> sequential loop or WorkerPool with at most max_parallel_tests jobs
 *        in flight
 *     -> per job: registry lookup -> [retry [timeout [pool lease -> Run]]]
 *        -> inversion -> statistics/history
 *
 * A job runs only once every dependency has a non-problem result in the
 * batch; otherwise it is recorded as Skip "dependencies not met" and its
 * probe is never called. A job whose dependency is still pending is moved
 * to the back of the queue instead.
 *
 * Retry wraps timeout, so every attempt gets its own time budget, and the
 * pool lease is taken inside each attempt so exhaustion is retryable. The
 * batch deadline travels in ProbeContext::deadline: it caps every attempt
 * and ends the retry loop once the next attempt can no longer start in time.
 */

#ifndef VIGIL_EXECUTION_ENGINE_HPP_
#define VIGIL_EXECUTION_ENGINE_HPP_

#include "vigil/dependency_graph.hpp"
#include "vigil/job.hpp"
#include "vigil/log.hpp"
#include "vigil/probe.hpp"
#include "vigil/resource_pool.hpp"
#include "vigil/result.hpp"
#include "vigil/result_aggregator.hpp"
#include "vigil/result_inverter.hpp"
#include "vigil/retry_controller.hpp"
#include "vigil/scheduler.hpp"
#include "vigil/settings.hpp"
#include "vigil/timeout_controller.hpp"
#include "vigil/vocabulary.hpp"
#include "vigil/worker_pool.hpp"

#include <cstdint>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

/// Called once per finished job, in completion order, on the thread running
/// ExecuteBatch and with no engine lock held. While it runs, workers keep
/// finishing jobs but no new job is dispatched.
using ProgressCallback = std::function<void(uint32_t current, uint32_t total,
                                            const std::string& job_id)>;

struct BatchOptions {
  std::string name{"batch"};
  std::string target;             ///< Used by jobs without their own target.
  Json context = Json::object();  ///< Copied into every result's context.
  std::string inversion_mode;     ///< Empty or "none" disables inversion.
  std::optional<InversionConditions> inversion_conditions;
  std::optional<double> deadline_s;  ///< Overrides execution_timeout.
  bool prune_to_deadline{false};     ///< Drop jobs the plan cannot fit.
  std::optional<bool> fail_fast;     ///< Overrides the engine setting.
  std::optional<bool> parallel;      ///< Overrides parallel_execution.
  ProgressCallback progress_callback;
};

struct ProbeExecutionStats {
  uint64_t total_executions{0U};
  double total_time{0.0};
  double average_execution_time{0.0};
  std::map<std::string, uint64_t> status_counts;
};

struct BatchMetrics {
  uint64_t batches{0U};
  uint64_t total_jobs{0U};
  uint64_t successful_jobs{0U};  ///< Pass or Warning.
  uint64_t failed_jobs{0U};      ///< Fail, Error or Timeout.
  double success_rate{0.0};
  double total_duration{0.0};
  double average_job_duration{0.0};
  double jobs_per_second{0.0};
};

static constexpr const char* kHealthTag = "health";
static constexpr double kHealthCheckTimeout = 10.0;
static constexpr uint32_t kHealthCheckRetries = 1U;

// ============================================================================
// ExecutionEngine
// ============================================================================

class ExecutionEngine {
 public:
  explicit ExecutionEngine(ProbeRegistry& registry,
                           const EngineConfig& cfg = EngineConfig{})
      : registry_(registry),
        cfg_(cfg),
        pool_(cfg.pool),
        timeout_(cfg.timeout),
        retry_(cfg.retry),
        scheduler_(cfg.scheduler),
        aggregator_(cfg.aggregator) {
    if (cfg_.max_parallel_tests == 0U) cfg_.max_parallel_tests = 1U;
    if (cfg_.history_size == 0U) cfg_.history_size = 1U;
  }

  ~ExecutionEngine() {
    std::lock_guard<std::mutex> lk(workers_mtx_);
    if (workers_) workers_->Shutdown();
  }

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  // --------------------------------------------------------------------------
  // Batch execution
  // --------------------------------------------------------------------------

  /**
   * @brief Analyzes, schedules and runs @p jobs.
   *
   * Fails without running anything on a dependency cycle, an empty or
   * duplicate job id, or an unknown inversion mode. Every other problem is
   * recorded as a Result.
   */
  expected<BatchResult, BatchError> ExecuteBatch(
      const std::vector<Job>& jobs, const BatchOptions& opts = BatchOptions{}) {
    using R = expected<BatchResult, BatchError>;
    auto valid = ValidateInversion(opts);
    if (!valid.has_value()) return R::error(valid.get_error());

    DependencyGraph graph;
    auto analysis = graph.Analyze(jobs);
    if (!analysis.has_value()) {
      VIGIL_LOG_ERROR("Engine", "batch '%s' rejected: %s", opts.name.c_str(),
                      analysis.get_error().detail.c_str());
      return R::error(analysis.get_error());
    }
    std::vector<Job> ordered = scheduler_.Optimize(jobs, analysis.value().order);

    BatchResult batch;
    batch.name = opts.name;
    batch.target = opts.target;
    batch.context = opts.context.is_object() ? opts.context : Json::object();

    BatchRun run;
    run.opts = &opts;
    run.started = SteadyNowSec();
    run.budget = opts.deadline_s.value_or(cfg_.execution_timeout);
    run.fail_fast = opts.fail_fast.value_or(cfg_.fail_fast);

    if (opts.prune_to_deadline && run.budget > 0.0) {
      DeadlinePlan plan = scheduler_.OptimizeForDeadline(ordered, run.budget);
      const std::set<std::string> drop(plan.dropped.begin(),
                                       plan.dropped.end());
      ordered.erase(std::remove_if(ordered.begin(), ordered.end(),
                                   [&drop](const Job& j) {
                                     return drop.count(j.id) > 0U;
                                   }),
                    ordered.end());
      batch.dropped = std::move(plan.dropped);
    }
    run.total = static_cast<uint32_t>(ordered.size());

    const bool parallel = opts.parallel.value_or(cfg_.parallel_execution) &&
                          cfg_.max_parallel_tests > 1U && ordered.size() > 1U;
    VIGIL_LOG_INFO("Engine", "batch '%s' started: %u jobs, %s, critical path %u",
                   opts.name.c_str(), run.total,
                   parallel ? "parallel" : "sequential",
                   analysis.value().critical_path.length);

    if (parallel) {
      RunParallel(ordered, run, batch);
    } else {
      RunSequential(ordered, run, batch);
    }

    batch.execution_time = SteadyNowSec() - run.started;
    RecordBatch(batch);
    VIGIL_LOG_INFO("Engine",
                   "batch '%s' finished in %.3fs: %u results, %.1f%% passed%s",
                   batch.name.c_str(), batch.execution_time,
                   batch.TotalCount(), batch.SuccessRate(),
                   batch.aborted ? " (aborted)" : "");
    return R::success(std::move(batch));
  }

  /// Runs one job through the same per-job pipeline, without dependencies.
  expected<Result, BatchError> ExecuteJob(
      const Job& job, const BatchOptions& opts = BatchOptions{}) {
    using R = expected<Result, BatchError>;
    auto valid = ValidateInversion(opts);
    if (!valid.has_value()) return R::error(valid.get_error());
    return R::success(RunJob(job, opts, std::nullopt));
  }

  /// One job per enabled probe in @p category, id = probe name.
  expected<BatchResult, BatchError> ExecuteByCategory(
      const std::string& category, const std::string& target,
      BatchOptions opts = BatchOptions{}) {
    opts.target = target;
    if (opts.name == "batch") opts.name = "category:" + category;
    return ExecuteBatch(JobsFor(registry_.ByCategory(category), target), opts);
  }

  /// One job per enabled probe carrying any of @p tags.
  expected<BatchResult, BatchError> ExecuteByTags(
      const std::vector<std::string>& tags, const std::string& target,
      BatchOptions opts = BatchOptions{}) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    for (const auto& tag : tags) {
      for (auto& n : registry_.ByTag(tag)) {
        if (seen.insert(n).second) names.push_back(std::move(n));
      }
    }
    opts.target = target;
    if (opts.name == "batch") opts.name = "tags";
    return ExecuteBatch(JobsFor(names, target), opts);
  }

  /**
   * @brief Quick verification: probes tagged "health", at most 10s and one
   *        retry each, never fail-fast.
   */
  expected<BatchResult, BatchError> ExecuteHealthCheck(
      const std::string& target) {
    std::vector<Job> jobs = JobsFor(registry_.ByTag(kHealthTag), target);
    for (auto& j : jobs) {
      j.timeout = std::min(j.timeout.value_or(kHealthCheckTimeout),
                           kHealthCheckTimeout);
      j.max_retries = std::min(j.max_retries.value_or(kHealthCheckRetries),
                               kHealthCheckRetries);
    }
    BatchOptions opts;
    opts.name = "health_check";
    opts.target = target;
    opts.fail_fast = false;
    return ExecuteBatch(jobs, opts);
  }

  AggregatedReport Summarize(const BatchResult& batch) const {
    return aggregator_.Aggregate(batch);
  }

  // --------------------------------------------------------------------------
  // Statistics
  // --------------------------------------------------------------------------

  std::map<std::string, ProbeExecutionStats> GetExecutionStatistics() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    return probe_stats_;
  }

  BatchMetrics GetBatchMetrics() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    BatchMetrics m = batch_metrics_;
    if (m.total_jobs > 0U) {
      m.success_rate =
          static_cast<double>(m.successful_jobs) / m.total_jobs * 100.0;
      m.average_job_duration = m.total_duration / m.total_jobs;
    }
    if (m.total_duration > 0.0) {
      m.jobs_per_second = static_cast<double>(m.total_jobs) / m.total_duration;
    }
    return m;
  }

  std::vector<std::string> GetOptimizationRecommendations() const {
    const BatchMetrics m = GetBatchMetrics();
    std::vector<std::string> recs;
    if (m.total_jobs == 0U) return recs;
    if (m.success_rate < 80.0) {
      recs.push_back(
          "Low success rate: consider enabling retries for transient failures");
    }
    if (m.average_job_duration > 10.0) {
      recs.push_back(
          "High average job duration: consider enabling parallel execution");
    }
    return recs;
  }

  void ResetStatistics() {
    {
      std::lock_guard<std::mutex> lk(stats_mtx_);
      probe_stats_.clear();
      batch_metrics_ = BatchMetrics{};
      history_.clear();
    }
    timeout_.ResetStatistics();
    retry_.ResetStatistics();
  }

  /// Recent execution times of @p probe_name against @p target.
  std::vector<double> DurationHistory(const std::string& probe_name,
                                      const std::string& target) const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    auto it = history_.find(HistoryKey(probe_name, target));
    if (it == history_.end()) return {};
    return std::vector<double>(it->second.durations.begin(),
                               it->second.durations.end());
  }

  /// Recent failures of @p probe_name against @p target, oldest first.
  std::vector<FailureRecord> FailureHistory(const std::string& probe_name,
                                            const std::string& target) const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    std::vector<FailureRecord> out;
    auto it = history_.find(HistoryKey(probe_name, target));
    if (it == history_.end()) return out;
    for (const auto& f : it->second.failures) out.push_back(f.record);
    return out;
  }

  // --------------------------------------------------------------------------
  // Components
  // --------------------------------------------------------------------------

  ProbeRegistry& Registry() noexcept { return registry_; }
  ResourcePool& Pool() noexcept { return pool_; }
  TimeoutController& Timeouts() noexcept { return timeout_; }
  RetryController& Retries() noexcept { return retry_; }
  ResultInverter& Inverter() noexcept { return inverter_; }
  Scheduler& JobScheduler() noexcept { return scheduler_; }
  const ResultAggregator& Aggregator() const noexcept { return aggregator_; }
  const EngineConfig& Config() const noexcept { return cfg_; }

 private:
  struct BatchRun {
    const BatchOptions* opts{nullptr};
    double started{0.0};
    double budget{0.0};  ///< Seconds; <= 0 disables the batch deadline.
    bool fail_fast{false};
    uint32_t total{0U};
    uint32_t completed{0U};
  };

  struct TimedFailure {
    FailureRecord record;
    double failed_at{0.0};
  };

  struct History {
    std::deque<double> durations;
    std::deque<TimedFailure> failures;
  };

  // --------------------------------------------------------------------------
  // Execution modes
  // --------------------------------------------------------------------------

  void RunSequential(const std::vector<Job>& ordered, BatchRun& run,
                     BatchResult& batch) {
    std::deque<const Job*> queue;
    std::set<std::string> pending;
    for (const auto& j : ordered) {
      queue.push_back(&j);
      pending.insert(j.id);
    }

    size_t stalls = 0U;
    while (!queue.empty()) {
      const Job* job = queue.front();
      queue.pop_front();
      // A full rotation without progress means no pending job can finish.
      if (stalls <= queue.size() && HasPendingDependency(*job, pending)) {
        queue.push_back(job);
        ++stalls;
        continue;
      }
      stalls = 0U;
      pending.erase(job->id);

      Result r = Process(*job, run, batch);
      const bool problem = r.HasProblems();
      batch.Add(job->id, std::move(r));
      NotifyProgress(run, CountProgress(run, job->id));

      if (run.fail_fast && problem) {
        Abort(batch, queue, job->id);
        break;
      }
    }
  }

  void RunParallel(const std::vector<Job>& ordered, BatchRun& run,
                   BatchResult& batch) {
    WorkerPool& workers = Workers();
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<const Job*> queue;
    std::set<std::string> pending;
    uint32_t in_flight = 0U;
    bool stop = false;
    std::string stop_id;
    std::vector<ProgressNote> notes;
    for (const auto& j : ordered) {
      queue.push_back(&j);
      pending.insert(j.id);
    }

    // Caller holds mtx.
    auto complete = [&](const Job& job, Result r) {
      const bool problem = r.HasProblems();
      pending.erase(job.id);
      batch.Add(job.id, std::move(r));
      notes.push_back(CountProgress(run, job.id));
      if (run.fail_fast && problem && !stop) {
        stop = true;
        stop_id = job.id;
      }
    };

    std::unique_lock<std::mutex> lk(mtx);
    // Progress is delivered on this thread, in completion order, unlocked.
    auto flush = [&]() {
      if (notes.empty()) return;
      std::vector<ProgressNote> out;
      out.swap(notes);
      lk.unlock();
      for (const auto& n : out) NotifyProgress(run, n);
      lk.lock();
    };
    while (true) {
      flush();
      if (stop || queue.empty()) {
        if (in_flight == 0U) break;
        cv.wait(lk);
        continue;
      }

      bool progressed = false;
      const size_t n = queue.size();
      for (size_t i = 0U; i < n && in_flight < cfg_.max_parallel_tests && !stop;
           ++i) {
        const Job* job = queue.front();
        queue.pop_front();
        if (HasPendingDependency(*job, pending)) {
          queue.push_back(job);
          continue;
        }
        progressed = true;

        std::optional<SteadyTime> deadline;
        std::optional<Result> immediate = Precheck(*job, run, batch, deadline);
        if (immediate.has_value()) {
          complete(*job, std::move(*immediate));
          continue;
        }

        ++in_flight;
        const bool submitted = workers.Submit([&, job, deadline]() {
          Result r = RunJob(*job, *run.opts, deadline);
          std::lock_guard<std::mutex> guard(mtx);
          complete(*job, std::move(r));
          --in_flight;
          cv.notify_all();
        });
        if (!submitted) {
          --in_flight;
          VIGIL_LOG_ERROR("Engine", "worker pool rejected job '%s'",
                          job->id.c_str());
          Result r(job->probe_name, Status::kError,
                   "worker pool rejected job");
          r.target = TargetOf(*job, *run.opts);
          ApplyContext(r, *job, *run.opts);
          complete(*job, std::move(r));
        }
      }

      if (!progressed && in_flight == 0U) {
        // Only reachable if every queued job waits on another queued job.
        while (!queue.empty()) {
          const Job* job = queue.front();
          queue.pop_front();
          complete(*job, SkipResult(*job, *run.opts, batch));
        }
        continue;
      }
      if (!progressed || in_flight >= cfg_.max_parallel_tests) cv.wait(lk);
    }
    flush();

    if (stop) Abort(batch, queue, stop_id);
  }

  /// Skip or deadline Timeout when the job must not run; sets @p deadline.
  std::optional<Result> Precheck(const Job& job, const BatchRun& run,
                                 const BatchResult& batch,
                                 std::optional<SteadyTime>& deadline) const {
    if (!CanExecute(job, batch)) return SkipResult(job, *run.opts, batch);
    if (run.budget > 0.0) {
      const double elapsed = SteadyNowSec() - run.started;
      const double remaining = run.budget - elapsed;
      if (remaining <= 0.0) {
        Result r(job.probe_name, Status::kTimeout,
                 "batch deadline exceeded before execution");
        r.target = TargetOf(job, *run.opts);
        r.AddData("timeout_limit", run.budget);
        r.AddData("actual_execution_time", 0.0);
        r.AddData("timeout_type", "batch");
        r.AddData("exceeded_by", elapsed - run.budget);
        ApplyContext(r, job, *run.opts);
        return r;
      }
      deadline = SteadyTime::clock::now() + SecondsToDuration(remaining);
    }
    return std::nullopt;
  }

  Result Process(const Job& job, const BatchRun& run,
                 const BatchResult& batch) {
    std::optional<SteadyTime> deadline;
    std::optional<Result> immediate = Precheck(job, run, batch, deadline);
    if (immediate.has_value()) return std::move(*immediate);
    return RunJob(job, *run.opts, deadline);
  }

  void Abort(BatchResult& batch, const std::deque<const Job*>& remaining,
             const std::string& culprit) const {
    batch.aborted = true;
    for (const Job* j : remaining) batch.not_run.push_back(j->id);
    VIGIL_LOG_WARN("Engine", "fail-fast: '%s' failed, %zu jobs not run",
                   culprit.c_str(), remaining.size());
  }

  // --------------------------------------------------------------------------
  // Per-job pipeline
  // --------------------------------------------------------------------------

  Result RunJob(const Job& job, const BatchOptions& opts,
                std::optional<SteadyTime> deadline) {
    const std::string target = TargetOf(job, opts);
    const double started = SteadyNowSec();
    Result r = Invoke(job, target, deadline);
    ApplyContext(r, job, opts);

    if (cfg_.enable_result_inversion && InversionActive(opts)) {
      auto inverted =
          opts.inversion_conditions.has_value()
              ? inverter_.ApplyConditionalInversion(r, opts.inversion_mode,
                                                    *opts.inversion_conditions)
              : inverter_.ApplyInversion(r, opts.inversion_mode);
      if (inverted.has_value()) {
        r = std::move(inverted).value();
      } else {
        // The rule was removed after the batch was validated.
        VIGIL_LOG_ERROR("Engine", "inversion skipped for '%s': %s",
                        job.id.c_str(), inverted.get_error().detail.c_str());
        r.AddData("inversion_error", inverted.get_error().detail);
      }
    }

    RecordExecution(job.probe_name, target, r, SteadyNowSec() - started);
    return r;
  }

  /// @p deadline bounds every attempt and retry delay of the job.
  Result Invoke(const Job& job, const std::string& target,
                std::optional<SteadyTime> deadline) {
    const std::string& name = job.probe_name;
    auto created = registry_.Create(name);
    if (!created.has_value()) {
      VIGIL_LOG_WARN("Engine", "job '%s': probe '%s' unavailable",
                     job.id.c_str(), name.c_str());
      Result r(name, Status::kError,
               "probe not found or could not be instantiated");
      r.target = target;
      r.AddData("registry_error",
                created.get_error() == RegistryError::kProbeDisabled
                    ? "disabled"
                    : "unknown");
      return r;
    }
    std::shared_ptr<Probe> probe(std::move(created).value());

    ProbeContext ctx;
    ctx.params = job.params.is_object() ? job.params : Json::object();
    if (deadline.has_value()) ctx.deadline = *deadline;

    std::optional<std::string> skip = probe->ShouldSkip(target, ctx);
    if (skip.has_value()) {
      Result r(name, Status::kSkip, *skip);
      r.target = target;
      return r;
    }

    ProbeCall call = MakeCall(probe, target);
    if (cfg_.enable_timeouts) {
      double limit = job.timeout.has_value() ? *job.timeout
                                             : timeout_.TimeoutFor(name);
      if (!job.timeout.has_value() && cfg_.adaptive_timeouts) {
        limit = timeout_.AdaptiveTimeout(DurationHistory(name, target), limit);
      }
      limit = timeout_.ValidateTimeout(limit);
      TimeoutController* tc = &timeout_;
      call = [tc, name, target, inner = std::move(call),
              limit](const ProbeContext& c) {
        return tc->Execute(name, target, inner, c, limit);
      };
    }

    if (cfg_.enable_retries) {
      if (cfg_.smart_retries && !job.max_retries.has_value()) {
        return retry_.ExecuteWithSmartRetry(name, target, call, ctx,
                                            FailureHistory(name, target));
      }
      return retry_.Execute(name, target, call, ctx, job.max_retries);
    }

    ProbeOutcome out = InvokeGuarded(call, name, target, ctx);
    if (out.has_value()) return std::move(out).value();
    const ProbeFault& fault = out.get_error();
    Result r(name, Status::kError, "probe failed: " + fault.message);
    r.target = target;
    r.AddData("fault_kind", FaultKindName(fault.kind));
    r.AddData("fault_message", fault.message);
    return r;
  }

  /// Binds the probe, borrowing a pool handle for the call when pooling.
  ProbeCall MakeCall(const std::shared_ptr<Probe>& probe,
                     const std::string& target) {
    if (!cfg_.resource_pooling) return BindProbe(probe, target);
    ResourcePool* pool = &pool_;
    return [pool, probe, target](const ProbeContext& c) -> ProbeOutcome {
      const double wait = std::min(pool->Config().acquire_timeout,
                                   std::max(c.RemainingSeconds(), 0.0));
      auto lease = pool->AcquireLeaseFor(wait);
      if (!lease.has_value()) {
        const bool closed = lease.get_error() == PoolError::kPoolClosed;
        return ProbeOutcome::error(ProbeFault{
            FaultKind::kResourceExhausted,
            closed ? "resource pool closed"
                   : "no connection available within the wait ceiling"});
      }
      ProbeContext with = c;
      with.connection = lease.value().get();
      return probe->Run(target, with);
    };
  }

  // --------------------------------------------------------------------------
  // Helpers
  // --------------------------------------------------------------------------

  static bool CanExecute(const Job& job, const BatchResult& done) {
    for (const auto& dep : job.dependencies) {
      const Result* r = done.Find(dep);
      if (r == nullptr || r->HasProblems()) return false;
    }
    return true;
  }

  static bool HasPendingDependency(const Job& job,
                                   const std::set<std::string>& pending) {
    for (const auto& dep : job.dependencies) {
      if (dep != job.id && pending.count(dep) > 0U) return true;
    }
    return false;
  }

  static Result SkipResult(const Job& job, const BatchOptions& opts,
                           const BatchResult& done) {
    Result r(job.probe_name, Status::kSkip, "dependencies not met");
    r.target = TargetOf(job, opts);
    Json unmet = Json::array();
    for (const auto& dep : job.dependencies) {
      const Result* d = done.Find(dep);
      if (d == nullptr || d->HasProblems()) unmet.push_back(dep);
    }
    r.AddData("unmet_dependencies", unmet);
    ApplyContext(r, job, opts);
    return r;
  }

  static std::string TargetOf(const Job& job, const BatchOptions& opts) {
    return job.target.empty() ? opts.target : job.target;
  }

  static void ApplyContext(Result& r, const Job& job, const BatchOptions& opts) {
    if (opts.context.is_object()) {
      for (auto it = opts.context.begin(); it != opts.context.end(); ++it) {
        if (!r.context.contains(it.key())) r.context[it.key()] = it.value();
      }
    }
    r.AddContext("job_id", job.id);
  }

  static bool InversionActive(const BatchOptions& opts) noexcept {
    return !opts.inversion_mode.empty() && opts.inversion_mode != kNoInversion;
  }

  expected<void, BatchError> ValidateInversion(const BatchOptions& opts) const {
    if (cfg_.enable_result_inversion && InversionActive(opts) &&
        !inverter_.HasRule(opts.inversion_mode)) {
      VIGIL_LOG_ERROR("Engine", "unknown inversion mode '%s'",
                      opts.inversion_mode.c_str());
      return expected<void, BatchError>::error(
          BatchError{BatchErrorCode::kUnknownInversionRule,
                     "unknown inversion rule: " + opts.inversion_mode});
    }
    return expected<void, BatchError>::success();
  }

  std::vector<Job> JobsFor(const std::vector<std::string>& names,
                           const std::string& target) const {
    std::vector<Job> jobs;
    for (const auto& name : names) {
      Job j;
      j.id = name;
      j.probe_name = name;
      j.target = target;
      std::optional<ProbeInfo> info = registry_.Info(name);
      if (info.has_value()) {
        j.timeout = info->default_timeout;
        j.max_retries = info->max_retries;
        j.priority = info->priority;
      }
      jobs.push_back(std::move(j));
    }
    return jobs;
  }

  struct ProgressNote {
    uint32_t current;
    uint32_t total;
    std::string job_id;
  };

  /// Counts one finished job; parallel callers hold the batch mutex.
  static ProgressNote CountProgress(BatchRun& run, const std::string& job_id) {
    ++run.completed;
    return ProgressNote{run.completed, run.total, job_id};
  }

  static void NotifyProgress(const BatchRun& run, const ProgressNote& note) {
    const double pct =
        note.total > 0U ? static_cast<double>(note.current) / note.total * 100.0
                        : 100.0;
    VIGIL_LOG_INFO("Engine", "progress: %.1f%% (%u/%u) - %s", pct,
                   note.current, note.total, note.job_id.c_str());
    if (run.opts->progress_callback) {
      run.opts->progress_callback(note.current, note.total, note.job_id);
    }
  }

  WorkerPool& Workers() {
    std::lock_guard<std::mutex> lk(workers_mtx_);
    if (!workers_) {
      WorkerPoolConfig wc;
      wc.name = "vigil-engine";
      wc.worker_num = cfg_.max_parallel_tests;
      workers_ = std::make_unique<WorkerPool>(wc);
      workers_->Start();
    }
    return *workers_;
  }

  static std::string HistoryKey(const std::string& probe_name,
                                const std::string& target) {
    return probe_name + '\n' + target;
  }

  void RecordExecution(const std::string& probe_name, const std::string& target,
                       const Result& r, double elapsed) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    ProbeExecutionStats& s = probe_stats_[probe_name];
    ++s.total_executions;
    s.total_time += elapsed;
    s.average_execution_time = s.total_time / s.total_executions;
    ++s.status_counts[StatusName(r.status)];

    History& h = history_[HistoryKey(probe_name, target)];
    h.durations.push_back(r.execution_time > 0.0 ? r.execution_time : elapsed);
    while (h.durations.size() > cfg_.history_size) h.durations.pop_front();

    const double now = SteadyNowSec();
    if (r.HasProblems()) {
      h.failures.push_back(TimedFailure{FailureRecord{r.status, 0.0}, now});
      while (h.failures.size() > cfg_.history_size) h.failures.pop_front();
    } else if (!h.failures.empty() &&
               h.failures.back().record.recovery_time <= 0.0) {
      h.failures.back().record.recovery_time = now - h.failures.back().failed_at;
    }
  }

  void RecordBatch(const BatchResult& batch) {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    ++batch_metrics_.batches;
    batch_metrics_.total_jobs += batch.TotalCount();
    for (const auto& kv : batch.results) {
      if (kv.second.IsSuccessful()) ++batch_metrics_.successful_jobs;
      if (kv.second.HasProblems()) ++batch_metrics_.failed_jobs;
    }
    batch_metrics_.total_duration += batch.execution_time;
  }

  ProbeRegistry& registry_;
  EngineConfig cfg_;
  ResourcePool pool_;
  TimeoutController timeout_;
  RetryController retry_;
  ResultInverter inverter_;
  Scheduler scheduler_;
  ResultAggregator aggregator_;

  mutable std::mutex stats_mtx_;
  std::map<std::string, ProbeExecutionStats> probe_stats_;
  BatchMetrics batch_metrics_;
  std::map<std::string, History> history_;

  std::mutex workers_mtx_;
  std::unique_ptr<WorkerPool> workers_;  ///< Created by the first parallel batch.
};

}  // namespace vigil

#endif  // VIGIL_EXECUTION_ENGINE_HPP_
