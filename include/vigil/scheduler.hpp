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
 * @file scheduler.hpp
 * @brief Orders a batch of jobs for execution.
 *
 * Optimize() composes four passes in a fixed order:
 *   1. Topological reordering (dependency-safe base order)
 *   2. Priority sort (stable; priority desc, then estimated_duration asc)
 *   3. Load balancing (heavy/medium/light round-robin by complexity)
 *   4. Adaptive batching (grouping by probe and target host for locality)
 *
 * Passes 2-4 can each be disabled. Only pass 1 reflects dependencies; the
 * engine's dependency guard, not this ordering, enforces correctness.
 */

#ifndef VIGIL_SCHEDULER_HPP_
#define VIGIL_SCHEDULER_HPP_

#include "vigil/job.hpp"
#include "vigil/log.hpp"

#include <cctype>
#include <cstdint>

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

struct SchedulerConfig {
  bool priority_scheduling{true};
  bool load_balancing{true};
  bool adaptive_batching{true};
};

struct SchedulerMetrics {
  uint64_t optimizations{0U};
  uint32_t last_job_count{0U};
  uint32_t last_batch_count{0U};
  uint32_t last_dropped{0U};
  std::vector<std::string> strategies_applied;
};

/// Outcome of OptimizeForDeadline().
struct DeadlinePlan {
  std::vector<Job> admitted;
  std::vector<std::string> dropped;
  double planned_duration{0.0};
};

static constexpr double kHeavyComplexity = 2.0;
static constexpr double kLightComplexity = 0.5;

class Scheduler {
 public:
  explicit Scheduler(const SchedulerConfig& cfg = SchedulerConfig{})
      : cfg_(cfg) {}

  std::vector<Job> Optimize(const std::vector<Job>& jobs,
                            const std::vector<std::string>& topo_order) {
    std::vector<std::string> applied{"topological"};
    std::vector<Job> out = TopologicalReorder(jobs, topo_order);
    if (cfg_.priority_scheduling) {
      PrioritySort(out);
      applied.push_back("priority");
    }
    if (cfg_.load_balancing) {
      out = LoadBalance(std::move(out));
      applied.push_back("load_balancing");
    }
    uint32_t batch_count = 0U;
    if (cfg_.adaptive_batching) {
      auto batches = AdaptiveBatches(out);
      batch_count = static_cast<uint32_t>(batches.size());
      out.clear();
      for (auto& b : batches) {
        for (auto& j : b) out.push_back(std::move(j));
      }
      applied.push_back("adaptive_batching");
    }

    std::lock_guard<std::mutex> lk(mtx_);
    ++metrics_.optimizations;
    metrics_.last_job_count = static_cast<uint32_t>(out.size());
    metrics_.last_batch_count = batch_count;
    metrics_.strategies_applied = std::move(applied);
    VIGIL_LOG_DEBUG("Sched", "optimized %zu jobs (%u batches)", out.size(),
                    batch_count);
    return out;
  }

  // --------------------------------------------------------------------------
  // Passes
  // --------------------------------------------------------------------------

  /// Jobs in @p order first; jobs missing from it keep their relative order.
  static std::vector<Job> TopologicalReorder(
      const std::vector<Job>& jobs, const std::vector<std::string>& order) {
    std::map<std::string, size_t> by_id;
    for (size_t i = 0; i < jobs.size(); ++i) by_id.emplace(jobs[i].id, i);
    std::vector<bool> placed(jobs.size(), false);
    std::vector<Job> out;
    out.reserve(jobs.size());
    for (const auto& id : order) {
      auto it = by_id.find(id);
      if (it != by_id.end() && !placed[it->second]) {
        out.push_back(jobs[it->second]);
        placed[it->second] = true;
      }
    }
    for (size_t i = 0; i < jobs.size(); ++i) {
      if (!placed[i]) out.push_back(jobs[i]);
    }
    return out;
  }

  static void PrioritySort(std::vector<Job>& jobs) {
    std::stable_sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
      if (a.priority != b.priority) return a.priority > b.priority;
      return a.estimated_duration < b.estimated_duration;
    });
  }

  /// Interleaves heavy (>2.0), medium and light (<=0.5) jobs round-robin.
  static std::vector<Job> LoadBalance(std::vector<Job> jobs) {
    if (jobs.size() <= 1U) return jobs;
    std::vector<Job> heavy;
    std::vector<Job> medium;
    std::vector<Job> light;
    for (auto& j : jobs) {
      if (j.complexity > kHeavyComplexity) {
        heavy.push_back(std::move(j));
      } else if (j.complexity <= kLightComplexity) {
        light.push_back(std::move(j));
      } else {
        medium.push_back(std::move(j));
      }
    }
    std::vector<Job> out;
    out.reserve(jobs.size());
    const size_t rounds =
        std::max(heavy.size(), std::max(medium.size(), light.size()));
    for (size_t i = 0; i < rounds; ++i) {
      if (i < heavy.size()) out.push_back(std::move(heavy[i]));
      if (i < medium.size()) out.push_back(std::move(medium[i]));
      if (i < light.size()) out.push_back(std::move(light[i]));
    }
    return out;
  }

  /// Groups by (probe, host) in first-seen order, chunked to BatchSizeFor().
  static std::vector<std::vector<Job>> AdaptiveBatches(
      const std::vector<Job>& jobs) {
    std::vector<std::string> keys;
    std::map<std::string, std::vector<Job>> groups;
    for (const auto& j : jobs) {
      const std::string key = j.probe_name + ":" + ExtractHost(j.target);
      auto it = groups.find(key);
      if (it == groups.end()) {
        keys.push_back(key);
        it = groups.emplace(key, std::vector<Job>{}).first;
      }
      it->second.push_back(j);
    }
    const size_t size = BatchSizeFor(jobs.size());
    std::vector<std::vector<Job>> batches;
    for (const auto& key : keys) {
      auto& group = groups[key];
      for (size_t i = 0; i < group.size(); i += size) {
        const size_t end = std::min(group.size(), i + size);
        batches.emplace_back(group.begin() + static_cast<std::ptrdiff_t>(i),
                             group.begin() + static_cast<std::ptrdiff_t>(end));
      }
    }
    return batches;
  }

  static uint32_t BatchSizeFor(size_t total_jobs) noexcept {
    if (total_jobs <= 10U) return 3U;
    if (total_jobs <= 50U) return 5U;
    if (total_jobs <= 200U) return 10U;
    return 20U;
  }

  // --------------------------------------------------------------------------
  // Deadline planning
  // --------------------------------------------------------------------------

  /**
   * @brief Admits the most efficient jobs that fit within @p deadline.
   *
   * Efficiency is priority / estimated_duration (priority alone for a zero
   * duration). Jobs that would push the running total past the deadline are
   * dropped; later, shorter jobs may still be admitted.
   */
  DeadlinePlan OptimizeForDeadline(const std::vector<Job>& jobs,
                                   double deadline) {
    std::vector<Job> ranked(jobs);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Job& a, const Job& b) {
                       return Efficiency(a) > Efficiency(b);
                     });
    DeadlinePlan plan;
    for (auto& j : ranked) {
      if (plan.planned_duration + j.estimated_duration <= deadline) {
        plan.planned_duration += j.estimated_duration;
        plan.admitted.push_back(std::move(j));
      } else {
        plan.dropped.push_back(j.id);
      }
    }
    if (!plan.dropped.empty()) {
      VIGIL_LOG_INFO("Sched", "deadline %.2fs: admitted %zu, dropped %zu",
                     deadline, plan.admitted.size(), plan.dropped.size());
    }
    std::lock_guard<std::mutex> lk(mtx_);
    metrics_.last_dropped = static_cast<uint32_t>(plan.dropped.size());
    return plan;
  }

  static double Efficiency(const Job& j) noexcept {
    return j.estimated_duration > 0.0
               ? static_cast<double>(j.priority) / j.estimated_duration
               : static_cast<double>(j.priority);
  }

  // --------------------------------------------------------------------------
  // Helpers
  // --------------------------------------------------------------------------

  /// Inserts @p job before the first queued job of strictly lower priority.
  static void SchedulePriorityJob(const Job& job, std::vector<Job>& queue) {
    auto it = std::find_if(queue.begin(), queue.end(), [&job](const Job& q) {
      return q.priority < job.priority;
    });
    queue.insert(it, job);
  }

  /**
   * @brief Wall-time estimate blending sequential and parallel execution.
   *
   * sequential * (1 - pf) + longest * pf, where pf is the share of jobs
   * without dependencies.
   */
  static double EstimateExecutionTime(const std::vector<Job>& jobs) noexcept {
    if (jobs.empty()) return 0.0;
    double sequential = 0.0;
    double longest = 0.0;
    size_t independent = 0U;
    for (const auto& j : jobs) {
      sequential += j.estimated_duration;
      longest = std::max(longest, j.estimated_duration);
      if (j.dependencies.empty()) ++independent;
    }
    const double pf = static_cast<double>(independent) / jobs.size();
    return sequential * (1.0 - pf) + longest * pf;
  }

  /**
   * @brief Host part of a target used for batching keys.
   *
   * "https://user@Example.com:8443/x" -> "example.com". Schemeless targets
   * use their leading segment; an empty host yields "unknown".
   */
  static std::string ExtractHost(const std::string& target) {
    std::string rest = target;
    const size_t scheme = rest.find("://");
    if (scheme != std::string::npos) rest = rest.substr(scheme + 3U);
    const size_t path = rest.find_first_of("/?#");
    if (path != std::string::npos) rest = rest.substr(0, path);
    const size_t at = rest.rfind('@');
    if (at != std::string::npos) rest = rest.substr(at + 1U);
    if (!rest.empty() && rest.front() == '[') {
      const size_t close = rest.find(']');
      rest = (close != std::string::npos) ? rest.substr(0, close + 1U) : rest;
    } else {
      const size_t colon = rest.find(':');
      if (colon != std::string::npos) rest = rest.substr(0, colon);
    }
    for (auto& c : rest) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return rest.empty() ? std::string("unknown") : rest;
  }

  SchedulerMetrics GetMetrics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return metrics_;
  }

  const SchedulerConfig& Config() const noexcept { return cfg_; }

 private:
  const SchedulerConfig cfg_;
  mutable std::mutex mtx_;
  SchedulerMetrics metrics_;
};

}  // namespace vigil

#endif  // VIGIL_SCHEDULER_HPP_
