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
 * @file dependency_graph.hpp
 * @brief Dependency DAG over the jobs of one batch.
 *
 * Build() indexes jobs in submission order and keeps only dependency edges
 * whose target is in the batch; other ids are recorded as external. The
 * graph must be acyclic: Analyze() runs cycle detection to completion first
 * and fails with the offending edge before any ordering is computed.
 *
 * Edge direction follows the job declaration: "B -> A" means B depends on
 * A, so A precedes B in the topological order.
 */

#ifndef VIGIL_DEPENDENCY_GRAPH_HPP_
#define VIGIL_DEPENDENCY_GRAPH_HPP_

#include "vigil/job.hpp"
#include "vigil/log.hpp"
#include "vigil/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

struct CriticalPath {
  uint32_t length{0U};              ///< Longest chain, in edges.
  std::vector<std::string> nodes;   ///< Ids attaining that distance.
};

struct GraphStats {
  uint32_t total_nodes{0U};
  uint32_t total_edges{0U};
  uint32_t max_depth{0U};
  double parallelization_factor{0.0};  ///< Largest group / node count.
  double dependency_density{0.0};      ///< Edges / (n * (n - 1)).
};

struct DependencyAnalysis {
  std::map<std::string, std::vector<std::string>> dependencies;
  std::map<std::string, std::vector<std::string>> reverse_dependencies;
  std::vector<std::string> order;
  CriticalPath critical_path;
  std::vector<std::vector<std::string>> parallel_groups;
  GraphStats stats;
};

class DependencyGraph {
 public:
  /// Build, check for cycles, then compute every derived view.
  expected<DependencyAnalysis, BatchError> Analyze(const std::vector<Job>& jobs) {
    using R = expected<DependencyAnalysis, BatchError>;
    auto built = Build(jobs);
    if (!built.has_value()) return R::error(built.get_error());
    auto acyclic = DetectCycle();
    if (!acyclic.has_value()) return R::error(acyclic.get_error());

    DependencyAnalysis a;
    for (size_t i = 0; i < ids_.size(); ++i) {
      auto& fwd = a.dependencies[ids_[i]];
      for (size_t d : deps_[i]) fwd.push_back(ids_[d]);
      auto& rev = a.reverse_dependencies[ids_[i]];
      for (size_t r : rdeps_[i]) rev.push_back(ids_[r]);
    }
    a.order = TopologicalOrder();
    a.critical_path = ComputeCriticalPath();
    a.parallel_groups = ParallelGroups();
    a.stats = ComputeStats(a.parallel_groups, a.critical_path);
    return R::success(std::move(a));
  }

  /// Indexes the jobs. Fails on duplicate or empty ids.
  expected<void, BatchError> Build(const std::vector<Job>& jobs) {
    Clear();
    for (const auto& job : jobs) {
      if (job.id.empty()) {
        return expected<void, BatchError>::error(
            BatchError{BatchErrorCode::kEmptyJobId,
                       "job for probe '" + job.probe_name + "' has no id"});
      }
      if (index_.find(job.id) != index_.end()) {
        return expected<void, BatchError>::error(BatchError{
            BatchErrorCode::kDuplicateJobId, "duplicate job id: " + job.id});
      }
      index_[job.id] = ids_.size();
      ids_.push_back(job.id);
    }
    deps_.assign(ids_.size(), {});
    rdeps_.assign(ids_.size(), {});
    for (size_t i = 0; i < jobs.size(); ++i) {
      for (const auto& dep : jobs[i].dependencies) {
        auto it = index_.find(dep);
        if (it == index_.end()) {
          external_.emplace_back(ids_[i], dep);
          VIGIL_LOG_DEBUG("Graph", "job %s depends on external id %s",
                          ids_[i].c_str(), dep.c_str());
          continue;
        }
        deps_[i].push_back(it->second);
        rdeps_[it->second].push_back(i);
        ++edge_count_;
      }
    }
    for (auto& v : deps_) std::sort(v.begin(), v.end());
    for (auto& v : rdeps_) std::sort(v.begin(), v.end());
    return expected<void, BatchError>::success();
  }

  /**
   * @brief Depth-first search with a recursion stack.
   *
   * A dependency edge into a node still on the stack closes a cycle; the
   * error names that edge.
   */
  expected<void, BatchError> DetectCycle() const {
    enum : uint8_t { kWhite = 0, kGrey, kBlack };
    std::vector<uint8_t> color(ids_.size(), kWhite);
    std::vector<std::pair<size_t, size_t>> stack;  // node, next dep index

    for (size_t root = 0; root < ids_.size(); ++root) {
      if (color[root] != kWhite) continue;
      stack.emplace_back(root, 0U);
      color[root] = kGrey;
      while (!stack.empty()) {
        auto& top = stack.back();
        const size_t node = top.first;
        if (top.second < deps_[node].size()) {
          const size_t next = deps_[node][top.second++];
          if (color[next] == kGrey) {
            const std::string edge = ids_[node] + " -> " + ids_[next];
            VIGIL_LOG_ERROR("Graph", "circular dependency detected: %s",
                            edge.c_str());
            return expected<void, BatchError>::error(
                BatchError{BatchErrorCode::kCyclicDependency,
                           "circular dependency detected: " + edge});
          }
          if (color[next] == kWhite) {
            color[next] = kGrey;
            stack.emplace_back(next, 0U);
          }
        } else {
          color[node] = kBlack;
          stack.pop_back();
        }
      }
    }
    return expected<void, BatchError>::success();
  }

  /**
   * @brief Kahn's algorithm; ready nodes leave in submission order.
   *
   * Nodes never released (only possible on a cyclic graph) are appended.
   */
  std::vector<std::string> TopologicalOrder() const {
    std::vector<size_t> indegree(ids_.size());
    std::set<size_t> ready;
    for (size_t i = 0; i < ids_.size(); ++i) {
      indegree[i] = deps_[i].size();
      if (indegree[i] == 0U) ready.insert(i);
    }
    std::vector<std::string> order;
    std::vector<bool> emitted(ids_.size(), false);
    while (!ready.empty()) {
      const size_t node = *ready.begin();
      ready.erase(ready.begin());
      order.push_back(ids_[node]);
      emitted[node] = true;
      for (size_t dependent : rdeps_[node]) {
        if (--indegree[dependent] == 0U) ready.insert(dependent);
      }
    }
    for (size_t i = 0; i < ids_.size(); ++i) {
      if (!emitted[i]) order.push_back(ids_[i]);
    }
    return order;
  }

  /// Longest dependency chain by edge count.
  CriticalPath ComputeCriticalPath() const {
    CriticalPath cp;
    const std::vector<uint32_t> dist = Depths();
    for (uint32_t d : dist) cp.length = std::max(cp.length, d);
    for (size_t i = 0; i < ids_.size(); ++i) {
      if (dist[i] == cp.length) cp.nodes.push_back(ids_[i]);
    }
    if (ids_.empty()) cp.nodes.clear();
    return cp;
  }

  /**
   * @brief Greedy partition of the topological order into independent groups.
   *
   * No two members of a group are connected by a dependency path in either
   * direction.
   */
  std::vector<std::vector<std::string>> ParallelGroups() const {
    const auto reach = Ancestors();
    std::vector<size_t> order_idx;
    for (const auto& id : TopologicalOrder()) order_idx.push_back(index_.at(id));

    std::vector<std::vector<std::string>> groups;
    std::vector<bool> processed(ids_.size(), false);
    for (size_t node : order_idx) {
      if (processed[node]) continue;
      std::vector<size_t> members{node};
      processed[node] = true;
      for (size_t other : order_idx) {
        if (processed[other]) continue;
        bool independent = true;
        for (size_t m : members) {
          if (reach[m][other] || reach[other][m]) {
            independent = false;
            break;
          }
        }
        if (independent) {
          members.push_back(other);
          processed[other] = true;
        }
      }
      std::vector<std::string> group;
      for (size_t m : members) group.push_back(ids_[m]);
      groups.push_back(std::move(group));
    }
    return groups;
  }

  /// True if @p from transitively depends on @p to.
  bool HasDependencyPath(const std::string& from, const std::string& to) const {
    auto fi = index_.find(from);
    auto ti = index_.find(to);
    if (fi == index_.end() || ti == index_.end()) return false;
    return Ancestors()[fi->second][ti->second];
  }

  /// (job, missing dependency) pairs seen by the last Build().
  const std::vector<std::pair<std::string, std::string>>& ExternalDependencies()
      const noexcept {
    return external_;
  }

  uint32_t NodeCount() const noexcept {
    return static_cast<uint32_t>(ids_.size());
  }
  uint32_t EdgeCount() const noexcept { return edge_count_; }

 private:
  void Clear() {
    ids_.clear();
    index_.clear();
    deps_.clear();
    rdeps_.clear();
    external_.clear();
    edge_count_ = 0U;
  }

  /// Distance (in edges) from the furthest root, computed along topo order.
  std::vector<uint32_t> Depths() const {
    std::vector<uint32_t> dist(ids_.size(), 0U);
    for (const auto& id : TopologicalOrder()) {
      const size_t node = index_.at(id);
      for (size_t d : deps_[node]) {
        dist[node] = std::max(dist[node], dist[d] + 1U);
      }
    }
    return dist;
  }

  /// reach[a][b] is true when a transitively depends on b.
  std::vector<std::vector<bool>> Ancestors() const {
    std::vector<std::vector<bool>> reach(ids_.size(),
                                         std::vector<bool>(ids_.size(), false));
    for (const auto& id : TopologicalOrder()) {
      const size_t node = index_.at(id);
      for (size_t d : deps_[node]) {
        reach[node][d] = true;
        for (size_t k = 0; k < ids_.size(); ++k) {
          if (reach[d][k]) reach[node][k] = true;
        }
      }
    }
    return reach;
  }

  GraphStats ComputeStats(const std::vector<std::vector<std::string>>& groups,
                          const CriticalPath& cp) const {
    GraphStats s;
    const size_t n = ids_.size();
    s.total_nodes = static_cast<uint32_t>(n);
    s.total_edges = edge_count_;
    s.max_depth = cp.length;
    size_t largest = 0U;
    for (const auto& g : groups) largest = std::max(largest, g.size());
    if (n > 0U) {
      s.parallelization_factor = static_cast<double>(largest) / n;
    }
    if (n > 1U) {
      s.dependency_density =
          static_cast<double>(edge_count_) / (static_cast<double>(n) * (n - 1U));
    }
    return s;
  }

  std::vector<std::string> ids_;
  std::map<std::string, size_t> index_;
  std::vector<std::vector<size_t>> deps_;
  std::vector<std::vector<size_t>> rdeps_;
  std::vector<std::pair<std::string, std::string>> external_;
  uint32_t edge_count_{0U};
};

}  // namespace vigil

#endif  // VIGIL_DEPENDENCY_GRAPH_HPP_
