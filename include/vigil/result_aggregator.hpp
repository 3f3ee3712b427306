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
 * @file result_aggregator.hpp
 * @brief Summary statistics, category scores and recommendations for a
 *        set of probe results.
 */

#ifndef VIGIL_RESULT_AGGREGATOR_HPP_
#define VIGIL_RESULT_AGGREGATOR_HPP_

#include "vigil/log.hpp"
#include "vigil/platform.hpp"
#include "vigil/result.hpp"

#include <cctype>
#include <cstdint>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

static constexpr const char* kCategorySecurity = "security";
static constexpr const char* kCategoryPerformance = "performance";
static constexpr const char* kCategoryAvailability = "availability";
static constexpr const char* kCategoryGeneral = "general";

/// Weight applied to categories without a configured weight.
static constexpr double kUnknownCategoryWeight = 0.1;

// ============================================================================
// Configuration & report types
// ============================================================================

struct AggregatorConfig {
  double weight_security{0.4};
  double weight_performance{0.3};
  double weight_availability{0.3};
  bool calculate_trends{true};
  bool generate_recommendations{true};
  double min_success_rate{80.0};      ///< Percent; below it is critical.
  double slow_average_time{10.0};     ///< Seconds per result.
  double stable_variance{0.1};

  double WeightFor(const std::string& category) const noexcept {
    if (category == kCategorySecurity) return weight_security;
    if (category == kCategoryPerformance) return weight_performance;
    if (category == kCategoryAvailability) return weight_availability;
    return kUnknownCategoryWeight;
  }
};

struct Summary {
  uint32_t total{0U};
  uint32_t passed{0U};
  uint32_t failed{0U};
  uint32_t warnings{0U};
  uint32_t errors{0U};
  uint32_t skipped{0U};
  uint32_t timeouts{0U};
  double success_rate{0.0};             ///< passed / total * 100.
  std::optional<double> average_score;  ///< Over scored results only.
  double total_execution_time{0.0};
  double average_execution_time{0.0};
  uint64_t total_memory_usage{0U};
  double average_memory_usage{0.0};
};

struct CategoryStats {
  uint32_t total{0U};
  uint32_t passed{0U};
  uint32_t failed{0U};
  uint32_t warnings{0U};
  uint32_t errors{0U};
  double success_rate{0.0};
  std::optional<double> average_score;
  double average_execution_time{0.0};
};

struct ScoreComponent {
  double average_score{0.0};
  uint32_t test_count{0U};
  double weight{0.0};
  double weighted_score{0.0};
};

struct ScoreBreakdown {
  std::map<std::string, ScoreComponent> categories;
  std::optional<double> overall_score;  ///< Sum of weighted scores.
};

struct Trends {
  bool computed{false};
  std::optional<double> execution_time_variance;  ///< Needs >= 2 results.
  std::string execution_time_stability;           ///< "stable" | "variable"
};

struct Recommendation {
  std::string type;      ///< "critical" | "warning"
  std::string category;  ///< "reliability" | "performance" | "stability"
  std::string message;
  std::string priority;  ///< "high" | "medium"
};

struct AggregatedReport {
  Summary summary;
  std::map<std::string, CategoryStats> categories;
  ScoreBreakdown scores;
  Trends trends;
  std::vector<Recommendation> recommendations;
  Json metadata = Json::object();
  double aggregation_time{0.0};

  Json ToJson() const {
    Json j;
    Json s;
    s["total_tests"] = summary.total;
    s["passed"] = summary.passed;
    s["failed"] = summary.failed;
    s["warnings"] = summary.warnings;
    s["errors"] = summary.errors;
    s["skipped"] = summary.skipped;
    s["timeouts"] = summary.timeouts;
    s["success_rate"] = summary.success_rate;
    s["average_score"] = summary.average_score.has_value()
                             ? Json(*summary.average_score)
                             : Json(nullptr);
    s["total_execution_time"] = summary.total_execution_time;
    s["average_execution_time"] = summary.average_execution_time;
    s["total_memory_usage"] = summary.total_memory_usage;
    s["average_memory_usage"] = summary.average_memory_usage;
    j["summary"] = s;

    Json cats = Json::object();
    for (const auto& kv : categories) {
      const CategoryStats& c = kv.second;
      cats[kv.first] = {{"total", c.total},
                        {"passed", c.passed},
                        {"failed", c.failed},
                        {"warnings", c.warnings},
                        {"errors", c.errors},
                        {"success_rate", c.success_rate},
                        {"average_score", c.average_score.has_value()
                                              ? Json(*c.average_score)
                                              : Json(nullptr)},
                        {"average_execution_time", c.average_execution_time}};
    }
    j["category_stats"] = cats;

    Json sb = Json::object();
    for (const auto& kv : scores.categories) {
      sb[kv.first] = {{"average_score", kv.second.average_score},
                      {"test_count", kv.second.test_count},
                      {"weight", kv.second.weight},
                      {"weighted_score", kv.second.weighted_score}};
    }
    if (scores.overall_score.has_value()) {
      sb["overall_score"] = *scores.overall_score;
    }
    j["score_breakdown"] = sb;

    Json tr = Json::object();
    if (trends.computed && trends.execution_time_variance.has_value()) {
      tr["execution_time_variance"] = *trends.execution_time_variance;
      tr["execution_time_stability"] = trends.execution_time_stability;
    }
    j["trends"] = tr;

    Json recs = Json::array();
    for (const auto& r : recommendations) {
      recs.push_back({{"type", r.type},
                      {"category", r.category},
                      {"message", r.message},
                      {"priority", r.priority}});
    }
    j["recommendations"] = recs;

    Json meta = metadata;
    meta["aggregation_time"] = aggregation_time;
    j["metadata"] = meta;
    return j;
  }
};

struct MetricComparison {
  double current{0.0};
  double historical_average{0.0};
  double change{0.0};
  double percent_change{0.0};  ///< 0 when the historical average is 0.
  std::string trend;           ///< "improved" | "declined" | "stable"
};

// ============================================================================
// ResultAggregator
// ============================================================================

class ResultAggregator {
 public:
  explicit ResultAggregator(AggregatorConfig cfg = AggregatorConfig{})
      : cfg_(cfg) {}

  const AggregatorConfig& Config() const noexcept { return cfg_; }

  AggregatedReport Aggregate(const std::vector<Result>& results,
                             Json metadata = Json::object()) const {
    const double start = SteadyNowSec();
    AggregatedReport report;
    report.summary = Summarize(results);
    report.categories = CategoryBreakdown(results);
    report.scores = Scores(results);
    if (cfg_.calculate_trends) report.trends = ComputeTrends(results);
    if (cfg_.generate_recommendations) {
      report.recommendations = Recommend(report.summary);
    }
    report.metadata = metadata.is_object() ? std::move(metadata)
                                           : Json::object();
    report.aggregation_time = SteadyNowSec() - start;
    VIGIL_LOG_DEBUG("Aggr", "aggregated %u results: %.2f%% success",
                    report.summary.total, report.summary.success_rate);
    return report;
  }

  /// Aggregates a batch in its execution order.
  AggregatedReport Aggregate(const BatchResult& batch) const {
    std::vector<Result> results;
    results.reserve(batch.order.size());
    for (const auto& id : batch.order) {
      const Result* r = batch.Find(id);
      if (r != nullptr) results.push_back(*r);
    }
    Json meta = {{"batch_name", batch.name}, {"target", batch.target}};
    return Aggregate(results, std::move(meta));
  }

  Summary Summarize(const std::vector<Result>& results) const {
    Summary s;
    s.total = static_cast<uint32_t>(results.size());
    double score_sum = 0.0;
    uint32_t scored = 0U;
    for (const auto& r : results) {
      switch (r.status) {
        case Status::kPass: ++s.passed; break;
        case Status::kFail: ++s.failed; break;
        case Status::kWarning: ++s.warnings; break;
        case Status::kError: ++s.errors; break;
        case Status::kSkip: ++s.skipped; break;
        case Status::kTimeout: ++s.timeouts; break;
      }
      s.total_execution_time += r.execution_time;
      s.total_memory_usage += r.memory_usage;
      if (r.score.has_value()) {
        score_sum += *r.score;
        ++scored;
      }
    }
    if (s.total > 0U) {
      s.success_rate = static_cast<double>(s.passed) / s.total * 100.0;
      s.average_execution_time = s.total_execution_time / s.total;
      s.average_memory_usage =
          static_cast<double>(s.total_memory_usage) / s.total;
    }
    if (scored > 0U) s.average_score = score_sum / scored;
    return s;
  }

  std::map<std::string, CategoryStats> CategoryBreakdown(
      const std::vector<Result>& results) const {
    std::map<std::string, CategoryStats> out;
    std::map<std::string, double> time_sum;
    std::map<std::string, std::pair<double, uint32_t>> score_sum;
    for (const auto& r : results) {
      const std::string cat = Classify(r.probe_name);
      CategoryStats& c = out[cat];
      ++c.total;
      if (r.status == Status::kPass) ++c.passed;
      if (r.status == Status::kFail) ++c.failed;
      if (r.status == Status::kWarning) ++c.warnings;
      if (r.status == Status::kError) ++c.errors;
      time_sum[cat] += r.execution_time;
      if (r.score.has_value()) {
        score_sum[cat].first += *r.score;
        ++score_sum[cat].second;
      }
    }
    for (auto& kv : out) {
      CategoryStats& c = kv.second;
      c.success_rate = static_cast<double>(c.passed) / c.total * 100.0;
      c.average_execution_time = time_sum[kv.first] / c.total;
      auto it = score_sum.find(kv.first);
      if (it != score_sum.end() && it->second.second > 0U) {
        c.average_score = it->second.first / it->second.second;
      }
    }
    return out;
  }

  /// Per-category average score and the weighted overall score.
  ScoreBreakdown Scores(const std::vector<Result>& results) const {
    std::map<std::string, std::vector<int32_t>> by_cat;
    for (const auto& r : results) {
      if (r.score.has_value()) by_cat[Classify(r.probe_name)].push_back(*r.score);
    }
    ScoreBreakdown b;
    double overall = 0.0;
    double total_weight = 0.0;
    for (const auto& kv : by_cat) {
      double sum = 0.0;
      for (int32_t v : kv.second) sum += v;
      ScoreComponent c;
      c.test_count = static_cast<uint32_t>(kv.second.size());
      c.average_score = sum / c.test_count;
      c.weight = cfg_.WeightFor(kv.first);
      c.weighted_score = c.average_score * c.weight;
      overall += c.weighted_score;
      total_weight += c.weight;
      b.categories[kv.first] = c;
    }
    if (total_weight > 0.0) b.overall_score = overall;
    return b;
  }

  Trends ComputeTrends(const std::vector<Result>& results) const {
    Trends t;
    t.computed = true;
    if (results.size() < 2U) return t;
    std::vector<double> times;
    times.reserve(results.size());
    for (const auto& r : results) times.push_back(r.execution_time);
    const double var = Variance(times);
    t.execution_time_variance = var;
    t.execution_time_stability = var < cfg_.stable_variance ? "stable"
                                                            : "variable";
    return t;
  }

  std::vector<Recommendation> Recommend(const Summary& s) const {
    std::vector<Recommendation> recs;
    if (s.success_rate < cfg_.min_success_rate) {
      recs.push_back({"critical", "reliability",
                      "Low success rate detected. Review failing probes and "
                      "address underlying issues.",
                      "high"});
    }
    if (s.average_execution_time > cfg_.slow_average_time) {
      recs.push_back({"warning", "performance",
                      "High average execution time. Consider optimizing slow "
                      "probes or infrastructure.",
                      "medium"});
    }
    if (s.errors > 0U) {
      recs.push_back({"warning", "stability",
                      "Probe execution errors detected. Review probe "
                      "implementations and dependencies.",
                      "medium"});
    }
    if (s.timeouts > 0U) {
      recs.push_back({"warning", "performance",
                      "Probe timeouts detected. Consider increasing timeout "
                      "values or optimizing probe performance.",
                      "medium"});
    }
    return recs;
  }

  /**
   * @brief Compares @p current against the mean of @p historical reports.
   *
   * Keys: success_rate, average_score, average_execution_time. A metric is
   * omitted when neither side has a value for it. Empty when there is no
   * history.
   */
  std::map<std::string, MetricComparison> CompareWithHistorical(
      const AggregatedReport& current,
      const std::vector<AggregatedReport>& historical) const {
    std::map<std::string, MetricComparison> out;
    if (historical.empty()) return out;

    auto compare = [&out](const char* key, std::optional<double> cur,
                          const std::vector<double>& hist) {
      if (!cur.has_value() || hist.empty()) return;
      double sum = 0.0;
      for (double v : hist) sum += v;
      MetricComparison m;
      m.current = *cur;
      m.historical_average = sum / static_cast<double>(hist.size());
      m.change = m.current - m.historical_average;
      m.percent_change = m.historical_average != 0.0
                             ? m.change / m.historical_average * 100.0
                             : 0.0;
      m.trend = m.change > 0.0 ? "improved"
                               : (m.change < 0.0 ? "declined" : "stable");
      out[key] = m;
    };

    std::vector<double> rates, scores, times;
    for (const auto& h : historical) {
      rates.push_back(h.summary.success_rate);
      if (h.summary.average_score.has_value()) {
        scores.push_back(*h.summary.average_score);
      }
      times.push_back(h.summary.average_execution_time);
    }
    compare("success_rate", current.summary.success_rate, rates);
    compare("average_score", current.summary.average_score, scores);
    compare("average_execution_time", current.summary.average_execution_time,
            times);
    return out;
  }

  /// security / performance / availability / general by probe-name substring.
  static std::string Classify(const std::string& probe_name) {
    std::string name = probe_name;
    for (auto& c : name) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto has = [&name](const char* s) {
      return name.find(s) != std::string::npos;
    };
    if (has("ssl") || has("security")) return kCategorySecurity;
    if (has("response_time") || has("performance")) return kCategoryPerformance;
    if (has("status") || has("availability")) return kCategoryAvailability;
    return kCategoryGeneral;
  }

  /// Population variance; 0 for fewer than two values.
  static double Variance(const std::vector<double>& values) noexcept {
    if (values.size() < 2U) return 0.0;
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    double acc = 0.0;
    for (double v : values) acc += (v - mean) * (v - mean);
    return acc / static_cast<double>(values.size());
  }

 private:
  AggregatorConfig cfg_;
};

}  // namespace vigil

#endif  // VIGIL_RESULT_AGGREGATOR_HPP_
