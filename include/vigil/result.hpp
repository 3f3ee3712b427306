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
 * @file result.hpp
 * @brief Probe outcome value types: Status, Result and BatchResult.
 *
 * A Result is created once per job execution. Retries, timeouts and
 * inversion enrich the same logical Result through its data map rather than
 * producing one Result per attempt. BatchResult collects the Results of one
 * ExecuteBatch() call keyed by job id; every statistic on it is derived on
 * demand.
 *
 * Serialization uses nlohmann/json. The field names are the ones persisted
 * by the surrounding application, so they are kept stable.
 */

#ifndef VIGIL_RESULT_HPP_
#define VIGIL_RESULT_HPP_

#include "vigil/platform.hpp"
#include "vigil/vocabulary.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vigil {

using Json = nlohmann::json;
using WallClock = std::chrono::system_clock;

// ============================================================================
// Status
// ============================================================================

/// Closed set of probe outcomes.
enum class Status : uint8_t {
  kPass = 0,
  kFail,
  kWarning,
  kError,
  kSkip,
  kTimeout,
};

static constexpr uint32_t kStatusCount = 6U;

inline const char* StatusName(Status s) noexcept {
  switch (s) {
    case Status::kPass:
      return "pass";
    case Status::kFail:
      return "fail";
    case Status::kWarning:
      return "warning";
    case Status::kError:
      return "error";
    case Status::kSkip:
      return "skip";
    case Status::kTimeout:
      return "timeout";
  }
  return "error";
}

inline expected<Status, ResultError> ParseStatus(const std::string& name) {
  static const std::pair<const char*, Status> kTable[] = {
      {"pass", Status::kPass},       {"fail", Status::kFail},
      {"warning", Status::kWarning}, {"error", Status::kError},
      {"skip", Status::kSkip},       {"timeout", Status::kTimeout},
  };
  for (const auto& entry : kTable) {
    if (name == entry.first) {
      return expected<Status, ResultError>::success(entry.second);
    }
  }
  return expected<Status, ResultError>::error(ResultError::kInvalidStatus);
}

/**
 * @brief Severity used by "worst status wins" merges.
 *
 * Pass(0) < Warning/Skip(1) < Fail(2) < Timeout(3) < Error(4).
 */
inline int32_t SeverityOf(Status s) noexcept {
  switch (s) {
    case Status::kPass:
      return 0;
    case Status::kWarning:
    case Status::kSkip:
      return 1;
    case Status::kFail:
      return 2;
    case Status::kTimeout:
      return 3;
    case Status::kError:
      return 4;
  }
  return 4;
}

/// Fail, Error and Timeout block dependents and trigger fail-fast.
inline bool IsProblem(Status s) noexcept {
  return s == Status::kFail || s == Status::kError || s == Status::kTimeout;
}

namespace detail {

static constexpr const char* kTimestampFormat = "%Y-%m-%d %H:%M:%S";

inline std::string FormatWallTime(WallClock::time_point tp) {
  const std::time_t secs = WallClock::to_time_t(tp);
  std::tm tm_buf{};
  gmtime_r(&secs, &tm_buf);
  char buf[32];
  (void)std::strftime(buf, sizeof(buf), kTimestampFormat, &tm_buf);
  return buf;
}

inline std::optional<WallClock::time_point> ParseWallTime(
    const std::string& text) {
  std::tm tm_buf{};
  std::istringstream in(text);
  in >> std::get_time(&tm_buf, kTimestampFormat);
  if (in.fail()) return std::nullopt;
  return WallClock::from_time_t(timegm(&tm_buf));
}

/// Human readable byte count: "512 B", "1.5 KB", "2 MB".
inline std::string FormatBytes(uint64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB"};
  double value = static_cast<double>(bytes);
  uint32_t unit = 0;
  while (value >= 1024.0 && unit < 2U) {
    value /= 1024.0;
    ++unit;
  }
  char num[32];
  (void)std::snprintf(num, sizeof(num), "%.2f", value);
  std::string s(num);
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  return s + " " + kUnits[unit];
}

}  // namespace detail

// ============================================================================
// Result
// ============================================================================

/**
 * @brief Outcome of a single probe execution.
 *
 * @c data and @c context are JSON objects so probes and the engine can attach
 * structured metadata (retry history, timeout limits, inversion notes).
 */
struct Result {
  std::string probe_name;
  Status status{Status::kError};
  std::string message;
  Json data = Json::object();
  double execution_time{0.0};  ///< Seconds.
  uint64_t memory_usage{0U};   ///< Bytes reported by the probe.
  WallClock::time_point timestamp{WallClock::now()};
  std::string target;
  Json context = Json::object();
  std::optional<int32_t> score;  ///< 0..100 when the probe rates its finding.
  std::vector<std::string> recommendations;

  Result() = default;
  Result(std::string name, Status st, std::string msg = std::string())
      : probe_name(std::move(name)), status(st), message(std::move(msg)) {}

  // --- Status predicates ---

  bool IsPassed() const noexcept { return status == Status::kPass; }
  bool IsFailed() const noexcept { return status == Status::kFail; }
  bool IsWarning() const noexcept { return status == Status::kWarning; }
  bool IsError() const noexcept { return status == Status::kError; }
  bool IsSkipped() const noexcept { return status == Status::kSkip; }
  bool IsTimeout() const noexcept { return status == Status::kTimeout; }

  /// Pass or Warning.
  bool IsSuccessful() const noexcept {
    return status == Status::kPass || status == Status::kWarning;
  }

  bool HasProblems() const noexcept { return IsProblem(status); }

  int32_t SeverityLevel() const noexcept { return SeverityOf(status); }

  // --- Mutators ---

  expected<void, ResultError> SetScore(int32_t value) {
    if (value < 0 || value > 100) {
      return expected<void, ResultError>::error(ResultError::kScoreOutOfRange);
    }
    score = value;
    return expected<void, ResultError>::success();
  }

  Result& AddData(const std::string& key, Json value) {
    data[key] = std::move(value);
    return *this;
  }

  Json GetData(const std::string& key, Json fallback = nullptr) const {
    auto it = data.find(key);
    return (it != data.end()) ? *it : fallback;
  }

  Result& AddContext(const std::string& key, Json value) {
    context[key] = std::move(value);
    return *this;
  }

  Result& AddRecommendation(std::string text) {
    recommendations.push_back(std::move(text));
    return *this;
  }

  /**
   * @brief Folds another result into this one.
   *
   * The more severe status wins and brings its message. Data maps are
   * merged (other overrides), times and memory are summed, recommendations
   * concatenated and the lower score is kept.
   */
  Result& MergeWith(const Result& other) {
    if (other.SeverityLevel() > SeverityLevel()) {
      status = other.status;
      message = other.message;
    }
    for (auto it = other.data.begin(); it != other.data.end(); ++it) {
      data[it.key()] = it.value();
    }
    execution_time += other.execution_time;
    memory_usage += other.memory_usage;
    recommendations.insert(recommendations.end(),
                           other.recommendations.begin(),
                           other.recommendations.end());
    if (other.score.has_value()) {
      score = score.has_value() ? std::min(*score, *other.score) : other.score;
    }
    return *this;
  }

  /// One-line rendering: "PASS: ssl_check - ok [12.34ms, 1.5 KB] [Score: 90/100]".
  std::string Summary() const {
    std::string upper = StatusName(status);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](char c) {
                     return static_cast<char>(
                         std::toupper(static_cast<unsigned char>(c)));
                   });
    char head[64];
    (void)std::snprintf(head, sizeof(head), "%.2fms", execution_time * 1000.0);
    std::string out = upper + ": " + probe_name + " - " + message + " [" +
                      head + ", " + detail::FormatBytes(memory_usage) + "]";
    if (score.has_value()) {
      out += " [Score: " + std::to_string(*score) + "/100]";
    }
    return out;
  }

  // --- Serialization ---

  Json ToJson() const {
    Json j;
    j["test_name"] = probe_name;
    j["status"] = StatusName(status);
    j["message"] = message;
    j["data"] = data;
    j["execution_time"] = execution_time;
    j["memory_usage"] = memory_usage;
    j["timestamp"] = detail::FormatWallTime(timestamp);
    j["target"] = target;
    j["context"] = context;
    j["score"] = score.has_value() ? Json(*score) : Json(nullptr);
    j["recommendations"] = recommendations;
    j["severity_level"] = SeverityLevel();
    return j;
  }

  /// Absent or null optional fields keep their defaults; a present field of
  /// the wrong type makes the whole document kMalformed.
  static expected<Result, ResultError> FromJson(const Json& j) {
    using R = expected<Result, ResultError>;
    if (!j.is_object() || !j.contains("test_name") || !j.contains("status") ||
        !j["test_name"].is_string() || !j["status"].is_string()) {
      return R::error(ResultError::kMalformed);
    }
    auto field = [&j](const char* key) -> const Json* {
      auto it = j.find(key);
      if (it == j.end() || it->is_null()) return nullptr;
      return &*it;
    };
    const Json* message = field("message");
    const Json* data = field("data");
    const Json* context = field("context");
    const Json* exec_time = field("execution_time");
    const Json* memory = field("memory_usage");
    const Json* target = field("target");
    const Json* timestamp = field("timestamp");
    const Json* score = field("score");
    const Json* recs = field("recommendations");
    if ((message != nullptr && !message->is_string()) ||
        (data != nullptr && !data->is_object()) ||
        (context != nullptr && !context->is_object()) ||
        (exec_time != nullptr && !exec_time->is_number()) ||
        (memory != nullptr && !memory->is_number_unsigned()) ||
        (target != nullptr && !target->is_string()) ||
        (timestamp != nullptr && !timestamp->is_string()) ||
        (score != nullptr && !score->is_number_integer()) ||
        (recs != nullptr && !recs->is_array())) {
      return R::error(ResultError::kMalformed);
    }

    auto st = ParseStatus(j["status"].get<std::string>());
    if (!st.has_value()) return R::error(st.get_error());

    Result r(j["test_name"].get<std::string>(), st.value(),
             message != nullptr ? message->get<std::string>() : std::string());
    if (data != nullptr) r.data = *data;
    if (context != nullptr) r.context = *context;
    if (exec_time != nullptr) r.execution_time = exec_time->get<double>();
    if (memory != nullptr) r.memory_usage = memory->get<uint64_t>();
    if (target != nullptr) r.target = target->get<std::string>();
    if (timestamp != nullptr) {
      auto tp = detail::ParseWallTime(timestamp->get<std::string>());
      if (tp.has_value()) r.timestamp = *tp;
    }
    if (score != nullptr) {
      const int64_t v = score->get<int64_t>();
      if (v < 0 || v > 100) return R::error(ResultError::kScoreOutOfRange);
      auto s = r.SetScore(static_cast<int32_t>(v));
      if (!s.has_value()) return R::error(s.get_error());
    }
    if (recs != nullptr) {
      for (const auto& rec : *recs) {
        if (!rec.is_string()) return R::error(ResultError::kMalformed);
        r.recommendations.push_back(rec.get<std::string>());
      }
    }
    return R::success(std::move(r));
  }
};

// ============================================================================
// BatchResult
// ============================================================================

/**
 * @brief Results of one batch keyed by job id.
 *
 * @c order records the sequence in which results were produced.
 */
struct BatchResult {
  std::string name;
  std::string target;
  std::map<std::string, Result> results;
  std::vector<std::string> order;
  double execution_time{0.0};
  Json context = Json::object();
  WallClock::time_point timestamp{WallClock::now()};

  bool aborted{false};                ///< fail_fast stopped the batch.
  std::vector<std::string> not_run;   ///< Ids left unexecuted by fail_fast.
  std::vector<std::string> dropped;   ///< Ids pruned to meet a deadline.

  void Add(const std::string& job_id, Result result) {
    if (results.find(job_id) == results.end()) order.push_back(job_id);
    results[job_id] = std::move(result);
  }

  const Result* Find(const std::string& job_id) const {
    auto it = results.find(job_id);
    return (it != results.end()) ? &it->second : nullptr;
  }

  uint32_t TotalCount() const noexcept {
    return static_cast<uint32_t>(results.size());
  }

  uint32_t CountByStatus(Status s) const noexcept {
    uint32_t n = 0;
    for (const auto& kv : results) {
      if (kv.second.status == s) ++n;
    }
    return n;
  }

  uint32_t PassedCount() const noexcept { return CountByStatus(Status::kPass); }
  uint32_t FailedCount() const noexcept { return CountByStatus(Status::kFail); }

  /// Percentage of passed results, 0 for an empty batch.
  double SuccessRate() const noexcept {
    const uint32_t total = TotalCount();
    return total > 0U ? static_cast<double>(PassedCount()) / total * 100.0
                      : 0.0;
  }

  Json ToJson() const {
    Json j;
    j["name"] = name;
    j["target"] = target;
    Json res = Json::object();
    for (const auto& id : order) {
      res[id] = results.at(id).ToJson();
    }
    j["results"] = res;
    j["execution_time"] = execution_time;
    j["context"] = context;
    j["timestamp"] = detail::FormatWallTime(timestamp);
    j["total_tests"] = TotalCount();
    j["passed_tests"] = PassedCount();
    j["failed_tests"] = FailedCount();
    j["success_rate"] = SuccessRate();
    j["aborted"] = aborted;
    j["not_run"] = not_run;
    j["dropped"] = dropped;
    return j;
  }
};

}  // namespace vigil

#endif  // VIGIL_RESULT_HPP_
