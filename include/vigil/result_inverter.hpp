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
 * @file result_inverter.hpp
 * @brief Named Status -> Status rules for "expect failure" style checks.
 *
 * Built-in rules:
 *   expect_failure         Pass <-> Fail
 *   expect_warning         Pass <-> Warning
 *   security_inverted      Pass <-> Fail, Warning kept
 *   availability_inverted  Timeout/Error collapse to Fail, then Pass <-> Fail
 *   compliance_strict      Warning -> Fail
 *   compliance_lenient     Fail -> Warning
 *
 * "none" is always accepted and passes results through untouched. Any other
 * unknown rule name is a batch-fatal error. Applying a rule never mutates
 * the rule table; the input Result is copied.
 */

#ifndef VIGIL_RESULT_INVERTER_HPP_
#define VIGIL_RESULT_INVERTER_HPP_

#include "vigil/log.hpp"
#include "vigil/result.hpp"
#include "vigil/vocabulary.hpp"

#include <cctype>
#include <cstdint>

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

using InversionRule = std::function<Status(Status)>;

static constexpr const char* kNoInversion = "none";

// ============================================================================
// Built-in rules
// ============================================================================

namespace rules {

inline Status ExpectFailure(Status s) noexcept {
  if (s == Status::kPass) return Status::kFail;
  if (s == Status::kFail) return Status::kPass;
  return s;
}

inline Status ExpectWarning(Status s) noexcept {
  if (s == Status::kPass) return Status::kWarning;
  if (s == Status::kWarning) return Status::kPass;
  return s;
}

inline Status SecurityInverted(Status s) noexcept {
  if (s == Status::kPass) return Status::kFail;
  if (s == Status::kFail) return Status::kPass;
  return s;
}

/// Timeout and Error collapse to Fail before the swap, so they end as Pass.
inline Status AvailabilityInverted(Status s) noexcept {
  if (s == Status::kTimeout || s == Status::kError) s = Status::kFail;
  if (s == Status::kPass) return Status::kFail;
  if (s == Status::kFail) return Status::kPass;
  return s;
}

inline Status ComplianceStrict(Status s) noexcept {
  return s == Status::kWarning ? Status::kFail : s;
}

inline Status ComplianceLenient(Status s) noexcept {
  return s == Status::kFail ? Status::kWarning : s;
}

}  // namespace rules

// ============================================================================
// Conditions
// ============================================================================

/**
 * @brief Predicates gating a conditional inversion; all set ones must hold.
 */
struct InversionConditions {
  std::vector<std::string> probe_names;
  std::vector<Status> statuses;
  std::optional<std::string> target_pattern;  ///< ECMAScript regex.
  std::optional<int32_t> score_threshold;     ///< Applies when score < threshold.
  std::optional<double> execution_time_min;
  std::optional<double> execution_time_max;
  Json data_contains = Json::object();        ///< Key/value pairs data must hold.
  std::function<bool(const Result&)> custom;

  bool Matches(const Result& r) const {
    if (!probe_names.empty() &&
        std::find(probe_names.begin(), probe_names.end(), r.probe_name) ==
            probe_names.end()) {
      return false;
    }
    if (!statuses.empty() &&
        std::find(statuses.begin(), statuses.end(), r.status) ==
            statuses.end()) {
      return false;
    }
    if (target_pattern.has_value() && !MatchesPattern(r.target)) return false;
    if (score_threshold.has_value() &&
        (!r.score.has_value() || *r.score >= *score_threshold)) {
      return false;
    }
    if (execution_time_min.has_value() &&
        r.execution_time < *execution_time_min) {
      return false;
    }
    if (execution_time_max.has_value() &&
        r.execution_time > *execution_time_max) {
      return false;
    }
    for (auto it = data_contains.begin(); it != data_contains.end(); ++it) {
      auto found = r.data.find(it.key());
      if (found == r.data.end() || *found != it.value()) return false;
    }
    if (custom && !custom(r)) return false;
    return true;
  }

 private:
  bool MatchesPattern(const std::string& target) const {
    std::regex re;
    try {
      re = std::regex(*target_pattern);
    } catch (const std::regex_error& e) {
      VIGIL_LOG_WARN("Invert", "invalid target pattern '%s': %s",
                     target_pattern->c_str(), e.what());
      return false;
    }
    return std::regex_search(target, re);
  }
};

struct InversionStats {
  uint32_t total_results{0U};
  uint32_t inversions_applied{0U};
  std::map<std::string, uint32_t> status_changes;  ///< "pass_to_fail" -> n
  std::map<std::string, uint32_t> modes_used;
};

// ============================================================================
// ResultInverter
// ============================================================================

class ResultInverter {
 public:
  ResultInverter() { RegisterDefaults(); }

  ResultInverter(const ResultInverter&) = delete;
  ResultInverter& operator=(const ResultInverter&) = delete;

  // --------------------------------------------------------------------------
  // Rule table
  // --------------------------------------------------------------------------

  /// Registers or replaces a rule.
  void AddRule(const std::string& name, InversionRule rule) {
    std::lock_guard<std::mutex> lk(mtx_);
    rules_[name] = std::move(rule);
  }

  bool RemoveRule(const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    return rules_.erase(name) > 0U;
  }

  /// True for registered rules and for "none".
  bool HasRule(const std::string& name) const {
    if (name == kNoInversion) return true;
    std::lock_guard<std::mutex> lk(mtx_);
    return rules_.find(name) != rules_.end();
  }

  std::vector<std::string> AvailableRules() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> names;
    for (const auto& kv : rules_) names.push_back(kv.first);
    return names;
  }

  /**
   * @brief Registers a rule built from (from, to) pairs; first match wins.
   *
   * Statuses not listed map to themselves.
   */
  void CreateInversionProfile(const std::string& name,
                              std::vector<std::pair<Status, Status>> mapping) {
    AddRule(name, [mapping](Status s) {
      for (const auto& m : mapping) {
        if (m.first == s) return m.second;
      }
      return s;
    });
  }

  void ResetToDefaults() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      rules_.clear();
    }
    RegisterDefaults();
  }

  /// Empty when the table holds the rules the engine relies on.
  std::vector<std::string> ValidateConfiguration() const {
    std::vector<std::string> issues;
    for (const char* required : {"expect_failure", "security_inverted"}) {
      if (!HasRule(required)) {
        issues.push_back(std::string("missing required rule: ") + required);
      }
    }
    return issues;
  }

  // --------------------------------------------------------------------------
  // Application
  // --------------------------------------------------------------------------

  /**
   * @brief Copies @p result and remaps its status through @p rule_name.
   *
   * The copy records original_status, original_message, inversion_mode and
   * inversion_applied in its data, and its message gains a note.
   */
  expected<Result, BatchError> ApplyInversion(const Result& result,
                                              const std::string& rule_name) const {
    using R = expected<Result, BatchError>;
    if (rule_name == kNoInversion) return R::success(result);
    auto rule = Lookup(rule_name);
    if (!rule.has_value()) return R::error(UnknownRule(rule_name));

    Result out = result;
    const Status original = result.status;
    const Status inverted = (*rule)(original);
    out.status = inverted;
    out.AddData("original_status", StatusName(original));
    out.AddData("original_message", result.message);
    out.AddData("inversion_mode", rule_name);
    out.AddData("inversion_applied", true);

    std::string note;
    if (inverted != original) {
      note = std::string("[Inverted: ") + StatusName(original) + " → " +
             StatusName(inverted) + " via " + rule_name + "]";
    } else {
      note = "[Inversion: " + rule_name + " - no change]";
    }
    out.message = out.message.empty() ? note : out.message + " " + note;
    return R::success(std::move(out));
  }

  /// Applies the rule only when every configured condition holds.
  expected<Result, BatchError> ApplyConditionalInversion(
      const Result& result, const std::string& rule_name,
      const InversionConditions& conditions) const {
    using R = expected<Result, BatchError>;
    if (!HasRule(rule_name)) return R::error(UnknownRule(rule_name));
    if (!conditions.Matches(result)) return R::success(result);
    return ApplyInversion(result, rule_name);
  }

  /// Applies rules left to right, each on the previous output.
  expected<Result, BatchError> ApplyMultipleInversions(
      const Result& result, const std::vector<std::string>& rule_names) const {
    Result current = result;
    for (const auto& name : rule_names) {
      auto r = ApplyInversion(current, name);
      if (!r.has_value()) return r;
      current = std::move(r).value();
    }
    return expected<Result, BatchError>::success(std::move(current));
  }

  expected<std::vector<Result>, BatchError> BatchApplyInversions(
      const std::vector<Result>& results, const std::string& rule_name) const {
    using R = expected<std::vector<Result>, BatchError>;
    if (!HasRule(rule_name)) return R::error(UnknownRule(rule_name));
    std::vector<Result> out;
    out.reserve(results.size());
    for (const auto& r : results) {
      auto inverted = ApplyInversion(r, rule_name);
      if (!inverted.has_value()) return R::error(inverted.get_error());
      out.push_back(std::move(inverted).value());
    }
    return R::success(std::move(out));
  }

  /**
   * @brief Picks a rule from the probe name and context.
   *
   * vulnerability/exploit/malware probes -> security_inverted; a
   * "compliance_mode" context of strict/lenient -> compliance_*;
   * availability/uptime/response_time probes -> availability_inverted.
   */
  std::string DetermineSmartInversion(const Result& result) const {
    std::string name = result.probe_name;
    for (auto& c : name) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto has = [&name](const char* s) {
      return name.find(s) != std::string::npos;
    };
    if (has("vulnerability") || has("exploit") || has("malware")) {
      return "security_inverted";
    }
    auto mode = result.context.find("compliance_mode");
    if (mode != result.context.end() && mode->is_string()) {
      const std::string m = mode->get<std::string>();
      if (m == "strict") return "compliance_strict";
      if (m == "lenient") return "compliance_lenient";
    }
    if (has("availability") || has("uptime") || has("response_time")) {
      return "availability_inverted";
    }
    return kNoInversion;
  }

  expected<Result, BatchError> ApplySmartInversion(const Result& result) const {
    return ApplyInversion(result, DetermineSmartInversion(result));
  }

  /// Summarizes the inversion metadata carried by @p results. Results whose
  /// inversion_applied is missing or not a boolean are not counted.
  static InversionStats GetInversionStatistics(
      const std::vector<Result>& results) {
    InversionStats s;
    s.total_results = static_cast<uint32_t>(results.size());
    for (const auto& r : results) {
      const Json applied = r.GetData("inversion_applied");
      if (!applied.is_boolean() || !applied.get<bool>()) continue;
      ++s.inversions_applied;
      const Json orig = r.GetData("original_status");
      if (orig.is_string() && orig.get<std::string>() != StatusName(r.status)) {
        ++s.status_changes[orig.get<std::string>() + "_to_" +
                           StatusName(r.status)];
      }
      const Json mode = r.GetData("inversion_mode");
      if (mode.is_string()) ++s.modes_used[mode.get<std::string>()];
    }
    return s;
  }

 private:
  void RegisterDefaults() {
    AddRule("expect_failure", rules::ExpectFailure);
    AddRule("expect_warning", rules::ExpectWarning);
    AddRule("security_inverted", rules::SecurityInverted);
    AddRule("availability_inverted", rules::AvailabilityInverted);
    AddRule("compliance_strict", rules::ComplianceStrict);
    AddRule("compliance_lenient", rules::ComplianceLenient);
  }

  std::optional<InversionRule> Lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = rules_.find(name);
    if (it == rules_.end()) return std::nullopt;
    return it->second;
  }

  static BatchError UnknownRule(const std::string& name) {
    VIGIL_LOG_ERROR("Invert", "unknown inversion rule '%s'", name.c_str());
    return BatchError{BatchErrorCode::kUnknownInversionRule,
                      "unknown inversion rule: " + name};
  }

  mutable std::mutex mtx_;
  std::map<std::string, InversionRule> rules_;
};

}  // namespace vigil

#endif  // VIGIL_RESULT_INVERTER_HPP_
