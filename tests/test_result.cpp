/**
 * @file test_result.cpp
 * @brief Tests for result.hpp: Status, Result and BatchResult.
 */

#include "vigil/result.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using vigil::Result;
using vigil::Status;

// ============================================================================
// Status
// ============================================================================

TEST_CASE("Status names parse back to the same status", "[result][status]") {
  for (uint32_t i = 0U; i < vigil::kStatusCount; ++i) {
    const auto s = static_cast<Status>(i);
    auto parsed = vigil::ParseStatus(vigil::StatusName(s));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed.value() == s);
  }
}

TEST_CASE("ParseStatus rejects unknown names", "[result][status]") {
  auto r = vigil::ParseStatus("passed");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == vigil::ResultError::kInvalidStatus);
}

TEST_CASE("Severity ordering", "[result][status]") {
  REQUIRE(vigil::SeverityOf(Status::kPass) == 0);
  REQUIRE(vigil::SeverityOf(Status::kWarning) == 1);
  REQUIRE(vigil::SeverityOf(Status::kSkip) == 1);
  REQUIRE(vigil::SeverityOf(Status::kFail) == 2);
  REQUIRE(vigil::SeverityOf(Status::kTimeout) == 3);
  REQUIRE(vigil::SeverityOf(Status::kError) == 4);
}

TEST_CASE("Problem statuses are fail, error and timeout", "[result][status]") {
  REQUIRE(vigil::IsProblem(Status::kFail));
  REQUIRE(vigil::IsProblem(Status::kError));
  REQUIRE(vigil::IsProblem(Status::kTimeout));
  REQUIRE_FALSE(vigil::IsProblem(Status::kPass));
  REQUIRE_FALSE(vigil::IsProblem(Status::kWarning));
  REQUIRE_FALSE(vigil::IsProblem(Status::kSkip));
}

// ============================================================================
// Result
// ============================================================================

TEST_CASE("Result predicates", "[result]") {
  Result warn("headers", Status::kWarning, "missing HSTS");
  REQUIRE(warn.IsWarning());
  REQUIRE(warn.IsSuccessful());
  REQUIRE_FALSE(warn.HasProblems());

  Result to("latency", Status::kTimeout);
  REQUIRE(to.IsTimeout());
  REQUIRE_FALSE(to.IsSuccessful());
  REQUIRE(to.HasProblems());
  REQUIRE(to.SeverityLevel() == 3);
}

TEST_CASE("Result SetScore enforces 0..100", "[result]") {
  Result r("ssl_check", Status::kPass);
  REQUIRE(r.SetScore(100).has_value());
  REQUIRE(*r.score == 100);

  auto bad = r.SetScore(101);
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == vigil::ResultError::kScoreOutOfRange);
  REQUIRE(*r.score == 100);
  REQUIRE(!r.SetScore(-1).has_value());
}

TEST_CASE("Result data helpers", "[result]") {
  Result r("ssl_check", Status::kPass);
  r.AddData("days_left", 42).AddContext("env", "prod").AddRecommendation("renew");
  REQUIRE(r.GetData("days_left").get<int>() == 42);
  REQUIRE(r.GetData("missing", "fallback").get<std::string>() == "fallback");
  REQUIRE(r.GetData("missing").is_null());
  REQUIRE(r.context["env"] == "prod");
  REQUIRE(r.recommendations.size() == 1U);
}

TEST_CASE("MergeWith keeps the worst status and sums costs", "[result]") {
  Result a("a", Status::kWarning, "slow");
  a.execution_time = 1.0;
  a.memory_usage = 100U;
  (void)a.SetScore(80);
  a.AddData("x", 1);

  Result b("b", Status::kError, "crashed");
  b.execution_time = 0.5;
  b.memory_usage = 50U;
  (void)b.SetScore(40);
  b.AddData("y", 2);
  b.AddRecommendation("investigate");

  a.MergeWith(b);
  REQUIRE(a.status == Status::kError);
  REQUIRE(a.message == "crashed");
  REQUIRE(a.execution_time == 1.5);
  REQUIRE(a.memory_usage == 150U);
  REQUIRE(*a.score == 40);
  REQUIRE(a.data.contains("x"));
  REQUIRE(a.data.contains("y"));
  REQUIRE(a.recommendations.size() == 1U);

  Result c("c", Status::kPass, "fine");
  a.MergeWith(c);
  REQUIRE(a.status == Status::kError);
  REQUIRE(a.message == "crashed");
}

TEST_CASE("Summary renders status, timing, memory and score", "[result]") {
  Result r("ssl_check", Status::kPass, "certificate valid");
  r.execution_time = 0.01234;
  r.memory_usage = 1536U;
  (void)r.SetScore(90);
  REQUIRE(r.Summary() ==
          "PASS: ssl_check - certificate valid [12.34ms, 1.5 KB] [Score: 90/100]");

  Result f("dns", Status::kFail, "nxdomain");
  REQUIRE(f.Summary() == "FAIL: dns - nxdomain [0.00ms, 0 B]");
}

TEST_CASE("Result JSON uses the persisted key names", "[result][json]") {
  Result r("ssl_check", Status::kFail, "expired");
  r.target = "https://example.com";
  (void)r.SetScore(10);
  r.AddData("days_left", -3);

  const vigil::Json j = r.ToJson();
  REQUIRE(j["test_name"] == "ssl_check");
  REQUIRE(j["status"] == "fail");
  REQUIRE(j["severity_level"] == 2);
  REQUIRE(j["score"] == 10);
  REQUIRE(j["timestamp"].get<std::string>().size() == 19U);

  auto back = Result::FromJson(j);
  REQUIRE(back.has_value());
  REQUIRE(back.value().probe_name == "ssl_check");
  REQUIRE(back.value().status == Status::kFail);
  REQUIRE(back.value().target == "https://example.com");
  REQUIRE(back.value().GetData("days_left") == -3);
  REQUIRE(vigil::detail::FormatWallTime(back.value().timestamp) ==
          j["timestamp"].get<std::string>());
}

TEST_CASE("FromJson rejects malformed documents", "[result][json]") {
  REQUIRE(Result::FromJson(vigil::Json::array()).get_error() ==
          vigil::ResultError::kMalformed);

  vigil::Json bad_status = {{"test_name", "x"}, {"status", "great"}};
  REQUIRE(Result::FromJson(bad_status).get_error() ==
          vigil::ResultError::kInvalidStatus);

  vigil::Json bad_score = {{"test_name", "x"}, {"status", "pass"}, {"score", 400}};
  REQUIRE(Result::FromJson(bad_score).get_error() ==
          vigil::ResultError::kScoreOutOfRange);
}

TEST_CASE("FromJson rejects fields of the wrong type", "[result][json]") {
  const vigil::Json base = {{"test_name", "x"}, {"status", "pass"}};
  const std::vector<std::pair<std::string, vigil::Json>> wrong = {
      {"execution_time", "slow"}, {"message", 42},
      {"memory_usage", -1},       {"target", true},
      {"data", "none"},           {"context", vigil::Json::array()},
      {"timestamp", 0},           {"score", 1.5},
      {"recommendations", "update"}};
  for (const auto& kv : wrong) {
    vigil::Json j = base;
    j[kv.first] = kv.second;
    auto r = Result::FromJson(j);
    INFO(kv.first);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == vigil::ResultError::kMalformed);
  }

  vigil::Json mixed = base;
  mixed["recommendations"] = {"renew", 7};
  REQUIRE(Result::FromJson(mixed).get_error() == vigil::ResultError::kMalformed);

  // Nulls read as absent.
  vigil::Json nulls = base;
  nulls["score"] = nullptr;
  nulls["message"] = nullptr;
  auto ok = Result::FromJson(nulls);
  REQUIRE(ok.has_value());
  REQUIRE_FALSE(ok.value().score.has_value());
  REQUIRE(ok.value().message.empty());
}

// ============================================================================
// BatchResult
// ============================================================================

TEST_CASE("BatchResult derived counts", "[result][batch]") {
  vigil::BatchResult batch;
  REQUIRE(batch.SuccessRate() == 0.0);

  batch.Add("a", Result("p", Status::kPass));
  batch.Add("b", Result("p", Status::kPass));
  batch.Add("c", Result("p", Status::kFail));
  batch.Add("d", Result("p", Status::kSkip));

  REQUIRE(batch.TotalCount() == 4U);
  REQUIRE(batch.PassedCount() == 2U);
  REQUIRE(batch.FailedCount() == 1U);
  REQUIRE(batch.CountByStatus(Status::kSkip) == 1U);
  REQUIRE(batch.SuccessRate() == 50.0);
  REQUIRE(batch.order == std::vector<std::string>{"a", "b", "c", "d"});
  REQUIRE(batch.Find("c")->IsFailed());
  REQUIRE(batch.Find("zz") == nullptr);
}

TEST_CASE("BatchResult JSON lists results in execution order", "[result][batch]") {
  vigil::BatchResult batch;
  batch.name = "nightly";
  batch.Add("second", Result("p", Status::kPass));
  batch.Add("first", Result("p", Status::kWarning));
  batch.not_run.push_back("third");
  batch.aborted = true;

  const vigil::Json j = batch.ToJson();
  REQUIRE(j["name"] == "nightly");
  REQUIRE(j["total_tests"] == 2);
  REQUIRE(j["results"].size() == 2U);
  REQUIRE(j["aborted"] == true);
  REQUIRE(j["not_run"][0] == "third");
}
