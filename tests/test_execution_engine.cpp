/**
 * @file test_execution_engine.cpp
 * @brief End-to-end tests for execution_engine.hpp using scripted probes.
 */

#include "vigil/execution_engine.hpp"

#include "test_probes.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using Catch::Approx;
using vigil::Status;
using vigil_test::CallLog;
using vigil_test::MakeJob;
using vigil_test::Pass;
using vigil_test::RegisterScripted;
using vigil_test::Sleeps;
using vigil_test::WithStatus;

namespace {

vigil::EngineConfig FastEngine() {
  vigil::EngineConfig cfg;
  cfg.timeout.default_timeout = 2.0;
  cfg.timeout.min_timeout = 0.01;
  cfg.timeout.max_timeout = 5.0;
  cfg.retry.retry_delay = 0.001;
  cfg.retry.jitter = false;
  cfg.pool.pool_size = 4U;
  cfg.pool.acquire_timeout = 0.5;
  cfg.pool.poll_interval = 0.005;
  cfg.max_parallel_tests = 3U;
  return cfg;
}

size_t IndexOf(const std::vector<std::string>& v, const std::string& s) {
  return static_cast<size_t>(std::find(v.begin(), v.end(), s) - v.begin());
}

std::shared_ptr<vigil_test::Script> RegisterWithInfo(
    vigil::ProbeRegistry& reg, vigil::ProbeInfo info,
    std::vector<vigil_test::Step> steps = {Pass()}) {
  auto script = std::make_shared<vigil_test::Script>(std::move(steps));
  const std::string name = info.name;
  REQUIRE(reg.Register(std::move(info), vigil_test::MakeFactory(name, script))
              .has_value());
  return script;
}

class PlainHttpSkipper : public vigil::Probe {
 public:
  const char* Name() const noexcept override { return "hsts"; }
  vigil::ProbeOutcome Run(const std::string& /*target*/,
                          const vigil::ProbeContext& /*ctx*/) override {
    return vigil::ProbeOutcome::success(vigil::Result("hsts", Status::kFail));
  }
  std::optional<std::string> ShouldSkip(
      const std::string& target, const vigil::ProbeContext& /*ctx*/) const override {
    if (target.rfind("http://", 0) == 0) return std::string("not an https target");
    return std::nullopt;
  }
};

}  // namespace

// ============================================================================
// Sequential execution
// ============================================================================

TEST_CASE("Sequential batch runs every job once", "[engine][sequential]") {
  vigil::ProbeRegistry reg;
  auto log = std::make_shared<CallLog>();
  auto a = RegisterScripted(reg, "ssl_check", {Pass("valid")}, log);
  auto b = RegisterScripted(reg, "dns", {Pass("resolved")}, log);

  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::BatchOptions opts;
  opts.name = "smoke";
  opts.context = {{"env", "staging"}};
  auto res = engine.ExecuteBatch({MakeJob("j1", "ssl_check"), MakeJob("j2", "dns")},
                                 opts);
  REQUIRE(res.has_value());
  const vigil::BatchResult& batch = res.value();
  REQUIRE(batch.name == "smoke");
  REQUIRE(batch.TotalCount() == 2U);
  REQUIRE(batch.PassedCount() == 2U);
  REQUIRE_FALSE(batch.aborted);
  REQUIRE(a->calls.load() == 1U);
  REQUIRE(b->calls.load() == 1U);

  const vigil::Result* r1 = batch.Find("j1");
  REQUIRE(r1 != nullptr);
  REQUIRE(r1->probe_name == "ssl_check");
  REQUIRE(r1->target == "https://example.com");
  REQUIRE(r1->context["job_id"] == "j1");
  REQUIRE(r1->context["env"] == "staging");
  // Pooling lends every call a connection.
  REQUIRE(a->with_connection.load() == 1U);
  REQUIRE(engine.Pool().InUseCount() == 0U);
}

TEST_CASE("Batch target fills jobs without one", "[engine][sequential]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::Job job = MakeJob("j", "p");
  job.target.clear();
  vigil::BatchOptions opts;
  opts.target = "https://fallback.example";
  auto res = engine.ExecuteBatch({job}, opts);
  REQUIRE(res.has_value());
  REQUIRE(res.value().Find("j")->target == "https://fallback.example");
}

TEST_CASE("Dependencies run before their dependents", "[engine][deps]") {
  vigil::ProbeRegistry reg;
  auto log = std::make_shared<CallLog>();
  (void)RegisterScripted(reg, "first", {Pass()}, log);
  (void)RegisterScripted(reg, "second", {Pass()}, log);
  (void)RegisterScripted(reg, "third", {Pass()}, log);

  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch({MakeJob("c", "third", {"b"}),
                                  MakeJob("b", "second", {"a"}),
                                  MakeJob("a", "first")});
  REQUIRE(res.has_value());
  REQUIRE(res.value().PassedCount() == 3U);
  REQUIRE(log->Snapshot() ==
          std::vector<std::string>{"first", "second", "third"});
  REQUIRE(res.value().order == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Failed dependency skips the dependent without calling it",
          "[engine][deps]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "base", {WithStatus(Status::kFail, "down")});
  auto dependent = RegisterScripted(reg, "dependent");

  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch(
      {MakeJob("a", "base"), MakeJob("b", "dependent", {"a"})});
  REQUIRE(res.has_value());
  const vigil::Result* b = res.value().Find("b");
  REQUIRE(b != nullptr);
  REQUIRE(b->IsSkipped());
  REQUIRE(b->message == "dependencies not met");
  REQUIRE(b->GetData("unmet_dependencies") == vigil::Json::array({"a"}));
  REQUIRE(b->context["job_id"] == "b");
  REQUIRE(dependent->calls.load() == 0U);
}

TEST_CASE("Dependency missing from the batch is unmet", "[engine][deps]") {
  vigil::ProbeRegistry reg;
  auto p = RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch({MakeJob("a", "p", {"ghost"})});
  REQUIRE(res.has_value());
  REQUIRE(res.value().Find("a")->IsSkipped());
  REQUIRE(p->calls.load() == 0U);
}

TEST_CASE("Skipped and warning dependencies still count as met",
          "[engine][deps]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "skipper", {WithStatus(Status::kSkip, "n/a")});
  (void)RegisterScripted(reg, "warner", {WithStatus(Status::kWarning, "meh")});
  auto dependent = RegisterScripted(reg, "dependent");

  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch({MakeJob("s", "skipper"), MakeJob("w", "warner"),
                                  MakeJob("d", "dependent", {"s", "w"})});
  REQUIRE(res.has_value());
  REQUIRE(res.value().Find("d")->IsPassed());
  REQUIRE(dependent->calls.load() == 1U);
}

// ============================================================================
// Batch-fatal errors
// ============================================================================

TEST_CASE("Dependency cycle rejects the batch before any call",
          "[engine][errors]") {
  vigil::ProbeRegistry reg;
  auto p = RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch({MakeJob("A", "p", {"B"}), MakeJob("B", "p", {"A"}),
                                  MakeJob("C", "p")});
  REQUIRE(!res.has_value());
  REQUIRE(res.get_error().code == vigil::BatchErrorCode::kCyclicDependency);
  REQUIRE(res.get_error().detail.find("circular dependency detected") !=
          std::string::npos);
  REQUIRE(p->calls.load() == 0U);
}

TEST_CASE("Unknown inversion mode rejects the batch", "[engine][errors]") {
  vigil::ProbeRegistry reg;
  auto p = RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::BatchOptions opts;
  opts.inversion_mode = "upside_down";
  auto res = engine.ExecuteBatch({MakeJob("a", "p")}, opts);
  REQUIRE(!res.has_value());
  REQUIRE(res.get_error().code == vigil::BatchErrorCode::kUnknownInversionRule);
  REQUIRE(res.get_error().detail == "unknown inversion rule: upside_down");
  REQUIRE(p->calls.load() == 0U);

  REQUIRE(!engine.ExecuteJob(MakeJob("a", "p"), opts).has_value());
}

TEST_CASE("Duplicate job ids reject the batch", "[engine][errors]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());
  auto res = engine.ExecuteBatch({MakeJob("a", "p"), MakeJob("a", "p")});
  REQUIRE(!res.has_value());
  REQUIRE(res.get_error().code == vigil::BatchErrorCode::kDuplicateJobId);
}

// ============================================================================
// Per-job outcomes
// ============================================================================

TEST_CASE("Unknown and disabled probes become error results",
          "[engine][job]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "off");
  REQUIRE(reg.Disable("off"));
  vigil::ExecutionEngine engine(reg, FastEngine());

  auto res = engine.ExecuteBatch({MakeJob("a", "missing"), MakeJob("b", "off")});
  REQUIRE(res.has_value());
  const vigil::Result* a = res.value().Find("a");
  REQUIRE(a->IsError());
  REQUIRE(a->message == "probe not found or could not be instantiated");
  REQUIRE(a->GetData("registry_error") == "unknown");
  REQUIRE(res.value().Find("b")->GetData("registry_error") == "disabled");
}

TEST_CASE("Probe exceptions become error results", "[engine][job]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "thrower", {vigil_test::Throws("kaboom")});
  auto cfg = FastEngine();
  cfg.enable_retries = false;
  vigil::ExecutionEngine engine(reg, cfg);

  auto r = engine.ExecuteJob(MakeJob("t", "thrower"));
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsError());
  REQUIRE(r.value().message == "probe failed: kaboom");
  REQUIRE(r.value().GetData("fault_kind") == "internal");
}

TEST_CASE("ShouldSkip records a skip without running", "[engine][job]") {
  vigil::ProbeRegistry reg;
  vigil::ProbeInfo info;
  info.name = "hsts";
  REQUIRE(reg.Register<PlainHttpSkipper>(info).has_value());
  vigil::ExecutionEngine engine(reg, FastEngine());

  vigil::Job job = MakeJob("h", "hsts");
  job.target = "http://insecure.example";
  auto r = engine.ExecuteJob(job);
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsSkipped());
  REQUIRE(r.value().message == "not an https target");
}

TEST_CASE("Retries recover a flaky probe", "[engine][retry]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(
      reg, "flaky", {WithStatus(Status::kError), WithStatus(Status::kError), Pass()});
  vigil::ExecutionEngine engine(reg, FastEngine());
  auto r = engine.ExecuteJob(MakeJob("f", "flaky"));
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsPassed());
  REQUIRE(r.value().GetData("retry_attempts") == 3);
  REQUIRE(s->calls.load() == 3U);
}

TEST_CASE("Job max_retries overrides the engine default", "[engine][retry]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(reg, "down", {WithStatus(Status::kError)});
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::Job job = MakeJob("d", "down");
  job.max_retries = 1U;
  auto r = engine.ExecuteJob(job);
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsFailed());
  REQUIRE(r.value().GetData("retries_exhausted") == true);
  REQUIRE(s->calls.load() == 2U);
}

TEST_CASE("Each retry attempt gets its own time budget", "[engine][timeout]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(reg, "slow_then_fast", {Sleeps(1.0), Pass("fast")});
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::Job job = MakeJob("j", "slow_then_fast");
  job.timeout = 0.05;

  const auto start = std::chrono::steady_clock::now();
  auto r = engine.ExecuteJob(job);
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsPassed());
  REQUIRE(r.value().GetData("retry_attempts") == 2);
  REQUIRE(s->calls.load() == 2U);
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(800));
}

TEST_CASE("Timeout without retries is reported as timeout", "[engine][timeout]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "stuck", {Sleeps(1.0)});
  auto cfg = FastEngine();
  cfg.enable_retries = false;
  vigil::ExecutionEngine engine(reg, cfg);
  vigil::Job job = MakeJob("j", "stuck");
  job.timeout = 0.03;
  auto r = engine.ExecuteJob(job);
  REQUIRE(r.has_value());
  REQUIRE(r.value().IsTimeout());
  REQUIRE(r.value().GetData("timeout_type") == "interrupt");
}

TEST_CASE("Pool exhaustion is reported as a resource fault", "[engine][pool]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "holder", {Sleeps(0.3)});
  auto cfg = FastEngine();
  cfg.enable_retries = false;
  cfg.pool.max_connections = 1U;
  cfg.pool.pool_size = 1U;
  cfg.pool.acquire_timeout = 0.02;
  cfg.parallel_execution = true;
  cfg.max_parallel_tests = 2U;
  vigil::ExecutionEngine engine(reg, cfg);

  auto res = engine.ExecuteBatch({MakeJob("a", "holder"), MakeJob("b", "holder")});
  REQUIRE(res.has_value());
  uint32_t exhausted = 0U;
  for (const auto& kv : res.value().results) {
    if (kv.second.GetData("fault_kind") == "resource_exhausted") {
      REQUIRE(kv.second.IsError());
      ++exhausted;
    }
  }
  REQUIRE(exhausted == 1U);
  REQUIRE(engine.Pool().InUseCount() == 0U);
}

// ============================================================================
// Inversion
// ============================================================================

TEST_CASE("Inversion mode remaps job results", "[engine][inversion]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "open_ports", {WithStatus(Status::kFail, "port 23")});
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::BatchOptions opts;
  opts.inversion_mode = "expect_failure";
  auto res = engine.ExecuteBatch({MakeJob("p", "open_ports")}, opts);
  REQUIRE(res.has_value());
  const vigil::Result* r = res.value().Find("p");
  REQUIRE(r->IsPassed());
  REQUIRE(r->GetData("original_status") == "fail");
  REQUIRE(r->message == "port 23 [Inverted: fail → pass via expect_failure]");
}

TEST_CASE("Conditional inversion only touches matching results",
          "[engine][inversion]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "a", {WithStatus(Status::kFail)});
  (void)RegisterScripted(reg, "b", {WithStatus(Status::kFail)});
  vigil::ExecutionEngine engine(reg, FastEngine());
  vigil::BatchOptions opts;
  opts.inversion_mode = "expect_failure";
  vigil::InversionConditions cond;
  cond.probe_names = {"a"};
  opts.inversion_conditions = cond;
  auto res = engine.ExecuteBatch({MakeJob("ja", "a"), MakeJob("jb", "b")}, opts);
  REQUIRE(res.has_value());
  REQUIRE(res.value().Find("ja")->IsPassed());
  REQUIRE(res.value().Find("jb")->IsFailed());
}

TEST_CASE("Disabled inversion ignores the mode", "[engine][inversion]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p", {WithStatus(Status::kFail)});
  auto cfg = FastEngine();
  cfg.enable_result_inversion = false;
  vigil::ExecutionEngine engine(reg, cfg);
  vigil::BatchOptions opts;
  opts.inversion_mode = "not_a_rule";
  auto res = engine.ExecuteBatch({MakeJob("p", "p")}, opts);
  REQUIRE(res.has_value());
  REQUIRE(res.value().Find("p")->IsFailed());
}

// ============================================================================
// Fail-fast, deadlines and progress
// ============================================================================

TEST_CASE("Fail-fast stops after the first problem", "[engine][fail_fast]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "bad", {WithStatus(Status::kFail)});
  auto b = RegisterScripted(reg, "b");
  auto c = RegisterScripted(reg, "c");
  auto cfg = FastEngine();
  cfg.fail_fast = true;
  vigil::ExecutionEngine engine(reg, cfg);

  auto res = engine.ExecuteBatch(
      {MakeJob("a", "bad"), MakeJob("b", "b"), MakeJob("c", "c")});
  REQUIRE(res.has_value());
  const vigil::BatchResult& batch = res.value();
  REQUIRE(batch.aborted);
  REQUIRE(batch.TotalCount() == 1U);
  REQUIRE(batch.not_run == std::vector<std::string>{"b", "c"});
  REQUIRE(b->calls.load() == 0U);
  REQUIRE(c->calls.load() == 0U);

  vigil::BatchOptions lenient;
  lenient.fail_fast = false;
  auto all = engine.ExecuteBatch(
      {MakeJob("a", "bad"), MakeJob("b", "b"), MakeJob("c", "c")}, lenient);
  REQUIRE(all.has_value());
  REQUIRE_FALSE(all.value().aborted);
  REQUIRE(all.value().TotalCount() == 3U);
}

TEST_CASE("Fail-fast in parallel leaves the rest unrun", "[engine][fail_fast]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "bad", {WithStatus(Status::kFail)});
  auto later = RegisterScripted(reg, "later");
  auto cfg = FastEngine();
  cfg.fail_fast = true;
  cfg.parallel_execution = true;
  cfg.max_parallel_tests = 2U;
  vigil::ExecutionEngine engine(reg, cfg);

  // "later" jobs all wait on the failing one, so none can start first.
  std::vector<vigil::Job> jobs = {MakeJob("a", "bad")};
  for (int i = 0; i < 4; ++i) {
    jobs.push_back(MakeJob("l" + std::to_string(i), "later", {"a"}));
  }
  auto res = engine.ExecuteBatch(jobs);
  REQUIRE(res.has_value());
  REQUIRE(res.value().aborted);
  REQUIRE(res.value().TotalCount() == 1U);
  REQUIRE(res.value().not_run.size() == 4U);
  REQUIRE(later->calls.load() == 0U);
}

TEST_CASE("Batch deadline times out jobs that cannot start",
          "[engine][deadline]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "slow", {Sleeps(1.0)});
  auto fast = RegisterScripted(reg, "fast");
  auto cfg = FastEngine();
  cfg.enable_retries = false;
  vigil::ExecutionEngine engine(reg, cfg);

  vigil::BatchOptions opts;
  opts.deadline_s = 0.05;
  auto res = engine.ExecuteBatch({MakeJob("s", "slow"), MakeJob("f", "fast", {"s"})},
                                 opts);
  REQUIRE(res.has_value());
  const vigil::Result* s = res.value().Find("s");
  REQUIRE(s->IsTimeout());
  REQUIRE(s->GetData("timeout_limit").get<double>() <= 0.05);
  // f depends on a timed-out job and is skipped instead.
  REQUIRE(res.value().Find("f")->IsSkipped());
  REQUIRE(fast->calls.load() == 0U);
  REQUIRE(res.value().execution_time < 0.5);
}

TEST_CASE("Spent deadline yields batch timeouts", "[engine][deadline]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "slow", {Sleeps(1.0)});
  auto other = RegisterScripted(reg, "other");
  auto cfg = FastEngine();
  cfg.enable_retries = false;
  cfg.execution_timeout = 0.05;
  vigil::ExecutionEngine engine(reg, cfg);

  auto res = engine.ExecuteBatch({MakeJob("s", "slow"), MakeJob("o", "other")});
  REQUIRE(res.has_value());
  const vigil::Result* o = res.value().Find("o");
  REQUIRE(o->IsTimeout());
  REQUIRE(o->message == "batch deadline exceeded before execution");
  REQUIRE(o->GetData("timeout_type") == "batch");
  REQUIRE(other->calls.load() == 0U);
}

TEST_CASE("Batch deadline caps retried attempts", "[engine][deadline]") {
  vigil::ProbeRegistry reg;
  auto stuck = RegisterScripted(reg, "stuck", {Sleeps(1.0)});
  auto cfg = FastEngine();
  cfg.execution_timeout = 0.2;
  vigil::ExecutionEngine engine(reg, cfg);

  auto res = engine.ExecuteBatch({MakeJob("s", "stuck")});
  REQUIRE(res.has_value());
  const vigil::Result* s = res.value().Find("s");
  REQUIRE(s->IsTimeout());
  REQUIRE(s->GetData("deadline_reached") == true);
  REQUIRE(stuck->calls.load() == 1U);
  // Four 2s attempts would run far past the 0.2s budget.
  REQUIRE(res.value().execution_time < 0.6);
}

TEST_CASE("Batch deadline ends the backoff between retries",
          "[engine][deadline]") {
  vigil::ProbeRegistry reg;
  auto flaky = RegisterScripted(reg, "flaky", {WithStatus(Status::kError, "down")});
  auto cfg = FastEngine();
  cfg.retry.retry_delay = 0.1;
  vigil::ExecutionEngine engine(reg, cfg);

  vigil::BatchOptions opts;
  opts.deadline_s = 0.25;
  auto res = engine.ExecuteBatch({MakeJob("f", "flaky")}, opts);
  REQUIRE(res.has_value());
  const vigil::Result* f = res.value().Find("f");
  REQUIRE(f->IsTimeout());
  REQUIRE(f->GetData("retry_attempts") == 2);
  REQUIRE(f->message == "deadline reached after 2 attempts: down");
  REQUIRE(flaky->calls.load() == 2U);
  REQUIRE(res.value().execution_time < 0.25);
}

TEST_CASE("Pruning drops jobs the deadline cannot fit", "[engine][deadline]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());

  vigil::Job big = MakeJob("big", "p");
  big.estimated_duration = 100.0;
  vigil::Job small = MakeJob("small", "p");
  small.estimated_duration = 1.0;

  vigil::BatchOptions opts;
  opts.deadline_s = 10.0;
  opts.prune_to_deadline = true;
  auto res = engine.ExecuteBatch({big, small}, opts);
  REQUIRE(res.has_value());
  REQUIRE(res.value().dropped == std::vector<std::string>{"big"});
  REQUIRE(res.value().TotalCount() == 1U);
  REQUIRE(res.value().Find("small")->IsPassed());
}

TEST_CASE("Progress callback fires once per job", "[engine][progress]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p");
  vigil::ExecutionEngine engine(reg, FastEngine());

  std::mutex mtx;
  std::vector<uint32_t> seen;
  std::vector<std::string> ids;
  uint32_t reported_total = 0U;
  vigil::BatchOptions opts;
  opts.parallel = true;
  opts.progress_callback = [&](uint32_t current, uint32_t total,
                               const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx);
    seen.push_back(current);
    ids.push_back(id);
    reported_total = total;
  };
  std::vector<vigil::Job> jobs;
  for (int i = 0; i < 5; ++i) jobs.push_back(MakeJob("j" + std::to_string(i), "p"));
  auto res = engine.ExecuteBatch(jobs, opts);
  REQUIRE(res.has_value());
  REQUIRE(seen == std::vector<uint32_t>{1U, 2U, 3U, 4U, 5U});
  REQUIRE(reported_total == 5U);
  std::sort(ids.begin(), ids.end());
  REQUIRE(ids == std::vector<std::string>{"j0", "j1", "j2", "j3", "j4"});
}

TEST_CASE("Progress callback runs unlocked on the calling thread",
          "[engine][progress]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(reg, "p", {Sleeps(0.05)});
  auto cfg = FastEngine();
  cfg.max_parallel_tests = 3U;
  vigil::ExecutionEngine engine(reg, cfg);

  const std::thread::id caller = std::this_thread::get_id();
  std::vector<uint32_t> seen;
  bool same_thread = true;
  uint32_t running_after_first = 99U;
  vigil::BatchOptions opts;
  opts.parallel = true;
  opts.progress_callback = [&](uint32_t current, uint32_t /*total*/,
                               const std::string& /*id*/) {
    same_thread = same_thread && std::this_thread::get_id() == caller;
    if (current == 1U) {
      // The other in-flight jobs still finish while this call blocks.
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      running_after_first = s->running.load();
    }
    seen.push_back(current);
  };
  std::vector<vigil::Job> jobs;
  for (int i = 0; i < 3; ++i) jobs.push_back(MakeJob("j" + std::to_string(i), "p"));
  auto res = engine.ExecuteBatch(jobs, opts);
  REQUIRE(res.has_value());
  REQUIRE(res.value().PassedCount() == 3U);
  REQUIRE(same_thread);
  REQUIRE(running_after_first == 0U);
  REQUIRE(seen == std::vector<uint32_t>{1U, 2U, 3U});
}

// ============================================================================
// Parallel execution
// ============================================================================

TEST_CASE("Parallel execution respects max_parallel_tests",
          "[engine][parallel]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(reg, "worker", {Sleeps(0.05)});
  auto cfg = FastEngine();
  cfg.parallel_execution = true;
  cfg.max_parallel_tests = 3U;
  cfg.pool.max_connections = 10U;
  vigil::ExecutionEngine engine(reg, cfg);

  std::vector<vigil::Job> jobs;
  for (int i = 0; i < 9; ++i) jobs.push_back(MakeJob("j" + std::to_string(i), "worker"));
  auto res = engine.ExecuteBatch(jobs);
  REQUIRE(res.has_value());
  REQUIRE(res.value().PassedCount() == 9U);
  REQUIRE(s->calls.load() == 9U);
  REQUIRE(s->max_running.load() <= 3U);
  REQUIRE(s->max_running.load() >= 2U);
}

TEST_CASE("Parallel execution honours dependencies", "[engine][parallel]") {
  vigil::ProbeRegistry reg;
  auto log = std::make_shared<CallLog>();
  (void)RegisterScripted(reg, "root", {Sleeps(0.03)}, log);
  (void)RegisterScripted(reg, "leaf", {Pass()}, log);
  (void)RegisterScripted(reg, "bad", {WithStatus(Status::kError)}, log);
  auto orphan = RegisterScripted(reg, "orphan", {Pass()}, log);
  auto cfg = FastEngine();
  cfg.parallel_execution = true;
  cfg.enable_retries = false;
  vigil::ExecutionEngine engine(reg, cfg);

  auto res = engine.ExecuteBatch({MakeJob("l1", "leaf", {"r"}),
                                  MakeJob("l2", "leaf", {"r"}),
                                  MakeJob("r", "root"),
                                  MakeJob("x", "bad"),
                                  MakeJob("o", "orphan", {"x"})});
  REQUIRE(res.has_value());
  const auto calls = log->Snapshot();
  const size_t root_at = IndexOf(calls, "root");
  REQUIRE(root_at < calls.size());
  for (size_t i = 0; i < calls.size(); ++i) {
    if (calls[i] == "leaf") REQUIRE(i > root_at);
  }
  REQUIRE(res.value().Find("l1")->IsPassed());
  REQUIRE(res.value().Find("l2")->IsPassed());
  REQUIRE(res.value().Find("o")->IsSkipped());
  REQUIRE(orphan->calls.load() == 0U);
  REQUIRE(res.value().TotalCount() == 5U);
}

// ============================================================================
// Registry-driven batches
// ============================================================================

TEST_CASE("Execute by category and tags", "[engine][registry]") {
  vigil::ProbeRegistry reg;
  vigil::ProbeInfo ssl;
  ssl.name = "ssl_check";
  ssl.category = "security";
  ssl.tags = {"health", "tls"};
  ssl.priority = 9;
  auto ssl_s = RegisterWithInfo(reg, ssl);

  vigil::ProbeInfo headers;
  headers.name = "security_headers";
  headers.category = "security";
  auto headers_s = RegisterWithInfo(reg, headers);

  vigil::ProbeInfo latency;
  latency.name = "response_time";
  latency.category = "performance";
  latency.tags = {"health"};
  auto latency_s = RegisterWithInfo(reg, latency);

  vigil::ExecutionEngine engine(reg, FastEngine());

  auto sec = engine.ExecuteByCategory("security", "https://shop.example");
  REQUIRE(sec.has_value());
  REQUIRE(sec.value().name == "category:security");
  REQUIRE(sec.value().TotalCount() == 2U);
  REQUIRE(sec.value().Find("ssl_check") != nullptr);
  REQUIRE(sec.value().Find("ssl_check")->target == "https://shop.example");
  REQUIRE(latency_s->calls.load() == 0U);

  auto tagged = engine.ExecuteByTags({"tls", "health"}, "https://shop.example");
  REQUIRE(tagged.has_value());
  REQUIRE(tagged.value().TotalCount() == 2U);
  REQUIRE(ssl_s->calls.load() == 2U);
  REQUIRE(latency_s->calls.load() == 1U);
  REQUIRE(headers_s->calls.load() == 1U);
}

TEST_CASE("Health check runs health-tagged probes with tight limits",
          "[engine][registry]") {
  vigil::ProbeRegistry reg;
  vigil::ProbeInfo ping;
  ping.name = "ping";
  ping.tags = {"health"};
  ping.max_retries = 5U;
  auto ping_s = RegisterWithInfo(reg, ping, {WithStatus(Status::kError)});

  vigil::ProbeInfo deep;
  deep.name = "deep_scan";
  auto deep_s = RegisterWithInfo(reg, deep);

  auto cfg = FastEngine();
  cfg.fail_fast = true;
  vigil::ExecutionEngine engine(reg, cfg);
  auto res = engine.ExecuteHealthCheck("https://api.example");
  REQUIRE(res.has_value());
  REQUIRE(res.value().name == "health_check");
  REQUIRE(res.value().TotalCount() == 1U);
  // One retry at most: two attempts.
  REQUIRE(ping_s->calls.load() == 2U);
  REQUIRE(deep_s->calls.load() == 0U);
  REQUIRE_FALSE(res.value().aborted);
}

// ============================================================================
// Statistics and history
// ============================================================================

TEST_CASE("Execution statistics and batch metrics", "[engine][stats]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "good");
  (void)RegisterScripted(reg, "bad", {WithStatus(Status::kFail)});
  vigil::ExecutionEngine engine(reg, FastEngine());

  auto res = engine.ExecuteBatch(
      {MakeJob("g1", "good"), MakeJob("g2", "good"), MakeJob("b", "bad")});
  REQUIRE(res.has_value());

  auto stats = engine.GetExecutionStatistics();
  REQUIRE(stats.at("good").total_executions == 2U);
  REQUIRE(stats.at("good").status_counts.at("pass") == 2U);
  REQUIRE(stats.at("bad").status_counts.at("fail") == 1U);

  auto m = engine.GetBatchMetrics();
  REQUIRE(m.batches == 1U);
  REQUIRE(m.total_jobs == 3U);
  REQUIRE(m.successful_jobs == 2U);
  REQUIRE(m.failed_jobs == 1U);
  REQUIRE(m.success_rate == Approx(200.0 / 3.0));
  REQUIRE(engine.GetOptimizationRecommendations().size() == 1U);

  REQUIRE(engine.DurationHistory("good", "https://example.com").size() == 2U);
  auto failures = engine.FailureHistory("bad", "https://example.com");
  REQUIRE(failures.size() == 1U);
  REQUIRE(failures[0].status == Status::kFail);

  auto report = engine.Summarize(res.value());
  REQUIRE(report.summary.total == 3U);
  REQUIRE(report.summary.passed == 2U);

  engine.ResetStatistics();
  REQUIRE(engine.GetExecutionStatistics().empty());
  REQUIRE(engine.GetBatchMetrics().total_jobs == 0U);
  REQUIRE(engine.DurationHistory("good", "https://example.com").empty());
}

TEST_CASE("Recovery time is recorded once a target recovers",
          "[engine][stats]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "flappy", {WithStatus(Status::kFail), Pass()});
  vigil::ExecutionEngine engine(reg, FastEngine());

  REQUIRE(engine.ExecuteJob(MakeJob("f", "flappy")).has_value());
  REQUIRE(engine.FailureHistory("flappy", "https://example.com")[0].recovery_time ==
          0.0);
  REQUIRE(engine.ExecuteJob(MakeJob("f", "flappy")).has_value());
  REQUIRE(engine.FailureHistory("flappy", "https://example.com")[0].recovery_time >
          0.0);
}

TEST_CASE("Smart retries grow with an error history", "[engine][retry]") {
  vigil::ProbeRegistry reg;
  auto s = RegisterScripted(
      reg, "erratic",
      {vigil_test::Fault(vigil::FaultKind::kTls, "bad cert"),
       WithStatus(Status::kError)});
  auto cfg = FastEngine();
  cfg.smart_retries = true;
  cfg.retry.retryable_faults.erase(vigil::FaultKind::kTls);
  vigil::ExecutionEngine engine(reg, cfg);

  auto first = engine.ExecuteJob(MakeJob("e", "erratic"));
  REQUIRE(first.has_value());
  REQUIRE(first.value().IsError());
  REQUIRE(s->calls.load() == 1U);
  // One recorded error and no timeouts: two retries beyond the default.
  auto second = engine.ExecuteJob(MakeJob("e", "erratic"));
  REQUIRE(second.has_value());
  REQUIRE(second.value().GetData("retry_attempts") == 6);
  REQUIRE(s->calls.load() == 7U);
}

TEST_CASE("History is bounded by history_size", "[engine][stats]") {
  vigil::ProbeRegistry reg;
  (void)RegisterScripted(reg, "p");
  auto cfg = FastEngine();
  cfg.history_size = 3U;
  vigil::ExecutionEngine engine(reg, cfg);
  for (int i = 0; i < 5; ++i) {
    REQUIRE(engine.ExecuteJob(MakeJob("p", "p")).has_value());
  }
  REQUIRE(engine.DurationHistory("p", "https://example.com").size() == 3U);
}
