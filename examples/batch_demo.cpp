// Copyright (c) 2024 liudegui. MIT License.
//
// batch_demo.cpp -- ExecutionEngine end-to-end demo with simulated probes.
//
// Demonstrates:
//   1. Loading engine settings from a config file
//   2. A dependency-ordered batch with retries and timeouts
//   3. Expected-failure runs through result inversion
//   4. Category and health-check batches built from the registry
//   5. Aggregated report and engine statistics
//
// Usage: batch_demo [config.json] [target]

#include "vigil/vigil.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// ============================================================================
// Simulated Probes
// ============================================================================

/// Sleeps for a fixed latency, then reports a fixed status.
class SimulatedProbe : public vigil::Probe {
 public:
  SimulatedProbe(std::string name, double latency_s, vigil::Status status,
                 std::string message)
      : name_(std::move(name)),
        latency_s_(latency_s),
        status_(status),
        message_(std::move(message)) {}

  const char* Name() const noexcept override { return name_.c_str(); }

  vigil::ProbeOutcome Run(const std::string& target,
                          const vigil::ProbeContext& ctx) override {
    if (!ctx.SleepFor(latency_s_)) {
      return vigil::ProbeOutcome::error(
          vigil::ProbeFault{vigil::FaultKind::kTimeout, "cancelled"});
    }
    vigil::Result r(name_, status_, message_);
    r.target = target;
    r.AddData("latency_ms", latency_s_ * 1000.0);
    return vigil::ProbeOutcome::success(std::move(r));
  }

 private:
  std::string name_;
  double latency_s_;
  vigil::Status status_;
  std::string message_;
};

/// Fails with a network fault on the first @p failures calls.
class FlakyProbe : public vigil::Probe {
 public:
  explicit FlakyProbe(std::shared_ptr<std::atomic<uint32_t>> calls)
      : calls_(std::move(calls)) {}

  const char* Name() const noexcept override { return "dns_resolution"; }

  vigil::ProbeOutcome Run(const std::string& target,
                          const vigil::ProbeContext& /*ctx*/) override {
    if (calls_->fetch_add(1U) < 2U) {
      return vigil::ProbeOutcome::error(
          vigil::ProbeFault{vigil::FaultKind::kDns, "SERVFAIL"});
    }
    vigil::Result r("dns_resolution", vigil::Status::kPass, "resolved");
    r.target = target;
    return vigil::ProbeOutcome::success(std::move(r));
  }

 private:
  std::shared_ptr<std::atomic<uint32_t>> calls_;
};

static void RegisterSimulated(vigil::ProbeRegistry& reg, const char* name,
                              const char* category,
                              std::vector<std::string> tags, double latency_s,
                              vigil::Status status, const char* message) {
  vigil::ProbeInfo info;
  info.name = name;
  info.category = category;
  info.tags = std::move(tags);
  info.default_timeout = 5.0;
  const std::string n(name);
  const std::string msg(message);
  auto reg_result = reg.Register(info, [n, latency_s, status, msg]() {
    return std::unique_ptr<vigil::Probe>(
        new SimulatedProbe(n, latency_s, status, msg));
  });
  if (!reg_result.has_value()) {
    std::printf("  register %s failed: error %d\n", name,
                static_cast<int>(reg_result.get_error()));
  }
}

static void PrintBatch(const vigil::BatchResult& batch) {
  std::printf("  batch '%s': %u results in %.3fs, %.1f%% passed%s\n",
              batch.name.c_str(), batch.TotalCount(), batch.execution_time,
              batch.SuccessRate(), batch.aborted ? " (aborted)" : "");
  for (const auto& id : batch.order) {
    std::printf("    %-14s %s\n", id.c_str(),
                batch.results.at(id).Summary().c_str());
  }
}

// ============================================================================
// Demo 1: Dependency-ordered batch
// ============================================================================

static void DemoBatch(vigil::ExecutionEngine& engine, const std::string& target) {
  std::printf("\n=== Demo 1: Dependency-Ordered Batch ===\n");
  std::vector<vigil::Job> jobs(4);
  jobs[0].id = "dns";
  jobs[0].probe_name = "dns_resolution";
  jobs[1].id = "tls";
  jobs[1].probe_name = "ssl_check";
  jobs[1].dependencies = {"dns"};
  jobs[1].priority = 8;
  jobs[2].id = "headers";
  jobs[2].probe_name = "security_headers";
  jobs[2].dependencies = {"tls"};
  jobs[3].id = "latency";
  jobs[3].probe_name = "response_time";
  jobs[3].timeout = 0.1;

  vigil::BatchOptions opts;
  opts.name = "site_audit";
  opts.target = target;
  opts.context = {{"run", "demo"}};
  opts.progress_callback = [](uint32_t current, uint32_t total,
                              const std::string& id) {
    std::printf("  [%u/%u] %s done\n", current, total, id.c_str());
  };

  auto res = engine.ExecuteBatch(jobs, opts);
  if (!res.has_value()) {
    std::printf("  batch rejected: %s\n", res.get_error().detail.c_str());
    return;
  }
  PrintBatch(res.value());

  const vigil::AggregatedReport report = engine.Summarize(res.value());
  if (report.scores.overall_score.has_value()) {
    std::printf("  overall score: %.1f\n", *report.scores.overall_score);
  }
  for (const auto& rec : report.recommendations) {
    std::printf("  recommendation [%s]: %s\n", rec.priority.c_str(),
                rec.message.c_str());
  }
}

// ============================================================================
// Demo 2: Expected failures
// ============================================================================

static void DemoInversion(vigil::ExecutionEngine& engine,
                          const std::string& target) {
  std::printf("\n=== Demo 2: Security-Inverted Port Scan ===\n");
  vigil::Job job;
  job.id = "telnet";
  job.probe_name = "open_port_23";
  job.target = target;

  vigil::BatchOptions opts;
  opts.inversion_mode = "security_inverted";
  auto r = engine.ExecuteJob(job, opts);
  if (r.has_value()) std::printf("  %s\n", r.value().Summary().c_str());

  opts.inversion_mode = "upside_down";
  auto bad = engine.ExecuteJob(job, opts);
  if (!bad.has_value()) {
    std::printf("  rejected as expected: %s\n", bad.get_error().detail.c_str());
  }
}

// ============================================================================
// Demo 3: Registry-driven batches
// ============================================================================

static void DemoRegistry(vigil::ExecutionEngine& engine,
                         const std::string& target) {
  std::printf("\n=== Demo 3: Category and Health Check ===\n");
  auto sec = engine.ExecuteByCategory("security", target);
  if (sec.has_value()) PrintBatch(sec.value());
  auto health = engine.ExecuteHealthCheck(target);
  if (health.has_value()) PrintBatch(health.value());
}

// ============================================================================
// Demo 4: Statistics
// ============================================================================

static void DemoStatistics(vigil::ExecutionEngine& engine) {
  std::printf("\n=== Demo 4: Engine Statistics ===\n");
  for (const auto& kv : engine.GetExecutionStatistics()) {
    std::printf("  %-18s runs=%llu avg=%.3fs\n", kv.first.c_str(),
                static_cast<unsigned long long>(kv.second.total_executions),
                kv.second.average_execution_time);
  }
  const vigil::BatchMetrics m = engine.GetBatchMetrics();
  std::printf("  batches=%llu jobs=%llu success=%.1f%% (%.1f jobs/s)\n",
              static_cast<unsigned long long>(m.batches),
              static_cast<unsigned long long>(m.total_jobs), m.success_rate,
              m.jobs_per_second);
  for (const auto& rec : engine.GetOptimizationRecommendations()) {
    std::printf("  hint: %s\n", rec.c_str());
  }
  const vigil::ResourcePoolStats ps = engine.Pool().GetStats();
  std::printf("  pool: created=%llu exhausted=%llu utilization=%.1f%%\n",
              static_cast<unsigned long long>(ps.created),
              static_cast<unsigned long long>(ps.exhausted),
              ps.utilization_rate);
}

int main(int argc, char* argv[]) {
  vigil::log::Init();

  vigil::EngineConfig cfg;
  cfg.retry.retry_delay = 0.05;
  cfg.timeout.min_timeout = 0.05;
  if (argc > 1) {
    vigil::MultiConfig file;
    auto loaded = file.LoadFile(argv[1]);
    if (loaded.has_value()) {
      cfg = vigil::LoadEngineConfig(file);
    } else {
      VIGIL_LOG_WARN("Demo", "cannot load %s (error %d), using defaults",
                     argv[1], static_cast<int>(loaded.get_error()));
    }
  }
  const std::string target = argc > 2 ? argv[2] : "https://shop.example.com";

  vigil::ProbeRegistry reg;
  RegisterSimulated(reg, "ssl_check", "security", {"health", "tls"}, 0.02,
                    vigil::Status::kPass, "certificate valid");
  RegisterSimulated(reg, "security_headers", "security", {}, 0.01,
                    vigil::Status::kWarning, "missing Content-Security-Policy");
  RegisterSimulated(reg, "response_time", "performance", {"health"}, 0.5,
                    vigil::Status::kPass, "fast");
  RegisterSimulated(reg, "open_port_23", "security", {}, 0.01,
                    vigil::Status::kFail, "port 23 open");
  auto dns_calls = std::make_shared<std::atomic<uint32_t>>(0U);
  vigil::ProbeInfo dns;
  dns.name = "dns_resolution";
  dns.category = "network";
  (void)reg.Register(dns, [dns_calls]() {
    return std::unique_ptr<vigil::Probe>(new FlakyProbe(dns_calls));
  });

  vigil::ExecutionEngine engine(reg, cfg);
  DemoBatch(engine, target);
  DemoInversion(engine, target);
  DemoRegistry(engine, target);
  DemoStatistics(engine);

  vigil::log::Shutdown();
  return 0;
}
