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
 * @file probe.hpp
 * @brief Probe capability, cooperative cancellation and the probe registry.
 *
 * A probe is an opaque check run against one target. The engine never looks
 * inside it: it builds a ProbeContext, calls Run(), and treats the returned
 * Result (or ProbeFault) as the outcome.
 *
 * Probes are made available through an explicit ProbeRegistry populated at
 * startup (name -> factory). There is no discovery step.
 *
 * Cancellation is cooperative: when a timeout fires under the interrupt
 * strategy the probe's CancelToken is tripped and any ProbeContext::SleepFor()
 * or CancelToken::WaitFor() it is blocked in returns early.
 */

#ifndef VIGIL_PROBE_HPP_
#define VIGIL_PROBE_HPP_

#include "vigil/log.hpp"
#include "vigil/result.hpp"
#include "vigil/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil {

struct ResourceHandle;

// ============================================================================
// ProbeFault
// ============================================================================

/// Classification of a fault raised by a probe instead of a Result.
enum class FaultKind : uint8_t {
  kNetwork = 0,         ///< Connect/read/write failure
  kDns,                 ///< Name resolution failure
  kTls,                 ///< Handshake or certificate failure
  kProtocol,            ///< Malformed response
  kIo,                  ///< Local I/O failure
  kResourceExhausted,   ///< No pooled connection within the wait ceiling
  kTimeout,             ///< Probe-internal deadline hit
  kInternal,            ///< Bug or unexpected exception inside the probe
};

static constexpr uint32_t kFaultKindCount = 8U;

inline const char* FaultKindName(FaultKind kind) noexcept {
  switch (kind) {
    case FaultKind::kNetwork:
      return "network";
    case FaultKind::kDns:
      return "dns";
    case FaultKind::kTls:
      return "tls";
    case FaultKind::kProtocol:
      return "protocol";
    case FaultKind::kIo:
      return "io";
    case FaultKind::kResourceExhausted:
      return "resource_exhausted";
    case FaultKind::kTimeout:
      return "timeout";
    case FaultKind::kInternal:
      return "internal";
  }
  return "internal";
}

struct ProbeFault {
  FaultKind kind{FaultKind::kInternal};
  std::string message;
};

using ProbeOutcome = expected<Result, ProbeFault>;

// ============================================================================
// CancelToken
// ============================================================================

/**
 * @brief Shared cancellation flag with a wakeable wait.
 *
 * Copies share state; the controller keeps one copy and hands another to
 * the probe through its ProbeContext.
 */
class CancelToken {
 public:
  CancelToken() : state_(std::make_shared<State>()) {}

  void Cancel() noexcept {
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
  }

  /**
   * @brief Sleeps up to @p seconds.
   * @return true if woken by cancellation.
   */
  bool WaitFor(double seconds) const {
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, SecondsToDuration(seconds), [this] {
      return state_->cancelled.load(std::memory_order_acquire);
    });
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mtx;
    std::condition_variable cv;
  };
  std::shared_ptr<State> state_;
};

// ============================================================================
// ProbeContext
// ============================================================================

struct ProbeContext {
  Json params = Json::object();  ///< Caller-supplied probe parameters.
  CancelToken cancel;
  std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::time_point::max();
  const ResourceHandle* connection{nullptr};  ///< Borrowed pool handle.
  uint32_t attempt{1U};

  /// Seconds left before the deadline, negative once it has passed.
  double RemainingSeconds() const noexcept {
    if (deadline == std::chrono::steady_clock::time_point::max()) {
      return 1e9;
    }
    return std::chrono::duration<double>(deadline -
                                         std::chrono::steady_clock::now())
        .count();
  }

  /// Cancellation-aware sleep. Returns false if cancelled before it elapsed.
  bool SleepFor(double seconds) const { return !cancel.WaitFor(seconds); }
};

// ============================================================================
// Probe
// ============================================================================

class Probe {
 public:
  virtual ~Probe() = default;

  virtual const char* Name() const noexcept = 0;

  /**
   * @brief Runs the check.
   *
   * Long-running probes should bound their I/O by ctx.deadline and poll
   * ctx.cancel; the polling timeout strategy cannot stop them otherwise.
   */
  virtual ProbeOutcome Run(const std::string& target,
                           const ProbeContext& ctx) = 0;

  /// Non-empty reason makes the engine record Skip without calling Run().
  virtual std::optional<std::string> ShouldSkip(
      const std::string& /*target*/, const ProbeContext& /*ctx*/) const {
    return std::nullopt;
  }
};

using ProbeFactory = std::function<std::unique_ptr<Probe>()>;

/// One invocation of a probe with its context bound by the caller.
using ProbeCall = std::function<ProbeOutcome(const ProbeContext&)>;

/// Wraps a shared probe so the call can outlive the caller's scope.
inline ProbeCall BindProbe(std::shared_ptr<Probe> probe, std::string target) {
  return [probe, target](const ProbeContext& ctx) {
    return probe->Run(target, ctx);
  };
}

/**
 * @brief Invokes a probe call, converting escaped exceptions into faults.
 *
 * Also fills the Result fields a probe commonly leaves empty: name, target
 * and the measured execution time.
 */
inline ProbeOutcome InvokeGuarded(const ProbeCall& call,
                                  const std::string& probe_name,
                                  const std::string& target,
                                  const ProbeContext& ctx) {
  const double start = SteadyNowSec();
  ProbeOutcome out = [&]() -> ProbeOutcome {
    try {
      return call(ctx);
    } catch (const std::exception& e) {
      return ProbeOutcome::error(ProbeFault{FaultKind::kInternal, e.what()});
    }
  }();
  if (out.has_value()) {
    Result& r = out.value();
    if (r.probe_name.empty()) r.probe_name = probe_name;
    if (r.target.empty()) r.target = target;
    if (r.execution_time <= 0.0) r.execution_time = SteadyNowSec() - start;
  }
  return out;
}

// ============================================================================
// ProbeRegistry
// ============================================================================

struct ProbeInfo {
  std::string name;
  std::string description;
  std::string category{"general"};
  std::vector<std::string> tags;
  bool enabled{true};
  double default_timeout{30.0};
  uint32_t max_retries{3U};
  int32_t priority{5};
};

/**
 * @brief Startup-time table mapping probe name to factory.
 *
 * Thread-safe: workers call Create() concurrently during a batch.
 */
class ProbeRegistry {
 public:
  ProbeRegistry() = default;
  ProbeRegistry(const ProbeRegistry&) = delete;
  ProbeRegistry& operator=(const ProbeRegistry&) = delete;

  expected<void, RegistryError> Register(ProbeInfo info, ProbeFactory factory) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (entries_.find(info.name) != entries_.end()) {
      VIGIL_LOG_WARN("Registry", "probe '%s' already registered",
                     info.name.c_str());
      return expected<void, RegistryError>::error(
          RegistryError::kDuplicateProbe);
    }
    VIGIL_LOG_DEBUG("Registry", "registered probe '%s' (category=%s)",
                    info.name.c_str(), info.category.c_str());
    std::string key = info.name;
    entries_.emplace(std::move(key), Entry{std::move(info), std::move(factory)});
    return expected<void, RegistryError>::success();
  }

  /// Registers a default-constructible probe type.
  template <typename P>
  expected<void, RegistryError> Register(ProbeInfo info) {
    return Register(std::move(info),
                    []() -> std::unique_ptr<Probe> { return std::make_unique<P>(); });
  }

  bool Unregister(const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.erase(name) > 0U;
  }

  bool Has(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.find(name) != entries_.end();
  }

  expected<std::unique_ptr<Probe>, RegistryError> Create(
      const std::string& name) const {
    using R = expected<std::unique_ptr<Probe>, RegistryError>;
    ProbeFactory factory;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = entries_.find(name);
      if (it == entries_.end()) return R::error(RegistryError::kUnknownProbe);
      if (!it->second.info.enabled) {
        return R::error(RegistryError::kProbeDisabled);
      }
      factory = it->second.factory;
    }
    std::unique_ptr<Probe> probe = factory ? factory() : nullptr;
    if (probe == nullptr) return R::error(RegistryError::kUnknownProbe);
    return R::success(std::move(probe));
  }

  std::optional<ProbeInfo> Info(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second.info;
  }

  bool Enable(const std::string& name) { return SetEnabled(name, true); }
  bool Disable(const std::string& name) { return SetEnabled(name, false); }

  std::vector<std::string> ListAll(bool enabled_only = false) const {
    return Collect([enabled_only](const ProbeInfo& info) {
      return !enabled_only || info.enabled;
    });
  }

  std::vector<std::string> ByCategory(const std::string& category) const {
    return Collect([&category](const ProbeInfo& info) {
      return info.enabled && info.category == category;
    });
  }

  std::vector<std::string> ByTag(const std::string& tag) const {
    return Collect([&tag](const ProbeInfo& info) {
      return info.enabled && std::find(info.tags.begin(), info.tags.end(),
                                       tag) != info.tags.end();
    });
  }

  std::vector<std::string> Categories() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::set<std::string> cats;
    for (const auto& kv : entries_) cats.insert(kv.second.info.category);
    return std::vector<std::string>(cats.begin(), cats.end());
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(entries_.size());
  }

 private:
  struct Entry {
    ProbeInfo info;
    ProbeFactory factory;
  };

  bool SetEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return false;
    it->second.info.enabled = enabled;
    return true;
  }

  template <typename Pred>
  std::vector<std::string> Collect(Pred pred) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : entries_) {
      if (pred(kv.second.info)) out.push_back(kv.first);
    }
    return out;
  }

  mutable std::mutex mtx_;
  std::map<std::string, Entry> entries_;
};

}  // namespace vigil

#endif  // VIGIL_PROBE_HPP_
