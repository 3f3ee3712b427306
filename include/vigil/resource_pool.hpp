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
 * @file resource_pool.hpp
 * @brief Bounded pool of reusable outbound-connection handles.
 *
 * Every handle lives in exactly one of two sets: @c available (owned by the
 * pool) or @c in_use (owned by the borrower). At every quiescent point
 * available + in_use == TotalResources(), and in_use never exceeds
 * max_connections.
 *
 * Acquire() prefers a healthy, non-expired idle handle, creates a new one
 * while under the ceiling, and otherwise waits (polling every
 * poll_interval, woken early by Release()) until acquire_timeout elapses.
 *
 * Release() of a handle that is not on loan is a logged no-op, so a double
 * release is always safe.
 */

#ifndef VIGIL_RESOURCE_POOL_HPP_
#define VIGIL_RESOURCE_POOL_HPP_

#include "vigil/log.hpp"
#include "vigil/platform.hpp"
#include "vigil/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace vigil {

// ============================================================================
// Handle and Configuration
// ============================================================================

/// Connection options each handle is created with.
struct ConnectionConfig {
  std::string user_agent{"vigil/1.0"};
  double timeout{30.0};  ///< Seconds.
  bool follow_redirects{true};
  uint32_t max_redirects{5U};
  bool verify_peer{true};
};

struct ResourceHandle {
  uint32_t id{0U};
  std::string type{"http_client"};
  double created_at{0.0};  ///< SteadyNowSec() at creation.
  double last_used{0.0};   ///< SteadyNowSec() at last acquire/release.
  uint64_t usage_count{0U};
  uint64_t loan_id{0U};  ///< Stamp of the current loan; 0 while idle.
  bool healthy{true};
  ConnectionConfig conn;
};

struct ResourcePoolConfig {
  uint32_t pool_size{20U};        ///< Idle handles kept warm.
  uint32_t max_connections{10U};  ///< Ceiling on simultaneous loans.
  double idle_timeout{300.0};     ///< Idle handles older than this expire.
  double max_age{3600.0};         ///< HealthCheck() marks older handles unhealthy.
  double acquire_timeout{30.0};   ///< Wait ceiling for Acquire().
  double poll_interval{0.1};      ///< Re-check period while waiting.
  bool warm_start{true};          ///< Create pool_size handles up front.
  ConnectionConfig connection;
};

struct PoolHealthReport {
  uint32_t healthy{0U};
  uint32_t unhealthy{0U};
  uint32_t total{0U};
  uint32_t pool_size{0U};
  uint32_t in_use{0U};
};

struct ResourcePoolStats {
  uint32_t pool_size{0U};
  uint32_t max_connections{0U};
  uint32_t available{0U};
  uint32_t in_use{0U};
  uint32_t total_resources{0U};
  double utilization_rate{0.0};  ///< in_use / max_connections * 100.
  double average_usage{0.0};     ///< Mean usage_count over all handles.
  double oldest_age{0.0};        ///< Seconds.
  double newest_age{0.0};        ///< Seconds.
  uint64_t created{0U};
  uint64_t destroyed{0U};
  uint64_t exhausted{0U};
};

// ============================================================================
// ResourcePool
// ============================================================================

class ResourcePool {
 public:
  /**
   * @brief RAII loan: releases its handle back to the pool on destruction.
   *
   * Must not outlive the pool that issued it.
   */
  class Lease {
   public:
    Lease() = default;
    Lease(ResourcePool* pool, ResourceHandle handle)
        : pool_(pool), handle_(std::move(handle)) {}
    ~Lease() { Release(); }

    Lease(Lease&& other) noexcept
        : pool_(other.pool_), handle_(std::move(other.handle_)) {
      other.pool_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        Release();
        pool_ = other.pool_;
        handle_ = std::move(other.handle_);
        other.pool_ = nullptr;
      }
      return *this;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    void Release() {
      if (pool_ != nullptr) {
        (void)pool_->Release(handle_);
        pool_ = nullptr;
      }
    }

    explicit operator bool() const noexcept { return pool_ != nullptr; }
    const ResourceHandle& operator*() const noexcept { return handle_; }
    const ResourceHandle* operator->() const noexcept { return &handle_; }
    const ResourceHandle* get() const noexcept {
      return pool_ != nullptr ? &handle_ : nullptr;
    }

   private:
    ResourcePool* pool_{nullptr};
    ResourceHandle handle_;
  };

  explicit ResourcePool(const ResourcePoolConfig& cfg = ResourcePoolConfig{})
      : cfg_(cfg) {
    if (cfg_.warm_start) {
      std::lock_guard<std::mutex> lk(mtx_);
      for (uint32_t i = 0U; i < cfg_.pool_size; ++i) {
        ResourceHandle h = CreateLocked();
        available_.emplace(h.id, std::move(h));
      }
    }
    VIGIL_LOG_INFO("Pool", "resource pool created (pool_size=%u, max=%u)",
                   cfg_.pool_size, cfg_.max_connections);
  }

  ~ResourcePool() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!in_use_.empty()) {
      VIGIL_LOG_WARN("Pool", "destroying pool with %zu handles on loan",
                     in_use_.size());
    }
    VIGIL_LOG_DEBUG("Pool", "resource pool destroyed (created=%lu)",
                    static_cast<unsigned long>(created_));
  }

  ResourcePool(const ResourcePool&) = delete;
  ResourcePool& operator=(const ResourcePool&) = delete;
  ResourcePool(ResourcePool&&) = delete;
  ResourcePool& operator=(ResourcePool&&) = delete;

  // --------------------------------------------------------------------------
  // Acquire / Release
  // --------------------------------------------------------------------------

  /// Borrow a handle, waiting up to acquire_timeout.
  expected<ResourceHandle, PoolError> Acquire() {
    return AcquireFor(cfg_.acquire_timeout);
  }

  /// Borrow a handle, waiting up to @p wait_seconds.
  expected<ResourceHandle, PoolError> AcquireFor(double wait_seconds) {
    using R = expected<ResourceHandle, PoolError>;
    const auto deadline =
        std::chrono::steady_clock::now() + SecondsToDuration(wait_seconds);
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
      if (closed_) return R::error(PoolError::kPoolClosed);

      std::optional<ResourceHandle> h = TakeAvailableLocked();
      if (!h.has_value() && in_use_.size() < cfg_.max_connections) {
        h = CreateLocked();
      }
      if (h.has_value()) {
        h->last_used = SteadyNowSec();
        ++h->usage_count;
        h->loan_id = next_loan_++;
        in_use_[h->id] = *h;
        return R::success(std::move(*h));
      }

      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        ++exhausted_;
        VIGIL_LOG_WARN("Pool",
                       "timeout waiting for available resource (%zu in use)",
                       in_use_.size());
        return R::error(PoolError::kResourceExhausted);
      }
      const auto slice =
          std::min(deadline - now, SecondsToDuration(cfg_.poll_interval));
      cv_.wait_for(lk, slice);
    }
  }

  /// Borrow a handle wrapped in a Lease.
  expected<Lease, PoolError> AcquireLease() {
    return AcquireLeaseFor(cfg_.acquire_timeout);
  }

  expected<Lease, PoolError> AcquireLeaseFor(double wait_seconds) {
    auto r = AcquireFor(wait_seconds);
    if (!r.has_value()) return expected<Lease, PoolError>::error(r.get_error());
    return expected<Lease, PoolError>::success(
        Lease(this, std::move(r).value()));
  }

  /**
   * @brief Return a borrowed handle.
   *
   * Healthy, non-expired handles go back to the available set while it is
   * below pool_size; anything else is destroyed.
   *
   * A handle from an earlier loan of the same id (for example one reclaimed
   * by ForceReleaseAll()) does not match the current loan and is ignored.
   *
   * @return false if the handle was not on loan (logged, no other effect).
   */
  bool Release(const ResourceHandle& handle) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = in_use_.find(handle.id);
      if (it == in_use_.end()) {
        VIGIL_LOG_WARN("Pool", "release of resource %u not currently in use",
                       handle.id);
        return false;
      }
      if (it->second.loan_id != handle.loan_id) {
        VIGIL_LOG_WARN("Pool",
                       "stale release of resource %u (loan %lu, current %lu)",
                       handle.id, static_cast<unsigned long>(handle.loan_id),
                       static_cast<unsigned long>(it->second.loan_id));
        return false;
      }
      ResourceHandle h = std::move(it->second);
      in_use_.erase(it);
      h.loan_id = 0U;
      h.last_used = SteadyNowSec();
      if (h.healthy && !IsExpired(h) && available_.size() < cfg_.pool_size &&
          !closed_) {
        available_.emplace(h.id, std::move(h));
      } else {
        ++destroyed_;
      }
    }
    cv_.notify_one();
    return true;
  }

  // --------------------------------------------------------------------------
  // Maintenance
  // --------------------------------------------------------------------------

  /// Marks handles older than max_age unhealthy and reports counts.
  PoolHealthReport HealthCheck() {
    std::lock_guard<std::mutex> lk(mtx_);
    const double now = SteadyNowSec();
    PoolHealthReport report;
    auto visit = [&](ResourceHandle& h) {
      if (now - h.created_at > cfg_.max_age) h.healthy = false;
      if (h.healthy) {
        ++report.healthy;
      } else {
        ++report.unhealthy;
      }
    };
    for (auto& kv : available_) visit(kv.second);
    for (auto& kv : in_use_) visit(kv.second);
    report.total = static_cast<uint32_t>(available_.size() + in_use_.size());
    report.pool_size = cfg_.pool_size;
    report.in_use = static_cast<uint32_t>(in_use_.size());
    if (report.unhealthy > 0U) {
      VIGIL_LOG_INFO("Pool", "health check: %u healthy, %u unhealthy",
                     report.healthy, report.unhealthy);
    }
    return report;
  }

  /// Destroys unhealthy or idle-expired available handles.
  uint32_t Cleanup() {
    std::lock_guard<std::mutex> lk(mtx_);
    uint32_t removed = 0U;
    for (auto it = available_.begin(); it != available_.end();) {
      if (!it->second.healthy || IsExpired(it->second)) {
        it = available_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    destroyed_ += removed;
    if (removed > 0U) {
      VIGIL_LOG_DEBUG("Pool", "cleanup removed %u resources", removed);
    }
    return removed;
  }

  /// Grows or shrinks the idle set to @p n. Loans are never revoked.
  void Resize(uint32_t n) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      cfg_.pool_size = n;
      while (available_.size() < n) {
        ResourceHandle h = CreateLocked();
        available_.emplace(h.id, std::move(h));
      }
      while (available_.size() > n) {
        available_.erase(std::prev(available_.end()));
        ++destroyed_;
      }
    }
    cv_.notify_all();
    VIGIL_LOG_INFO("Pool", "resized to %u", n);
  }

  /// Reclaims every loan. Releasing an outstanding copy afterwards is a no-op.
  uint32_t ForceReleaseAll() {
    uint32_t count = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      count = static_cast<uint32_t>(in_use_.size());
      for (auto& kv : in_use_) {
        ResourceHandle& h = kv.second;
        h.loan_id = 0U;
        if (h.healthy && !IsExpired(h) && available_.size() < cfg_.pool_size &&
            !closed_) {
          available_.emplace(h.id, std::move(h));
        } else {
          ++destroyed_;
        }
      }
      in_use_.clear();
    }
    if (count > 0U) {
      VIGIL_LOG_WARN("Pool", "force released %u resources", count);
    }
    cv_.notify_all();
    return count;
  }

  /// Refuses further acquires and wakes any waiter.
  void Close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  std::optional<ResourceHandle> GetResourceById(uint32_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = available_.find(id);
    if (it != available_.end()) return it->second;
    it = in_use_.find(id);
    if (it != in_use_.end()) return it->second;
    return std::nullopt;
  }

  bool IsInUse(uint32_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_use_.find(id) != in_use_.end();
  }

  uint32_t AvailableCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(available_.size());
  }

  uint32_t InUseCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(in_use_.size());
  }

  uint32_t TotalResources() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(available_.size() + in_use_.size());
  }

  ResourcePoolStats GetStats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    ResourcePoolStats s;
    s.pool_size = cfg_.pool_size;
    s.max_connections = cfg_.max_connections;
    s.available = static_cast<uint32_t>(available_.size());
    s.in_use = static_cast<uint32_t>(in_use_.size());
    s.total_resources = s.available + s.in_use;
    s.utilization_rate =
        cfg_.max_connections > 0U
            ? static_cast<double>(s.in_use) / cfg_.max_connections * 100.0
            : 0.0;
    const double now = SteadyNowSec();
    uint64_t usage_sum = 0U;
    double oldest = 0.0;
    double newest = -1.0;
    auto visit = [&](const ResourceHandle& h) {
      usage_sum += h.usage_count;
      const double age = now - h.created_at;
      oldest = std::max(oldest, age);
      newest = (newest < 0.0) ? age : std::min(newest, age);
    };
    for (const auto& kv : available_) visit(kv.second);
    for (const auto& kv : in_use_) visit(kv.second);
    if (s.total_resources > 0U) {
      s.average_usage = static_cast<double>(usage_sum) / s.total_resources;
      s.oldest_age = oldest;
      s.newest_age = newest;
    }
    s.created = created_;
    s.destroyed = destroyed_;
    s.exhausted = exhausted_;
    return s;
  }

  const ResourcePoolConfig& Config() const noexcept { return cfg_; }

 private:
  ResourceHandle CreateLocked() {
    ResourceHandle h;
    h.id = next_id_++;
    h.created_at = SteadyNowSec();
    h.last_used = h.created_at;
    h.conn = cfg_.connection;
    ++created_;
    return h;
  }

  /// Removes and returns the first healthy, non-expired idle handle.
  std::optional<ResourceHandle> TakeAvailableLocked() {
    for (auto it = available_.begin(); it != available_.end(); ++it) {
      if (it->second.healthy && !IsExpired(it->second)) {
        ResourceHandle h = std::move(it->second);
        available_.erase(it);
        return h;
      }
    }
    return std::nullopt;
  }

  bool IsExpired(const ResourceHandle& h) const {
    return SteadyNowSec() - h.last_used > cfg_.idle_timeout;
  }

  ResourcePoolConfig cfg_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::map<uint32_t, ResourceHandle> available_;
  std::map<uint32_t, ResourceHandle> in_use_;
  uint32_t next_id_{1U};
  uint64_t next_loan_{1U};
  bool closed_{false};
  uint64_t created_{0U};
  uint64_t destroyed_{0U};
  uint64_t exhausted_{0U};
};

}  // namespace vigil

#endif  // VIGIL_RESOURCE_POOL_HPP_
