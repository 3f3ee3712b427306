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
 * @file worker_pool.hpp
 * @brief WorkerPool - fixed set of threads draining one shared task queue.
 *
 * Architecture:
 *   Submit() -> task queue (mutex + condition_variable)
 *                    |
 *              Worker[0..N-1] -> task()
 *
 * Probes perform blocking network I/O, so the engine runs them here and
 * keeps its coordinating thread free. All workers pull from one queue so a
 * long-running probe never strands work queued behind it.
 *
 * Features:
 * - Bounded queue depth with admission rejection
 * - WaitIdle() for draining without shutting down
 * - Thread priority support (Linux)
 *
 * Usage:
 *   vigil::WorkerPoolConfig cfg;
 *   cfg.name = "probes";
 *   cfg.worker_num = 4;
 *
 *   vigil::WorkerPool pool(cfg);
 *   pool.Start();
 *   pool.Submit([] { RunProbe(); });
 *   pool.Shutdown();
 */

#ifndef VIGIL_WORKER_POOL_HPP_
#define VIGIL_WORKER_POOL_HPP_

#include "vigil/log.hpp"
#include "vigil/platform.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace vigil {

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultWorkerQueueDepth = 1024U;

struct WorkerPoolConfig {
  std::string name{"pool"};
  uint32_t worker_num{1U};
  uint32_t queue_depth{kDefaultWorkerQueueDepth};
  int32_t priority{0};
};

// ============================================================================
// WorkerPool Statistics
// ============================================================================

struct WorkerPoolStats {
  uint64_t dispatched{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};
  uint32_t queued{0U};
  uint32_t busy{0U};
};

// ============================================================================
// WorkerPool
// ============================================================================

class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(const WorkerPoolConfig& cfg)
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        queue_depth_(cfg.queue_depth > 0U ? cfg.queue_depth
                                          : kDefaultWorkerQueueDepth),
        priority_(cfg.priority) {}

  ~WorkerPool() {
    if (running_.load(std::memory_order_acquire)) {
      Shutdown();
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_ = false;
    running_.store(true, std::memory_order_release);
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
    VIGIL_LOG_DEBUG("Worker", "pool '%s' started with %u workers",
                    name_.c_str(), worker_num_);
  }

  /**
   * @brief Stop accepting tasks, drain the queue, join all threads.
   */
  void Shutdown() {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      shutdown_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
    running_.store(false, std::memory_order_release);
    VIGIL_LOG_DEBUG("Worker", "pool '%s' stopped (processed=%lu)",
                    name_.c_str(),
                    static_cast<unsigned long>(
                        processed_.load(std::memory_order_relaxed)));
  }

  // ======================== Submit API ========================

  /**
   * @brief Queue a task for execution on a worker thread.
   * @return false if the pool is not running or the queue is full.
   */
  bool Submit(Task task) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!running_.load(std::memory_order_acquire) || shutdown_ ||
          queue_.size() >= queue_depth_) {
        rejected_.fetch_add(1U, std::memory_order_relaxed);
        return false;
      }
      queue_.push_back(std::move(task));
    }
    dispatched_.fetch_add(1U, std::memory_order_release);
    work_cv_.notify_one();
    return true;
  }

  /// Blocks until the queue is empty and no task is executing.
  void WaitIdle() {
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [this] { return queue_.empty() && busy_ == 0U; });
  }

  // ======================== Query ========================

  WorkerPoolStats GetStats() const {
    WorkerPoolStats s;
    s.dispatched = dispatched_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(mtx_);
    s.queued = static_cast<uint32_t>(queue_.size());
    s.busy = busy_;
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

 private:
  // ======================== Worker thread ========================

  void WorkerLoop() {
    SetThreadPriority(priority_);
    while (true) {
      Task task;
      {
        std::unique_lock<std::mutex> lk(mtx_);
        work_cv_.wait(lk, [this] { return shutdown_ || !queue_.empty(); });
        if (queue_.empty()) {
          return;  // shutdown with nothing left to drain
        }
        task = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;
      }
      task();
      processed_.fetch_add(1U, std::memory_order_release);
      {
        std::lock_guard<std::mutex> lk(mtx_);
        --busy_;
        if (queue_.empty() && busy_ == 0U) {
          idle_cv_.notify_all();
        }
      }
    }
  }

  // ======================== Platform helpers ========================

  static void SetThreadPriority(int32_t prio) noexcept {
#ifdef __linux__
    if (prio > 0) {
      struct sched_param param{};
      param.sched_priority = (prio > 99) ? 99 : prio;
      (void)pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    } else if (prio < 0) {
      struct sched_param param{};
      param.sched_priority = 0;
      (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
    }
#else
    (void)prio;
#endif
  }

  // ======================== Data members ========================

  const std::string name_;
  const uint32_t worker_num_;
  const uint32_t queue_depth_;
  const int32_t priority_;

  mutable std::mutex mtx_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  uint32_t busy_{0U};
  bool shutdown_{false};

  std::atomic<bool> running_{false};
  alignas(kCacheLineSize) std::atomic<uint64_t> dispatched_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> rejected_{0U};

  std::vector<std::thread> threads_;
};

}  // namespace vigil

#endif  // VIGIL_WORKER_POOL_HPP_
