// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <kvdns/core/logger.hpp>

namespace kvdns
{
namespace core
{

/// A bounded, dynamically sized thread pool.
///
/// At most maxSize workers run and at most maxQueueSize tasks wait for a
/// busy worker, so the number of tasks in flight never exceeds
/// maxSize + maxQueueSize. A maxQueueSize of 0 accepts a task only when a
/// worker is free to take it. Workers above initialSize exit after
/// idleTimeout without work.
class ThreadPool
{
public:
  /// @param initialSize   Workers started up front and always kept.
  /// @param maxSize       Hard limit on workers.
  /// @param idleTimeout   Idle time after which extra workers exit.
  /// @param maxQueueSize  Waiting tasks before submissions are rejected.
  /// @param onTaskError   Receives exceptions escaping a task; when unset
  ///                      they are logged.
  ThreadPool(std::size_t initialSize = std::thread::hardware_concurrency(),
             std::size_t maxSize = std::thread::hardware_concurrency() * 4,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(30),
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _initialSize(initialSize), _maxSize(std::max<std::size_t>(maxSize, 1)),
        _idleTimeout(idleTimeout), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _initialSize && i < _maxSize; ++i)
    {
      spawnWorker();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Enqueue a fire-and-forget task.
  /// \throws std::runtime_error when the queue is full or the pool is
  /// shutting down.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    push(std::bind(std::forward<F>(func), std::forward<Args>(args)...), true);
  }

  /// Enqueue a fire-and-forget task; returns false instead of throwing when
  /// the task is rejected.
  template <typename F, typename... Args> bool tryEnqueue(F &&func, Args &&...args)
  {
    return push(std::bind(std::forward<F>(func), std::forward<Args>(args)...), false);
  }

  /// Enqueue a task and get a future for its result.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    push([task]() { (*task)(); }, true);
    return future;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  /// Workers currently executing a task.
  std::size_t getActiveThreadCount() const { return _activeThreads.load(); }

  /// Workers alive (busy or idle).
  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _liveThreads;
  }

  std::size_t getMaxQueueSize() const { return _maxQueueSize; }
  std::size_t getMaxThreadCount() const { return _maxSize; }

  /// Stop accepting tasks, run what is already queued, then join all workers.
  void shutdown()
  {
    std::unordered_map<std::thread::id, std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    _condition.notify_all();

    {
      std::lock_guard<std::mutex> lock(_mutex);
      threads.swap(_threads);
    }

    for (auto &entry : threads)
    {
      if (!entry.second.joinable())
      {
        continue;
      }
      if (entry.first == std::this_thread::get_id())
      {
        // shutdown() called from inside a task
        entry.second.detach();
        continue;
      }
      entry.second.join();
    }
    Logger::debug("ThreadPool::shutdown() - " + std::to_string(threads.size()) +
                  " workers stopped");
  }

private:
  bool push(std::function<void()> task, bool throwOnReject)
  {
    std::vector<std::thread> reaped;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool is shutting down");
        }
        return false;
      }

      // Tasks an idle or not yet started worker will pick up do not count
      // against the queue bound
      const std::size_t takers = _idleThreads + (_maxSize - _liveThreads);
      if (_tasks.size() >= _maxQueueSize + takers)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool task queue is full");
        }
        return false;
      }

      _tasks.emplace(std::move(task));

      if (_idleThreads < _tasks.size() && _liveThreads < _maxSize)
      {
        reapFinished(reaped);
        spawnWorker();
      }
    }

    _condition.notify_one();

    for (auto &t : reaped)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
    return true;
  }

  /// Caller holds _mutex.
  void spawnWorker()
  {
    std::thread t([this]() { workerLoop(); });
    auto id = t.get_id();
    _threads.emplace(id, std::move(t));
    ++_liveThreads;
  }

  /// Move the thread objects of workers that already left workerLoop() out
  /// of the map. Caller holds _mutex and joins them after unlocking.
  void reapFinished(std::vector<std::thread> &reaped)
  {
    for (const auto &id : _finished)
    {
      auto it = _threads.find(id);
      if (it != _threads.end())
      {
        reaped.push_back(std::move(it->second));
        _threads.erase(it);
      }
    }
    _finished.clear();
  }

  void workerLoop()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    while (true)
    {
      ++_idleThreads;
      bool ready = _condition.wait_for(lock, _idleTimeout,
                                       [this]() { return _shutdown || !_tasks.empty(); });
      --_idleThreads;

      if (!ready)
      {
        if (_liveThreads > _initialSize)
        {
          --_liveThreads;
          _finished.push_back(std::this_thread::get_id());
          return;
        }
        continue;
      }

      if (_tasks.empty())
      {
        // Shutdown with nothing left to run
        --_liveThreads;
        return;
      }

      std::function<void()> task = std::move(_tasks.front());
      _tasks.pop();
      ++_activeThreads;
      lock.unlock();

      runTask(task);
      // Release captures before the task counts as finished
      task = nullptr;

      lock.lock();
      --_activeThreads;
    }
  }

  void runTask(const std::function<void()> &task)
  {
    try
    {
      task();
    }
    catch (...)
    {
      reportTaskError(std::current_exception());
    }
  }

  void reportTaskError(std::exception_ptr error)
  {
    if (_onTaskError)
    {
      _onTaskError(error);
      return;
    }

    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      Logger::error(std::string("ThreadPool task failed: ") + e.what());
    }
    catch (...)
    {
      Logger::error("ThreadPool task failed with a non-standard exception");
    }
  }

  std::unordered_map<std::thread::id, std::thread> _threads;
  std::vector<std::thread::id> _finished;
  std::queue<std::function<void()>> _tasks;
  mutable std::mutex _mutex;
  std::condition_variable _condition;

  const std::size_t _initialSize;
  const std::size_t _maxSize;
  const std::chrono::milliseconds _idleTimeout;
  const std::size_t _maxQueueSize;
  const std::function<void(std::exception_ptr)> _onTaskError;

  bool _shutdown{false};
  std::size_t _liveThreads{0};
  std::size_t _idleThreads{0};
  std::atomic<std::size_t> _activeThreads{0};
};

} // namespace core
} // namespace kvdns
