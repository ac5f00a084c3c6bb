// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include <svgtr/core/logger.hpp>

namespace svgtr
{
namespace core
{

/// A fixed-size thread pool for document batches. Accepts void or
/// result-returning callables. Exceptions escaping void tasks are reported
/// to the error handler; result tasks deliver them through their future.
class ThreadPool
{
public:
  /// Constructs the pool.
  ///
  /// @param size          Number of worker threads (at least one).
  /// @param maxQueueSize  Maximum number of queued tasks; 0 means unbounded.
  /// @param onTaskError   Optional handler for uncaught exceptions in void
  /// tasks.
  explicit ThreadPool(std::size_t size = std::thread::hardware_concurrency(),
                      std::size_t maxQueueSize = 0,
                      std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _maxQueueSize(maxQueueSize), _onTaskError(std::move(onTaskError))
  {
    if (size == 0)
    {
      size = 1;
    }
    _workers.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
    {
      _workers.emplace_back([this]() { workerLoop(); });
    }
    SVGTR_LOG_DEBUG("ThreadPool started with " << size << " workers");
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Enqueue a fire-and-forget task with arguments.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    enqueueImpl(
      [bound = std::move(bound), this]() mutable
      {
        try
        {
          bound();
        }
        catch (...)
        {
          std::function<void(std::exception_ptr)> handlerCopy;
          {
            std::lock_guard<std::mutex> lock(_mutex);
            handlerCopy = _onTaskError;
          }
          if (handlerCopy)
          {
            handlerCopy(std::current_exception());
          }
          else
          {
            SVGTR_LOG_ERROR("ThreadPool: unhandled exception in void task");
          }
        }
      });
  }

  /// Enqueue a task that returns a value and get a future for it.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  void setTaskErrorHandler(std::function<void(std::exception_ptr)> handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _onTaskError = std::move(handler);
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getThreadCount() const { return _workers.size(); }

  /// Stop accepting tasks, run everything already queued, and join all
  /// workers. Safe to call more than once.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    _condition.notify_all();
    _spaceAvailable.notify_all();
    for (auto &worker : _workers)
    {
      if (worker.joinable())
      {
        worker.join();
      }
    }
    SVGTR_LOG_DEBUG("ThreadPool shut down");
  }

private:
  void enqueueImpl(std::function<void()> task)
  {
    {
      std::unique_lock<std::mutex> lock(_mutex);
      if (_maxQueueSize > 0)
      {
        _spaceAvailable.wait(lock,
                             [this]() { return _shutdown || _tasks.size() < _maxQueueSize; });
      }
      if (_shutdown)
      {
        throw std::runtime_error("ThreadPool: enqueue on stopped pool");
      }
      _tasks.push(std::move(task));
    }
    _condition.notify_one();
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait(lock, [this]() { return _shutdown || !_tasks.empty(); });
        if (_tasks.empty())
        {
          return; // shutdown with drained queue
        }
        task = std::move(_tasks.front());
        _tasks.pop();
      }
      _spaceAvailable.notify_one();
      task();
    }
  }

  std::vector<std::thread> _workers;
  std::queue<std::function<void()>> _tasks;
  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::condition_variable _spaceAvailable;
  std::size_t _maxQueueSize;
  bool _shutdown{false};
  std::function<void(std::exception_ptr)> _onTaskError;
};

} // namespace core
} // namespace svgtr
