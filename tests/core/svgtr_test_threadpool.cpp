// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

TEST_CASE("ThreadPool runs fire-and-forget tasks", "[threadpool]")
{
  std::atomic<int> counter{0};
  {
    svgtr::core::ThreadPool pool(2, 4);
    REQUIRE(pool.getThreadCount() == 2);
    for (int i = 0; i < 10; ++i)
    {
      pool.enqueue([&counter]() { counter.fetch_add(1); });
    }
    pool.shutdown();
  }
  REQUIRE(counter == 10);
}

TEST_CASE("ThreadPool task with future result", "[threadpool][future]")
{
  svgtr::core::ThreadPool pool(2);

  auto future = pool.enqueueWithResult([](int a, int b) { return a * b; }, 6, 7);
  REQUIRE(future.get() == 42);

  SECTION("Exceptions travel through the future")
  {
    auto failing = pool.enqueueWithResult([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
  }
}

TEST_CASE("ThreadPool reports exceptions of void tasks", "[threadpool][errors]")
{
  std::atomic<int> errors{0};
  svgtr::core::ThreadPool pool(1, 0,
                               [&errors](std::exception_ptr ep)
                               {
                                 try
                                 {
                                   std::rethrow_exception(ep);
                                 }
                                 catch (const std::runtime_error &)
                                 {
                                   errors.fetch_add(1);
                                 }
                               });

  pool.enqueue([]() { throw std::runtime_error("task failed"); });
  std::atomic<bool> ran{false};
  pool.enqueue([&ran]() { ran = true; });
  pool.shutdown();

  REQUIRE(errors == 1);
  REQUIRE(ran);
}

TEST_CASE("ThreadPool shutdown drains the queue", "[threadpool][lifecycle]")
{
  std::atomic<int> completed{0};
  svgtr::core::ThreadPool pool(1);
  for (int i = 0; i < 5; ++i)
  {
    pool.enqueue(
      [&completed]()
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        completed.fetch_add(1);
      });
  }
  pool.shutdown();
  REQUIRE(completed == 5);
  REQUIRE(pool.getPendingTaskCount() == 0);

  SECTION("Shutdown is idempotent and rejects new work")
  {
    pool.shutdown();
    REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);
  }
}

TEST_CASE("ThreadPool zero size still gets one worker", "[threadpool]")
{
  svgtr::core::ThreadPool pool(0);
  REQUIRE(pool.getThreadCount() == 1);
  REQUIRE(pool.enqueueWithResult([]() { return std::string("ok"); }).get() == "ok");
}
