#include <mutex>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include <condition_variable>
#include <algorithm>
#include <stdexcept>
#include <gtest/gtest.h>
#include <runbox/scheduler.h>

namespace {

using Clock = std::chrono::steady_clock;

template <class Pred>
bool WaitFor(Pred&& pred, int timeout_ms = 5000) {
  auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!pred()) {
    if (Clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

ExecutionRequest MakeRequest(long id) {
  ExecutionRequest req;
  req.id = id;
  req.language = "test";
  return req;
}

ExecutionResult Success() {
  ExecutionResult ret;
  ret.status = ExecStatus::SUCCESS;
  ret.termination = Termination::EXITED;
  return ret;
}

// runner that holds every job until released
class Gate {
  std::mutex mtx_;
  std::condition_variable cv_;
  bool open_ = false;
 public:
  void Open() {
    {
      std::lock_guard lck(mtx_);
      open_ = true;
    }
    cv_.notify_all();
  }
  void Wait() {
    std::unique_lock lck(mtx_);
    cv_.wait(lck, [this]{ return open_; });
  }
};

} // namespace

TEST(Scheduler, AssignsId) {
  Scheduler sched(1, 0, [](const ExecutionRequest&, const std::atomic_bool&) { return Success(); });
  EXPECT_EQ(sched.Workers(), 1);
  ExecutionResponse resp = sched.Submit(MakeRequest(0));
  ASSERT_TRUE(resp.Ok());
  EXPECT_NE(resp.id, 0);
  EXPECT_EQ(resp.result.status, ExecStatus::SUCCESS);
}

TEST(Scheduler, OverloadedBeyondCapacity) {
  constexpr int kWorkers = 3, kExtra = 5;
  std::mutex mtx;
  std::vector<std::pair<Clock::time_point, Clock::time_point>> spans;
  Scheduler sched(kWorkers, 0, [&](const ExecutionRequest&, const std::atomic_bool&) {
    auto start = Clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    std::lock_guard lck(mtx);
    spans.emplace_back(start, Clock::now());
    return Success();
  });
  std::vector<std::future<ExecutionResponse>> futs;
  for (int i = 0; i < kWorkers + kExtra; i++) {
    futs.push_back(std::async(std::launch::async, [&sched, i] { return sched.Submit(MakeRequest(100 + i)); }));
  }
  int ok = 0, overloaded = 0;
  for (auto& fut : futs) {
    ExecutionResponse resp = fut.get();
    if (resp.Ok()) {
      ok++;
    } else {
      EXPECT_EQ(resp.error, ExecError::OVERLOADED);
      overloaded++;
    }
  }
  EXPECT_EQ(ok, kWorkers);
  EXPECT_EQ(overloaded, kExtra);
  ASSERT_EQ(spans.size(), (size_t)kWorkers);
  // accepted executions ran concurrently
  auto latest_start = std::max_element(spans.begin(), spans.end())->first;
  auto earliest_end = std::min_element(spans.begin(), spans.end(),
      [](auto& a, auto& b) { return a.second < b.second; })->second;
  EXPECT_LT(latest_start, earliest_end);
}

TEST(Scheduler, QueueIsFifo) {
  Gate gate;
  std::mutex mtx;
  std::vector<long> order;
  Scheduler sched(1, 8, [&](const ExecutionRequest& req, const std::atomic_bool&) {
    gate.Wait();
    std::lock_guard lck(mtx);
    order.push_back(req.id);
    return Success();
  });
  std::vector<std::future<ExecutionResponse>> futs;
  futs.push_back(std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(1)); }));
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  for (long id = 2; id <= 5; id++) {
    futs.push_back(std::async(std::launch::async, [&sched, id] { return sched.Submit(MakeRequest(id)); }));
    ASSERT_TRUE(WaitFor([&] { return sched.QueueSize() == (size_t)(id - 1); }));
  }
  EXPECT_EQ(sched.QueuedIds(), (std::vector<long>{2, 3, 4, 5}));
  gate.Open();
  for (auto& fut : futs) EXPECT_TRUE(fut.get().Ok());
  EXPECT_EQ(order, (std::vector<long>{1, 2, 3, 4, 5}));
  EXPECT_EQ(sched.QueueSize(), 0u);
}

TEST(Scheduler, QueueFullIsOverloaded) {
  Gate gate;
  Scheduler sched(1, 1, [&](const ExecutionRequest&, const std::atomic_bool&) {
    gate.Wait();
    return Success();
  });
  auto first = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(1)); });
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  auto second = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(2)); });
  ASSERT_TRUE(WaitFor([&] { return sched.QueueSize() == 1; }));
  ExecutionResponse third = sched.Submit(MakeRequest(3));
  EXPECT_EQ(third.error, ExecError::OVERLOADED);
  EXPECT_EQ(third.id, 3);
  gate.Open();
  EXPECT_TRUE(first.get().Ok());
  EXPECT_TRUE(second.get().Ok());
}

TEST(Scheduler, DuplicateId) {
  Gate gate;
  Scheduler sched(2, 2, [&](const ExecutionRequest&, const std::atomic_bool&) {
    gate.Wait();
    return Success();
  });
  auto first = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(7)); });
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  ExecutionResponse dup = sched.Submit(MakeRequest(7));
  EXPECT_EQ(dup.error, ExecError::INVALID_INPUT);
  gate.Open();
  EXPECT_TRUE(first.get().Ok());
}

TEST(Scheduler, CancelQueued) {
  Gate gate;
  std::atomic_int runs{0};
  Scheduler sched(1, 4, [&](const ExecutionRequest&, const std::atomic_bool&) {
    runs++;
    gate.Wait();
    return Success();
  });
  auto first = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(1)); });
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  auto second = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(2)); });
  ASSERT_TRUE(WaitFor([&] { return sched.QueueSize() == 1; }));

  EXPECT_TRUE(sched.Cancel(2));
  // answered before the worker is free
  ASSERT_EQ(second.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  ExecutionResponse resp = second.get();
  EXPECT_EQ(resp.error, ExecError::CANCELLED);
  EXPECT_EQ(resp.id, 2);
  EXPECT_EQ(sched.QueueSize(), 0u);
  EXPECT_FALSE(sched.Cancel(2));

  gate.Open();
  EXPECT_TRUE(first.get().Ok());
  EXPECT_EQ(runs, 1);
}

TEST(Scheduler, CancelRunning) {
  Scheduler sched(1, 0, [](const ExecutionRequest&, const std::atomic_bool& cancel) {
    while (!cancel) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ExecutionResult ret;
    ret.status = ExecStatus::RUNTIME_ERROR;
    ret.termination = Termination::CANCELLED;
    ret.stdout_data = "partial";
    return ret;
  });
  auto fut = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(9)); });
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  EXPECT_TRUE(sched.Cancel(9));
  ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  ExecutionResponse resp = fut.get();
  EXPECT_EQ(resp.error, ExecError::CANCELLED);
  EXPECT_EQ(resp.result.termination, Termination::CANCELLED);
  EXPECT_EQ(resp.result.stdout_data, "partial");
  EXPECT_EQ(sched.Running(), 0);
}

// a cancel that was accepted always shows in the response, even if it races the runner's return
TEST(Scheduler, AcceptedCancelIsReported) {
  Scheduler sched(1, 0, [](const ExecutionRequest&, const std::atomic_bool&) { return Success(); });
  for (long id = 1; id <= 200; id++) {
    std::atomic_bool done{false};
    auto fut = std::async(std::launch::async, [&sched, &done, id] {
      ExecutionResponse ret = sched.Submit(MakeRequest(id));
      done = true;
      return ret;
    });
    bool accepted = false;
    while (!done && !accepted) accepted = sched.Cancel(id);
    ExecutionResponse resp = fut.get();
    if (accepted) EXPECT_EQ(resp.error, ExecError::CANCELLED) << "id=" << id;
  }
}

TEST(Scheduler, CancelUnknown) {
  Scheduler sched(1, 0, [](const ExecutionRequest&, const std::atomic_bool&) { return Success(); });
  EXPECT_FALSE(sched.Cancel(12345));
}

TEST(Scheduler, RunnerThrows) {
  Scheduler sched(1, 0, [](const ExecutionRequest& req, const std::atomic_bool&) -> ExecutionResult {
    if (req.id == 1) throw std::runtime_error("boom");
    return Success();
  });
  ExecutionResponse resp = sched.Submit(MakeRequest(1));
  EXPECT_TRUE(resp.Ok());
  EXPECT_EQ(resp.result.status, ExecStatus::INTERNAL_ERROR);
  // the worker survives
  EXPECT_EQ(sched.Submit(MakeRequest(2)).result.status, ExecStatus::SUCCESS);
}

TEST(Scheduler, Shutdown) {
  Scheduler sched(1, 4, [](const ExecutionRequest&, const std::atomic_bool& cancel) {
    while (!cancel) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return ExecutionResult();
  });
  auto running = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(1)); });
  ASSERT_TRUE(WaitFor([&] { return sched.Running() == 1; }));
  auto queued = std::async(std::launch::async, [&] { return sched.Submit(MakeRequest(2)); });
  ASSERT_TRUE(WaitFor([&] { return sched.QueueSize() == 1; }));

  sched.Shutdown();
  EXPECT_EQ(running.get().error, ExecError::CANCELLED);
  EXPECT_EQ(queued.get().error, ExecError::CANCELLED);
  EXPECT_EQ(sched.Submit(MakeRequest(3)).error, ExecError::OVERLOADED);
}
