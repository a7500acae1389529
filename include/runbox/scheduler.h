#ifndef INCLUDE_RUNBOX_SCHEDULER_H_
#define INCLUDE_RUNBOX_SCHEDULER_H_

#include <list>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <vector>
#include <functional>
#include <unordered_map>
#include <condition_variable>

#include "execution.h"

// Fixed-size worker pool with a bounded FIFO admission queue.
// Submit blocks the caller until its request is finished, rejected or cancelled.
class Scheduler {
 public:
  // Runs one execution end-to-end; must return only after the sandbox is torn down
  using Runner = std::function<ExecutionResult(const ExecutionRequest&, const std::atomic_bool& cancel)>;

  Scheduler(int workers, size_t queue_depth, Runner runner);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Called from any thread; never blocks on admission
  ExecutionResponse Submit(ExecutionRequest&&);
  // Queued: removed and answered Cancelled immediately.
  // Running: the sandbox is asked to terminate; the caller still receives the result.
  // Returns false if no such request is known.
  bool Cancel(long id);

  size_t QueueSize() const;
  int Running() const;
  std::vector<long> QueuedIds() const;
  int Workers() const { return (int)workers_.size(); }

  // Queued requests are answered Cancelled, running ones are cancelled and awaited
  void Shutdown();

 private:
  struct Job {
    ExecutionRequest request;
    std::atomic_bool cancel;
    std::promise<ExecutionResponse> promise;

    explicit Job(ExecutionRequest&& req) : request(std::move(req)), cancel(false) {}
  };

  void WorkLoop();

  const size_t queue_depth_;
  const Runner runner_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::list<std::shared_ptr<Job>> queue_;
  std::unordered_map<long, std::shared_ptr<Job>> running_;
  bool stopping_;
  std::vector<std::thread> workers_;
};

#endif  // INCLUDE_RUNBOX_SCHEDULER_H_
