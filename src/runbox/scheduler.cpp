#include <runbox/scheduler.h>

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>
#include <runbox/utils.h>

Scheduler::Scheduler(int workers, size_t queue_depth, Runner runner) :
    queue_depth_(queue_depth), runner_(std::move(runner)), stopping_(false) {
  if (workers < 1) workers = 1;
  for (int i = 0; i < workers; i++) workers_.emplace_back(&Scheduler::WorkLoop, this);
  spdlog::info("Scheduler started: workers={} queue_depth={}", workers, queue_depth);
}

Scheduler::~Scheduler() {
  Shutdown();
}

void Scheduler::WorkLoop() {
  std::unique_lock lck(mtx_);
  while (true) {
    cv_.wait(lck, [this]{ return stopping_ || !queue_.empty(); });
    if (queue_.empty()) break; // stopping and nothing left
    std::shared_ptr<Job> job = std::move(queue_.front());
    queue_.pop_front();
    long id = job->request.id;
    running_.emplace(id, job);
    spdlog::debug("Execution dispatched: id={} running={} queued={}", id, running_.size(), queue_.size());
    lck.unlock();

    ExecutionResponse resp;
    resp.id = id;
    try {
      resp.result = runner_(job->request, job->cancel);
    } catch (const std::exception& e) {
      // the default result is InternalError
      spdlog::error("Execution failed: id={} what={}", id, e.what());
    }

    lck.lock();
    // Cancel sets the flag under mtx_ while the job is in running_
    if (job->cancel.load()) {
      resp.error = ExecError::CANCELLED;
      resp.message = "cancelled while running";
    }
    running_.erase(id);
    // fulfil after the slot is released so that a caller resubmitting right away finds it free
    job->promise.set_value(std::move(resp));
  }
}

ExecutionResponse Scheduler::Submit(ExecutionRequest&& req) {
  std::future<ExecutionResponse> fut;
  {
    std::lock_guard lck(mtx_);
    if (!req.id) req.id = GetUniqueExecutionId();
    long id = req.id;
    if (stopping_) {
      return ExecutionResponse::Rejected(id, ExecError::OVERLOADED, "shutting down");
    }
    if (running_.count(id) || std::any_of(queue_.begin(), queue_.end(),
                                          [id](auto& i) { return i->request.id == id; })) {
      return ExecutionResponse::Rejected(id, ExecError::INVALID_INPUT, "duplicate execution id");
    }
    if (running_.size() + queue_.size() >= workers_.size() + queue_depth_) {
      spdlog::info("Execution rejected: id={} running={} queued={}", id, running_.size(), queue_.size());
      return ExecutionResponse::Rejected(id, ExecError::OVERLOADED, "execution queue is full");
    }
    auto job = std::make_shared<Job>(std::move(req));
    fut = job->promise.get_future();
    queue_.push_back(std::move(job));
    spdlog::info("Execution enqueued: id={} queued={}", id, queue_.size());
  }
  cv_.notify_one();
  return fut.get();
}

bool Scheduler::Cancel(long id) {
  std::lock_guard lck(mtx_);
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if ((*it)->request.id != id) continue;
    spdlog::info("Queued execution cancelled: id={}", id);
    (*it)->promise.set_value(ExecutionResponse::Rejected(id, ExecError::CANCELLED, "cancelled while queued"));
    queue_.erase(it);
    return true;
  }
  if (auto it = running_.find(id); it != running_.end()) {
    spdlog::info("Running execution cancelled: id={}", id);
    it->second->cancel = true;
    return true;
  }
  return false;
}

size_t Scheduler::QueueSize() const {
  std::lock_guard lck(mtx_);
  return queue_.size();
}

int Scheduler::Running() const {
  std::lock_guard lck(mtx_);
  return running_.size();
}

std::vector<long> Scheduler::QueuedIds() const {
  std::vector<long> ret;
  std::lock_guard lck(mtx_);
  for (auto& i : queue_) ret.push_back(i->request.id);
  return ret;
}

void Scheduler::Shutdown() {
  {
    std::lock_guard lck(mtx_);
    if (stopping_) return;
    stopping_ = true;
    for (auto& i : queue_) {
      i->promise.set_value(ExecutionResponse::Rejected(i->request.id, ExecError::CANCELLED, "shutting down"));
    }
    queue_.clear();
    for (auto& i : running_) i.second->cancel = true;
  }
  cv_.notify_all();
  for (auto& i : workers_) {
    if (i.joinable()) i.join();
  }
  spdlog::info("Scheduler stopped");
}
