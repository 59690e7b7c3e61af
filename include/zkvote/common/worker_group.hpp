#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace zkvote {

// One dedicated thread per submitted task. Used where every task blocks for most of its life
// (a connection worker, a client session), so a bounded pool would starve later tasks.
class WorkerGroup {
 public:
  WorkerGroup() = default;

  ~WorkerGroup() {
    JoinAll();
  }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;
  WorkerGroup(WorkerGroup&&) = delete;
  WorkerGroup& operator=(WorkerGroup&&) = delete;

  template <typename Fn>
  auto Spawn(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(mu_);
    ReapFinishedLocked();
    workers_.push_back(Worker{
        .thread = std::thread([task, done]() {
          (*task)();
          done->store(true);
        }),
        .done = done,
    });
    return future;
  }

  size_t active_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t active = 0;
    for (const Worker& worker : workers_) {
      if (!worker.done->load()) {
        ++active;
      }
    }
    return active;
  }

  void JoinAll() {
    std::vector<Worker> workers;
    {
      std::lock_guard<std::mutex> lock(mu_);
      workers.swap(workers_);
    }
    for (Worker& worker : workers) {
      if (worker.thread.joinable()) {
        worker.thread.join();
      }
    }
  }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ReapFinishedLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load()) {
        if (it->thread.joinable()) {
          it->thread.join();
        }
        it = workers_.erase(it);
        continue;
      }
      ++it;
    }
  }

  mutable std::mutex mu_;
  std::vector<Worker> workers_;
};

}  // namespace zkvote
