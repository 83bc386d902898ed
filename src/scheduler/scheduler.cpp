#include "cdm/scheduler/scheduler.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "cdm/core/error.hpp"

namespace cdm {
namespace {

class BasicScheduler final : public IScheduler {
 public:
  explicit BasicScheduler(SchedulerConfig cfg)
      : handler_(std::move(cfg.handler)),
        queue_depth_(cfg.queue_depth == 0 ? 1u : cfg.queue_depth),
        worker_threads_(cfg.worker_threads == 0 ? 1u : cfg.worker_threads) {}

  ~BasicScheduler() override { static_cast<void>(join()); }

  Expected<void> start() noexcept override {
    {
      std::scoped_lock lock(mu_);
      if (started_) {
        return {};
      }
      accepting_ = true;
      stopping_ = false;
      started_ = true;
    }

    struct ThreadJoinGuard {
      explicit ThreadJoinGuard(std::vector<std::thread>& workers, BasicScheduler& owner)
          : workers_(workers), owner_(owner) {}

      ~ThreadJoinGuard() {
        if (!active_) {
          return;
        }
        {
          std::scoped_lock lock(owner_.mu_);
          owner_.stopping_ = true;
          owner_.started_ = false;
        }
        owner_.cv_not_empty_.notify_all();
        for (auto& thread : workers_) {
          if (thread.joinable()) {
            thread.join();
          }
        }
      }

      void release() noexcept { active_ = false; }

     private:
      std::vector<std::thread>& workers_;
      BasicScheduler& owner_;
      bool active_{true};
    };

    std::vector<std::thread> local_workers;
    ThreadJoinGuard join_guard{local_workers, *this};
    try {
      local_workers.reserve(worker_threads_);
      for (uint32_t i = 0; i < worker_threads_; ++i) {
        local_workers.emplace_back([this]() { this->worker_loop(); });
      }
    } catch (const std::exception& ex) {
      return std::unexpected(Error{ErrorCode::Internal, ex.what()});
    }

    {
      std::scoped_lock lock(mu_);
      workers_ = std::move(local_workers);
    }
    join_guard.release();
    return {};
  }

  Expected<void> submit(Job job) noexcept override {
    try {
      std::unique_lock lock(mu_);
      if (!started_) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "scheduler has not started"});
      }
      if (!accepting_) {
        return std::unexpected(
            Error{ErrorCode::Unsupported, "scheduler is not accepting new jobs"});
      }

      cv_not_full_.wait(lock, [this]() {
        return queue_.size() < queue_depth_ || stopping_ || !accepting_;
      });
      if (stopping_ || !accepting_) {
        return std::unexpected(Error{ErrorCode::Unsupported, "scheduler is stopping"});
      }

      queue_.push_back(std::move(job));
      cv_not_empty_.notify_one();
      return {};
    } catch (const std::exception& ex) {
      return std::unexpected(Error{ErrorCode::Internal, ex.what()});
    }
  }

  Expected<void> stop_issue_new_work() noexcept override {
    std::scoped_lock lock(mu_);
    accepting_ = false;
    cv_not_full_.notify_all();
    return {};
  }

  Expected<void> drain() noexcept override {
    std::unique_lock lock(mu_);
    if (!started_) {
      return std::unexpected(Error{ErrorCode::InvalidArgument, "scheduler has not started"});
    }
    cv_drained_.wait(lock, [this]() { return queue_.empty() && in_flight_ == 0; });
    if (failure_) {
      return std::unexpected(*failure_);
    }
    return {};
  }

  Expected<void> join() noexcept override {
    std::vector<std::thread> local_workers;
    {
      std::scoped_lock lock(mu_);
      if (!started_) {
        return {};
      }
      accepting_ = false;
      stopping_ = true;
      local_workers.swap(workers_);
      queue_.clear();
      started_ = false;
    }

    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
    cv_drained_.notify_all();

    for (auto& t : local_workers) {
      if (t.joinable()) {
        t.join();
      }
    }
    return {};
  }

  uint64_t processed() const noexcept override {
    std::scoped_lock lock(mu_);
    return processed_count_;
  }

 private:
  void worker_loop() {
    for (;;) {
      Job job{};
      {
        std::unique_lock lock(mu_);
        cv_not_empty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) {
          return;
        }
        job = std::move(queue_.front());
        queue_.pop_front();
        ++in_flight_;
        cv_not_full_.notify_one();
      }

      std::optional<Error> failure;
      try {
        handler_(job);
      } catch (const Error& e) {
        failure = e;
      } catch (const std::exception& ex) {
        failure = Error{ErrorCode::Internal, ex.what()};
      }

      {
        std::scoped_lock lock(mu_);
        --in_flight_;
        ++processed_count_;
        if (failure && !failure_) {
          failure_ = std::move(failure);
        }
        if (queue_.empty() && in_flight_ == 0) {
          cv_drained_.notify_all();
        }
      }
    }
  }

  JobHandler handler_;
  size_t queue_depth_{1};
  uint32_t worker_threads_{1};

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
  std::condition_variable cv_drained_;

  std::deque<Job> queue_;
  std::vector<std::thread> workers_;
  size_t in_flight_{0};
  uint64_t processed_count_{0};
  std::optional<Error> failure_;

  bool started_{false};
  bool accepting_{false};
  bool stopping_{false};
};

}  // namespace

Expected<std::unique_ptr<IScheduler>> make_scheduler(SchedulerConfig cfg) noexcept {
  if (cfg.worker_threads == 0) {
    return std::unexpected(Error{ErrorCode::InvalidArgument, "worker_threads must be > 0"});
  }
  if (cfg.queue_depth == 0) {
    return std::unexpected(Error{ErrorCode::InvalidArgument, "queue_depth must be > 0"});
  }
  if (!cfg.handler) {
    return std::unexpected(Error{ErrorCode::InvalidArgument, "job handler must be set"});
  }
  try {
    return std::unique_ptr<IScheduler>(std::make_unique<BasicScheduler>(std::move(cfg)));
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

}  // namespace cdm
