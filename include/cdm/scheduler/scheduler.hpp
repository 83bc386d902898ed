#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "cdm/core/expected.hpp"

namespace cdm {

struct Job {
  uint64_t seq{};
  std::string path{};
};

using JobHandler = std::function<void(const Job&)>;

struct SchedulerConfig {
  uint32_t worker_threads{};
  uint32_t queue_depth{};
  JobHandler handler{};
};

// Bounded worker pool. submit() blocks while the queue is full; drain() waits
// until every accepted job has run and reports the first handler failure.
class IScheduler {
 public:
  virtual ~IScheduler() = default;

  virtual Expected<void> start() noexcept = 0;
  virtual Expected<void> submit(Job job) noexcept = 0;
  virtual Expected<void> stop_issue_new_work() noexcept = 0;
  virtual Expected<void> drain() noexcept = 0;
  virtual Expected<void> join() noexcept = 0;
  virtual uint64_t processed() const noexcept = 0;
};

Expected<std::unique_ptr<IScheduler>> make_scheduler(SchedulerConfig cfg) noexcept;

}  // namespace cdm
