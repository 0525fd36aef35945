#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "internal/invoke/invocation_queue.hpp"
#include "internal/invoke/module_channel.hpp"

namespace fleet::invoke {

/*
  Runs module invocations on a fixed number of worker threads, so at most
  max_parallel child processes exist at once. Workers start on construction
  and are joined by Stop() or the destructor; queued work is finished first.
*/
class InvocationPool {
 public:
  InvocationPool(std::shared_ptr<const ModuleChannel> channel, size_t max_parallel);
  ~InvocationPool();

  InvocationPool(const InvocationPool&)            = delete;
  InvocationPool& operator=(const InvocationPool&) = delete;

  std::future<fleet::v1::ModuleCallResult> Submit(InvocationRequest request);

  // Results in request order.
  std::vector<fleet::v1::ModuleCallResult> RunAll(std::vector<InvocationRequest> requests);

  void Stop();

  size_t max_parallel() const {
    return workers_.size();
  }

  // Highest number of invocations observed running at the same time.
  size_t peak_in_flight() const {
    return peak_in_flight_.load();
  }

 private:
  void Run();

  std::shared_ptr<const ModuleChannel> channel_;
  InvocationQueue                      queue_;
  std::vector<std::thread>             workers_;

  std::atomic<size_t> in_flight_{0};
  std::atomic<size_t> peak_in_flight_{0};
  std::atomic<bool>   stopped_{false};
};

} // namespace fleet::invoke
