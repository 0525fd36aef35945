#include "invocation_pool.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fleet::invoke {

InvocationPool::InvocationPool(std::shared_ptr<const ModuleChannel> channel, size_t max_parallel)
    : channel_(std::move(channel)) {
  if (max_parallel == 0) throw std::invalid_argument("max_parallel must be positive");

  workers_.reserve(max_parallel);
  for (size_t i = 0; i < max_parallel; ++i) {
    workers_.emplace_back(&InvocationPool::Run, this);
  }
}

InvocationPool::~InvocationPool() {
  Stop();
}

void InvocationPool::Stop() {
  if (stopped_.exchange(true)) return;

  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

std::future<fleet::v1::ModuleCallResult> InvocationPool::Submit(InvocationRequest request) {
  InvocationTask task;
  task.request = std::move(request);
  auto future  = task.promise.get_future();
  queue_.Enqueue(std::move(task));
  return future;
}

std::vector<fleet::v1::ModuleCallResult> InvocationPool::RunAll(std::vector<InvocationRequest> requests) {
  std::vector<std::future<fleet::v1::ModuleCallResult>> futures;
  futures.reserve(requests.size());
  for (auto& request : requests) {
    futures.push_back(Submit(std::move(request)));
  }

  std::vector<fleet::v1::ModuleCallResult> results;
  results.reserve(futures.size());
  for (auto& future : futures) {
    results.push_back(future.get());
  }
  return results;
}

void InvocationPool::Run() {
  for (;;) {
    auto task = queue_.Dequeue();
    if (!task) break;

    const size_t running = ++in_flight_;
    size_t       peak    = peak_in_flight_.load();
    while (running > peak && !peak_in_flight_.compare_exchange_weak(peak, running)) {
    }

    try {
      const auto& req = task->request;
      task->promise.set_value(channel_->Invoke(req.executable, req.arguments, req.timeout, req.argv));
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Module invocation could not start", {observability::StringField("module", task->request.executable),
                                                            observability::StringField("error", e.what())});
      task->promise.set_exception(std::current_exception());
    }

    --in_flight_;
  }
}

} // namespace fleet::invoke
