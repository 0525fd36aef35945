#include "invocation_queue.hpp"

#include <stdexcept>

namespace fleet::invoke {

void InvocationQueue::Enqueue(InvocationTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::runtime_error("invocation queue is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<InvocationTask> InvocationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  InvocationTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void InvocationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace fleet::invoke
