#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "fleet/v1/module.pb.h"

namespace fleet::invoke {

struct InvocationRequest {
  std::string               executable;
  google::protobuf::Struct  arguments;
  std::chrono::milliseconds timeout{0};
  std::vector<std::string>  argv;
};

struct InvocationTask {
  InvocationRequest                          request;
  std::promise<fleet::v1::ModuleCallResult> promise;
};

/*
  InvocationQueue

  Hands module invocations from callers (InvocationPool::Submit, the --host
  fan-out of dynamic inventories) to the pool's worker threads, first in
  first out. Each task carries the promise its caller is waiting on.

  Shutdown() stops intake: Enqueue then throws, while workers keep receiving
  the tasks already queued until it is empty. No accepted task is dropped,
  so no caller is left holding a future that never resolves.
*/
class InvocationQueue {
 public:
  void Enqueue(InvocationTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<InvocationTask> Dequeue();

  void Shutdown();

 private:
  std::mutex                 mutex_;
  std::condition_variable    cv_;
  std::queue<InvocationTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace fleet::invoke
