/*
VoicePrompter — Owner of the input source threads.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_WORKER_GROUP_H
#define VPROMPTER_WORKER_GROUP_H

#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vprompter {

class StopToken;

// Starts named worker threads and joins all of them on destruction.
//
// A worker that throws requests a stop on the shared token, so the rest of
// the session winds down; the first error message is kept for the caller.
class WorkerGroup {
public:
  explicit WorkerGroup(StopToken& stop) : stop_(stop) {}
  ~WorkerGroup();

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  void spawn(std::string name, std::function<void()> body);

  // Requests a stop and waits for every worker.
  void joinAll();

  bool failed() const;
  std::string firstError() const;

private:
  StopToken& stop_;
  std::vector<std::thread> threads_;

  mutable std::mutex mtx_;
  std::string firstError_;
};

}  // namespace vprompter

#endif  // VPROMPTER_WORKER_GROUP_H
