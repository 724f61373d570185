/*
VoicePrompter — Owner of the input source threads.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "worker_group.h"

#include "debug_log.h"
#include "session.h"

#include <exception>
#include <utility>

namespace vprompter {

WorkerGroup::~WorkerGroup() {
  joinAll();
}

void WorkerGroup::spawn(std::string name, std::function<void()> body) {
  threads_.emplace_back([this, name = std::move(name), body = std::move(body)]() {
    DEBUG_LOG("worker %s: started", name.c_str());
    try {
      body();
    } catch (const std::exception& e) {
      DEBUG_LOG("worker %s: failed: %s", name.c_str(), e.what());
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (firstError_.empty()) firstError_ = name + ": " + e.what();
      }
      stop_.requestStop();
    }
    DEBUG_LOG("worker %s: exited", name.c_str());
  });
}

void WorkerGroup::joinAll() {
  if (threads_.empty()) return;
  stop_.requestStop();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

bool WorkerGroup::failed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return !firstError_.empty();
}

std::string WorkerGroup::firstError() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return firstError_;
}

}  // namespace vprompter
