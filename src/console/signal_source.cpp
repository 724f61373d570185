/*
VoicePrompter — SIGINT/SIGTERM as Quit commands.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "signal_source.h"

#include "prompter/debug_log.h"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <pthread.h>
#include <signal.h>

namespace vprompter {

namespace {

sigset_t terminationSet() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

}  // namespace

SignalSource::SignalSource(Session& session, CommandChannel& channel,
                           std::chrono::milliseconds interval)
    : session_(session), channel_(channel), interval_(interval) {}

bool SignalSource::blockTerminationSignals() {
  const sigset_t set = terminationSet();
  return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

void SignalSource::run() {
  const sigset_t set = terminationSet();

  timespec ts{};
  ts.tv_sec = static_cast<time_t>(interval_.count() / 1000);
  ts.tv_nsec = static_cast<long>((interval_.count() % 1000) * 1000000L);

  while (!session_.stop.stopRequested()) {
    const int sig = sigtimedwait(&set, nullptr, &ts);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      DEBUG_LOG("signals: sigtimedwait failed: %s", std::strerror(errno));
      return;
    }

    DEBUG_LOG("signals: got %s, quitting", sig == SIGINT ? "SIGINT" : "SIGTERM");
    if (!channel_.push(Command::make(CommandType::Quit, CommandSource::System))) {
      session_.stop.requestStop();
    }
    return;
  }
}

}  // namespace vprompter
