/*
VoicePrompter — Presentation sink interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_PRESENTER_H
#define VPROMPTER_PRESENTER_H

#include <cstddef>
#include <string>

namespace vprompter {

// Renders engine state. It only consumes state; it never produces commands.
// All calls come from the engine thread.
class Presenter {
public:
  virtual ~Presenter() = default;

  // Discrete policy: one call per state change. index is 0-based.
  virtual void showUnit(const std::string& unit, std::size_t index, std::size_t total,
                        bool voiceOn) = 0;

  // Continuous policy: one call per tick. progress is 0..1.
  virtual void showMarquee(const std::string& text, double offset, double progress,
                           const std::string& speedIndicator, bool voiceOn) = 0;

  // Called once when the session ends.
  virtual void showFinished() = 0;

  // Visible columns; the continuous policy scrolls text through this many.
  virtual int viewportWidth() const = 0;
};

}  // namespace vprompter

#endif  // VPROMPTER_PRESENTER_H
