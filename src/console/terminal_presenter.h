/*
VoicePrompter — ANSI terminal rendering.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_TERMINAL_PRESENTER_H
#define VPROMPTER_TERMINAL_PRESENTER_H

#include "prompter/presenter.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace vprompter {

struct TerminalSize {
  int cols = 80;
  int rows = 24;
};

// Full-screen rendering with ANSI escapes. Hides the cursor while alive.
class TerminalPresenter : public Presenter {
public:
  // fd is queried for the window size; pass -1 to always use the fallback
  // (or a size set with setFixedSize).
  TerminalPresenter(std::ostream& out, int fd);
  ~TerminalPresenter() override;

  TerminalPresenter(const TerminalPresenter&) = delete;
  TerminalPresenter& operator=(const TerminalPresenter&) = delete;

  void showUnit(const std::string& unit, std::size_t index, std::size_t total,
                bool voiceOn) override;
  void showMarquee(const std::string& text, double offset, double progress,
                   const std::string& speedIndicator, bool voiceOn) override;
  void showFinished() override;
  int viewportWidth() const override;

  void setFixedSize(int cols, int rows);
  TerminalSize size() const;

  // Greedy word wrap; a word longer than width gets a line of its own.
  static std::vector<std::string> wrapWords(const std::string& text, std::size_t width);

  // width - 2 cells of '#' and '.' between brackets.
  static std::string progressBar(double progress, int width);

private:
  void centered(int row, const std::string& line, int cols, const char* style = nullptr);

  std::ostream& out_;
  int fd_;
  bool fixed_ = false;
  TerminalSize fixedSize_;
};

}  // namespace vprompter

#endif  // VPROMPTER_TERMINAL_PRESENTER_H
