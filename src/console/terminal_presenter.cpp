/*
VoicePrompter — ANSI terminal rendering.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "terminal_presenter.h"

#include "prompter/utf8.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

namespace vprompter {

namespace {

const char* const kClear = "\x1b[2J\x1b[H";
const char* const kHideCursor = "\x1b[?25l";
const char* const kShowCursor = "\x1b[?25h";
const char* const kReset = "\x1b[0m";
const char* const kBold = "\x1b[1;97m";
const char* const kDim = "\x1b[90m";

constexpr int kMaxTextWidth = 80;

void moveTo(std::ostream& out, int row, int col) {
  out << "\x1b[" << row << ';' << col << 'H';
}

std::string repeat(const char* s, int n) {
  std::string out;
  for (int i = 0; i < n; ++i) out += s;
  return out;
}

std::string voiceLabel(bool voiceOn) {
  return voiceOn ? "MIC ON" : "MIC OFF";
}

}  // namespace

TerminalPresenter::TerminalPresenter(std::ostream& out, int fd) : out_(out), fd_(fd) {
  out_ << kHideCursor << std::flush;
}

TerminalPresenter::~TerminalPresenter() {
  out_ << kReset << kShowCursor << std::flush;
}

void TerminalPresenter::setFixedSize(int cols, int rows) {
  fixed_ = true;
  fixedSize_.cols = std::max(1, cols);
  fixedSize_.rows = std::max(1, rows);
}

TerminalSize TerminalPresenter::size() const {
  if (fixed_) return fixedSize_;

  TerminalSize s;
  winsize ws{};
  if (fd_ >= 0 && ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
    s.cols = ws.ws_col;
    s.rows = ws.ws_row;
  }
  return s;
}

int TerminalPresenter::viewportWidth() const {
  // The last column is left empty; writing it makes some terminals wrap.
  return std::max(1, size().cols - 1);
}

std::vector<std::string> TerminalPresenter::wrapWords(const std::string& text, std::size_t width) {
  std::vector<std::string> lines;
  std::istringstream words(text);
  std::string word;
  std::string line;
  std::size_t lineLen = 0;

  while (words >> word) {
    const std::size_t len = codepointCount(word);
    if (lineLen == 0) {
      line = word;
      lineLen = len;
    } else if (lineLen + 1 + len <= width) {
      line += ' ';
      line += word;
      lineLen += 1 + len;
    } else {
      lines.push_back(line);
      line = word;
      lineLen = len;
    }
  }
  if (lineLen > 0) lines.push_back(line);
  return lines;
}

std::string TerminalPresenter::progressBar(double progress, int width) {
  const int inner = std::max(0, width - 2);
  const double p = std::min(1.0, std::max(0.0, progress));
  const int filled = static_cast<int>(std::floor(p * inner));
  return "[" + std::string(static_cast<std::size_t>(filled), '#') +
         std::string(static_cast<std::size_t>(inner - filled), '.') + "]";
}

void TerminalPresenter::centered(int row, const std::string& line, int cols, const char* style) {
  const int len = static_cast<int>(codepointCount(line));
  const int col = std::max(1, (cols - len) / 2 + 1);
  moveTo(out_, row, col);
  if (style) out_ << style;
  out_ << line;
  if (style) out_ << kReset;
}

void TerminalPresenter::showUnit(const std::string& unit, std::size_t index, std::size_t total,
                                 bool voiceOn) {
  const TerminalSize s = size();
  const std::size_t wrapWidth =
      static_cast<std::size_t>(std::max(1, std::min(s.cols - 4, kMaxTextWidth)));
  const std::vector<std::string> lines = wrapWords(unit, wrapWidth);

  out_ << kClear;

  const std::string rule = repeat("\xe2\x94\x80", s.cols);  // U+2500
  moveTo(out_, 1, 1);
  out_ << kDim << rule << kReset;
  centered(2, "[" + std::to_string(index + 1) + "/" + std::to_string(total) + "]", s.cols);
  moveTo(out_, 3, 1);
  out_ << kDim << rule << kReset;

  const int bodyTop = 4;
  const int bodyRows = std::max(1, s.rows - bodyTop - 2);
  int row = bodyTop + std::max(0, (bodyRows - static_cast<int>(lines.size())) / 2);
  for (const auto& line : lines) {
    if (row > s.rows - 2) break;
    centered(row++, line, s.cols, kBold);
  }

  centered(s.rows - 1, voiceLabel(voiceOn), s.cols, voiceOn ? "\x1b[32m" : kDim);
  centered(s.rows, "SPACE/ENTER next | B back | V voice | Q quit", s.cols, kDim);
  out_ << std::flush;
}

void TerminalPresenter::showMarquee(const std::string& text, double offset, double progress,
                                    const std::string& speedIndicator, bool voiceOn) {
  const TerminalSize s = size();
  const int width = viewportWidth();

  // The text enters from the right edge and leaves on the left.
  std::u32string padded(static_cast<std::size_t>(width), U' ');
  padded += utf8ToU32(text);
  padded.append(static_cast<std::size_t>(width), U' ');

  const std::size_t start = std::min(
      padded.size(), static_cast<std::size_t>(std::max(0.0, std::floor(offset))));
  std::u32string visible = padded.substr(start, static_cast<std::size_t>(width));
  visible.resize(static_cast<std::size_t>(width), U' ');

  out_ << kClear;

  const int textRow = std::max(1, (s.rows - 4) / 2 + 1);
  moveTo(out_, textRow, 1);
  out_ << kBold << u32ToUtf8(visible) << kReset;

  const int barWidth = std::max(10, s.cols - 20);
  const std::string status = progressBar(progress, barWidth) + " " + speedIndicator;
  centered(s.rows - 2, status, s.cols, kDim);
  centered(s.rows - 1, voiceLabel(voiceOn), s.cols, voiceOn ? "\x1b[32m" : kDim);
  centered(s.rows, "RIGHT/LEFT speed | SPACE pause | V voice | Q quit", s.cols, kDim);
  out_ << std::flush;
}

void TerminalPresenter::showFinished() {
  const TerminalSize s = size();
  out_ << kClear;
  centered(std::max(1, s.rows / 2), "Done.", s.cols, kBold);
  moveTo(out_, s.rows, 1);
  out_ << kReset << '\n' << std::flush;
}

}  // namespace vprompter
