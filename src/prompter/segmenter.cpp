/*
VoicePrompter — Script segmentation (sentences, paragraphs, marquee text).
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "segmenter.h"

#include "errors.h"
#include "utf8.h"

#include <cctype>
#include <fstream>
#include <sstream>

namespace vprompter {

static bool isSentenceEnd(char32_t c) {
  switch (c) {
    case U'.':
    case U'!':
    case U'?':
    case 0x2026:  // …
    case 0x3002:  // 。
    case 0xFF01:  // ！
    case 0xFF1F:  // ？
      return true;
    default:
      return false;
  }
}

// Characters that stay attached to the sentence they close.
static bool isCloser(char32_t c) {
  switch (c) {
    case U'"':
    case U'\'':
    case U')':
    case U']':
    case U'}':
    case 0x2019:  // ’
    case 0x201D:  // ”
    case 0x00BB:  // »
      return true;
    default:
      return false;
  }
}

static bool isComma(char32_t c) {
  return c == U',' || c == 0xFF0C || c == 0x3001;  // , ， 、
}

static void pushUnit(std::u32string_view raw, std::vector<std::u32string>& out) {
  std::u32string s = collapseSpaces(raw);
  if (!s.empty()) out.push_back(std::move(s));
}

static void splitSentences(const std::u32string& text, std::vector<std::u32string>& out) {
  size_t start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (!isSentenceEnd(text[i])) {
      ++i;
      continue;
    }

    // Swallow "?!", "..." and closing quotes/brackets.
    size_t j = i + 1;
    while (j < text.size() && (isSentenceEnd(text[j]) || isCloser(text[j]))) ++j;

    // A terminator only ends a sentence when whitespace follows ("3.14" stays).
    if (j == text.size() || isSpaceCodepoint(text[j])) {
      pushUnit(std::u32string_view(text).substr(start, j - start), out);
      start = j;
    }
    i = j;
  }
  if (start < text.size()) {
    pushUnit(std::u32string_view(text).substr(start), out);
  }
}

// Re-packs a long sentence at comma boundaries, never exceeding maxChars
// unless a single comma-free piece is already longer.
static void splitLongSentence(const std::u32string& sentence, size_t maxChars,
                              std::vector<std::u32string>& out) {
  if (maxChars == 0 || sentence.size() <= maxChars) {
    out.push_back(sentence);
    return;
  }

  std::vector<std::u32string> pieces;
  size_t start = 0;
  for (size_t i = 0; i < sentence.size(); ++i) {
    if (isComma(sentence[i]) && i + 1 < sentence.size() && isSpaceCodepoint(sentence[i + 1])) {
      pushUnit(std::u32string_view(sentence).substr(start, i + 1 - start), pieces);
      start = i + 1;
    }
  }
  pushUnit(std::u32string_view(sentence).substr(start), pieces);

  std::u32string current;
  for (auto& piece : pieces) {
    if (current.empty()) {
      current = std::move(piece);
    } else if (current.size() + 1 + piece.size() <= maxChars) {
      current.push_back(U' ');
      current += piece;
    } else {
      out.push_back(std::move(current));
      current = std::move(piece);
    }
  }
  if (!current.empty()) out.push_back(std::move(current));
}

static void splitParagraphs(const std::u32string& text, std::vector<std::u32string>& out) {
  std::u32string paragraph;
  size_t lineStart = 0;
  while (lineStart <= text.size()) {
    size_t lineEnd = text.find(U'\n', lineStart);
    if (lineEnd == std::u32string::npos) lineEnd = text.size();

    std::u32string_view line = std::u32string_view(text).substr(lineStart, lineEnd - lineStart);
    bool blank = true;
    for (char32_t c : line) {
      if (!isSpaceCodepoint(c)) {
        blank = false;
        break;
      }
    }

    if (blank) {
      pushUnit(paragraph, out);
      paragraph.clear();
    } else {
      paragraph.append(line);
      paragraph.push_back(U' ');
    }
    lineStart = lineEnd + 1;
  }
  pushUnit(paragraph, out);
}

std::vector<std::string> segment(std::string_view rawText, SegmentMode mode, std::size_t maxChars) {
  const std::u32string text = utf8ToU32(rawText);

  std::vector<std::u32string> units;
  switch (mode) {
    case SegmentMode::Sentence: {
      std::vector<std::u32string> sentences;
      splitSentences(text, sentences);
      for (const auto& s : sentences) {
        splitLongSentence(s, maxChars, units);
      }
      break;
    }
    case SegmentMode::Paragraph:
      splitParagraphs(text, units);
      break;
    case SegmentMode::Flat:
      pushUnit(text, units);
      break;
  }

  if (units.empty()) {
    throw EmptyScriptError("Script contains no text");
  }

  std::vector<std::string> out;
  out.reserve(units.size());
  for (const auto& u : units) {
    out.push_back(u32ToUtf8(u));
  }
  return out;
}

std::string loadScriptFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    throw ConfigError("Cannot open script file: " + path);
  }

  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    throw ConfigError("Error reading script file: " + path);
  }
  std::string text = ss.str();

  if (text.size() >= 3 &&
      static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      // CRLF -> LF, lone CR -> LF.
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

bool parseSegmentMode(std::string_view name, SegmentMode& out) {
  std::string s;
  s.reserve(name.size());
  for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (s == "sentence" || s == "phrase") { out = SegmentMode::Sentence; return true; }
  if (s == "paragraph") { out = SegmentMode::Paragraph; return true; }
  if (s == "flat") { out = SegmentMode::Flat; return true; }
  return false;
}

const char* segmentModeName(SegmentMode mode) {
  switch (mode) {
    case SegmentMode::Sentence: return "sentence";
    case SegmentMode::Paragraph: return "paragraph";
    case SegmentMode::Flat: return "flat";
  }
  return "sentence";
}

}  // namespace vprompter
