/*
VoicePrompter — Transcript matching against the expected script unit.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "speech_matcher.h"

#include "utf8.h"

#include <unordered_set>

namespace vprompter {

namespace {

bool isPunctuation(char32_t c) {
  if (c < 0x80) {
    // Apostrophes inside words ("don't") are punctuation too: recognizers
    // disagree on them, so both sides lose them the same way.
    return (c >= U'!' && c <= U'/') || (c >= U':' && c <= U'@') ||
           (c >= U'[' && c <= U'`') || (c >= U'{' && c <= U'~');
  }
  switch (c) {
    case 0x00A1:  // ¡
    case 0x00AB:  // «
    case 0x00BB:  // »
    case 0x00BF:  // ¿
    case 0x2013:  // –
    case 0x2014:  // —
    case 0x2018:  // ‘
    case 0x2019:  // ’
    case 0x201C:  // “
    case 0x201D:  // ”
    case 0x2026:  // …
    case 0x3001:  // 、
    case 0x3002:  // 。
    case 0xFF01:  // ！
    case 0xFF0C:  // ，
    case 0xFF1F:  // ？
      return true;
    default:
      return false;
  }
}

std::unordered_set<std::string> distinctWords(std::string_view text) {
  std::unordered_set<std::string> out;
  for (auto& w : matchWords(text)) {
    out.insert(std::move(w));
  }
  return out;
}

}  // namespace

std::string normalizeForMatch(std::string_view text) {
  std::u32string s = utf8ToU32(text);
  for (char32_t& c : s) {
    if (isPunctuation(c)) {
      c = U' ';
    } else {
      c = toLowerCodepoint(c);
    }
  }
  return u32ToUtf8(collapseSpaces(s));
}

std::vector<std::string> matchWords(std::string_view text) {
  const std::string norm = normalizeForMatch(text);
  std::vector<std::string> words;
  size_t start = 0;
  while (start < norm.size()) {
    size_t end = norm.find(' ', start);
    if (end == std::string::npos) end = norm.size();
    if (end > start) words.push_back(norm.substr(start, end - start));
    start = end + 1;
  }
  return words;
}

double matchRatio(std::string_view spoken, std::string_view expected) {
  const auto expectedWords = distinctWords(expected);
  const auto spokenWords = distinctWords(spoken);
  if (expectedWords.empty() || spokenWords.empty()) return 0.0;

  size_t hits = 0;
  for (const auto& w : expectedWords) {
    if (spokenWords.count(w) != 0) ++hits;
  }
  return static_cast<double>(hits) / static_cast<double>(expectedWords.size());
}

bool isMatch(std::string_view spoken, std::string_view expected, double threshold) {
  const double ratio = matchRatio(spoken, expected);
  // A zero ratio also covers "nothing to compare".
  return ratio > 0.0 && ratio >= threshold;
}

bool wordCountAtLeast(std::string_view spoken, std::size_t n) {
  return matchWords(spoken).size() >= n;
}

}  // namespace vprompter
