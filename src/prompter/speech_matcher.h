/*
VoicePrompter — Transcript matching against the expected script unit.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SPEECH_MATCHER_H
#define VPROMPTER_SPEECH_MATCHER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vprompter {

constexpr double kDefaultMatchThreshold = 0.4;

// Lowercases ASCII letters, turns punctuation into spaces and collapses
// whitespace. Applied identically to transcripts and script units.
std::string normalizeForMatch(std::string_view text);

// Normalized words, in order, duplicates kept.
std::vector<std::string> matchWords(std::string_view text);

// Fraction of the distinct expected words that appear in the transcript.
// 0.0 when either side has no words.
double matchRatio(std::string_view spoken, std::string_view expected);

// Bag-of-words overlap test: true iff matchRatio >= threshold and both sides
// have at least one word. Word order and repeats do not matter.
bool isMatch(std::string_view spoken, std::string_view expected,
             double threshold = kDefaultMatchThreshold);

// True when the transcript has at least n normalized words.
bool wordCountAtLeast(std::string_view spoken, std::size_t n);

}  // namespace vprompter

#endif  // VPROMPTER_SPEECH_MATCHER_H
