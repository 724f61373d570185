/*
VoicePrompter — Script segmentation interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SEGMENTER_H
#define VPROMPTER_SEGMENTER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vprompter {

enum class SegmentMode {
  // One unit per sentence; long sentences are re-packed at commas.
  Sentence,
  // One unit per blank-line separated paragraph.
  Paragraph,
  // The whole script as a single whitespace-collapsed unit (marquee).
  Flat,
};

constexpr std::size_t kDefaultMaxUnitChars = 150;

// Splits raw script text into display units, in reading order.
//
// Every unit is trimmed, has its internal whitespace collapsed, and is
// non-empty. maxChars is measured in code points and only applies to
// Sentence mode: a longer sentence is cut after commas so that each piece
// stays within maxChars. A piece without any comma to cut at is kept whole.
//
// Throws EmptyScriptError if the text yields no units.
std::vector<std::string> segment(
    std::string_view rawText,
    SegmentMode mode,
    std::size_t maxChars = kDefaultMaxUnitChars);

// Reads a UTF-8 script file. Strips a BOM and normalizes CRLF.
// Throws ConfigError if the file cannot be read.
std::string loadScriptFile(const std::string& path);

// "sentence", "paragraph" or "flat" (case-insensitive).
bool parseSegmentMode(std::string_view name, SegmentMode& out);
const char* segmentModeName(SegmentMode mode);

}  // namespace vprompter

#endif  // VPROMPTER_SEGMENTER_H
