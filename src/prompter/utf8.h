/*
VoicePrompter — UTF-8 helpers for script text.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_UTF8_H
#define VPROMPTER_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>

namespace vprompter {

// Best-effort UTF-8 -> UTF-32. Invalid or truncated sequences become U+FFFD.
std::u32string utf8ToU32(std::string_view s);

// UTF-32 -> UTF-8.
std::string u32ToUtf8(std::u32string_view s);

// Number of code points in a UTF-8 string (what the screen counts as columns
// for the scripts we expect).
std::size_t codepointCount(std::string_view s);

// Whitespace as the segmenter and matcher see it (ASCII space family plus
// NBSP and the common Unicode spaces).
bool isSpaceCodepoint(char32_t c);

// Simple one-to-one lowercase mapping for ASCII, Latin-1, Latin Extended-A,
// basic Greek and Cyrillic. Anything else comes back unchanged.
char32_t toLowerCodepoint(char32_t c);

// Trim, and fold every run of whitespace into a single ASCII space.
std::u32string collapseSpaces(std::u32string_view s);

} // namespace vprompter

#endif // VPROMPTER_UTF8_H
