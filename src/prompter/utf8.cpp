/*
VoicePrompter — UTF-8 helpers for script text.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "utf8.h"

#include <cstdint>

namespace vprompter {

static constexpr char32_t kReplacementChar = 0xFFFD;

// Sequence length implied by a lead byte, or 0 if the byte cannot start one.
static int leadLength(unsigned char c0) {
  if (c0 < 0x80) return 1;
  if ((c0 >> 5) == 0x6) return 2;
  if ((c0 >> 4) == 0xE) return 3;
  if ((c0 >> 3) == 0x1E) return 4;
  return 0;
}

// Decodes one code point starting at p and advances p past it.
static char32_t decodeOne(const unsigned char*& p, const unsigned char* end) {
  const unsigned char c0 = *p++;
  const int len = leadLength(c0);
  if (len == 1) return c0;
  if (len == 0) return kReplacementChar;

  if (end - p < len - 1) {
    p = end;
    return kReplacementChar;
  }

  static const uint32_t kLeadMask[5] = {0, 0x7F, 0x1F, 0x0F, 0x07};
  static const uint32_t kMinValue[5] = {0, 0, 0x80, 0x800, 0x10000};

  uint32_t cp = c0 & kLeadMask[len];
  for (int i = 1; i < len; ++i) {
    const unsigned char cx = *p;
    if ((cx & 0xC0) != 0x80) {
      // Leave the offending byte for the next call.
      return kReplacementChar;
    }
    cp = (cp << 6) | (cx & 0x3F);
    ++p;
  }

  if (cp < kMinValue[len] || cp > 0x10FFFF) return kReplacementChar;
  if (cp >= 0xD800 && cp <= 0xDFFF) return kReplacementChar;
  return static_cast<char32_t>(cp);
}

std::u32string utf8ToU32(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());

  const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
  const unsigned char* end = p + s.size();
  while (p < end) {
    out.push_back(decodeOne(p, end));
  }
  return out;
}

std::string u32ToUtf8(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());

  for (char32_t ch : s) {
    uint32_t cp = static_cast<uint32_t>(ch);
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacementChar;

    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

std::size_t codepointCount(std::string_view s) {
  std::size_t n = 0;
  const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
  const unsigned char* end = p + s.size();
  while (p < end) {
    decodeOne(p, end);
    ++n;
  }
  return n;
}

bool isSpaceCodepoint(char32_t c) {
  switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0x00A0:  // no-break space
    case 0x2007:  // figure space
    case 0x202F:  // narrow no-break space
    case 0x3000:  // ideographic space
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

char32_t toLowerCodepoint(char32_t c) {
  if (c < 0x80) {
    return (c >= U'A' && c <= U'Z') ? c + 0x20 : c;
  }

  // Latin-1: À..Þ, skipping the multiplication sign.
  if (c >= 0x00C0 && c <= 0x00DE && c != 0x00D7) return c + 0x20;

  // Latin Extended-A pairs upper/lower, with a few irregular spots.
  if (c >= 0x0100 && c <= 0x017F) {
    if (c == 0x0130) return U'i';     // İ
    if (c == 0x0178) return 0x00FF;   // Ÿ
    if (c == 0x0131 || c == 0x0138 || c == 0x0149 || c == 0x017F) return c;
    const bool oddUpper = (c >= 0x0139 && c <= 0x0148) || (c >= 0x0179 && c <= 0x017E);
    if (oddUpper) return (c & 1) ? c + 1 : c;
    return (c & 1) ? c : c + 1;
  }

  // Greek capitals, no capital final sigma at U+03A2.
  if (c >= 0x0391 && c <= 0x03A9 && c != 0x03A2) return c + 0x20;

  // Cyrillic.
  if (c >= 0x0400 && c <= 0x040F) return c + 0x50;
  if (c >= 0x0410 && c <= 0x042F) return c + 0x20;

  return c;
}

std::u32string collapseSpaces(std::u32string_view s) {
  std::u32string out;
  out.reserve(s.size());

  bool inSpace = true;  // trims leading
  for (char32_t c : s) {
    if (isSpaceCodepoint(c)) {
      if (!inSpace) {
        out.push_back(U' ');
        inSpace = true;
      }
      continue;
    }
    out.push_back(c);
    inSpace = false;
  }

  while (!out.empty() && out.back() == U' ') out.pop_back();
  return out;
}

} // namespace vprompter
