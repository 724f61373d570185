/*
VoicePrompter — Segmenter tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "prompter/errors.h"
#include "prompter/segmenter.h"
#include "prompter/utf8.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace vprompter;

namespace {

std::vector<std::string> words(const std::string& s) {
  std::istringstream in(s);
  std::vector<std::string> out;
  std::string w;
  while (in >> w) out.push_back(w);
  return out;
}

std::vector<std::string> words(const std::vector<std::string>& units) {
  std::vector<std::string> out;
  for (const auto& u : units) {
    auto w = words(u);
    out.insert(out.end(), w.begin(), w.end());
  }
  return out;
}

std::string tempPath(const char* name) {
  return std::string(::testing::TempDir()) + name;
}

}  // namespace

TEST(Segmenter, SplitsSentences) {
  const auto units = segment("One. Two. Three.", SegmentMode::Sentence);
  ASSERT_EQ(units.size(), 3u);
  EXPECT_EQ(units[0], "One.");
  EXPECT_EQ(units[1], "Two.");
  EXPECT_EQ(units[2], "Three.");
}

TEST(Segmenter, KeepsTerminatorRunsAndClosers) {
  const auto units = segment("Really?! \"Yes.\" Wait... ok", SegmentMode::Sentence);
  ASSERT_EQ(units.size(), 4u);
  EXPECT_EQ(units[0], "Really?!");
  EXPECT_EQ(units[1], "\"Yes.\"");
  EXPECT_EQ(units[2], "Wait...");
  EXPECT_EQ(units[3], "ok");
}

TEST(Segmenter, DoesNotSplitInsideNumbers) {
  const auto units = segment("Pi is 3.14 roughly. Done.", SegmentMode::Sentence);
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0], "Pi is 3.14 roughly.");
}

TEST(Segmenter, CollapsesWhitespace) {
  const auto units = segment("  Hello\n   there,\tfriend.  \n\n Bye. ", SegmentMode::Sentence);
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0], "Hello there, friend.");
  EXPECT_EQ(units[1], "Bye.");
}

TEST(Segmenter, HandlesCjkTerminators) {
  const auto units = segment(u8"你好。 再见！", SegmentMode::Sentence);
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0], u8"你好。");
}

TEST(Segmenter, LongSentenceSplitsAtCommas) {
  const std::string text =
      "The first part of this sentence is long enough, the second part is long as well, "
      "and the third part closes it.";
  const auto units = segment(text, SegmentMode::Sentence, 50);
  ASSERT_GT(units.size(), 1u);
  for (const auto& u : units) {
    EXPECT_LE(codepointCount(u), 50u) << u;
  }
  EXPECT_EQ(units[0], "The first part of this sentence is long enough,");
  EXPECT_EQ(words(units), words(text));
}

TEST(Segmenter, IrreducibleSentenceStaysWhole) {
  const std::string text = "This sentence has no commas and is clearly longer than twenty characters.";
  const auto units = segment(text, SegmentMode::Sentence, 20);
  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0], text);
}

TEST(Segmenter, ZeroMaxCharsDisablesSplitting) {
  const std::string text = "Alpha, beta, gamma, delta, epsilon, zeta, eta.";
  const auto units = segment(text, SegmentMode::Sentence, 0);
  ASSERT_EQ(units.size(), 1u);
}

TEST(Segmenter, PreservesWordsInOrder) {
  const std::string text =
      "Welcome back.   Today we talk about tests, and why they matter!\n\n"
      "Short one? Another, with a comma... End";
  const auto units = segment(text, SegmentMode::Sentence, 25);
  EXPECT_EQ(words(units), words(text));
  for (const auto& u : units) {
    ASSERT_FALSE(u.empty());
    EXPECT_NE(u.front(), ' ');
    EXPECT_NE(u.back(), ' ');
  }
}

TEST(Segmenter, Paragraphs) {
  const auto units =
      segment("First line\nsame paragraph.\n\n  \nSecond. Still second.\n", SegmentMode::Paragraph);
  ASSERT_EQ(units.size(), 2u);
  EXPECT_EQ(units[0], "First line same paragraph.");
  EXPECT_EQ(units[1], "Second. Still second.");
}

TEST(Segmenter, FlatIsOneUnit) {
  const auto units = segment("One. Two.\n\nThree.", SegmentMode::Flat);
  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0], "One. Two. Three.");
}

TEST(Segmenter, EmptyScriptThrows) {
  EXPECT_THROW(segment("", SegmentMode::Sentence), EmptyScriptError);
  EXPECT_THROW(segment(" \n\t \n", SegmentMode::Paragraph), EmptyScriptError);
  EXPECT_THROW(segment("   ", SegmentMode::Flat), ConfigError);
}

TEST(Segmenter, ParseModeNames) {
  SegmentMode m = SegmentMode::Flat;
  EXPECT_TRUE(parseSegmentMode("Paragraph", m));
  EXPECT_EQ(m, SegmentMode::Paragraph);
  EXPECT_TRUE(parseSegmentMode("sentence", m));
  EXPECT_EQ(m, SegmentMode::Sentence);
  EXPECT_FALSE(parseSegmentMode("chapter", m));
  EXPECT_STREQ(segmentModeName(SegmentMode::Flat), "flat");
}

TEST(ScriptFile, StripsBomAndNormalizesLineEnds) {
  const std::string path = tempPath("vprompter_script_bom.txt");
  {
    std::ofstream f(path, std::ios::binary);
    f << "\xEF\xBB\xBFLine one.\r\nLine two.\rLine three.";
  }
  EXPECT_EQ(loadScriptFile(path), "Line one.\nLine two.\nLine three.");
  std::remove(path.c_str());
}

TEST(ScriptFile, MissingFileThrowsConfigError) {
  EXPECT_THROW(loadScriptFile(tempPath("vprompter_does_not_exist.txt")), ConfigError);
}
