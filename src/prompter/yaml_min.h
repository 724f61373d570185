/*
VoicePrompter — Minimal YAML subset for settings files.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_YAML_MIN_H
#define VPROMPTER_YAML_MIN_H

#include <map>
#include <string>
#include <string_view>

namespace vprompter::yaml_min {

struct Node {
  enum class Type {
    Null,
    Scalar,
    Map,
  };

  Type type = Type::Null;
  // For scalars, the raw text without quotes.
  std::string scalar;
  // Ordered so that error messages and dumps are stable.
  std::map<std::string, Node> map;

  bool isScalar() const { return type == Type::Scalar; }
  bool isMap() const { return type == Type::Map; }

  // Typed scalar helpers. Return true on success.
  bool asBool(bool& out) const;
  bool asNumber(double& out) const;
  std::string asString(const std::string& fallback = "") const;

  const Node* get(std::string_view key) const;
  // Dotted lookup: find("voice.min_words").
  const Node* find(std::string_view dottedPath) const;
};

// Parses an indentation-based subset:
// - maps (key: value), nested by indentation
// - scalar strings, bools, numbers (quoted or bare)
// - comments (# ...) on their own line or after a scalar
// Sequences are not supported; settings never need them.
//
// Returns true on success. On failure, outError holds "<source>:<line>: message".
bool parseText(const std::string& text, const std::string& sourceName, Node& outRoot,
               std::string& outError);

bool loadFile(const std::string& path, Node& outRoot, std::string& outError);

}  // namespace vprompter::yaml_min

#endif  // VPROMPTER_YAML_MIN_H
