/*
VoicePrompter — Minimal YAML subset for settings files.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "yaml_min.h"

#include <cctype>
#include <fstream>
#include <locale>
#include <sstream>
#include <vector>

namespace vprompter::yaml_min {

namespace {

std::string rtrim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

std::string trim(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return rtrim(s.substr(i));
}

std::string unquote(const std::string& s) {
  if (s.size() < 2) return s;
  const char q = s.front();
  if ((q != '"' && q != '\'') || s.back() != q) return s;

  std::string out;
  out.reserve(s.size() - 2);
  for (size_t i = 1; i + 1 < s.size(); ++i) {
    const char c = s[i];
    if (q == '"' && c == '\\' && i + 2 < s.size()) {
      const char n = s[i + 1];
      if (n == '"' || n == '\\') { out.push_back(n); ++i; continue; }
      if (n == 'n') { out.push_back('\n'); ++i; continue; }
      if (n == 't') { out.push_back('\t'); ++i; continue; }
    }
    out.push_back(c);
  }
  return out;
}

// Removes a trailing "# comment" unless the '#' is quoted.
std::string stripComment(const std::string& s) {
  bool inSingle = false;
  bool inDouble = false;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\'' && !inDouble) {
      inSingle = !inSingle;
    } else if (c == '"' && !inSingle) {
      inDouble = !inDouble;
    } else if (c == '#' && !inSingle && !inDouble && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
      return rtrim(s.substr(0, i));
    }
  }
  return rtrim(s);
}

struct Line {
  int lineNo = 0;  // 1-based
  int indent = 0;  // spaces
  std::string key;
  std::string value;  // empty => nested block follows
};

bool splitLines(const std::string& text, std::vector<Line>& out, int& errLine, std::string& err) {
  std::istringstream in(text);
  std::string raw;
  int lineNo = 0;
  while (std::getline(in, raw)) {
    ++lineNo;
    if (lineNo == 1 && raw.size() >= 3 &&
        static_cast<unsigned char>(raw[0]) == 0xEF &&
        static_cast<unsigned char>(raw[1]) == 0xBB &&
        static_cast<unsigned char>(raw[2]) == 0xBF) {
      raw.erase(0, 3);
    }

    int indent = 0;
    while (indent < static_cast<int>(raw.size()) && raw[indent] == ' ') ++indent;
    if (indent < static_cast<int>(raw.size()) && raw[indent] == '\t') {
      errLine = lineNo;
      err = "Tabs are not allowed for indentation";
      return false;
    }

    const std::string t = stripComment(raw.substr(static_cast<size_t>(indent)));
    if (t.empty()) continue;

    if (t[0] == '-') {
      errLine = lineNo;
      err = "Sequences are not supported";
      return false;
    }

    // First ':' outside quotes separates key and value.
    bool inSingle = false;
    bool inDouble = false;
    size_t colon = std::string::npos;
    for (size_t i = 0; i < t.size(); ++i) {
      const char c = t[i];
      if (c == '\'' && !inDouble) inSingle = !inSingle;
      if (c == '"' && !inSingle) inDouble = !inDouble;
      if (c == ':' && !inSingle && !inDouble) {
        colon = i;
        break;
      }
    }
    if (colon == std::string::npos) {
      errLine = lineNo;
      err = "Expected 'key: value'";
      return false;
    }

    Line ln;
    ln.lineNo = lineNo;
    ln.indent = indent;
    ln.key = unquote(trim(t.substr(0, colon)));
    ln.value = trim(t.substr(colon + 1));
    if (ln.key.empty()) {
      errLine = lineNo;
      err = "Empty key";
      return false;
    }
    out.push_back(std::move(ln));
  }
  return true;
}

bool parseMap(const std::vector<Line>& lines, size_t& idx, int indent, Node& out,
              int& errLine, std::string& err) {
  out = Node{};
  out.type = Node::Type::Map;

  while (idx < lines.size()) {
    const Line& ln = lines[idx];
    if (ln.indent < indent) break;
    if (ln.indent > indent) {
      errLine = ln.lineNo;
      err = "Unexpected indentation";
      return false;
    }
    if (out.map.count(ln.key) != 0) {
      errLine = ln.lineNo;
      err = "Duplicate key '" + ln.key + "'";
      return false;
    }

    Node value;
    ++idx;
    if (!ln.value.empty()) {
      value.type = Node::Type::Scalar;
      value.scalar = unquote(ln.value);
    } else if (idx < lines.size() && lines[idx].indent > indent) {
      if (!parseMap(lines, idx, lines[idx].indent, value, errLine, err)) return false;
    }
    out.map[ln.key] = std::move(value);
  }
  return true;
}

}  // namespace

bool Node::asBool(bool& out) const {
  if (!isScalar()) return false;
  std::string s;
  s.reserve(scalar.size());
  for (char c : scalar) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "true" || s == "yes" || s == "on" || s == "1") { out = true; return true; }
  if (s == "false" || s == "no" || s == "off" || s == "0") { out = false; return true; }
  return false;
}

bool Node::asNumber(double& out) const {
  if (!isScalar()) return false;

  // Locale-independent: the process locale may use ',' as decimal separator.
  std::istringstream iss(scalar);
  iss.imbue(std::locale::classic());

  iss >> std::ws;
  double v = 0.0;
  iss >> v;
  if (!iss) return false;

  iss >> std::ws;
  if (!iss.eof()) return false;

  out = v;
  return true;
}

std::string Node::asString(const std::string& fallback) const {
  if (!isScalar()) return fallback;
  return scalar;
}

const Node* Node::get(std::string_view key) const {
  if (!isMap()) return nullptr;
  auto it = map.find(std::string(key));
  if (it == map.end()) return nullptr;
  return &it->second;
}

const Node* Node::find(std::string_view dottedPath) const {
  const Node* cur = this;
  while (cur && !dottedPath.empty()) {
    const size_t dot = dottedPath.find('.');
    cur = cur->get(dottedPath.substr(0, dot));
    if (dot == std::string_view::npos) break;
    dottedPath.remove_prefix(dot + 1);
  }
  return cur;
}

bool parseText(const std::string& text, const std::string& sourceName, Node& outRoot,
               std::string& outError) {
  std::vector<Line> lines;
  int errLine = 0;
  std::string err;

  outRoot = Node{};
  outRoot.type = Node::Type::Map;

  bool ok = splitLines(text, lines, errLine, err);
  if (ok && !lines.empty()) {
    size_t idx = 0;
    ok = parseMap(lines, idx, lines[0].indent, outRoot, errLine, err);
    if (ok && idx < lines.size()) {
      // A line indented less than the first one.
      ok = false;
      errLine = lines[idx].lineNo;
      err = "Indent mismatch";
    }
  }

  if (!ok) {
    std::ostringstream oss;
    oss << sourceName << ":" << errLine << ": " << err;
    outError = oss.str();
    return false;
  }
  return true;
}

bool loadFile(const std::string& path, Node& outRoot, std::string& outError) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Could not open file: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return parseText(ss.str(), path, outRoot, outError);
}

}  // namespace vprompter::yaml_min
