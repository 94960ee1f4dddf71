#include "markup.hpp"
#include <vector>

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string sanitize(const std::string& text) {
  std::string s = text;
  replace_all(s, "&", "&amp;");
  replace_all(s, "<", "&lt;");
  replace_all(s, ">", "&gt;");
  return s;
}

std::string unsanitize(const std::string& text) {
  std::string s = text;
  replace_all(s, "&lt;", "<");
  replace_all(s, "&gt;", ">");
  replace_all(s, "&amp;", "&");
  return s;
}

// Splits into literal runs and "<...>" tags; an unterminated '<' stays literal.
static std::vector<std::string> split_tags(const std::string& s) {
  std::vector<std::string> parts;
  std::string acc;
  for (char ch : s) {
    if (ch == '<') {
      if (!acc.empty()) { parts.push_back(acc); acc.clear(); }
      acc.push_back(ch);
    } else if (ch == '>') {
      acc.push_back(ch);
      if (acc[0] == '<') { parts.push_back(acc); acc.clear(); }
    } else {
      acc.push_back(ch);
    }
  }
  if (!acc.empty()) parts.push_back(acc);
  return parts;
}

namespace {
struct Nesting {
  int depth = 0;
  // Returns true when the flag should flip.
  bool open() { return ++depth == 1; }
  bool close() {
    bool flip = depth == 1;
    if (depth > 0) depth--;
    return flip;
  }
};
}

StyledLine highlight(const std::string& markup) {
  Attr cur;
  Nesting b, u, r;
  StyledLine out;
  for (const auto& part : split_tags(markup)) {
    bool tag = part.size() >= 2 && part.front() == '<' && part.back() == '>';
    if (tag) {
      if (part == "<b>" || part == "<bold>") { if (b.open()) cur.bold = true; continue; }
      if (part == "</b>" || part == "</bold>") { if (b.close()) cur.bold = false; continue; }
      if (part == "<u>" || part == "<underline>") { if (u.open()) cur.underline = true; continue; }
      if (part == "</u>" || part == "</underline>") { if (u.close()) cur.underline = false; continue; }
      if (part == "<r>" || part == "<reverse>") { if (r.open()) cur.reverse = true; continue; }
      if (part == "</r>" || part == "</reverse>") { if (r.close()) cur.reverse = false; continue; }
    }
    std::u32string text = utf8_decode(unsanitize(part));
    out.text += text;
    out.attrs.insert(out.attrs.end(), text.size(), cur);
  }
  return out;
}
