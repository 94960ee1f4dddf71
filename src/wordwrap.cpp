#include "wordwrap.hpp"
#include <cctype>
#include <cwctype>

namespace wrap_detail {

bool is_blank(char32_t c) { return c == U' ' || c == U'\t'; }

bool is_break_punct(char32_t c) {
  switch (c) {
    case U'-': case U'+': case U';': case U'~':
    case U'(': case U')': case U'[': case U']':
    case U'{': case U'}': case U'<': case U'>':
      return true;
    default:
      return false;
  }
}

bool is_alnum(char32_t c) {
  if (c < 0x80) return std::isalnum(static_cast<int>(c)) != 0;
  return std::iswalnum(static_cast<wint_t>(c)) != 0;
}

std::vector<size_t> break_points(const std::u32string& text) {
  std::vector<size_t> points;
  bool last_punct = false;
  for (size_t i = 0; i < text.size(); ++i) {
    char32_t ch = text[i];
    if (ch == U' ' || ch == U'\t' || ch == U'\n') {
      last_punct = false;
      points.push_back(i);
    } else if (is_break_punct(ch)) {
      last_punct = true;
    } else if (is_alnum(ch)) {
      // so "well-known" can break after the hyphen without orphaning "known"
      if (last_punct) points.push_back(i);
      last_punct = false;
    }
  }
  return points;
}

}

std::vector<StyledLine> wordwrap(const StyledLine& line, int width, const WrapOptions& opts) {
  std::vector<StyledLine> out;
  for (auto& w : wordwrap<Attr>(line.text, line.attrs, width, opts)) {
    out.emplace_back(std::move(w.text), std::move(w.meta));
  }
  return out;
}
