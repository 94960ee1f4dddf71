#pragma once
/*
 * WordWrap
 *
 * Purpose: break text into lines no wider than `width`, carrying a parallel
 *          metadata sequence (attributes, source indices, ...) through intact.
 * Preference: embedded newline, then the rightmost space, then the first
 *             alphanumeric after punctuation, then mid-word at exactly `width`.
 * Note: whitespace separates words like a browser would treat it; it is not
 *       positional formatting. The strip flags are independent.
 */
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "styled_text.hpp"

struct WrapOptions {
  bool strip_trailing_spaces = true;
  bool strip_trailing_newlines = true;
};

template <typename T>
struct Wrapped {
  std::u32string text;
  std::vector<T> meta;
};

namespace wrap_detail {
// Private non-printable marker appended after a trailing newline so that the
// final empty line survives the split.
constexpr char32_t kTrailingNewline = U'\x08';

bool is_blank(char32_t c);       // space or tab
bool is_break_punct(char32_t c);
bool is_alnum(char32_t c);
// Candidate break positions, ascending.
std::vector<size_t> break_points(const std::u32string& text);
}

template <typename T>
std::vector<Wrapped<T>> wordwrap(const std::u32string& input, const std::vector<T>& input_meta, int width,
                                 const WrapOptions& opts = {}) {
  using namespace wrap_detail;
  if (input.size() != input_meta.size()) throw std::invalid_argument("wordwrap: metadata length must match text length");
  if (width < 1) throw std::invalid_argument("wordwrap: width must be positive");
  if (input.empty()) return {Wrapped<T>{}};

  // Single newline representation; metadata follows the surviving characters.
  std::u32string text;
  std::vector<T> meta;
  text.reserve(input.size() + 1);
  meta.reserve(input.size() + 1);
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == U'\r') {
      if (i + 1 < input.size() && input[i + 1] == U'\n') continue;
      text.push_back(U'\n');
    } else {
      text.push_back(input[i]);
    }
    meta.push_back(input_meta[i]);
  }
  if (text.back() == U'\n') {
    text.push_back(kTrailingNewline);
    meta.push_back(meta.back());
  }

  const size_t n = text.size();
  const size_t w = static_cast<size_t>(width);
  std::vector<size_t> points = break_points(text);
  std::vector<Wrapped<T>> out;

  auto emit = [&](size_t from, size_t to) {
    Wrapped<T> line;
    line.text = text.substr(from, to - from);
    line.meta.assign(meta.begin() + static_cast<long>(from), meta.begin() + static_cast<long>(to));
    out.push_back(std::move(line));
  };
  auto next_non_blank = [&](size_t from) {
    size_t i = from;
    while (i < n && is_blank(text[i])) i++;
    return i;
  };

  size_t base = 0;
  size_t first = 0;  // first break point at or after base
  while (base < n) {
    while (first < points.size() && points[first] < base) first++;
    size_t last = first;  // one past the last candidate within width
    while (last < points.size() && points[last] - base <= w) last++;

    bool newline = false;
    for (size_t k = first; k < last; ++k) {
      size_t p = points[k];
      if (text[p] == U'\n') {
        emit(base, p);
        base = p + 1;
        newline = true;
        break;
      }
    }
    if (newline) continue;

    // A punctuation break at the very start of what is left cannot make progress.
    while (last > first && points[last - 1] == base && !is_blank(text[base])) last--;

    if (n - base > w && last > first) {
      size_t p = points[last - 1];
      if (is_blank(text[p])) {
        if (opts.strip_trailing_spaces) {
          emit(base, p);
          base = next_non_blank(p + 1);
        } else if (p - base == w && !is_blank(text[p - 1])) {
          // The space is replaced by the line break itself.
          emit(base, p);
          base = p + 1;
          if (base >= n) out.push_back(Wrapped<T>{});
        } else {
          size_t spot = next_non_blank(p + 1);
          if (spot - base > w) spot = base + w;
          emit(base, spot);
          base = spot;
        }
      } else {
        emit(base, p);
        base = p;
      }
    } else {
      size_t take = std::min(w, n - base);
      emit(base, base + take);
      base += take;
    }
  }

  for (auto& line : out) {
    if (line.text.size() == 1 && line.text[0] == kTrailingNewline) {
      line.text.clear();
      line.meta.clear();
      continue;
    }
    if (opts.strip_trailing_spaces) {
      while (!line.text.empty() && line.text.back() == U' ') {
        line.text.pop_back();
        line.meta.pop_back();
      }
    }
  }
  if (opts.strip_trailing_newlines) {
    while (!out.empty() && out.back().text.empty()) out.pop_back();
  }
  return out;
}

// Styled convenience overload; every output line keeps text/attrs paired.
std::vector<StyledLine> wordwrap(const StyledLine& line, int width, const WrapOptions& opts = {});
