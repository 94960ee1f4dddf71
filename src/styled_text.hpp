#pragma once
/*
 * StyledText
 *
 * Purpose: text plus a parallel per-character attribute array, and the
 *          minimal-diff attribute transition between two device modes.
 * Invariant: StyledLine::text.size() == StyledLine::attrs.size(), always.
 * Note: one char32_t per device cell; UTF-8 only at the edges (markup/feed).
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

struct Attr {
  bool bold = false;
  bool underline = false;
  bool reverse = false;

  // Commands that take a device currently in `prev` to this mode.
  std::vector<Op> codes_from(const Attr& prev) const;

  bool operator==(const Attr& o) const {
    return bold == o.bold && underline == o.underline && reverse == o.reverse;
  }
  bool operator!=(const Attr& o) const { return !(*this == o); }
};

struct StyledLine {
  std::u32string text;
  std::vector<Attr> attrs;

  StyledLine() = default;
  StyledLine(std::u32string t, std::vector<Attr> a);
  // Every character gets `attr`.
  static StyledLine plain(const std::u32string& t, Attr attr = {});

  int size() const { return static_cast<int>(text.size()); }
  bool empty() const { return text.empty(); }
  StyledLine substr(int start, int len = -1) const;
  bool operator==(const StyledLine& o) const { return text == o.text && attrs == o.attrs; }
};

std::u32string utf8_decode(const std::string& s);
std::string utf8_encode(const std::u32string& s);
std::string utf8_encode(char32_t c);
// Drops C0 controls; keeps tab and newline when allow_safe.
std::string strip_low(const std::string& s, bool allow_safe = false);

std::u32string pad(const std::u32string& line, int length);
std::u32string lpad(const std::u32string& line, int length);
std::u32string center(const std::u32string& line, int length);
StyledLine pad(const StyledLine& line, int length, Attr fill = {});

StyledLine join(const std::vector<StyledLine>& chunks);
// Overwrites part of `original`; a negative offset counts from the right edge.
// Plain-text replacements keep the original attributes underneath.
StyledLine replace(const StyledLine& original, const StyledLine& replacement, int offset = 0);
StyledLine replace(const StyledLine& original, const std::u32string& replacement, int offset = 0);

StyledLine box_top(int width);
StyledLine box_bottom(int width);
StyledLine box_middle(const StyledLine& line, int width);
