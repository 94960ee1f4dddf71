#include "styled_text.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<Op> Attr::codes_from(const Attr& prev) const {
  std::vector<Op> ops;
  if ((!bold && prev.bold) || (!underline && prev.underline) || (!reverse && prev.reverse)) {
    // The device has no per-flag "off"; reset everything and re-enable.
    ops.push_back(Op::SetNormal);
    if (bold) ops.push_back(Op::SetBold);
    if (underline) ops.push_back(Op::SetUnderline);
    if (reverse) ops.push_back(Op::SetReverse);
    return ops;
  }
  if (bold && !prev.bold) ops.push_back(Op::SetBold);
  if (underline && !prev.underline) ops.push_back(Op::SetUnderline);
  if (reverse && !prev.reverse) ops.push_back(Op::SetReverse);
  return ops;
}

StyledLine::StyledLine(std::u32string t, std::vector<Attr> a) : text(std::move(t)), attrs(std::move(a)) {
  if (text.size() != attrs.size()) throw std::invalid_argument("styled line: attribute count must match text length");
}

StyledLine StyledLine::plain(const std::u32string& t, Attr attr) {
  return StyledLine(t, std::vector<Attr>(t.size(), attr));
}

StyledLine StyledLine::substr(int start, int len) const {
  int n = size();
  start = std::clamp(start, 0, n);
  int end = len < 0 ? n : std::min(n, start + len);
  StyledLine out;
  out.text = text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
  out.attrs.assign(attrs.begin() + start, attrs.begin() + end);
  return out;
}

std::u32string utf8_decode(const std::string& s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0, n = s.size();
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int extra = 0;
    char32_t cp = 0;
    if (c < 0x80) { out.push_back(c); i++; continue; }
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else { out.push_back(0xFFFD); i++; continue; }
    if (i + static_cast<size_t>(extra) >= n) { out.push_back(0xFFFD); i = n; continue; }
    bool ok = true;
    for (int k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) { out.push_back(0xFFFD); i++; continue; }
    out.push_back(cp);
    i += static_cast<size_t>(extra) + 1;
  }
  return out;
}

std::string utf8_encode(char32_t c) {
  std::string out;
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
  return out;
}

std::string utf8_encode(const std::u32string& s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t c : s) out += utf8_encode(c);
  return out;
}

std::string strip_low(const std::string& s, bool allow_safe) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 32 && !(allow_safe && (u == '\t' || u == '\n'))) continue;
    out.push_back(c);
  }
  return out;
}

std::u32string pad(const std::u32string& line, int length) {
  if (length <= 0) return std::u32string();
  if (static_cast<int>(line.size()) >= length) return line.substr(0, static_cast<size_t>(length));
  return line + std::u32string(static_cast<size_t>(length) - line.size(), U' ');
}

std::u32string lpad(const std::u32string& line, int length) {
  if (length <= 0) return std::u32string();
  if (static_cast<int>(line.size()) >= length) return line.substr(0, static_cast<size_t>(length));
  return std::u32string(static_cast<size_t>(length) - line.size(), U' ') + line;
}

std::u32string center(const std::u32string& line, int length) {
  int len = static_cast<int>(line.size());
  if (len == length) return line;
  if (len > length) {
    int cut = (len - length) / 2;
    return line.substr(static_cast<size_t>(cut), static_cast<size_t>(std::max(0, length)));
  }
  int add = (length - len) / 2;
  return pad(std::u32string(static_cast<size_t>(add), U' ') + line, length);
}

StyledLine pad(const StyledLine& line, int length, Attr fill) {
  if (line.size() >= length) return line.substr(0, length);
  StyledLine out = line;
  out.text.append(static_cast<size_t>(length - line.size()), U' ');
  out.attrs.resize(static_cast<size_t>(length), fill);
  return out;
}

StyledLine join(const std::vector<StyledLine>& chunks) {
  StyledLine out;
  for (const auto& c : chunks) {
    out.text += c.text;
    out.attrs.insert(out.attrs.end(), c.attrs.begin(), c.attrs.end());
  }
  return out;
}

static StyledLine replace_impl(const StyledLine& original, const std::u32string& text_in,
                               const std::vector<Attr>* attrs_in, int offset) {
  std::u32string text = text_in;
  std::vector<Attr> attrs = attrs_in ? *attrs_in : std::vector<Attr>();
  int olen = original.size();
  if (offset >= 0) {
    offset = std::min(offset, olen);
    if (offset + static_cast<int>(text.size()) > olen) {
      size_t amount = static_cast<size_t>(olen - offset);
      text.resize(amount);
      if (attrs_in) attrs.resize(amount);
    }
  } else {
    offset = (olen - static_cast<int>(text.size())) + offset;
    if (offset < 0) {
      size_t cut = std::min(text.size(), static_cast<size_t>(-offset));
      text.erase(0, cut);
      if (attrs_in) attrs.erase(attrs.begin(), attrs.begin() + static_cast<long>(cut));
      offset = 0;
    }
  }
  StyledLine out = original;
  size_t at = static_cast<size_t>(offset);
  size_t n = std::min(text.size(), original.text.size() - at);
  out.text.replace(at, n, text.substr(0, n));
  if (attrs_in) std::copy(attrs.begin(), attrs.begin() + static_cast<long>(n), out.attrs.begin() + static_cast<long>(at));
  return out;
}

StyledLine replace(const StyledLine& original, const StyledLine& replacement, int offset) {
  return replace_impl(original, replacement.text, &replacement.attrs, offset);
}

StyledLine replace(const StyledLine& original, const std::u32string& replacement, int offset) {
  return replace_impl(original, replacement, nullptr, offset);
}

StyledLine box_top(int width) {
  if (width < 2) return StyledLine::plain(std::u32string(static_cast<size_t>(std::max(0, width)), U'─'));
  return StyledLine::plain(U"┌" + std::u32string(static_cast<size_t>(width - 2), U'─') + U"┐");
}

StyledLine box_bottom(int width) {
  if (width < 2) return StyledLine::plain(std::u32string(static_cast<size_t>(std::max(0, width)), U'─'));
  return StyledLine::plain(U"└" + std::u32string(static_cast<size_t>(width - 2), U'─') + U"┘");
}

StyledLine box_middle(const StyledLine& line, int width) {
  StyledLine inner = pad(line, std::max(0, width - 2));
  return join({StyledLine::plain(U"│"), inner, StyledLine::plain(U"│")});
}
