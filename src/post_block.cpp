#include "post_block.hpp"
#include <algorithm>
#include <stdexcept>
#include "markup.hpp"
#include "painter.hpp"
#include "rect.hpp"
#include "wordwrap.hpp"

namespace {

constexpr char32_t kShade = U'▒';
const std::u32string kEllipsis = U"•••";

StyledLine styled(const std::u32string& text, bool bold = false) {
  Attr a;
  a.bold = bold;
  return StyledLine::plain(text, a);
}

// Name is cut with an ellipsis so that name + rest fits in `width`.
std::u32string fit_name(std::u32string name, const std::u32string& rest, int width) {
  int leftover = width - static_cast<int>(rest.size());
  if (static_cast<int>(name.size()) > leftover) {
    int keep = std::max(0, leftover - static_cast<int>(kEllipsis.size()));
    name = name.substr(0, static_cast<size_t>(keep)) + kEllipsis;
  }
  return name;
}

}

std::u32string format_timestamp(std::time_t when) {
  std::tm tm{};
  localtime_r(&when, &tm);
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), "%a, %b %d, %Y, %I:%M:%S %p", &tm);
  std::string s(buf, n);
  // no leading zeros on day or hour
  size_t at = 0;
  while ((at = s.find(" 0", at)) != std::string::npos) s.erase(at + 1, 1);
  return utf8_decode(s);
}

StyledLine obscure(const StyledLine& line) {
  StyledLine out = line;
  for (auto& c : out.text) {
    if (c != U' ' && c != U'\t' && c != U'\n') c = kShade;
  }
  return out;
}

PostBlock::PostBlock(PostRecord post, int width) : post_(std::move(post)), width_(width) {
  if (width_ < 8) throw std::invalid_argument("post block too narrow");
  spoilered_ = has_spoiler();
  format();
}

bool PostBlock::toggle_spoiler() {
  if (!has_spoiler()) return false;
  spoilered_ = !spoilered_;
  format();
  return true;
}

StyledLine PostBlock::boost_line() const {
  std::u32string rest = U" (@" + utf8_decode(strip_low(post_.boosted_by_acct)) + U") boosted";
  std::u32string name = fit_name(utf8_decode(strip_low(post_.boosted_by)), rest, width_ - 2);
  return styled(name + rest);
}

StyledLine account_line(const std::string& name, const std::string& acct, int width) {
  std::u32string rest = U" @" + utf8_decode(strip_low(acct));
  std::u32string shown = fit_name(utf8_decode(strip_low(name)), rest, width);
  return join({styled(shown, true), styled(rest)});
}

StyledLine PostBlock::name_line() const { return account_line(post_.author, post_.acct, width_ - 2); }

StyledLine PostBlock::stats_line() const {
  std::vector<StyledLine> parts;
  auto stat = [&](const std::u32string& text, bool bold) {
    if (!parts.empty()) parts.push_back(styled(U"├─┤"));
    parts.push_back(styled(text, bold));
  };
  parts.push_back(styled(U"┤"));
  stat(format_timestamp(post_.created), false);
  stat(utf8_decode(std::to_string(post_.replies)) + U" C", false);
  stat(utf8_decode(std::to_string(post_.boosts)) + U" B", post_.boosted);
  stat(utf8_decode(std::to_string(post_.favs)) + U" L", post_.liked);
  stat(U"S", post_.bookmarked);
  parts.push_back(styled(U"├"));
  return join(parts);
}

std::vector<StyledLine> PostBlock::attachment_lines() const {
  std::vector<StyledLine> out;
  for (const auto& a : post_.attachments) {
    std::string alt = a.description.empty() ? "no description" : strip_low(a.description, true);
    std::string file = strip_low(a.file);
    size_t slash = file.rfind('/');
    if (slash != std::string::npos) file = file.substr(slash + 1);

    Attr underline;
    underline.underline = true;
    StyledLine desc = join({StyledLine::plain(utf8_decode(file), underline), styled(U": " + utf8_decode(alt))});

    out.push_back(box_top(width_ - 2));
    for (const auto& line : wordwrap(desc, width_ - 4)) out.push_back(box_middle(line, width_ - 2));
    out.push_back(box_bottom(width_ - 2));
  }
  return out;
}

void PostBlock::format() {
  std::vector<StyledLine> text;
  if (!post_.boosted_by.empty()) text.push_back(boost_line());
  text.push_back(name_line());
  if (has_spoiler()) {
    Attr reverse;
    reverse.reverse = true;
    text.push_back(StyledLine::plain(pad(U"CW: " + utf8_decode(strip_low(post_.cw)), width_ - 2), reverse));
  }

  StyledLine body = highlight(strip_low(post_.body, true));
  if (spoilered_) body = obscure(body);
  for (auto& line : wordwrap(body, width_ - 2)) text.push_back(std::move(line));
  for (auto& line : attachment_lines()) text.push_back(std::move(line));

  lines_.clear();
  lines_.reserve(text.size() + 2);
  lines_.push_back(box_top(width_));
  for (const auto& line : text) lines_.push_back(box_middle(line, width_));
  lines_.push_back(replace(box_bottom(width_), stats_line(), -2));
}

StyledLine PostBlock::labeled_top(std::optional<int> ordinal) const {
  std::u32string label = ordinal ? U"┤" + utf8_decode(std::to_string(*ordinal)) + U"├" : std::u32string(U"───");
  return replace(lines_.front(), label, 3);
}

void PostBlock::draw(Painter& painter, int top, int bottom, int offset, std::optional<int> ordinal) const {
  if (offset < 0 || offset >= height() || bottom < top) return;
  int count = std::min(height() - offset, bottom - top + 1);
  std::vector<StyledLine> slice(lines_.begin() + offset, lines_.begin() + offset + count);
  if (offset == 0) slice.front() = labeled_top(ordinal);
  painter.paint(slice, BoundingRect{top, bottom + 1, 1, width_ + 1});
}
