#include "widgets.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include "markup.hpp"
#include "painter.hpp"
#include "rect.hpp"
#include "wordwrap.hpp"

namespace {

Attr reverse_attr() {
  Attr a;
  a.reverse = true;
  return a;
}

bool printable(const Key& key) { return key.kind == Key::Kind::Char && key.ch >= 0x20 && key.ch < 0x7f; }

}

// ---------- Button ----------

Button::Button(Painter& painter, std::string caption, int row, int column, bool focused)
    : painter_(painter), caption_(std::move(caption)), row_(row), column_(column), focused_(focused) {}

std::vector<StyledLine> Button::lines() const {
  int width = static_cast<int>(caption_.size()) + 2;
  Attr a;
  a.bold = focused_;
  return {box_top(width), box_middle(StyledLine::plain(utf8_decode(caption_), a), width), box_bottom(width)};
}

void Button::draw() {
  int width = static_cast<int>(caption_.size()) + 2;
  painter_.paint(lines(), BoundingRect{row_, row_ + 3, column_, column_ + width});
  if (focused_) painter_.move_cursor(row_ + 1, column_ + 1);
}

void Button::draw_caption() {
  int width = static_cast<int>(caption_.size()) + 2;
  painter_.paint({lines()[1]}, BoundingRect{row_ + 1, row_ + 2, column_, column_ + width});
}

bool Button::process_input(const Key& key) {
  bool was = focused_;
  if (key.kind == Key::Kind::Focus) {
    focused_ = true;
    if (!was) draw_caption();
    painter_.move_cursor(row_ + 1, column_ + 1);
    return true;
  }
  if (key.kind == Key::Kind::Unfocus) {
    focused_ = false;
    if (was) draw_caption();
    return true;
  }
  return false;
}

// ---------- HorizontalSelect ----------

HorizontalSelect::HorizontalSelect(Painter& painter, std::vector<std::string> choices, int row, int column,
                                   int width, const std::string& selected, bool focused)
    : painter_(painter), choices_(std::move(choices)), row_(row), column_(column), width_(width), focused_(focused) {
  if (choices_.empty()) throw std::invalid_argument("select needs at least one choice");
  for (size_t i = 0; i < choices_.size(); ++i) {
    if (choices_[i] == selected) {
      index_ = i;
      break;
    }
  }
}

std::vector<StyledLine> HorizontalSelect::lines() const {
  std::string left = focused_ ? "<r>&lt;</r> " : "&lt; ";
  std::string right = focused_ ? " <r>&gt;</r>" : " &gt;";
  std::string text = utf8_encode(center(utf8_decode(choices_[index_]), width_ - 6));
  return {box_top(width_), box_middle(highlight(left + sanitize(text) + right), width_), box_bottom(width_)};
}

void HorizontalSelect::place_cursor() {
  if (!focused_) return;
  std::u32string text = center(utf8_decode(choices_[index_]), width_ - 6);
  int lpos = 0;
  while (lpos < static_cast<int>(text.size()) && text[static_cast<size_t>(lpos)] == U' ') lpos++;
  painter_.move_cursor(row_ + 1, column_ + 3 + lpos);
}

void HorizontalSelect::draw() {
  painter_.paint(lines(), BoundingRect{row_, row_ + 3, column_, column_ + width_});
  place_cursor();
}

void HorizontalSelect::draw_choice() {
  painter_.paint({lines()[1]}, BoundingRect{row_ + 1, row_ + 2, column_, column_ + width_});
}

bool HorizontalSelect::process_input(const Key& key) {
  bool was = focused_;
  switch (key.kind) {
    case Key::Kind::Focus:
      focused_ = true;
      if (!was) draw_choice();
      place_cursor();
      return true;
    case Key::Kind::Unfocus:
      focused_ = false;
      if (was) draw_choice();
      return true;
    case Key::Kind::Left:
      if (index_ > 0) {
        index_--;
        draw_choice();
        place_cursor();
      }
      return true;
    case Key::Kind::Right:
      if (index_ + 1 < choices_.size()) {
        index_++;
        draw_choice();
        place_cursor();
      }
      return true;
    default:
      return false;
  }
}

// ---------- OneLineInputBox ----------

OneLineInputBox::OneLineInputBox(Painter& painter, std::string text, int row, int column, int length)
    : painter_(painter), text_(std::move(text)), row_(row), column_(column), length_(length) {
  if (static_cast<int>(text_.size()) > length_) text_.resize(static_cast<size_t>(length_));
  cursor_ = static_cast<int>(text_.size());
}

std::vector<StyledLine> OneLineInputBox::lines() const {
  return {StyledLine::plain(pad(utf8_decode(text_), length_), reverse_attr())};
}

void OneLineInputBox::place_cursor() { painter_.move_cursor(row_, column_ + cursor_); }

void OneLineInputBox::draw() {
  painter_.paint(lines(), BoundingRect{row_, row_ + 1, column_, column_ + length_});
  place_cursor();
}

bool OneLineInputBox::process_input(const Key& key) {
  switch (key.kind) {
    case Key::Kind::Left:
      if (cursor_ > 0) {
        cursor_--;
        place_cursor();
      }
      return true;
    case Key::Kind::Right:
      if (cursor_ < static_cast<int>(text_.size())) {
        cursor_++;
        place_cursor();
      }
      return true;
    case Key::Kind::Focus:
      place_cursor();
      return true;
    case Key::Kind::Unfocus:
      return true;
    case Key::Kind::Backspace:
    case Key::Kind::Delete:
      if (cursor_ > 0) {
        text_.erase(static_cast<size_t>(cursor_ - 1), 1);
        cursor_--;
        draw();
      }
      return true;
    default:
      break;
  }
  if (!printable(key)) return false;
  // One cell stays free for the cursor.
  if (static_cast<int>(text_.size()) < length_ - 1) {
    text_.insert(static_cast<size_t>(cursor_), 1, key.ch);
    cursor_++;
    draw();
  }
  return true;
}

// ---------- MultiLineInputBox ----------

MultiLineInputBox::MultiLineInputBox(Painter& painter, std::string text, int row, int column, int width, int height)
    : painter_(painter), text_(std::move(text)), row_(row), column_(column), width_(width), height_(height) {
  if (width_ < 2 || height_ < 1) throw std::invalid_argument("text box too small");
  cursor_ = static_cast<int>(text_.size());
}

MultiLineInputBox::Layout MultiLineInputBox::layout(const std::string& text) const {
  std::u32string t = utf8_decode(text);
  std::vector<int> index(t.size());
  std::iota(index.begin(), index.end(), 0);
  WrapOptions opts;
  opts.strip_trailing_spaces = false;
  opts.strip_trailing_newlines = false;
  auto wrapped = wordwrap(t, index, width_ - 1, opts);

  Layout out;
  int last = -1;  // last text index that has a slot
  for (size_t i = 0; i < wrapped.size(); ++i) {
    const auto& line = wrapped[i];
    int row = row_ + static_cast<int>(i);
    if (i > 0) {
      // End of the previous line: either the break character the wrap
      // consumed, or nothing when the next line picks up right where it left.
      int end_row = row - 1;
      int end_col = column_ + static_cast<int>(wrapped[i - 1].text.size());
      size_t next = static_cast<size_t>(last + 1);
      if (!line.meta.empty() && line.meta.front() == last + 1) {
        out.slots.push_back({-1, end_row, end_col});
      } else if (next < t.size() && (t[next] == U' ' || t[next] == U'\n')) {
        out.slots.push_back({last + 1, end_row, end_col});
        last++;
      } else {
        throw std::logic_error("text box: wrapped text does not map back to the input");
      }
    }
    for (size_t j = 0; j < line.meta.size(); ++j) {
      out.slots.push_back({line.meta[j], row, column_ + static_cast<int>(j)});
    }
    if (!line.meta.empty()) last = line.meta.back();
    out.lines.push_back(line.text);
  }

  int row = row_ + static_cast<int>(wrapped.size()) - 1;
  int col = column_ + static_cast<int>(wrapped.back().text.size());
  while (last < static_cast<int>(t.size())) out.slots.push_back({++last, row, col++});
  return out;
}

size_t MultiLineInputBox::slot_of(const Layout& l) const {
  for (size_t k = 0; k < l.slots.size(); ++k) {
    if (l.slots[k].index == cursor_) return k;
  }
  throw std::logic_error("text box: cursor has no position");
}

Pos MultiLineInputBox::cursor_pos() const {
  Layout l = layout(text_);
  const Slot& s = l.slots[slot_of(l)];
  return {s.row, s.column};
}

void MultiLineInputBox::place_cursor(const Layout& l) {
  const Slot& s = l.slots[slot_of(l)];
  painter_.move_cursor(s.row, s.column);
}

std::vector<StyledLine> MultiLineInputBox::lines() const {
  Layout l = layout(text_);
  std::vector<StyledLine> out;
  for (const auto& line : l.lines) {
    if (static_cast<int>(out.size()) == height_) break;
    out.push_back(StyledLine::plain(pad(line, width_), reverse_attr()));
  }
  while (static_cast<int>(out.size()) < height_) {
    out.push_back(StyledLine::plain(std::u32string(static_cast<size_t>(width_), U' '), reverse_attr()));
  }
  return out;
}

void MultiLineInputBox::draw() {
  painter_.paint(lines(), BoundingRect{row_, row_ + height_, column_, column_ + width_});
  place_cursor(layout(text_));
}

void MultiLineInputBox::repaint_changes(const Layout& before, const Layout& after) {
  std::vector<StyledLine> drawable = lines();
  size_t old_count = before.lines.size();
  size_t new_count = after.lines.size();
  size_t common = std::min(old_count, new_count);

  for (size_t i = 0; i < common && i < static_cast<size_t>(height_); ++i) {
    const auto& a = before.lines[i];
    const auto& b = after.lines[i];
    if (a == b) continue;
    int first = -1;
    int last = -1;
    size_t shorter = std::min(a.size(), b.size());
    for (size_t j = 0; j < shorter; ++j) {
      if (a[j] != b[j]) {
        if (first == -1) first = static_cast<int>(j);
        last = static_cast<int>(j) + 1;
      }
    }
    if (a.size() != b.size()) last = static_cast<int>(std::max(a.size(), b.size()));
    if (first == -1) first = static_cast<int>(shorter);

    int row = row_ + static_cast<int>(i);
    painter_.paint({drawable[i].substr(first)}, BoundingRect{row, row + 1, column_ + first, column_ + last});
  }
  for (size_t i = common; i < std::max(old_count, new_count) && i < static_cast<size_t>(height_); ++i) {
    int row = row_ + static_cast<int>(i);
    painter_.paint({drawable[i]}, BoundingRect{row, row + 1, column_, column_ + width_});
  }
}

bool MultiLineInputBox::edit(std::string text, int cursor) {
  Layout after = layout(text);
  if (static_cast<int>(after.lines.size()) > height_) return false;
  Layout before = layout(text_);
  text_ = std::move(text);
  cursor_ = cursor;
  repaint_changes(before, after);
  place_cursor(after);
  return true;
}

bool MultiLineInputBox::process_input(const Key& key) {
  Layout l = layout(text_);
  size_t k = slot_of(l);
  const size_t last = l.slots.size() - 1;

  switch (key.kind) {
    case Key::Kind::Left:
      if (k > 0) {
        k--;
        while (k > 0 && l.slots[k].index < 0) k--;
        cursor_ = l.slots[k].index;
        place_cursor(l);
      }
      return true;
    case Key::Kind::Right:
      if (k < last) {
        k++;
        while (k < last && l.slots[k].index < 0) k++;
        cursor_ = l.slots[k].index;
        place_cursor(l);
      }
      return true;
    case Key::Kind::Up:
    case Key::Kind::Down: {
      const Slot cur = l.slots[k];
      int target = key.kind == Key::Kind::Up ? cur.row - 1 : cur.row + 1;
      const Slot* best = nullptr;
      for (const auto& s : l.slots) {
        if (s.index >= 0 && s.row == target && s.column <= cur.column) best = &s;
      }
      // Off the first or last line: let the form move focus instead.
      if (!best) return false;
      cursor_ = best->index;
      place_cursor(l);
      return true;
    }
    case Key::Kind::Focus:
      place_cursor(l);
      return true;
    case Key::Kind::Unfocus:
      return true;
    case Key::Kind::Backspace:
    case Key::Kind::Delete:
      if (cursor_ > 0) {
        std::string t = text_;
        t.erase(static_cast<size_t>(cursor_ - 1), 1);
        edit(std::move(t), cursor_ - 1);
      }
      return true;
    case Key::Kind::Enter: {
      std::string t = text_;
      t.insert(static_cast<size_t>(cursor_), 1, '\n');
      edit(std::move(t), cursor_ + 1);
      return true;
    }
    default:
      break;
  }
  if (!printable(key)) return false;
  std::string t = text_;
  t.insert(static_cast<size_t>(cursor_), 1, key.ch);
  edit(std::move(t), cursor_ + 1);
  return true;
}

// ---------- FocusWrapper ----------

FocusWrapper::FocusWrapper(std::vector<Focusable*> members, size_t focused)
    : members_(std::move(members)), focused_(focused) {
  if (members_.empty() || focused_ >= members_.size()) throw std::invalid_argument("focus index out of range");
}

void FocusWrapper::focus() { members_[focused_]->process_input(Key::of(Key::Kind::Focus)); }

bool FocusWrapper::process_input(const Key& key) { return members_[focused_]->process_input(key); }

void FocusWrapper::move_to(size_t index) {
  members_[focused_]->process_input(Key::of(Key::Kind::Unfocus));
  focused_ = index;
  members_[focused_]->process_input(Key::of(Key::Kind::Focus));
}

void FocusWrapper::previous(bool wrap) {
  if (focused_ > 0) move_to(focused_ - 1);
  else if (wrap) move_to(members_.size() - 1);
}

void FocusWrapper::next(bool wrap) {
  if (focused_ + 1 < members_.size()) move_to(focused_ + 1);
  else if (wrap) move_to(0);
}
