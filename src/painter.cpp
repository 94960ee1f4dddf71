#include "painter.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

Painter::Painter(ITerminal& term) : term_(term), size_(term.get_size()) {
  Pos pos = term_.fetch_cursor();
  state_.row = pos.row;
  state_.col = pos.col;
  // The device's mode is unknown at session start; pin it down once.
  term_.send_command(Op::SetNormal);
  state_.attr = Attr{};
  saved_ = state_;
  spdlog::debug("painter: {}x{} device, cursor at {},{}", size_.rows, size_.cols, pos.row, pos.col);
}

void Painter::paint(const std::vector<StyledLine>& lines, const BoundingRect& bounds) {
  // 1-based, so the device spans [1, rows+1) x [1, cols+1).
  if (bounds.bottom <= 1 || bounds.top > size_.rows) return;
  if (bounds.right <= 1 || bounds.left > size_.cols) return;

  // Content above row 1 / left of column 1 is dropped from the lines, not the rect.
  size_t skip_rows = bounds.top < 1 ? static_cast<size_t>(1 - bounds.top) : 0;
  int skip_cols = bounds.left < 1 ? 1 - bounds.left : 0;

  BoundingRect r = bounds.clip(BoundingRect{1, size_.rows + 1, 1, size_.cols + 1});
  if (r.width() == 0 || r.height() == 0) return;
  if (lines.size() <= skip_rows) return;
  size_t count = std::min(lines.size() - skip_rows, static_cast<size_t>(r.height()));

  if (state_.row != r.top || state_.col != r.left) {
    // A bare newline is cheaper than addressing when it lands us there.
    if (state_.row == r.top - 1 && r.left == 1) send_text(U"\n");
    else move_cursor(r.top, r.left);
  }

  for (size_t i = 0; i < count; ++i) {
    if (i != 0) {
      if (r.left == 1) send_text(U"\n");
      else move_cursor(r.top + static_cast<int>(i), r.left);
    }
    const StyledLine& src = lines[skip_rows + i];
    int start = std::min(skip_cols, src.size());
    int len = std::min(src.size() - start, r.width());

    std::u32string run;
    for (int pos = start; pos < start + len; ++pos) {
      const Attr& a = src.attrs[static_cast<size_t>(pos)];
      if (a != state_.attr) {
        if (!run.empty()) { send_text(run); run.clear(); }
        set_attr(a);
      }
      run.push_back(src.text[static_cast<size_t>(pos)]);
    }
    if (!run.empty()) send_text(run);
  }
}

void Painter::set_attr(const Attr& attr) {
  for (Op op : attr.codes_from(state_.attr)) term_.send_command(op);
  state_.attr = attr;
}

void Painter::move_cursor(int row, int col) {
  term_.move_cursor(row, col);
  state_.row = row;
  state_.col = col;
}

void Painter::send_text(const std::u32string& text) {
  term_.send_text(text);
  for (char32_t c : text) {
    if (c == U'\n') {
      state_.row = std::min(state_.row + 1, size_.rows);
      state_.col = 1;
      continue;
    }
    if (state_.col == 0) {
      // pending wrap resolves by wrapping first
      state_.row = std::min(state_.row + 1, size_.rows);
      state_.col = 1;
    }
    state_.col++;
    if (state_.col > size_.cols) state_.col = 0;
  }
}

void Painter::send_command(Op op) {
  term_.send_command(op);
  switch (op) {
    case Op::SetNormal: state_.attr = Attr{}; break;
    case Op::SetBold: state_.attr.bold = true; break;
    case Op::SetUnderline: state_.attr.underline = true; break;
    case Op::SetReverse: state_.attr.reverse = true; break;
    case Op::SaveCursor: saved_ = state_; break;
    case Op::RestoreCursor: state_ = saved_; break;
    case Op::CursorUp: state_.row = std::max(1, state_.row - 1); break;
    case Op::CursorDown: state_.row = std::min(size_.rows, state_.row + 1); break;
    default: break;
  }
}

void Painter::clear_line(int row) {
  if (state_.row != row || state_.col != 1) {
    if (state_.row == row - 1) send_text(U"\n");
    else move_cursor(row, 1);
  }
  send_command(Op::ClearLine);
}

void Painter::shift_down(int top, int bottom, int amount) {
  if (amount <= 0) return;
  if (top >= bottom) {
    clear_line(top);
    return;
  }
  term_.set_scroll_region(top, bottom);
  move_cursor(top, 1);
  for (int i = 0; i < amount; ++i) term_.send_command(Op::CursorUp);
  term_.clear_scroll_region();
  state_.row = 1;
  state_.col = 1;
}

void Painter::shift_up(int top, int bottom, int amount) {
  if (amount <= 0) return;
  if (top >= bottom) {
    clear_line(top);
    return;
  }
  term_.set_scroll_region(top, bottom);
  move_cursor(bottom, 1);
  for (int i = 0; i < amount; ++i) term_.send_command(Op::CursorDown);
  term_.clear_scroll_region();
  state_.row = 1;
  state_.col = 1;
}

void Painter::status(const std::u32string& text) {
  send_command(Op::SaveCursor);
  move_cursor(size_.rows, 1);
  Attr reverse;
  reverse.reverse = true;
  set_attr(reverse);
  send_text(pad(text, size_.cols));
  send_command(Op::RestoreCursor);
}
