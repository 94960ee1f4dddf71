#include "headless_terminal.hpp"
#include <algorithm>
#include <stdexcept>
#include "vt100_codes.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols),
      grid_(static_cast<size_t>(rows), std::vector<Cell>(static_cast<size_t>(cols))),
      double_(static_cast<size_t>(rows), false),
      region_top_(1), region_bottom_(rows) {
  if (rows < 1 || cols < 1) throw std::invalid_argument("headless terminal needs a positive size");
}

TermSize HeadlessTerminal::get_size() const { return {rows_, cols_}; }

void HeadlessTerminal::move_cursor(int row, int col) {
  bytes_ += vt100::cursor_address(row, col).size();
  moves_++;
  row_ = std::clamp(row, 1, rows_);
  col_ = std::clamp(col, 1, cols_);
  pending_wrap_ = false;
}

void HeadlessTerminal::send_text(const std::u32string& text) {
  last_touched_row_ = 0;
  for (char32_t c : text) {
    if (c == U'\n') {
      if (acs_) { bytes_ += 1; acs_ = false; }
      bytes_ += 2;
      col_ = 1;
      pending_wrap_ = false;
      line_feed();
      continue;
    }
    if (c == U'\r') {
      bytes_ += 1;
      col_ = 1;
      pending_wrap_ = false;
      continue;
    }
    bool graphic = vt100::acs_letter(c) != 0;
    if (graphic != acs_) { bytes_ += 1; acs_ = graphic; }
    bytes_ += 1;
    put(c);
  }
}

void HeadlessTerminal::put(char32_t c) {
  if (pending_wrap_) {
    pending_wrap_ = false;
    col_ = 1;
    line_feed();
  }
  touch(row_);
  Cell& cell = grid_[static_cast<size_t>(row_ - 1)][static_cast<size_t>(col_ - 1)];
  cell.ch = c;
  cell.attr = attr_;
  if (col_ < cols_) col_++;
  else pending_wrap_ = true;
}

void HeadlessTerminal::touch(int row) {
  // one count per text run per row
  if (row == last_touched_row_) return;
  last_touched_row_ = row;
  touched_[row]++;
}

void HeadlessTerminal::line_feed() {
  if (row_ == region_bottom_) scroll_up(region_top_, region_bottom_);
  else if (row_ < rows_) row_++;
}

void HeadlessTerminal::scroll_up(int top, int bottom) {
  for (int r = top; r < bottom; ++r) {
    grid_[static_cast<size_t>(r - 1)] = grid_[static_cast<size_t>(r)];
    double_[static_cast<size_t>(r - 1)] = double_[static_cast<size_t>(r)];
  }
  grid_[static_cast<size_t>(bottom - 1)].assign(static_cast<size_t>(cols_), Cell{});
  double_[static_cast<size_t>(bottom - 1)] = false;
}

void HeadlessTerminal::scroll_down(int top, int bottom) {
  for (int r = bottom; r > top; --r) {
    grid_[static_cast<size_t>(r - 1)] = grid_[static_cast<size_t>(r - 2)];
    double_[static_cast<size_t>(r - 1)] = double_[static_cast<size_t>(r - 2)];
  }
  grid_[static_cast<size_t>(top - 1)].assign(static_cast<size_t>(cols_), Cell{});
  double_[static_cast<size_t>(top - 1)] = false;
}

void HeadlessTerminal::clear_cells(int row, int from_col) {
  auto& cells = grid_[static_cast<size_t>(row - 1)];
  for (int c = from_col; c <= cols_; ++c) cells[static_cast<size_t>(c - 1)] = Cell{};
}

void HeadlessTerminal::send_command(Op op) {
  bytes_ += vt100::command(op).size();
  switch (op) {
    case Op::SetNormal: attr_ = Attr{}; break;
    case Op::SetBold: attr_.bold = true; break;
    case Op::SetUnderline: attr_.underline = true; break;
    case Op::SetReverse: attr_.reverse = true; break;
    case Op::ClearLine:
      last_touched_row_ = 0;
      touch(row_);
      clear_cells(row_, 1);
      break;
    case Op::ClearToEol:
      last_touched_row_ = 0;
      touch(row_);
      clear_cells(row_, col_);
      break;
    case Op::SaveCursor:
      saved_pos_ = {row_, col_};
      saved_attr_ = attr_;
      break;
    case Op::RestoreCursor:
      row_ = saved_pos_.row;
      col_ = saved_pos_.col;
      attr_ = saved_attr_;
      pending_wrap_ = false;
      break;
    case Op::CursorUp:
      shifts_++;
      pending_wrap_ = false;
      if (row_ == region_top_) scroll_down(region_top_, region_bottom_);
      else if (row_ > 1) row_--;
      break;
    case Op::CursorDown:
      shifts_++;
      pending_wrap_ = false;
      line_feed();
      break;
    case Op::DoubleHeightTop:
    case Op::DoubleHeightBottom:
      double_[static_cast<size_t>(row_ - 1)] = true;
      break;
    case Op::NormalSize:
      double_[static_cast<size_t>(row_ - 1)] = false;
      break;
  }
}

void HeadlessTerminal::set_scroll_region(int top, int bottom) {
  if (top < 1 || bottom > rows_ || top >= bottom) throw std::invalid_argument("bad scroll region");
  bytes_ += vt100::scroll_region(top, bottom).size();
  region_top_ = top;
  region_bottom_ = bottom;
  row_ = 1;
  col_ = 1;
  pending_wrap_ = false;
}

void HeadlessTerminal::clear_scroll_region() {
  bytes_ += vt100::reset_scroll_region().size();
  region_top_ = 1;
  region_bottom_ = rows_;
  row_ = 1;
  col_ = 1;
  pending_wrap_ = false;
}

Pos HeadlessTerminal::fetch_cursor() {
  bytes_ += std::string(vt100::kQueryCursor).size();
  fetches_++;
  return {row_, col_};
}

const HeadlessTerminal::Cell& HeadlessTerminal::cell(int row, int col) const {
  return grid_.at(static_cast<size_t>(row - 1)).at(static_cast<size_t>(col - 1));
}

std::u32string HeadlessTerminal::row_text(int row) const {
  std::u32string out;
  for (const auto& c : grid_.at(static_cast<size_t>(row - 1))) out.push_back(c.ch);
  return out;
}

std::string HeadlessTerminal::row_utf8(int row) const { return utf8_encode(row_text(row)); }

std::string HeadlessTerminal::line(int row) const {
  std::u32string t = row_text(row);
  while (!t.empty() && t.back() == U' ') t.pop_back();
  return utf8_encode(t);
}

bool HeadlessTerminal::double_height(int row) const { return double_.at(static_cast<size_t>(row - 1)); }

std::vector<int> HeadlessTerminal::touched_rows() const {
  std::vector<int> rows;
  for (const auto& [row, count] : touched_) rows.push_back(row);
  return rows;
}

void HeadlessTerminal::reset_counters() {
  bytes_ = 0;
  moves_ = 0;
  shifts_ = 0;
  fetches_ = 0;
  last_touched_row_ = 0;
  touched_.clear();
}
