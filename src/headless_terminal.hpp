#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory VT-100 (cell grid, attributes, cursor, scroll region,
 *          saved cursor, index/reverse-index scrolling) for automated tests
 *          and render verification.
 * Accounting: costs every call with the built-in VT-100 encoding, including
 *             SO/SI switches for line-drawing characters, and records which
 *             rows received text or were cleared.
 */
#include <map>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "styled_text.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell { char32_t ch = U' '; Attr attr; };

  HeadlessTerminal(int rows = 24, int cols = 80);

  TermSize get_size() const override;
  void move_cursor(int row, int col) override;
  void send_text(const std::u32string& text) override;
  void send_command(Op op) override;
  void set_scroll_region(int top, int bottom) override;
  void clear_scroll_region() override;
  Pos fetch_cursor() override;

  const Cell& cell(int row, int col) const;
  std::u32string row_text(int row) const;
  std::string row_utf8(int row) const;
  // Row without trailing blanks, UTF-8.
  std::string line(int row) const;
  Pos cursor() const { return {row_, col_}; }
  Attr attr() const { return attr_; }
  bool double_height(int row) const;

  size_t bytes_sent() const { return bytes_; }
  int cursor_moves() const { return moves_; }
  int shifts() const { return shifts_; }
  int fetches() const { return fetches_; }
  // Row -> number of text runs or clears that landed on it since reset_counters().
  const std::map<int, int>& rows_touched() const { return touched_; }
  std::vector<int> touched_rows() const;
  void reset_counters();

private:
  void put(char32_t c);
  void line_feed();
  void scroll_up(int top, int bottom);
  void scroll_down(int top, int bottom);
  void clear_cells(int row, int from_col);
  void touch(int row);

  int rows_;
  int cols_;
  std::vector<std::vector<Cell>> grid_;
  std::vector<bool> double_;
  int row_ = 1;
  int col_ = 1;
  bool pending_wrap_ = false;
  Attr attr_;
  int region_top_;
  int region_bottom_;
  Pos saved_pos_;
  Attr saved_attr_;
  bool acs_ = false;

  size_t bytes_ = 0;
  int moves_ = 0;
  int shifts_ = 0;
  int fetches_ = 0;
  int last_touched_row_ = 0;
  std::map<int, int> touched_;
};
