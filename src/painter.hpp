#pragma once
/*
 * Painter
 *
 * Purpose: render styled lines into a clipped device region with the fewest
 *          bytes, and own the device shadow state (cursor + attributes) for
 *          one connected session.
 * Rule: everything that talks to the device goes through here, so the shadow
 *       always mirrors what was actually emitted. The device is never asked
 *       where its cursor is after construction.
 */
#include <vector>
#include "iterminal.hpp"
#include "rect.hpp"
#include "styled_text.hpp"

struct DeviceState {
  int row = 1;
  int col = 1;  // 0 = unknown (pending wrap after the last column)
  Attr attr;
};

class Painter {
public:
  explicit Painter(ITerminal& term);

  int rows() const { return size_.rows; }
  int columns() const { return size_.cols; }
  const DeviceState& state() const { return state_; }

  void paint(const std::vector<StyledLine>& lines, const BoundingRect& bounds);

  void move_cursor(int row, int col);
  void send_text(const std::u32string& text);
  void send_command(Op op);
  void clear_line(int row);
  // Scroll rows top..bottom (inclusive) by `amount`; the exposed rows are blank.
  void shift_down(int top, int bottom, int amount);
  void shift_up(int top, int bottom, int amount);
  // Reverse-video status line on the last device row; cursor and attributes
  // are restored afterwards.
  void status(const std::u32string& text);

private:
  void set_attr(const Attr& attr);

  ITerminal& term_;
  TermSize size_;
  DeviceState state_;
  DeviceState saved_;
};
