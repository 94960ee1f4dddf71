#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract device backend (size, cursor, text, mode commands, scroll region).
 * Goal: decouple from concrete impls (serial VT-100/headless), enable testing.
 * Contract: every call goes to the device immediately and in order; nothing is
 *           buffered for a later flush. Coordinates are 1-based.
 */
#include <stdexcept>
#include <string>
#include "types.hpp"

// The link to the terminal failed; the session has to be reopened.
class LinkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct TermSize { int rows; int cols; };

enum class Op {
  SetNormal,
  SetBold,
  SetUnderline,
  SetReverse,
  ClearLine,        // whole line, cursor stays
  ClearToEol,
  SaveCursor,       // position and attributes
  RestoreCursor,
  CursorUp,         // reverse index: scrolls the region down at its top row
  CursorDown,       // index: scrolls the region up at its bottom row
  DoubleHeightTop,
  DoubleHeightBottom,
  NormalSize,
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void move_cursor(int row, int col) = 0;
  // '\n' is a newline: column 1 of the next row, scrolling at the region bottom.
  virtual void send_text(const std::u32string& text) = 0;
  virtual void send_command(Op op) = 0;
  // Both leave the cursor at the home position.
  virtual void set_scroll_region(int top, int bottom) = 0;
  virtual void clear_scroll_region() = 0;
  // One-shot query, only valid at session start.
  virtual Pos fetch_cursor() = 0;
};
