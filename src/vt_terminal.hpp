#pragma once
/*
 * VtTerminal
 *
 * Purpose: ITerminal over a link file descriptor. Sequences come from the
 *          terminfo entry loaded by Terminal, with built-in VT-100 strings
 *          for what terminfo cannot express (line erase, double height).
 * Output: written as each call is made. Line-drawing characters go through
 *         the alternate character set unless the link is UTF-8; anything else
 *         outside ASCII becomes '?'.
 * Errors: a failed read or write throws LinkError.
 */
#include <deque>
#include <string>
#include "iterminal.hpp"

class Terminfo;

class VtTerminal : public ITerminal {
public:
  // Without a loaded entry every sequence is the built-in VT-100 one.
  VtTerminal(int fd, TermSize size, bool utf8, const Terminfo& info);

  TermSize get_size() const override { return size_; }
  void move_cursor(int row, int col) override;
  void send_text(const std::u32string& text) override;
  void send_command(Op op) override;
  void set_scroll_region(int top, int bottom) override;
  void clear_scroll_region() override;
  Pos fetch_cursor() override;

  // False when nothing arrived within `timeout_ms` (negative waits forever).
  bool read_byte(unsigned char& out, int timeout_ms);
  void write(const std::string& bytes);

private:
  std::string encode(const std::u32string& text);

  static constexpr int kOpCount = static_cast<int>(Op::NormalSize) + 1;

  int fd_;
  TermSize size_;
  bool utf8_;
  const Terminfo& info_;
  bool acs_ = false;
  std::string enter_acs_;
  std::string exit_acs_;
  char acs_map_[128];
  std::string commands_[kOpCount];
  std::deque<unsigned char> typeahead_;
};
