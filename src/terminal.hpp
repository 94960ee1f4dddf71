#pragma once
/*
 * Terminal
 *
 * Purpose: RAII session on the link: opens the serial device (or the
 *          process's own tty), sets raw mode, baud rate and flow control,
 *          loads terminfo and selects 80 or 132 columns.
 * Usage: construct per connection; the destructor resets the terminal and
 *        restores the original line settings.
 * Errors: throws LinkError when the link cannot be opened or configured.
 */
#include <termios.h>
#include <memory>
#include "config.hpp"
#include "posix_fd.hpp"
#include "terminfo.hpp"
#include "vt_terminal.hpp"

class Terminal {
public:
  explicit Terminal(const Settings& settings);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  VtTerminal& vt() { return *vt_; }

private:
  void configure(const Settings& settings);
  void start(const Settings& settings, const std::string& device);

  UniqueFd fd_;
  struct termios saved_{};
  Terminfo info_;
  std::unique_ptr<VtTerminal> vt_;
};

// Terminal type used for a session: --term, else $TERM on the own tty, else vt100.
std::string terminal_type(const Settings& settings);
