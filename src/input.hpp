#pragma once
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
/*
 * Input
 *
 * Purpose: decode the byte stream from the terminal into keys with minimal
 *          state (CSI/SS3 cursor keys, Tab, Enter, Backspace/Delete, Ctrl-C,
 *          printable ASCII).
 * Note: CR, LF and CRLF each produce one Enter. Unknown escape sequences and
 *       other control bytes are dropped.
 */

class Input {
public:
  // Returns a key once a complete sequence has arrived.
  std::optional<Key> feed(unsigned char byte);
  // True in the middle of an escape sequence.
  bool pending() const { return state_ != State::Ground; }
  // Abandons a partial sequence (a bare ESC that timed out).
  void reset();
private:
  enum class State { Ground, Esc, Csi, Ss3 };
  std::optional<Key> ground(unsigned char byte);
  State state_ = State::Ground;
  std::string params_;
  bool after_cr_ = false;
};

// Drops Up/Down keys that repeat the key right before them; a held arrow key
// queues faster than a slow link can repaint.
std::vector<Key> collapse_repeats(const std::vector<Key>& keys);
