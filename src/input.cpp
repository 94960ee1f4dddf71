#include "input.hpp"

std::optional<Key> Input::feed(unsigned char byte) {
  switch (state_) {
    case State::Ground:
      return ground(byte);
    case State::Esc:
      if (byte == '[') { state_ = State::Csi; params_.clear(); return std::nullopt; }
      if (byte == 'O') { state_ = State::Ss3; return std::nullopt; }
      // not a sequence we know; treat the byte on its own
      state_ = State::Ground;
      return ground(byte);
    case State::Csi:
      if (byte >= 0x20 && byte <= 0x3f) { params_ += static_cast<char>(byte); return std::nullopt; }
      state_ = State::Ground;
      switch (byte) {
        case 'A': return Key::of(Key::Kind::Up);
        case 'B': return Key::of(Key::Kind::Down);
        case 'C': return Key::of(Key::Kind::Right);
        case 'D': return Key::of(Key::Kind::Left);
        case '~': if (params_ == "3") return Key::of(Key::Kind::Delete); return std::nullopt;
        default: return std::nullopt;
      }
    case State::Ss3:
      state_ = State::Ground;
      switch (byte) {
        case 'A': return Key::of(Key::Kind::Up);
        case 'B': return Key::of(Key::Kind::Down);
        case 'C': return Key::of(Key::Kind::Right);
        case 'D': return Key::of(Key::Kind::Left);
        case 'M': return Key::of(Key::Kind::Enter);  // keypad enter in application mode
        default: return std::nullopt;
      }
  }
  return std::nullopt;
}

std::optional<Key> Input::ground(unsigned char byte) {
  bool was_cr = after_cr_;
  after_cr_ = false;
  if (byte == 0x1b) { state_ = State::Esc; return std::nullopt; }
  if (byte == '\r') { after_cr_ = true; return Key::of(Key::Kind::Enter); }
  if (byte == '\n') {
    if (was_cr) return std::nullopt;
    return Key::of(Key::Kind::Enter);
  }
  if (byte == '\t') return Key::of(Key::Kind::Tab);
  if (byte == 0x03) return Key::of(Key::Kind::CtrlC);
  if (byte == 0x7f || byte == 0x08) return Key::of(Key::Kind::Backspace);
  if (byte >= 0x20 && byte < 0x7f) return Key::chr(static_cast<char>(byte));
  return std::nullopt;
}

void Input::reset() {
  state_ = State::Ground;
  params_.clear();
  after_cr_ = false;
}

std::vector<Key> collapse_repeats(const std::vector<Key>& keys) {
  std::vector<Key> out;
  for (const Key& k : keys) {
    bool arrow = k.kind == Key::Kind::Up || k.kind == Key::Kind::Down;
    if (arrow && !out.empty() && out.back() == k) continue;
    out.push_back(k);
  }
  return out;
}
