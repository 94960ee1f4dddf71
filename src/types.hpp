#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Key/Timeline/Visibility/Pos).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>

enum class Timeline { Home, Local, Global };

enum class Visibility { Public, Unlisted, Private, Direct };

// 1-based device coordinates, the way the VT-100 manual counts them.
struct Pos { int row = 1; int col = 1; };

struct Key {
  enum class Kind {
    None, Char, Up, Down, Left, Right, Backspace, Delete, Enter, Tab, CtrlC,
    Focus, Unfocus
  };
  Kind kind = Kind::None;
  char ch = 0;

  static Key of(Kind k) { Key key; key.kind = k; return key; }
  static Key chr(char c) { Key key; key.kind = Kind::Char; key.ch = c; return key; }
  bool is(char c) const { return kind == Kind::Char && ch == c; }
  bool operator==(const Key& o) const { return kind == o.kind && ch == o.ch; }
};
