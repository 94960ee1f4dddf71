#include "vt100_codes.hpp"

namespace vt100 {

std::string command(Op op) {
  switch (op) {
    case Op::SetNormal: return "\x1b[0m";
    case Op::SetBold: return "\x1b[1m";
    case Op::SetUnderline: return "\x1b[4m";
    case Op::SetReverse: return "\x1b[7m";
    case Op::ClearLine: return "\x1b[2K";
    case Op::ClearToEol: return "\x1b[K";
    case Op::SaveCursor: return "\x1b" "7";
    case Op::RestoreCursor: return "\x1b" "8";
    case Op::CursorUp: return "\x1bM";
    case Op::CursorDown: return "\x1b" "D";
    case Op::DoubleHeightTop: return "\x1b#3";
    case Op::DoubleHeightBottom: return "\x1b#4";
    case Op::NormalSize: return "\x1b#5";
  }
  return std::string();
}

std::string cursor_address(int row, int col) {
  return "\x1b[" + std::to_string(row) + ";" + std::to_string(col) + "H";
}

std::string scroll_region(int top, int bottom) {
  return "\x1b[" + std::to_string(top) + ";" + std::to_string(bottom) + "r";
}

std::string reset_scroll_region() { return "\x1b[r"; }

char acs_letter(char32_t c) {
  switch (c) {
    case U'┌': return 'l';
    case U'┐': return 'k';
    case U'└': return 'm';
    case U'┘': return 'j';
    case U'─': return 'q';
    case U'│': return 'x';
    case U'├': return 't';
    case U'┤': return 'u';
    case U'┬': return 'w';
    case U'┴': return 'v';
    case U'┼': return 'n';
    case U'▒': return 'a';
    case U'•': return '~';
    default: return 0;
  }
}

}
