#pragma once
/*
 * Vt100Codes
 *
 * Purpose: built-in VT-100 escape sequences, used where terminfo has no
 *          capability and by the headless backend to cost its output.
 */
#include <string>
#include "iterminal.hpp"

namespace vt100 {
std::string command(Op op);
std::string cursor_address(int row, int col);
std::string scroll_region(int top, int bottom);
std::string reset_scroll_region();
// Alternate character set letter for a box-drawing code point, 0 if none.
char acs_letter(char32_t c);
constexpr const char* kNewline = "\r\n";
constexpr const char* kEnterAcs = "\x0e";  // SO, with G1 designated as DEC graphics
constexpr const char* kExitAcs = "\x0f";   // SI
constexpr const char* kDesignateAcs = "\x1b(B\x1b)0";
constexpr const char* kQueryCursor = "\x1b[6n";
constexpr const char* kSet80Columns = "\x1b[?3l";
constexpr const char* kSet132Columns = "\x1b[?3h";
constexpr const char* kReset = "\x1b" "c";
}
