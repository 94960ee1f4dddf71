#include "widgets.hpp"
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>
#include "headless_terminal.hpp"
#include "painter.hpp"

namespace {

struct Rig {
  HeadlessTerminal term;
  Painter painter;
  Rig() : term(24, 80), painter(term) {}
};

void type(Focusable& w, const std::string& text) {
  for (char c : text) w.process_input(Key::chr(c));
}

Key k(Key::Kind kind) { return Key::of(kind); }

}

static void test_button() {
  Rig rig;
  Button b(rig.painter, "Post", 5, 3);
  b.draw();
  assert(rig.term.line(5) == "  ┌────┐");
  assert(rig.term.line(6) == "  │Post│");
  assert(rig.term.line(7) == "  └────┘");
  assert(!rig.term.cell(6, 4).attr.bold);

  rig.term.reset_counters();
  assert(b.process_input(k(Key::Kind::Focus)));
  assert(b.focused());
  assert(rig.term.cell(6, 4).attr.bold);
  assert((rig.term.touched_rows() == std::vector<int>{6}));
  assert(rig.term.cursor().row == 6 && rig.term.cursor().col == 4);

  // focusing again only moves the cursor
  rig.term.reset_counters();
  b.process_input(k(Key::Kind::Focus));
  assert(rig.term.touched_rows().empty());

  assert(b.process_input(k(Key::Kind::Unfocus)));
  assert(!rig.term.cell(6, 4).attr.bold);
  assert(!b.process_input(Key::chr('x')));
  assert(!b.process_input(k(Key::Kind::Enter)));
}

static void test_select() {
  Rig rig;
  std::vector<std::string> choices = {"one", "two", "three"};
  HorizontalSelect s(rig.painter, choices, 2, 1, 15, "two");
  assert(s.selected() == "two");
  assert(s.selected_index() == 1);
  s.draw();
  assert(rig.term.line(3).find("two") != std::string::npos);
  assert(rig.term.line(3).find("<") != std::string::npos);

  assert(s.process_input(k(Key::Kind::Right)));
  assert(s.selected() == "three");
  assert(rig.term.line(3).find("three") != std::string::npos);
  // ends do not wrap
  assert(s.process_input(k(Key::Kind::Right)));
  assert(s.selected() == "three");
  s.process_input(k(Key::Kind::Left));
  s.process_input(k(Key::Kind::Left));
  s.process_input(k(Key::Kind::Left));
  assert(s.selected() == "one");
  assert(!s.process_input(Key::chr('a')));

  HorizontalSelect unknown(rig.painter, choices, 10, 1, 15, "four");
  assert(unknown.selected() == "one");
  bool threw = false;
  try {
    HorizontalSelect empty(rig.painter, {}, 10, 1, 15);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

static void test_one_line_box() {
  Rig rig;
  OneLineInputBox box(rig.painter, "", 4, 10, 5);
  box.draw();
  assert(rig.term.cell(4, 10).attr.reverse);
  assert(rig.term.cell(4, 14).attr.reverse);
  assert(!rig.term.cell(4, 15).attr.reverse);

  type(box, "abcdef");
  assert(box.text() == "abcd");  // the last cell is kept for the cursor
  assert(box.cursor() == 4);
  assert(rig.term.row_text(4).substr(9, 4) == U"abcd");

  box.process_input(k(Key::Kind::Left));
  box.process_input(k(Key::Kind::Backspace));
  assert(box.text() == "abd");
  assert(box.cursor() == 2);
  assert(rig.term.cursor().row == 4 && rig.term.cursor().col == 12);

  box.process_input(k(Key::Kind::Right));
  box.process_input(k(Key::Kind::Right));
  assert(box.cursor() == 3);
  // tabs and other controls are left to the form
  assert(!box.process_input(k(Key::Kind::Tab)));
  assert(!box.process_input(k(Key::Kind::Up)));

  OneLineInputBox long_text(rig.painter, "overflowing", 6, 1, 4);
  assert(long_text.text() == "over");
}

static void test_multi_line_wrap() {
  Rig rig;
  MultiLineInputBox box(rig.painter, "", 5, 3, 10, 3);
  box.draw();
  type(box, "hello world");
  assert(box.text() == "hello world");
  assert(rig.term.row_text(5).substr(2, 10) == U"hello     ");
  assert(rig.term.row_text(6).substr(2, 10) == U"world     ");
  assert(rig.term.cell(7, 3).attr.reverse);
  assert(box.cursor_pos().row == 6 && box.cursor_pos().col == 8);
  assert(rig.term.cursor().row == 6 && rig.term.cursor().col == 8);

  // an explicit newline opens a line
  box.process_input(k(Key::Kind::Enter));
  type(box, "x");
  assert(box.text() == "hello world\nx");
  assert(rig.term.row_text(7).substr(2, 1) == U"x");

  box.process_input(k(Key::Kind::Backspace));
  box.process_input(k(Key::Kind::Backspace));
  assert(box.text() == "hello world");
  assert(rig.term.row_text(7).substr(2, 10) == U"          ");
}

static void test_multi_line_limits_and_motion() {
  Rig rig;
  MultiLineInputBox box(rig.painter, "", 1, 1, 5, 2);
  box.draw();
  type(box, "abcdefgh");
  assert(rig.term.line(1) == "abcd");
  assert(rig.term.line(2) == "efgh");
  // a third line does not fit
  type(box, "i");
  assert(box.text() == "abcdefgh");
  assert(box.cursor() == 8);

  assert(box.process_input(k(Key::Kind::Up)));
  assert(box.cursor() == 3);
  assert(box.cursor_pos().row == 1 && box.cursor_pos().col == 4);
  // off the first line the form takes over
  assert(!box.process_input(k(Key::Kind::Up)));
  assert(box.process_input(k(Key::Kind::Down)));
  assert(box.cursor() == 7);
  assert(!box.process_input(k(Key::Kind::Down)));

  box.process_input(k(Key::Kind::Left));
  box.process_input(k(Key::Kind::Left));
  box.process_input(k(Key::Kind::Left));
  assert(box.cursor() == 4);
  box.process_input(k(Key::Kind::Left));
  assert(box.cursor() == 3);

  box.process_input(k(Key::Kind::Backspace));
  assert(box.text() == "abdefgh");
  assert(box.cursor() == 2);
  assert(rig.term.line(1) == "abde");
  assert(rig.term.line(2) == "fgh");

  bool threw = false;
  try {
    MultiLineInputBox tiny(rig.painter, "", 1, 1, 1, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

static void test_focus_wrapper() {
  Rig rig;
  Button a(rig.painter, "A", 1, 1);
  Button b(rig.painter, "B", 1, 5);
  Button c(rig.painter, "C", 1, 9);
  FocusWrapper focus({&a, &b, &c}, 0);
  focus.focus();
  assert(a.focused());

  focus.next();
  assert(focus.focused() == 1);
  assert(!a.focused() && b.focused());
  focus.next();
  focus.next();
  assert(focus.focused() == 2);
  focus.next(true);
  assert(focus.focused() == 0);
  assert(a.focused() && !c.focused());
  focus.previous();
  assert(focus.focused() == 0);
  focus.previous(true);
  assert(focus.focused() == 2);

  // keys go to the focused member only
  assert(!focus.process_input(Key::chr('x')));

  bool threw = false;
  try {
    FocusWrapper bad({&a}, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_button();
  test_select();
  test_one_line_box();
  test_multi_line_wrap();
  test_multi_line_limits_and_motion();
  test_focus_wrapper();
  return 0;
}
