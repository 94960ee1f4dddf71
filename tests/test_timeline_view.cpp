#include "timeline_view.hpp"
#include <cassert>
#include <string>
#include <vector>
#include "fake_source.hpp"
#include "headless_terminal.hpp"
#include "painter.hpp"
#include "screen_stack.hpp"

namespace {

struct Rig {
  HeadlessTerminal term;
  Painter painter;
  FakeSource source;
  ScreenStack stack;
  Rig() : term(24, 80), painter(term), stack(painter, source, SessionProps{}) {}
};

std::vector<std::u32string> screen(const HeadlessTerminal& term, int from, int to) {
  std::vector<std::u32string> rows;
  for (int r = from; r <= to; ++r) rows.push_back(term.row_text(r));
  return rows;
}

std::u32string label(const HeadlessTerminal& term, int row) { return term.row_text(row).substr(0, 6); }

void load(TimelineView& view) {
  std::string msg;
  bool ok = view.load(msg);
  assert(ok);
  view.draw();
}

}

// 24x80, three 10-row blocks, one row per step.
static void test_end_to_end_line_scroll() {
  Rig rig;
  rig.source.fill(Timeline::Home, 3, 7);
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);

  assert(view.view_height() == 23);
  assert(view.posts().size() == 3);
  assert(view.posts()[0].height() == 10);
  assert(label(rig.term, 1) == U"┌──┤1├");
  assert(label(rig.term, 11) == U"┌──┤2├");
  assert(label(rig.term, 21) == U"┌──┤3├");
  assert(rig.term.row_text(2).substr(0, 6) == U"│Alice");
  assert(rig.term.cell(2, 2).attr.bold);
  assert(rig.term.line(3) == "│post 1 line 1" + std::string(65, ' ') + "│");

  rig.term.reset_counters();
  view.redraw();
  const size_t full = rig.term.bytes_sent();

  for (int step = 1; step <= 9; ++step) {
    rig.term.reset_counters();
    view.scroll_down();
    assert(view.offset() == step);
    assert(rig.term.shifts() == 1);
    assert((rig.term.touched_rows() == std::vector<int>{23}));
    assert(rig.term.bytes_sent() < full);
  }
  // the first block's bottom is on row 1; its label is still 1
  assert(label(rig.term, 2) == U"┌──┤2├");

  // the first block leaves: both remaining labels move down by one
  rig.term.reset_counters();
  view.scroll_down();
  assert(view.offset() == 10);
  assert((rig.term.touched_rows() == std::vector<int>{1, 11, 23}));
  assert(label(rig.term, 1) == U"┌──┤1├");
  assert(label(rig.term, 11) == U"┌──┤2├");

  for (int step = 11; step <= 19; ++step) {
    rig.term.reset_counters();
    view.scroll_down();
    assert((rig.term.touched_rows() == std::vector<int>{23}));
  }
  rig.term.reset_counters();
  view.scroll_down();
  assert((rig.term.touched_rows() == std::vector<int>{1, 23}));
  assert(label(rig.term, 1) == U"┌──┤1├");
}

static void test_jump_shift_or_repaint() {
  Rig rig;
  rig.source.fill(Timeline::Home, 10, 3);
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  const std::vector<std::u32string> top = screen(rig.term, 1, 23);

  // N rows without label changes: N shifts, N repainted rows
  for (int i = 0; i < 5; ++i) view.scroll_down();
  rig.term.reset_counters();
  view.jump_top();
  assert(view.offset() == 0);
  assert(rig.term.shifts() == 5);
  assert((rig.term.touched_rows() == std::vector<int>{1, 2, 3, 4, 5}));
  assert(screen(rig.term, 1, 23) == top);

  // one row short of the viewport still shifts
  for (int i = 0; i < 22; ++i) view.scroll_down();
  rig.term.reset_counters();
  view.jump_top();
  assert(rig.term.shifts() == 22);
  assert(screen(rig.term, 1, 23) == top);

  // a full viewport away repaints instead
  for (int i = 0; i < 23; ++i) view.scroll_down();
  rig.term.reset_counters();
  view.jump_top();
  assert(rig.term.shifts() == 0);
  assert(rig.term.touched_rows().size() == 23);
  assert(screen(rig.term, 1, 23) == top);

  // already at the top: nothing
  rig.term.reset_counters();
  view.jump_top();
  view.scroll_up();
  assert(rig.term.bytes_sent() == 0);
}

static void test_post_navigation() {
  Rig rig;
  rig.source.fill(Timeline::Home, 10, 3);
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  const std::vector<std::u32string> top = screen(rig.term, 1, 23);

  view.next_post();
  assert(view.offset() == 6);
  assert(label(rig.term, 1) == U"┌──┤1├");
  assert(rig.term.row_text(3).substr(0, 14) == U"│post 2 line 1");

  // mid-block, 'p' goes back to that block's own top
  view.scroll_down();
  view.prev_post();
  assert(view.offset() == 6);

  view.prev_post();
  assert(view.offset() == 0);
  assert(screen(rig.term, 1, 23) == top);

  // nothing before the first block
  rig.term.reset_counters();
  view.prev_post();
  assert(rig.term.bytes_sent() == 0);
}

static std::vector<int> rows_between(int from, int to) {
  std::vector<int> rows;
  for (int r = from; r <= to; ++r) rows.push_back(r);
  return rows;
}

// A post exactly one row short of the viewport shifts; a full viewport repaints.
static void test_post_navigation_boundary() {
  for (int height : {22, 23}) {
    Rig rig;
    for (int id = 1; id <= 3; ++id) rig.source.posts[Timeline::Home].push_back(make_post(std::to_string(id), height - 3));
    TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
    load(view);
    assert(view.view_height() == 23);
    const std::vector<std::u32string> top = screen(rig.term, 1, 23);
    const int expected_shifts = height < view.view_height() ? height : 0;

    rig.term.reset_counters();
    view.next_post();
    assert(view.offset() == height);
    assert(rig.term.shifts() == expected_shifts);
    assert(label(rig.term, 1) == U"┌──┤1├");
    assert(rig.term.row_text(3).substr(0, 14) == U"│post 2 line 1");
    assert(view.pending_rows().empty());

    rig.term.reset_counters();
    view.prev_post();
    assert(view.offset() == 0);
    assert(rig.term.shifts() == expected_shifts);
    assert(screen(rig.term, 1, 23) == top);
    assert(rig.source.fetches == 1);
  }
}

// 'n' on the last fetched block, 30 rows tall: repaint, one fetch, then the
// new block fills the rows the repaint left blank.
static void test_next_post_past_end_repaints() {
  Rig rig;
  rig.source.fill(Timeline::Home, 3, 27);
  rig.source.page_size = 1;
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  assert(view.posts().size() == 1);
  assert(view.posts()[0].height() == 30);

  rig.term.reset_counters();
  auto action = view.process_input(Key::chr('n'));
  assert(action && action->kind == Action::Kind::None);
  assert(view.offset() == 30);
  assert(rig.term.shifts() == 0);
  assert(rig.source.fetches == 2);
  assert(rig.source.sinces.back() == "1");
  assert(view.posts().size() == 2);
  assert(view.pending_rows().empty());
  assert(label(rig.term, 1) == U"┌──┤1├");
  assert(rig.term.row_text(3).substr(0, 14) == U"│post 2 line 1");
  assert(rig.term.touched_rows() == rows_between(1, 24));
}

// Same on the shift path: a 10-row block, shifted up by 10. The rows that
// were blank below it and the exposed ones are painted after one fetch.
static void test_next_post_past_end_shifts() {
  Rig rig;
  rig.source.fill(Timeline::Home, 3, 7);
  rig.source.page_size = 1;
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  assert(rig.term.line(11).empty());

  rig.term.reset_counters();
  auto action = view.process_input(Key::chr('n'));
  assert(action && action->kind == Action::Kind::None);
  assert(view.offset() == 10);
  assert(rig.term.shifts() == 10);
  assert(rig.source.fetches == 2);
  assert(view.posts().size() == 2);
  assert(view.pending_rows().empty());
  assert(label(rig.term, 1) == U"┌──┤1├");
  assert(rig.term.row_text(3).substr(0, 14) == U"│post 2 line 1");
  assert(rig.term.row_text(10).substr(0, 1) == U"└");
  for (int row = 11; row <= 23; ++row) assert(rig.term.line(row).empty());
  assert(rig.term.touched_rows() == rows_between(1, 24));
}

static void test_infinite_scroll() {
  Rig rig;
  rig.source.fill(Timeline::Home, 10, 3);
  rig.source.page_size = 5;
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  assert(view.posts().size() == 5);
  assert(rig.source.fetches == 1);

  // 30 rows of content; row 23 runs past it at offset 8
  for (int i = 0; i < 7; ++i) view.process_input(Key::of(Key::Kind::Down));
  assert(rig.source.fetches == 1);
  assert(rig.term.line(23) != "");

  rig.term.reset_counters();
  auto action = view.process_input(Key::of(Key::Kind::Down));
  assert(action && action->kind == Action::Kind::None);
  assert(rig.source.fetches == 2);
  assert(rig.source.sinces.back() == "5");
  assert(view.posts().size() == 10);
  for (size_t i = 0; i < view.posts().size(); ++i) {
    assert(view.posts()[i].post().id == std::to_string(i + 1));
  }
  assert(view.pending_rows().empty());
  assert(label(rig.term, 23) == U"┌──┤5├");
  // the blank row, painted twice, and the status line
  assert((rig.term.touched_rows() == std::vector<int>{23, 24}));
  assert(rig.stack.current_status() == "Press '?' for help.");

  view.process_input(Key::of(Key::Kind::Down));
  assert(rig.source.fetches == 2);
}

static void test_end_of_feed() {
  Rig rig;
  rig.source.fill(Timeline::Home, 5, 3);
  rig.source.page_size = 5;
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);

  for (int i = 0; i < 8; ++i) view.process_input(Key::of(Key::Kind::Down));
  assert(rig.source.fetches == 2);
  assert(view.posts().size() == 5);
  assert(rig.term.line(23).empty());

  for (int i = 0; i < 3; ++i) view.process_input(Key::of(Key::Kind::Down));
  assert(rig.source.fetches == 2);
  assert(view.pending_rows().empty());

  // refresh starts over and may fetch again
  std::string msg;
  assert(view.refresh(msg));
  assert(view.offset() == 0);
  assert(rig.source.fetches == 3);
  assert(label(rig.term, 1) == U"┌──┤1├");
}

static void test_fetch_failure() {
  Rig rig;
  rig.source.fill(Timeline::Home, 10, 3);
  rig.source.page_size = 5;
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  rig.source.fail_fetch = true;

  for (int i = 0; i < 7; ++i) view.process_input(Key::of(Key::Kind::Down));
  auto action = view.process_input(Key::of(Key::Kind::Down));
  assert(action && action->kind == Action::Kind::Swap);
  assert(view.pending_rows().empty());

  auto refresh = view.process_input(Key::chr('r'));
  assert(refresh && refresh->kind == Action::Kind::Swap);
}

static void test_spoilers() {
  Rig rig;
  rig.source.posts[Timeline::Home].push_back(make_post("1", 0, "plot twist"));
  rig.source.posts[Timeline::Home][0].body = "secret words";
  rig.source.fill(Timeline::Home, 2, 3);
  rig.source.posts[Timeline::Home][1].id = "2";
  rig.source.posts[Timeline::Home][2].id = "3";
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);

  // top, name, CW, body, bottom
  assert(view.posts()[0].height() == 5);
  assert(rig.term.row_text(3).substr(0, 15) == U"│CW: plot twist");
  assert(rig.term.cell(3, 2).attr.reverse);
  assert(rig.term.row_text(4).substr(0, 13) == U"│▒▒▒▒▒▒ ▒▒▒▒▒");

  rig.term.reset_counters();
  auto action = view.process_input(Key::chr('!'));
  assert(action && action->kind == Action::Kind::None);
  assert(rig.term.row_text(4).substr(0, 13) == U"│secret words");
  assert(rig.term.shifts() == 0);
  for (int row : rig.term.touched_rows()) assert(row <= 5);

  view.process_input(Key::chr('!'));
  assert(rig.term.row_text(4).substr(0, 13) == U"│▒▒▒▒▒▒ ▒▒▒▒▒");

  // no content warning on ordinal 2; ordinal 9 is not on screen
  rig.term.reset_counters();
  view.process_input(Key::chr('@'));
  view.process_input(Key::chr('('));
  assert(rig.term.bytes_sent() == 0);
}

static void test_expanded_spoilers() {
  HeadlessTerminal term(24, 80);
  Painter painter(term);
  FakeSource source;
  SessionProps props;
  props.expand_spoilers = true;
  ScreenStack stack(painter, source, props);
  source.posts[Timeline::Home].push_back(make_post("1", 1, "cw"));
  TimelineView view(stack, 1, stack.rows(), Timeline::Home);
  load(view);
  assert(!view.posts()[0].spoilered());
  assert(term.row_text(4).substr(0, 14) == U"│post 1 line 1");
}

static void test_duplicates_dropped() {
  Rig rig;
  rig.source.fill(Timeline::Home, 3, 1);
  rig.source.posts[Timeline::Home].push_back(make_post("2", 1));
  TimelineView view(rig.stack, 1, rig.stack.rows(), Timeline::Home);
  load(view);
  assert(view.posts().size() == 3);
}

int main() {
  test_end_to_end_line_scroll();
  test_jump_shift_or_repaint();
  test_post_navigation();
  test_post_navigation_boundary();
  test_next_post_past_end_repaints();
  test_next_post_past_end_shifts();
  test_infinite_scroll();
  test_end_of_feed();
  test_fetch_failure();
  test_spoilers();
  test_expanded_spoilers();
  test_duplicates_dropped();
  return 0;
}
