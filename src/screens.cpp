#include "screens.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "markup.hpp"
#include "rect.hpp"
#include "screen_stack.hpp"
#include "wordwrap.hpp"

namespace {

const char* kTitle = "vtfeed for VT-100";

struct Tab {
  Timeline timeline;
  char key;
  const char* label;
};

const Tab kTabs[] = {
    {Timeline::Home, 'h', "[H]ome"},
    {Timeline::Local, 'l', "[L]ocal"},
    {Timeline::Global, 'g', "[G]lobal"},
};

void clear_rows(Painter& painter, int top, int bottom) {
  for (int row = top; row <= bottom; ++row) painter.clear_line(row);
}

}

// ---------- TimelineTabs ----------

TimelineTabs::TimelineTabs(ScreenStack& stack, int top, int bottom, Timeline timeline)
    : Component(stack, top, bottom), current_(timeline) {
  views_[current_] = std::make_unique<TimelineView>(stack, top + 1, bottom, timeline);
}

bool TimelineTabs::load(std::string& msg) { return view().load(msg); }

std::string TimelineTabs::help_text() {
  return "<u>Timeline Selection</u>\n"
         "<b>h</b> view your home timeline\n"
         "<b>l</b> view your local timeline\n"
         "<b>g</b> view the global timeline\n"
         "\n"
         "<u>Navigation</u>\n"
         "<b>up</b> and <b>down</b> keys scroll the timeline up or down one single line.\n"
         "<b>n</b> scrolls until the next post is at the top of the screen.\n"
         "<b>p</b> scrolls until the previous post is at the top of the screen.\n"
         "<b>t</b> scrolls to the top of the timeline.\n"
         "<b>! @ # $ % ^ &amp; * ( )</b> reveal or hide the content warning of post 1 to 10.\n"
         "\n"
         "<u>Actions</u>\n"
         "<b>r</b> refreshes the timeline, scrolling to the top of the refreshed content.\n"
         "<b>c</b> opens up the composer to write a new post.\n"
         "<b>q</b> quits.\n";
}

StyledLine TimelineTabs::tab_bar() const {
  std::string markup;
  for (const auto& tab : kTabs) {
    if (tab.timeline == current_) markup += std::string("<b><r> ") + tab.label + " </r></b> ";
    else markup += std::string("<r> ") + tab.label + " </r> ";
  }
  return highlight(markup);
}

void TimelineTabs::draw() {
  Painter& painter = stack_.painter();
  StyledLine bar = tab_bar();
  // Blank whatever follows the bar, then paint the bar itself.
  painter.move_cursor(top_, bar.size() + 1);
  painter.send_command(Op::ClearToEol);
  painter.paint({bar}, BoundingRect{top_, top_ + 1, 1, stack_.columns() + 1});
  view().draw();
}

std::optional<Action> TimelineTabs::process_input(const Key& key) {
  if (key.is('?')) {
    return Action::swap_to([](ScreenStack& s) { open_help(s, help_text()); });
  }
  for (const auto& tab : kTabs) {
    if (!key.is(tab.key)) continue;
    if (tab.timeline == current_) return Action::none();
    if (views_.find(tab.timeline) == views_.end()) {
      stack_.status("Fetching timeline...");
      auto fresh = std::make_unique<TimelineView>(stack_, top_ + 1, bottom_, tab.timeline);
      std::string msg;
      if (!fresh->load(msg)) return Action::swap_to([msg](ScreenStack& s) { open_error(s, msg); });
      views_[tab.timeline] = std::move(fresh);
    }
    spdlog::info("tabs: switched to {}", tab.label);
    current_ = tab.timeline;
    draw();
    return Action::none();
  }
  return view().process_input(key);
}

// ---------- HelpScreen ----------

HelpScreen::HelpScreen(ScreenStack& stack, int top, int bottom, const std::string& markup)
    : Component(stack, top, bottom) {
  lines_ = wordwrap(highlight(markup), stack.columns());
  // No scrolling here; whatever does not fit is cut.
  int max_lines = bottom - top + 1;
  if (static_cast<int>(lines_.size()) > max_lines) lines_.resize(static_cast<size_t>(max_lines));
}

void HelpScreen::draw() {
  stack_.status("Press 'b' to go back to the previous screen.");
  Painter& painter = stack_.painter();
  clear_rows(painter, top_, bottom_);
  painter.paint(lines_, BoundingRect{top_, top_ + static_cast<int>(lines_.size()), 1, stack_.columns() + 1});
}

std::optional<Action> HelpScreen::process_input(const Key& key) {
  if (key.is('b')) return Action::back();
  return std::nullopt;
}

// ---------- ErrorScreen ----------

ErrorScreen::ErrorScreen(ScreenStack& stack, int top, int bottom, const std::string& message)
    : Component(stack, top, bottom),
      left_(std::max(0, stack.columns() / 2 - 20)),
      text_(wordwrap(highlight(sanitize(message)), 36)),
      quit_(stack.painter(), "quit", top + 6 + static_cast<int>(text_.size()), left_ + 32, true) {}

std::vector<StyledLine> ErrorScreen::box() const {
  std::vector<StyledLine> quit = quit_.lines();
  StyledLine middle = StyledLine::plain(std::u32string(30, U' '));
  std::vector<StyledLine> out;
  out.push_back(box_top(38));
  for (const auto& line : text_) out.push_back(box_middle(line, 38));
  out.push_back(box_middle(StyledLine(), 38));
  for (const auto& q : quit) out.push_back(box_middle(join({middle, q}), 38));
  out.push_back(box_bottom(38));
  return out;
}

void ErrorScreen::draw() {
  Painter& painter = stack_.painter();
  clear_rows(painter, top_, bottom_);

  std::u32string title = utf8_decode(kTitle);
  int title_col = left_ / 2 + 1;
  painter.move_cursor(top_ + 2, title_col);
  painter.send_command(Op::DoubleHeightTop);
  painter.send_text(title);
  painter.move_cursor(top_ + 3, title_col);
  painter.send_command(Op::DoubleHeightBottom);
  painter.send_text(title);

  std::vector<StyledLine> lines = box();
  int box_top_row = top_ + 4;
  painter.paint(lines, BoundingRect{box_top_row, box_top_row + static_cast<int>(lines.size()), left_ + 1,
                                    left_ + 1 + 38});
  stack_.status("");
  quit_.process_input(Key::of(Key::Kind::Focus));
}

std::optional<Action> ErrorScreen::process_input(const Key& key) {
  if (key.kind != Key::Kind::Enter) return std::nullopt;
  // Double height is a line attribute; clearing the row does not undo it.
  Painter& painter = stack_.painter();
  painter.move_cursor(top_ + 2, 1);
  painter.send_command(Op::NormalSize);
  painter.move_cursor(top_ + 3, 1);
  painter.send_command(Op::NormalSize);
  if (stack_.has_history()) return Action::back();
  return Action::exit();
}

// ---------- ComposeScreen ----------

const std::vector<std::string>& visibility_labels() {
  static const std::vector<std::string> labels = {"public", "quiet public", "followers", "specific accounts"};
  return labels;
}

ComposeScreen::ComposeScreen(ScreenStack& stack, int top, int bottom)
    : Component(stack, top, bottom),
      body_(stack.painter(), "", top + 2, 2, stack.columns() - 2, 10),
      cw_(stack.painter(), "", top + 13, 2, stack.columns() - 2),
      visibility_(stack.painter(), visibility_labels(), top + 14, 19, 25,
                  visibility_labels()[static_cast<size_t>(stack.props().default_visibility)]),
      post_(stack.painter(), "Post", top + 17, 2),
      discard_(stack.painter(), "Discard", top + 17, 9),
      focus_({&body_, &cw_, &visibility_, &post_, &discard_}, 0) {}

std::vector<StyledLine> ComposeScreen::box() const {
  const int columns = stack_.columns();
  const SessionProps& props = stack_.props();
  std::vector<StyledLine> lines;
  lines.push_back(join({highlight("Posting as "), account_line(props.name, props.handle, columns - 13)}));
  for (auto& line : body_.lines()) lines.push_back(std::move(line));
  lines.push_back(highlight("Optional CW:"));
  lines.push_back(cw_.lines()[0]);

  std::vector<StyledLine> vis = visibility_.lines();
  StyledLine indent = StyledLine::plain(std::u32string(17, U' '));
  lines.push_back(join({indent, vis[0]}));
  lines.push_back(join({highlight("Post Visibility: "), vis[1]}));
  lines.push_back(join({indent, vis[2]}));

  std::vector<StyledLine> post = post_.lines();
  std::vector<StyledLine> discard = discard_.lines();
  for (size_t i = 0; i < 3; ++i) lines.push_back(join({post[i], highlight(" "), discard[i]}));

  std::vector<StyledLine> out;
  out.push_back(box_top(columns));
  for (const auto& line : lines) out.push_back(box_middle(line, columns));
  out.push_back(box_bottom(columns));
  return out;
}

void ComposeScreen::draw() {
  stack_.status("Use tab to move between inputs.");
  Painter& painter = stack_.painter();
  std::vector<StyledLine> lines = box();
  int end = top_ + static_cast<int>(lines.size());
  painter.paint(lines, BoundingRect{top_, end, 1, stack_.columns() + 1});
  clear_rows(painter, end, bottom_);
  focus_.focus();
}

std::optional<Action> ComposeScreen::submit() {
  Visibility visibility = static_cast<Visibility>(visibility_.selected_index());
  PostRecord created;
  std::string msg;
  stack_.status("Posting...");
  if (!stack_.source().create_post(body_.text(), visibility, cw_.text(), created, msg)) {
    spdlog::error("compose: post failed: {}", msg);
    return Action::swap_to([msg](ScreenStack& s) { open_error(s, msg); });
  }
  spdlog::info("compose: created post {}", created.id);
  stack_.props().last_post = true;
  stack_.status("New status posted! Drawing...");
  return Action::back();
}

std::optional<Action> ComposeScreen::process_input(const Key& key) {
  const size_t body = 0, cw = 1, select = 2, post = 3, discard = 4;
  switch (key.kind) {
    case Key::Kind::Up:
    case Key::Kind::Down:
      if (focus_.focused() == body && focus_.process_input(key)) return Action::none();
      if (key.kind == Key::Kind::Up) focus_.previous();
      else focus_.next();
      return Action::none();
    case Key::Kind::Tab:
      focus_.next(true);
      return Action::none();
    case Key::Kind::Enter:
      if (focus_.focused() == body) {
        focus_.process_input(key);
      } else if (focus_.focused() == cw || focus_.focused() == select) {
        focus_.next();
      } else if (focus_.focused() == post) {
        return submit();
      } else if (focus_.focused() == discard) {
        return Action::back();
      }
      return Action::none();
    default:
      if (focus_.process_input(key)) return Action::none();
      return std::nullopt;
  }
}

// ---------- factories ----------

void open_timeline(ScreenStack& stack, Timeline timeline) {
  auto tabs = std::make_unique<TimelineTabs>(stack, 1, stack.rows(), timeline);
  std::string msg;
  if (!tabs->load(msg)) {
    open_error(stack, msg);
    return;
  }
  Group group;
  group.push_back(std::move(tabs));
  stack.replace(std::move(group));
}

void open_error(ScreenStack& stack, const std::string& message) {
  Group group;
  group.push_back(std::make_unique<ErrorScreen>(stack, 1, stack.rows(), message));
  stack.push(std::move(group));
}

void open_compose(ScreenStack& stack) {
  Group group;
  group.push_back(std::make_unique<ComposeScreen>(stack, 1, stack.rows()));
  stack.push(std::move(group));
}

void open_help(ScreenStack& stack, const std::string& markup) {
  Group group;
  group.push_back(std::make_unique<HelpScreen>(stack, 1, stack.rows(), markup));
  stack.push(std::move(group));
}
