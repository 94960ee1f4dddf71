#include "timeline_view.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "screen_stack.hpp"
#include "screens.hpp"

namespace {

const char* kHelpStatus = "Press '?' for help.";

// Shifted digits pick ordinals 1..10 the way they sit on the keyboard.
std::optional<int> ordinal_for_key(char c) {
  static const std::string keys = "!@#$%^&*()";
  size_t at = keys.find(c);
  if (at == std::string::npos) return std::nullopt;
  return static_cast<int>(at) + 1;
}

std::vector<int> values_of(const std::map<int, int>& m) {
  std::vector<int> out;
  out.reserve(m.size());
  for (const auto& [row, index] : m) out.push_back(index);
  return out;
}

}

TimelineView::TimelineView(ScreenStack& stack, int top, int bottom, Timeline timeline)
    : Component(stack, top, bottom), timeline_(timeline) {}

void TimelineView::append(std::vector<PostRecord> records) {
  for (auto& record : records) {
    if (!ids_.insert(record.id).second) continue;
    last_id_ = record.id;
    PostBlock block(std::move(record), stack_.columns());
    if (stack_.props().expand_spoilers) block.toggle_spoiler();
    posts_.push_back(std::move(block));
  }
}

bool TimelineView::load(std::string& msg) {
  std::vector<PostRecord> records;
  if (!stack_.source().fetch_timeline(timeline_, "", records, msg)) {
    spdlog::warn("timeline: initial fetch failed: {}", msg);
    return false;
  }
  spdlog::info("timeline: fetched {} post(s)", records.size());
  append(std::move(records));
  update_positions();
  stack_.status("Timeline fetched, drawing...");
  return true;
}

std::map<int, int> TimelineView::compute_positions() const {
  // No early break: a block entering or leaving below the viewport without
  // changing the order must not count as a numbering change.
  std::map<int, int> out;
  int pos = -offset_;
  for (size_t i = 0; i < posts_.size(); ++i) {
    int h = posts_[i].height();
    if (pos + h <= 0) {
      pos += h;
      continue;
    }
    out[pos + top_] = static_cast<int>(i);
    pos += h;
  }
  return out;
}

bool TimelineView::update_positions() {
  std::map<int, int> fresh = compute_positions();
  bool changed = values_of(fresh) != values_of(positions_);
  positions_ = std::move(fresh);
  return changed;
}

std::optional<int> TimelineView::ordinal_at(int row) const {
  if (positions_.empty()) return std::nullopt;
  auto it = positions_.find(row);
  if (it == positions_.end()) return std::nullopt;
  return it->second - positions_.begin()->second + 1;
}

TimelineView::BlockAt TimelineView::post_at_line(int row) const {
  int pos = -offset_;
  for (size_t i = 0; i < posts_.size(); ++i) {
    int h = posts_[i].height();
    int top = pos + top_;
    if (row >= top && row < top + h) return {static_cast<int>(i), row - top};
    pos += h;
  }
  return {static_cast<int>(posts_.size()), 0};
}

std::optional<int> TimelineView::line_for_post(int index) const {
  if (index < 0 || index >= static_cast<int>(posts_.size())) return std::nullopt;
  int pos = 0;
  for (int i = 0; i < index; ++i) pos += posts_[static_cast<size_t>(i)].height();
  return pos + top_;
}

std::optional<std::pair<int, int>> TimelineView::redraw() {
  Painter& painter = stack_.painter();
  const int vh = view_height();
  int pos = -offset_;
  for (const auto& post : posts_) {
    if (pos >= vh) break;
    int h = post.height();
    if (pos + h <= 0) {
      pos += h;
      continue;
    }
    int top = pos + top_;
    int bottom = std::min(top + h - 1, bottom_);
    int offset = 0;
    if (top < top_) {
      offset = top_ - top;
      top = top_;
    }
    post.draw(painter, top, bottom, offset, ordinal_at(pos + top_));
    pos += h;
  }

  int row = std::max(pos, 0) + top_;
  int first_missed = row;
  for (; row <= bottom_; ++row) painter.clear_line(row);
  if (first_missed > bottom_) return std::nullopt;
  return std::make_pair(first_missed, bottom_);
}

bool TimelineView::draw_one_line(int row) {
  const int vh = view_height();
  int pos = -offset_;
  for (const auto& post : posts_) {
    if (pos >= vh) break;
    int h = post.height();
    if (pos + h <= 0) {
      pos += h;
      continue;
    }
    int offset = row - (pos + top_);
    if (offset < 0) break;
    if (offset >= h) {
      pos += h;
      continue;
    }
    post.draw(stack_.painter(), row, row, offset, ordinal_at(pos + top_));
    return true;
  }
  stack_.painter().clear_line(row);
  return false;
}

void TimelineView::queue(int row) {
  if (std::find(pending_.begin(), pending_.end(), row) == pending_.end()) pending_.push_back(row);
}

void TimelineView::shift_and_paint(int amount, bool relabel) {
  Painter& painter = stack_.painter();
  int first_exposed;
  int last_exposed;
  if (amount > 0) {
    painter.shift_up(top_, bottom_, amount);
    first_exposed = bottom_ - amount + 1;
    last_exposed = bottom_;
  } else {
    painter.shift_down(top_, bottom_, -amount);
    first_exposed = top_;
    last_exposed = top_ - amount - 1;
  }
  spdlog::trace("timeline: shift {} (rows {}-{} exposed)", amount, first_exposed, last_exposed);

  if (relabel) {
    for (const auto& [row, index] : positions_) {
      if (row < top_ || row > bottom_) continue;
      if (row >= first_exposed && row <= last_exposed) continue;
      draw_one_line(row);
    }
  }
  if (amount > 0) {
    // Rows that were already blank before the shift wait for the same page.
    int content_end = top_ - offset_;
    for (const auto& post : posts_) content_end += post.height();
    for (int row = std::max(content_end, top_); row < first_exposed; ++row) queue(row);
  }
  for (int row = first_exposed; row <= last_exposed; ++row) {
    if (!draw_one_line(row) && amount > 0) queue(row);
  }
}

void TimelineView::scroll_up() {
  if (offset_ <= 0) return;
  offset_--;
  bool relabel = update_positions();
  shift_and_paint(-1, relabel);
}

void TimelineView::scroll_down() {
  if (offset_ >= kOffsetCeiling) return;
  offset_++;
  bool relabel = update_positions();
  shift_and_paint(1, relabel);
}

void TimelineView::jump_top() {
  if (offset_ <= 0) return;
  int amount = offset_;
  offset_ = 0;
  bool relabel = update_positions();
  if (amount < view_height()) {
    shift_and_paint(-amount, relabel);
  } else {
    spdlog::debug("timeline: top is {} rows away, repainting", amount);
    redraw();
  }
}

void TimelineView::prev_post() {
  if (posts_.empty()) return;
  BlockAt at = post_at_line(top_);
  int which = at.index;
  if (at.row_in_block == 0) which--;
  if (which < 0) which = 0;

  std::optional<int> line = line_for_post(which);
  int move = line ? offset_ - (*line - top_) : 0;
  if (move <= 0) return;

  offset_ -= move;
  bool relabel = update_positions();
  if (move < view_height()) {
    shift_and_paint(-move, relabel);
  } else {
    spdlog::debug("timeline: previous post is {} rows away, repainting", move);
    redraw();
  }
}

void TimelineView::next_post() {
  BlockAt at = post_at_line(top_);
  int which = at.index + 1;
  int count = static_cast<int>(posts_.size());

  std::optional<int> line;
  if (which == count && which > 0) {
    // Past the last fetched block: scroll to where the next page will go.
    line = *line_for_post(which - 1) + posts_.back().height();
  } else {
    line = line_for_post(which);
  }
  int move = line ? (*line - top_) - offset_ : 0;
  if (move <= 0) return;

  offset_ += move;
  bool relabel = update_positions();
  if (move < view_height()) {
    shift_and_paint(move, relabel);
  } else {
    spdlog::debug("timeline: next post is {} rows away, repainting", move);
    if (auto missed = redraw()) {
      for (int row = missed->first; row <= missed->second; ++row) queue(row);
    }
  }
}

bool TimelineView::refresh(std::string& msg) {
  stack_.props().last_post = false;
  stack_.status("Refetching timeline...");
  std::vector<PostRecord> records;
  if (!stack_.source().fetch_timeline(timeline_, "", records, msg)) {
    spdlog::warn("timeline: refresh failed: {}", msg);
    return false;
  }
  spdlog::info("timeline: refreshed, {} post(s)", records.size());
  stack_.status("Timeline fetched, drawing...");

  posts_.clear();
  ids_.clear();
  last_id_.clear();
  pending_.clear();
  exhausted_ = false;
  offset_ = 0;
  append(std::move(records));
  update_positions();
  redraw();
  stack_.status(kHelpStatus);
  return true;
}

void TimelineView::toggle_spoiler(int ordinal) {
  if (positions_.empty()) return;
  const int first = positions_.begin()->second;
  std::optional<std::pair<int, int>> found;
  for (const auto& [row, index] : positions_) {
    if (index - first + 1 == ordinal) {
      found = std::make_pair(row, index);
      break;
    }
  }
  if (!found) return;

  auto [row, index] = *found;
  PostBlock& post = posts_[static_cast<size_t>(index)];
  int old_height = post.height();
  if (!post.toggle_spoiler()) return;

  int from = std::max(row, top_);
  if (post.height() == old_height) {
    int to = std::min(row + post.height() - 1, bottom_);
    for (int r = from; r <= to; ++r) draw_one_line(r);
    return;
  }
  // Everything below the block moved.
  update_positions();
  for (int r = from; r <= bottom_; ++r) {
    if (!draw_one_line(r)) queue(r);
  }
}

bool TimelineView::fetch_more(std::string& msg) {
  stack_.props().last_post = false;
  stack_.status("Fetching more posts...");
  std::vector<PostRecord> records;
  if (!stack_.source().fetch_timeline(timeline_, last_id_, records, msg)) {
    spdlog::warn("timeline: fetch after {} failed: {}", last_id_, msg);
    pending_.clear();
    return false;
  }
  spdlog::info("timeline: fetched {} more post(s) after {}", records.size(), last_id_);
  if (records.empty()) exhausted_ = true;
  stack_.status("Additional posts fetched, drawing...");

  // Appending never reorders, so the numbering cannot change.
  append(std::move(records));
  update_positions();
  for (int row : pending_) draw_one_line(row);
  pending_.clear();
  stack_.status(kHelpStatus);
  return true;
}

void TimelineView::draw() {
  update_positions();
  redraw();
  stack_.status(stack_.props().last_post ? "New status posted! Press '?' for help." : kHelpStatus);
}

std::optional<Action> TimelineView::process_input(const Key& key) {
  std::string msg;
  switch (key.kind) {
    case Key::Kind::Up: scroll_up(); break;
    case Key::Kind::Down: scroll_down(); break;
    case Key::Kind::Char:
      if (key.ch == 't') {
        jump_top();
      } else if (key.ch == 'p') {
        prev_post();
      } else if (key.ch == 'n') {
        next_post();
      } else if (key.ch == 'r') {
        if (!refresh(msg)) return Action::swap_to([msg](ScreenStack& s) { open_error(s, msg); });
        return Action::none();
      } else if (key.ch == 'c') {
        stack_.props().last_post = false;
        return Action::swap_to([](ScreenStack& s) { open_compose(s); });
      } else if (key.ch == 'q') {
        stack_.status("Goodbye.");
        return Action::exit();
      } else if (auto ordinal = ordinal_for_key(key.ch)) {
        toggle_spoiler(*ordinal);
      } else {
        return std::nullopt;
      }
      break;
    default:
      return std::nullopt;
  }

  if (!pending_.empty()) {
    if (exhausted_) {
      pending_.clear();
    } else if (!fetch_more(msg)) {
      return Action::swap_to([msg](ScreenStack& s) { open_error(s, msg); });
    }
  }
  return Action::none();
}
