#pragma once
/*
 * TimelineView
 *
 * Purpose: scrollable list of post blocks for one timeline; decides, for each
 *          navigation key, between a scroll-region shift and a full repaint,
 *          and fetches continuation pages when blank rows come into view.
 * State:
 *   - offset_: rows scrolled past the top of the first block.
 *   - positions_: top row of every block not entirely above the viewport ->
 *     block index. Only used to see whether the visible ordinals moved.
 * Rule: a move shorter than the viewport shifts and paints the exposed rows;
 *       a move of the full viewport height or more repaints everything.
 */
#include <climits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "component.hpp"
#include "post_block.hpp"

class TimelineView : public Component {
public:
  static constexpr int kOffsetCeiling = INT_MAX;

  TimelineView(ScreenStack& stack, int top, int bottom, Timeline timeline);

  Timeline timeline() const { return timeline_; }
  int offset() const { return offset_; }
  int view_height() const { return bottom_ - top_ + 1; }
  const std::vector<PostBlock>& posts() const { return posts_; }
  const std::map<int, int>& positions() const { return positions_; }

  // First page; no painting.
  bool load(std::string& msg);

  void draw() override;
  std::optional<Action> process_input(const Key& key) override;

  // Navigation; each may queue rows for an infinite-scroll fetch.
  void scroll_up();
  void scroll_down();
  void jump_top();
  void prev_post();
  void next_post();
  bool refresh(std::string& msg);
  // Ordinal is 1-based, as labeled on screen.
  void toggle_spoiler(int ordinal);
  // Fetches the page after the last block and paints the queued rows.
  bool fetch_more(std::string& msg);
  const std::vector<int>& pending_rows() const { return pending_; }

  // Full repaint. Returns the rows (first, last) no block covers.
  std::optional<std::pair<int, int>> redraw();
  // Paints one viewport row; false when no block covers it (row cleared).
  bool draw_one_line(int row);

  // Ordinal label for a block whose top border is on `row`.
  std::optional<int> ordinal_at(int row) const;

private:
  struct BlockAt {
    int index;
    int row_in_block;
  };

  std::map<int, int> compute_positions() const;
  // Recomputes positions; true when the visible numbering changed.
  bool update_positions();
  // Block covering `row`; past the last block yields {posts_.size(), 0}.
  BlockAt post_at_line(int row) const;
  std::optional<int> line_for_post(int index) const;
  void append(std::vector<PostRecord> records);
  // Shift the viewport content by `amount` rows (positive = content moves up).
  void shift_and_paint(int amount, bool relabel);
  void queue(int row);

  Timeline timeline_;
  std::vector<PostBlock> posts_;
  std::string last_id_;
  int offset_ = 0;
  std::map<int, int> positions_;
  std::set<std::string> ids_;
  std::vector<int> pending_;
  bool exhausted_ = false;
};
