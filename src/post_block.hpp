#pragma once
/*
 * PostBlock
 *
 * Purpose: one post rendered as a boxed block of styled lines at a fixed width
 *          (boost line, name line, content warning, body, attachments, stats).
 * Lifecycle: immutable once built; toggling the spoiler rebuilds every line.
 * Note: the ordinal label lives in the top border but is stamped at paint
 *       time, so the same block can show different numbers as it scrolls.
 */
#include <optional>
#include <vector>
#include "content_source.hpp"
#include "styled_text.hpp"

class Painter;

class PostBlock {
public:
  PostBlock(PostRecord post, int width);

  const PostRecord& post() const { return post_; }
  int width() const { return width_; }
  int height() const { return static_cast<int>(lines_.size()); }
  const std::vector<StyledLine>& lines() const { return lines_; }

  bool has_spoiler() const { return !post_.cw.empty(); }
  bool spoilered() const { return spoilered_; }
  // Returns false when there is no content warning to toggle.
  bool toggle_spoiler();

  // Top border with `┤N├`, or `───` when unlabeled.
  StyledLine labeled_top(std::optional<int> ordinal) const;

  // Paint block rows [offset, offset + bottom - top] into device rows
  // top..bottom inclusive.
  void draw(Painter& painter, int top, int bottom, int offset, std::optional<int> ordinal) const;

private:
  void format();
  StyledLine name_line() const;
  StyledLine boost_line() const;
  StyledLine stats_line() const;
  std::vector<StyledLine> attachment_lines() const;

  PostRecord post_;
  int width_;
  bool spoilered_;
  std::vector<StyledLine> lines_;
};

// Bold display name then " @acct"; the name is cut with an ellipsis to fit.
StyledLine account_line(const std::string& name, const std::string& acct, int width);
// "Sun, Mar 3, 2024, 9:05:07 PM" in local time.
std::u32string format_timestamp(std::time_t when);
// Every character except whitespace replaced by the shade block.
StyledLine obscure(const StyledLine& line);
