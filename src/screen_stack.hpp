#pragma once
/*
 * ScreenStack
 *
 * Purpose: LIFO of screen groups with exactly one active group; routes input
 *          to its members in order and owns the status line.
 * Rule: every activation draws the whole group; pop never trusts what is on
 *       the device and repaints the restored group from scratch.
 * Note: also carries the session values that survive screen changes.
 */
#include <memory>
#include <string>
#include <vector>
#include "component.hpp"
#include "content_source.hpp"
#include "painter.hpp"

struct SessionProps {
  std::string name;    // display name used by the composer
  std::string handle;
  bool expand_spoilers = false;
  Visibility default_visibility = Visibility::Public;
  bool last_post = false;  // a post was created since the timeline was last drawn
};

using Group = std::vector<std::unique_ptr<Component>>;

class ScreenStack {
public:
  ScreenStack(Painter& painter, IContentSource& source, SessionProps props);

  Painter& painter() { return painter_; }
  IContentSource& source() { return source_; }
  SessionProps& props() { return props_; }

  // Rows available to screens; the last device row is the status line.
  int rows() const { return painter_.rows() - 1; }
  int columns() const { return painter_.columns(); }

  void replace(Group group);
  void push(Group group);
  // No-op when there is nothing to return to.
  void pop();
  bool has_history() const { return !history_.empty(); }
  size_t depth() const { return history_.size() + (current_.empty() ? 0 : 1); }

  // Returns the previous status; repainting an unchanged status is skipped.
  std::string status(const std::string& text);
  const std::string& current_status() const { return status_; }

  std::optional<Action> process_input(const Key& key);
  // Runs an action returned by process_input. Returns false on Exit.
  bool apply(const Action& action);

private:
  void draw_current();

  Painter& painter_;
  IContentSource& source_;
  SessionProps props_;
  Group current_;
  std::vector<Group> history_;
  std::string status_;
  bool status_drawn_ = false;
};
