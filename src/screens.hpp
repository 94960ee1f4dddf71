#pragma once
/*
 * Screens
 *
 * Purpose: the full-screen components and the functions that install them
 *          on the stack.
 *   - TimelineTabs: tab bar over one TimelineView per visited timeline.
 *   - HelpScreen: static markup, 'b' returns.
 *   - ErrorScreen: single-acknowledgement error with a quit button.
 *   - ComposeScreen: new-post form.
 */
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "component.hpp"
#include "styled_text.hpp"
#include "timeline_view.hpp"
#include "widgets.hpp"

class ScreenStack;

class TimelineTabs : public Component {
public:
  TimelineTabs(ScreenStack& stack, int top, int bottom, Timeline timeline);

  Timeline current() const { return current_; }
  TimelineView& view() { return *views_.at(current_); }
  bool load(std::string& msg);

  void draw() override;
  std::optional<Action> process_input(const Key& key) override;

  static std::string help_text();

private:
  StyledLine tab_bar() const;

  Timeline current_;
  std::map<Timeline, std::unique_ptr<TimelineView>> views_;
};

class HelpScreen : public Component {
public:
  HelpScreen(ScreenStack& stack, int top, int bottom, const std::string& markup);

  void draw() override;
  std::optional<Action> process_input(const Key& key) override;

private:
  std::vector<StyledLine> lines_;
};

class ErrorScreen : public Component {
public:
  ErrorScreen(ScreenStack& stack, int top, int bottom, const std::string& message);

  void draw() override;
  std::optional<Action> process_input(const Key& key) override;

private:
  std::vector<StyledLine> box() const;

  int left_;
  std::vector<StyledLine> text_;
  Button quit_;
};

class ComposeScreen : public Component {
public:
  ComposeScreen(ScreenStack& stack, int top, int bottom);

  size_t focused() const { return focus_.focused(); }
  const MultiLineInputBox& body() const { return body_; }

  void draw() override;
  std::optional<Action> process_input(const Key& key) override;

private:
  std::vector<StyledLine> box() const;
  std::optional<Action> submit();

  MultiLineInputBox body_;
  OneLineInputBox cw_;
  HorizontalSelect visibility_;
  Button post_;
  Button discard_;
  FocusWrapper focus_;
};

// Timeline tabs become the only screen. Shows the error screen when the
// first page cannot be fetched.
void open_timeline(ScreenStack& stack, Timeline timeline);
void open_error(ScreenStack& stack, const std::string& message);
void open_compose(ScreenStack& stack);
void open_help(ScreenStack& stack, const std::string& markup);

// Compose form labels, in Visibility order.
const std::vector<std::string>& visibility_labels();
