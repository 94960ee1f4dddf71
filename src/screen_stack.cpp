#include "screen_stack.hpp"
#include <spdlog/spdlog.h>
#include "styled_text.hpp"

ScreenStack::ScreenStack(Painter& painter, IContentSource& source, SessionProps props)
    : painter_(painter), source_(source), props_(std::move(props)) {
  status("");
}

void ScreenStack::draw_current() {
  for (auto& c : current_) c->draw();
}

void ScreenStack::replace(Group group) {
  current_ = std::move(group);
  history_.clear();
  spdlog::debug("screens: replace, {} member(s)", current_.size());
  draw_current();
}

void ScreenStack::push(Group group) {
  if (!current_.empty()) history_.push_back(std::move(current_));
  current_ = std::move(group);
  spdlog::debug("screens: push, depth {}", depth());
  draw_current();
}

void ScreenStack::pop() {
  if (history_.empty()) return;
  current_ = std::move(history_.back());
  history_.pop_back();
  spdlog::debug("screens: pop, depth {}", depth());
  draw_current();
}

std::string ScreenStack::status(const std::string& text) {
  if (status_drawn_ && text == status_) return status_;
  std::string old = status_;
  status_ = text;
  status_drawn_ = true;
  painter_.status(utf8_decode(text));
  return old;
}

std::optional<Action> ScreenStack::process_input(const Key& key) {
  for (size_t i = 0; i < current_.size(); ++i) {
    if (auto action = current_[i]->process_input(key)) return action;
  }
  if (key.kind == Key::Kind::CtrlC) return Action::exit();
  return std::nullopt;
}

bool ScreenStack::apply(const Action& action) {
  switch (action.kind) {
    case Action::Kind::None:
      return true;
    case Action::Kind::Exit:
      return false;
    case Action::Kind::Back:
      pop();
      return true;
    case Action::Kind::Swap:
      if (action.swap) action.swap(*this);
      return true;
  }
  return true;
}
