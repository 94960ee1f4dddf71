#pragma once
/*
 * Component
 *
 * Purpose: one member of a screen group: owns a band of rows, draws itself
 *          in full on request and handles the keys offered to it.
 * Action: what the session loop should do after a key was claimed.
 *         Swap runs after the claiming component has returned, so it may
 *         replace the group that component belongs to.
 */
#include <functional>
#include <optional>
#include "types.hpp"

class ScreenStack;

struct Action {
  enum class Kind { None, Exit, Back, Swap };
  Kind kind = Kind::None;
  std::function<void(ScreenStack&)> swap;

  static Action none() { return Action{}; }
  static Action exit() { Action a; a.kind = Kind::Exit; return a; }
  static Action back() { Action a; a.kind = Kind::Back; return a; }
  static Action swap_to(std::function<void(ScreenStack&)> fn) {
    Action a;
    a.kind = Kind::Swap;
    a.swap = std::move(fn);
    return a;
  }
};

class Component {
public:
  Component(ScreenStack& stack, int top, int bottom) : stack_(stack), top_(top), bottom_(bottom) {}
  virtual ~Component() = default;

  int top() const { return top_; }
  int bottom() const { return bottom_; }

  // Full repaint of the component's rows; device contents are not trusted.
  virtual void draw() = 0;
  // nullopt = not claimed, offer the key to the next member.
  virtual std::optional<Action> process_input(const Key& key) = 0;

protected:
  ScreenStack& stack_;
  int top_;
  int bottom_;
};
