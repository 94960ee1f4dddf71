#pragma once
/*
 * Widgets
 *
 * Purpose: the focusable controls used by forms, behind one interface.
 *   - Button: boxed caption, bold while focused.
 *   - HorizontalSelect: boxed "< choice >" cycled with Left/Right.
 *   - OneLineInputBox: reverse-video single-line field.
 *   - MultiLineInputBox: word-wrapped text area; repaints only changed spans.
 * Input: process_input returns true when the key was consumed; Focus and
 *        Unfocus keys are delivered by FocusWrapper.
 * Note: ASCII text only; the link is 7-bit.
 */
#include <string>
#include <vector>
#include "styled_text.hpp"
#include "types.hpp"

class Painter;

class Focusable {
public:
  virtual ~Focusable() = default;
  virtual bool process_input(const Key& key) = 0;
  virtual std::vector<StyledLine> lines() const = 0;
  virtual void draw() = 0;
};

class Button final : public Focusable {
public:
  Button(Painter& painter, std::string caption, int row, int column, bool focused = false);

  bool focused() const { return focused_; }
  bool process_input(const Key& key) override;
  std::vector<StyledLine> lines() const override;
  void draw() override;

private:
  void draw_caption();

  Painter& painter_;
  std::string caption_;
  int row_;
  int column_;
  bool focused_;
};

class HorizontalSelect final : public Focusable {
public:
  HorizontalSelect(Painter& painter, std::vector<std::string> choices, int row, int column, int width,
                   const std::string& selected = "", bool focused = false);

  const std::string& selected() const { return choices_[index_]; }
  size_t selected_index() const { return index_; }
  bool process_input(const Key& key) override;
  std::vector<StyledLine> lines() const override;
  void draw() override;

private:
  void draw_choice();
  void place_cursor();

  Painter& painter_;
  std::vector<std::string> choices_;
  int row_;
  int column_;
  int width_;
  size_t index_ = 0;
  bool focused_;
};

class OneLineInputBox final : public Focusable {
public:
  OneLineInputBox(Painter& painter, std::string text, int row, int column, int length);

  const std::string& text() const { return text_; }
  int cursor() const { return cursor_; }
  bool process_input(const Key& key) override;
  std::vector<StyledLine> lines() const override;
  void draw() override;

private:
  void place_cursor();

  Painter& painter_;
  std::string text_;
  int cursor_;
  int row_;
  int column_;
  int length_;
};

class MultiLineInputBox final : public Focusable {
public:
  MultiLineInputBox(Painter& painter, std::string text, int row, int column, int width, int height);

  const std::string& text() const { return text_; }
  int cursor() const { return cursor_; }
  // Device position of the text cursor.
  Pos cursor_pos() const;
  bool process_input(const Key& key) override;
  std::vector<StyledLine> lines() const override;
  void draw() override;

private:
  // A place the cursor can sit. index -1 marks the end of a line broken
  // mid-word, which is the same text position as the next line's start.
  struct Slot {
    int index;
    int row;
    int column;
  };
  struct Layout {
    std::vector<std::u32string> lines;
    std::vector<Slot> slots;
  };

  Layout layout(const std::string& text) const;
  size_t slot_of(const Layout& l) const;
  void place_cursor(const Layout& l);
  bool edit(std::string text, int cursor);
  void repaint_changes(const Layout& before, const Layout& after);

  Painter& painter_;
  std::string text_;
  int cursor_;
  int row_;
  int column_;
  int width_;
  int height_;
};

// Moves focus between the members of a form. Does not own them.
class FocusWrapper {
public:
  FocusWrapper(std::vector<Focusable*> members, size_t focused);

  size_t focused() const { return focused_; }
  void focus();
  bool process_input(const Key& key);
  void previous(bool wrap = false);
  void next(bool wrap = false);

private:
  void move_to(size_t index);

  std::vector<Focusable*> members_;
  size_t focused_;
};
