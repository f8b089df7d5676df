#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

// curses key code -> KeyEvent; no screen needed
KeyEvent decode_key(int ch);
// whether the key read right after ESC combines with it into Alt+key
bool joins_escape(int next);

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  bool get_size(TermSize& out, IoError& err) const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_status(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void set_cursor_shape(CursorShape shape) override;
  void refresh() override;
  bool read_event(Event& out, IoError& err) override;
private:
  static constexpr short kStatusPair = 1;
  bool colors_ = false;
  CursorShape shape_ = CursorShape::Default;
  bool shape_dirty_ = true;
};
