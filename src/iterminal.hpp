#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, input).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "event.hpp"
#include "types.hpp"

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual bool get_size(TermSize& out, IoError& err) const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  // status line style: black bold on cyan
  virtual void draw_status(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_shape(CursorShape shape) = 0;
  virtual void refresh() = 0;
  // blocks until an event arrives; false with err filled on failure
  virtual bool read_event(Event& out, IoError& err) = 0;
};
