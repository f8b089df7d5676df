#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Screen: rows x cols grid of chars plus a parallel "status style" mask.
 * Input: scripted event queue; an exhausted queue reports EndOfInput.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  bool get_size(TermSize& out, IoError& err) const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_status(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void set_cursor_shape(CursorShape shape) override { shape_ = shape; }
  void refresh() override { refresh_count_++; }
  bool read_event(Event& out, IoError& err) override;

  void push_event(const Event& ev);
  void push_keys(const std::string& s);
  // next read_event fails with this error (once)
  void push_error(const IoError& e);
  void resize(int rows, int cols);
  void fail_size_query(bool fail) { fail_size_ = fail; }

  std::string row_text(int row) const;
  bool is_status_cell(int row, int col) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  CursorShape cursor_shape() const { return shape_; }
  int refresh_count() const { return refresh_count_; }
  int clear_count() const { return clear_count_; }

private:
  void put(int row, int col, const std::string& text, bool status);

  struct Pending {
    bool is_error = false;
    Event ev;
    IoError err;
  };
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<bool>> status_mask_;
  std::deque<Pending> events_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  CursorShape shape_ = CursorShape::Default;
  int refresh_count_ = 0;
  int clear_count_ = 0;
  bool fail_size_ = false;
};
