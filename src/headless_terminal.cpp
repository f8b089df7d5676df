#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
  clear_count_ = 0;
}

bool HeadlessTerminal::get_size(TermSize& out, IoError& err) const {
  if (fail_size_) {
    err = {IoError::Kind::SizeQueryFailed, "size query failed"};
    return false;
  }
  out = {rows_, cols_};
  return true;
}

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(std::max(0, rows_)), std::string(static_cast<size_t>(std::max(0, cols_)), ' '));
  status_mask_.assign(static_cast<size_t>(std::max(0, rows_)), std::vector<bool>(static_cast<size_t>(std::max(0, cols_)), false));
  clear_count_++;
}

void HeadlessTerminal::put(int row, int col, const std::string& text, bool status) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
    status_mask_[row][c] = status;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, false); }

void HeadlessTerminal::draw_status(int row, int col, const std::string& text) { put(row, col, text, true); }

void HeadlessTerminal::move_cursor(int row, int col) { cur_row_ = row; cur_col_ = col; }

bool HeadlessTerminal::read_event(Event& out, IoError& err) {
  if (events_.empty()) {
    err = {IoError::Kind::EndOfInput, "no more scripted input"};
    return false;
  }
  Pending p = events_.front();
  events_.pop_front();
  if (p.is_error) { err = p.err; return false; }
  out = p.ev;
  return true;
}

void HeadlessTerminal::push_event(const Event& ev) {
  Pending p;
  p.ev = ev;
  events_.push_back(p);
}

void HeadlessTerminal::push_keys(const std::string& s) {
  for (char c : s) {
    if (c == '\n') push_event(make_key(KeyCode::Enter));
    else if (c == '\t') push_event(make_key(KeyCode::Tab));
    else push_event(make_char_key(c));
  }
}

void HeadlessTerminal::push_error(const IoError& e) {
  Pending p;
  p.is_error = true;
  p.err = e;
  events_.push_back(p);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s = grid_[row];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

bool HeadlessTerminal::is_status_cell(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return false;
  return status_mask_[row][col];
}
