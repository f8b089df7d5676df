#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include "config.hpp"

std::string Renderer::expand_line(const std::string& s, int tab_width) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\t') out.append(static_cast<size_t>(std::max(1, tab_width)), ' ');
    else if (c == TV_EMPTY_SLOT) out.push_back(' ');
    else out.push_back(c);
  }
  return out;
}

std::string Renderer::debug_line(const std::string& s) {
  std::string out = "[";
  for (char c : s) {
    if (c == '\t') out += "\\t";
    else if (c == TV_EMPTY_SLOT) out += "\\0";
    else out.push_back(c);
  }
  out += "]";
  return out;
}

std::string Renderer::status_text(const RenderInfo& info) {
  std::ostringstream oss;
  oss << mode_name(info.mode) << " [" << info.cur.col << ", " << info.cur.row << "]";
  if (!info.message.empty()) oss << "  " << info.message;
  if (info.show_debug && info.buf) oss << "  " << debug_line(info.buf->line(info.cur.row));
  return oss.str();
}

void Renderer::render(ITerminal& term, const RenderInfo& info) {
  int rows = info.size.rows, cols = info.size.cols;
  term.clear();
  if (rows <= 0 || cols <= 0 || !info.buf) { term.refresh(); return; }
  const TextBuffer& buf = *info.buf;
  int max_text_rows = rows - 1;
  int n = static_cast<int>(std::min<size_t>(buf.line_count(), static_cast<size_t>(std::max(0, max_text_rows))));
  for (int i = 0; i < n; ++i) {
    std::string vis = expand_line(buf.line(static_cast<size_t>(i)), info.tab_width);
    if (static_cast<int>(vis.size()) > cols) vis.resize(static_cast<size_t>(cols));
    if (!vis.empty()) term.draw_text(i, 0, vis);
  }
  std::string status = status_text(info);
  if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(cols));
  term.draw_status(rows - 1, 0, status);

  term.set_cursor_shape(info.mode == Mode::Normal ? CursorShape::Block : CursorShape::Default);
  int screen_row = static_cast<int>(info.cur.row);
  if (screen_row < max_text_rows) {
    int screen_col = static_cast<int>(buf.display_col(info.cur.row, info.cur.col, info.tab_width));
    screen_col = std::min(screen_col, cols - 1);
    term.move_cursor(screen_row, screen_col);
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}
