#include "renderer.hpp"
#include "headless_terminal.hpp"
#include "config.hpp"
#include <cassert>
#include <string>

static RenderInfo info_for(const TextBuffer& b, Cursor cur, Mode mode, TermSize sz) {
  RenderInfo info;
  info.buf = &b;
  info.cur = cur;
  info.mode = mode;
  info.size = sz;
  info.tab_width = 4;
  return info;
}

static void test_expand_line() {
  std::string s = std::string("a\tb") + TV_EMPTY_SLOT + "c";
  assert(Renderer::expand_line(s, 4) == "a    b c");
  assert(Renderer::expand_line("\t", 2) == "  ");
  assert(Renderer::debug_line(s) == "[a\\tb\\0c]");
}

static void test_lines_and_status() {
  HeadlessTerminal term(5, 30);
  TextBuffer b;
  b.insert(0, 0, 'h');
  b.insert(1, 0, 'i');
  b.insert(2, 1, 'z');
  Renderer r;
  RenderInfo info = info_for(b, Cursor{1, 3}, Mode::Insert, TermSize{5, 30});
  info.message = "tabwidth=4";
  r.render(term, info);
  assert(term.row_text(0) == "hi");
  assert(term.row_text(1) == "  z");
  assert(term.row_text(2).empty());
  assert(term.row_text(4) == "INSERT [3, 1]  tabwidth=4");
  assert(term.is_status_cell(4, 0));
  assert(!term.is_status_cell(0, 0));
  assert(term.cursor_row() == 1 && term.cursor_col() == 3);
  assert(term.cursor_shape() == CursorShape::Default);
  assert(term.refresh_count() == 1);
}

static void test_cursor_after_tab_and_block_shape() {
  HeadlessTerminal term(5, 30);
  TextBuffer b;
  b.insert(0, 0, '\t');
  b.insert(1, 0, 'x');
  Renderer r;
  r.render(term, info_for(b, Cursor{0, 1}, Mode::Normal, TermSize{5, 30}));
  assert(term.row_text(0) == "    x");
  assert(term.cursor_col() == 4);
  assert(term.cursor_shape() == CursorShape::Block);
  assert(term.row_text(4) == "NORMAL [1, 0]");
}

static void test_clipping() {
  HeadlessTerminal term(3, 5);
  TextBuffer b;
  for (size_t y = 0; y < 4; ++y)
    for (size_t x = 0; x < 8; ++x) b.insert(x, y, static_cast<char>('a' + x));
  Renderer r;
  r.render(term, info_for(b, Cursor{3, 7}, Mode::Normal, TermSize{3, 5}));
  assert(term.row_text(0) == "abcde");
  assert(term.row_text(1) == "abcde");
  // only two text rows fit; row 2 is the status line
  assert(term.is_status_cell(2, 0));
  assert(term.cursor_row() == 2 && term.cursor_col() == 0);
}

static void test_debug_readout() {
  HeadlessTerminal term(4, 60);
  TextBuffer b;
  b.insert(2, 0, '\t');
  Renderer r;
  RenderInfo info = info_for(b, Cursor{0, 0}, Mode::Normal, TermSize{4, 60});
  info.show_debug = true;
  r.render(term, info);
  assert(term.row_text(3) == "NORMAL [0, 0]  [\\0\\0\\t]");
}

static void test_repaint_clears() {
  HeadlessTerminal term(4, 20);
  TextBuffer b;
  b.insert(0, 0, 'a');
  b.insert(1, 0, 'b');
  Renderer r;
  r.render(term, info_for(b, Cursor{0, 2}, Mode::Normal, TermSize{4, 20}));
  b.remove(1, 0);
  r.render(term, info_for(b, Cursor{0, 1}, Mode::Normal, TermSize{4, 20}));
  assert(term.row_text(0) == "a");
  assert(term.clear_count() == 2);
}

int main() {
  test_expand_line();
  test_lines_and_status();
  test_cursor_after_tab_and_block_shape();
  test_clipping();
  test_debug_readout();
  test_repaint_clears();
  return 0;
}
