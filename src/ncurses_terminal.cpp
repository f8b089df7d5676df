#include "ncurses_terminal.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include "terminal.hpp"

static constexpr int ESC = 27;

KeyEvent decode_key(int ch) {
  switch (ch) {
    case KEY_UP: return make_key(KeyCode::Up);
    case KEY_DOWN: return make_key(KeyCode::Down);
    case KEY_LEFT: return make_key(KeyCode::Left);
    case KEY_RIGHT: return make_key(KeyCode::Right);
    case KEY_ENTER: case '\n': case '\r': return make_key(KeyCode::Enter);
    case KEY_BACKSPACE: case 127: case 8: return make_key(KeyCode::Backspace);
    case KEY_DC: return make_key(KeyCode::Delete);
    case '\t': return make_key(KeyCode::Tab);
    case ESC: return make_key(KeyCode::Escape);
    default: break;
  }
  if (ch >= 32 && ch <= 126) return make_char_key(static_cast<char>(ch));
  if (ch >= 1 && ch <= 26) return make_char_key(static_cast<char>('a' + ch - 1), kModCtrl);
  return make_key(KeyCode::Other);
}

bool joins_escape(int next) {
  // ESC immediately followed by a key is how terminals send Alt+key
  return next != ERR && next != KEY_RESIZE;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    init_pair(kStatusPair, COLOR_BLACK, COLOR_CYAN);
    colors_ = true;
  }
}

bool NcursesTerminal::get_size(TermSize& out, IoError& err) const {
  int r, c; getmaxyx(stdscr, r, c);
  if (r <= 0 || c <= 0) {
    err = {IoError::Kind::SizeQueryFailed, "can not query terminal size"};
    return false;
  }
  out = {r, c};
  return true;
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_status(int row, int col, const std::string& text) {
  attr_t attrs = colors_ ? (COLOR_PAIR(kStatusPair) | A_BOLD) : (A_REVERSE | A_BOLD);
  attron(static_cast<int>(attrs));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(static_cast<int>(attrs));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_shape(CursorShape shape) {
  if (shape != shape_) { shape_ = shape; shape_dirty_ = true; }
}

void NcursesTerminal::refresh() {
  ::refresh();
  if (!shape_dirty_) return;
  // DECSCUSR: 2 steady block, 0 terminal default; after refresh so it is not
  // interleaved with the curses output buffer
  const char* seq = shape_ == CursorShape::Block ? "\x1b[2 q" : "\x1b[0 q";
  if (::write(STDOUT_FILENO, seq, std::strlen(seq)) >= 0) shape_dirty_ = false;
}

static ResizeEvent current_size() {
  int r, c; getmaxyx(stdscr, r, c);
  return ResizeEvent{c, r};
}

bool NcursesTerminal::read_event(Event& out, IoError& err) {
  int ch = ERR;
  for (;;) {
    // checked before blocking too, so a signal that lands between two reads
    // is not held until the next key press
    if (Terminal::termination_requested()) {
      err = {IoError::Kind::Interrupted, "terminated by signal"};
      return false;
    }
    errno = 0;
    ch = getch();
    if (ch != ERR) break;
    // a signal that did not ask us to quit: read again
    if (errno == EINTR) continue;
    err = {IoError::Kind::ReadFailed, std::string("read failed: ") + std::strerror(errno)};
    return false;
  }
  if (ch == KEY_RESIZE) {
    out = current_size();
    return true;
  }
  if (ch == ESC) {
    nodelay(stdscr, TRUE);
    int next = getch();
    nodelay(stdscr, FALSE);
    if (joins_escape(next)) {
      KeyEvent k = decode_key(next);
      k.mods |= kModAlt;
      out = k;
      return true;
    }
    // a resize right behind ESC: deliver ESC now, the resize on the next read
    if (next != ERR && ungetch(next) == ERR) {
      out = current_size();
      return true;
    }
  }
  out = decode_key(ch);
  return true;
}
