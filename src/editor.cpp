#include "editor.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <variant>
#include "config.hpp"
#include "file_reader.hpp"

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& rc)
    : term(t), tab_width_(TV_TAB_WIDTH) {
  refresh_size();
  register_commands();
  if (rc) {
    if (!rc->empty()) load_rc(*rc);
    return;
  }
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / TV_RC_NAME;
  if (std::filesystem::exists(p, ec)) load_rc(p);
}

void Editor::refresh_size() {
  TermSize sz{0, 0};
  IoError err;
  if (term.get_size(sz, err)) { size_ = sz; return; }
  // degrade: keep the last known size
  if (size_.rows <= 0 || size_.cols <= 0) size_ = {TV_DEFAULT_ROWS, TV_DEFAULT_COLS};
  message_ = err.msg;
}

bool Editor::run() {
  render();
  int failures = 0;
  for (;;) {
    Event ev;
    IoError err;
    if (!term.read_event(ev, err)) {
      switch (err.kind) {
        case IoError::Kind::EndOfInput:
        case IoError::Kind::Interrupted:
          return true;
        case IoError::Kind::None:
        case IoError::Kind::ReadFailed:
        case IoError::Kind::SizeQueryFailed:
          if (++failures >= TV_MAX_READ_RETRIES) { message_ = err.msg; return false; }
          continue;
      }
    }
    failures = 0;
    bool resized = std::holds_alternative<ResizeEvent>(ev);
    if (auto a = handle_event(ev)) {
      if (!apply(*a)) return true;
      render();
    } else if (resized) {
      render();
    }
  }
}

void Editor::render() {
  RenderInfo info;
  info.buf = &buf;
  info.cur = cur;
  info.mode = mode_;
  info.size = size_;
  info.tab_width = tab_width_;
  info.message = message_;
  info.show_debug = show_debug_;
  renderer.render(term, info);
}

std::optional<Action> Editor::handle_event(const Event& ev) {
  if (const auto* r = std::get_if<ResizeEvent>(&ev)) {
    if (r->rows > 0 && r->cols > 0) size_ = {r->rows, r->cols};
    else refresh_size();
    return std::nullopt;
  }
  const KeyEvent& k = std::get<KeyEvent>(ev);
  switch (k.code) {
    case KeyCode::Up: return make_action(ActionType::MoveUp);
    case KeyCode::Down: return make_action(ActionType::MoveDown);
    case KeyCode::Left: return make_action(ActionType::MoveLeft);
    case KeyCode::Right: return make_action(ActionType::MoveRight);
    case KeyCode::Char:
    case KeyCode::Enter:
    case KeyCode::Backspace:
    case KeyCode::Delete:
    case KeyCode::Tab:
    case KeyCode::Escape:
    case KeyCode::Other:
      break;
  }
  switch (mode_) {
    case Mode::Normal: return translate_normal(k);
    case Mode::Insert: return translate_insert(k);
  }
  return std::nullopt;
}

std::optional<Action> Editor::translate_normal(const KeyEvent& k) const {
  switch (k.code) {
    case KeyCode::Char:
      if (k.has(kModCtrl)) return std::nullopt;
      if (k.ch == 'i') {
        if (alt_switch_ && !k.has(kModAlt)) return std::nullopt;
        return make_action(ActionType::ModeToInsert);
      }
      if (k.has(kModAlt)) return std::nullopt;
      if (k.ch == 'q') return make_action(ActionType::Exit);
      if (k.ch == 'd') return make_action(ActionType::DeleteChar);
      return std::nullopt;
    case KeyCode::Delete: return make_action(ActionType::DeleteChar);
    case KeyCode::Up:
    case KeyCode::Down:
    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Enter:
    case KeyCode::Backspace:
    case KeyCode::Tab:
    case KeyCode::Escape:
    case KeyCode::Other:
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<Action> Editor::translate_insert(const KeyEvent& k) const {
  switch (k.code) {
    case KeyCode::Escape: return make_action(ActionType::ModeToNormal);
    case KeyCode::Backspace: return make_action(ActionType::Backspace);
    case KeyCode::Enter: return make_action(ActionType::NewLine);
    case KeyCode::Tab: return make_action(ActionType::Tab);
    case KeyCode::Char:
      if (k.has(kModAlt)) {
        if (k.ch == 'i') return make_action(ActionType::ModeToNormal);
        return std::nullopt;
      }
      if (k.has(kModCtrl)) return std::nullopt;
      if (k.ch >= 32 && k.ch <= 126) return add_char(k.ch);
      return std::nullopt;
    case KeyCode::Up:
    case KeyCode::Down:
    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Delete:
    case KeyCode::Other:
      return std::nullopt;
  }
  return std::nullopt;
}

bool Editor::apply(const Action& a) {
  switch (a.type) {
    case ActionType::MoveUp: move_up(); break;
    case ActionType::MoveDown: move_down(); break;
    case ActionType::MoveLeft: move_left(); break;
    case ActionType::MoveRight: move_right(); break;
    case ActionType::NewLine: new_line(); break;
    case ActionType::Backspace: backspace(); break;
    case ActionType::ModeToNormal: mode_ = Mode::Normal; break;
    case ActionType::ModeToInsert: mode_ = Mode::Insert; break;
    case ActionType::AddChar: insert_char(a.ch); break;
    // one stored unit; the renderer expands it to tab_width columns
    case ActionType::Tab: insert_char('\t'); break;
    case ActionType::DeleteChar: delete_char(); break;
    case ActionType::Exit: return false;
  }
  return true;
}

void Editor::move_up() {
  if (cur.row > 0) cur.row--;
  cur.col = std::min(cur.col, buf.line_length(cur.row));
}

void Editor::move_down() {
  if (!buf.has_line(cur.row + 1)) return;
  cur.col = buf.line_length(cur.row + 1);
  cur.row++;
}

void Editor::move_left() {
  if (cur.col > 0 && buf.char_at(cur.col - 1, cur.row)) cur.col--;
}

void Editor::move_right() {
  if (buf.char_at(cur.col + 1, cur.row)) cur.col++;
}

// Starts a fresh row below; the tail of the current row stays where it is.
void Editor::new_line() {
  buf.insert(cur.col, cur.row, '\n');
  cur.row++;
  cur.col = 0;
  buf.ensure_line(cur.row);
}

// At column 0 only the row moves up; rows are never joined.
void Editor::backspace() {
  if (cur.col > 0) {
    buf.remove(cur.col - 1, cur.row);
    cur.col--;
  } else if (cur.row > 0) {
    cur.row--;
  }
}

void Editor::insert_char(char ch) {
  buf.insert(cur.col, cur.row, ch);
  cur.col++;
}

void Editor::delete_char() { buf.remove(cur.col, cur.row); }

// rc line -> directive text; empty for blanks and comments
static std::string rc_directive(const std::string& raw) {
  static const char* const kBlank = " \t\r\f\v";
  size_t first = raw.find_first_not_of(kBlank);
  if (first == std::string::npos) return std::string();
  std::string line = raw.substr(first, raw.find_last_not_of(kBlank) - first + 1);
  if (line[0] == '#' || line[0] == '"' || line.rfind("//", 0) == 0) return std::string();
  if (line[0] == ':') line.erase(0, 1);
  return line;
}

void Editor::load_rc(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::string msg;
  if (!mmap_readlines(path, lines, msg)) { message_ = msg; return; }
  for (const std::string& raw : lines) {
    std::string directive = rc_directive(raw);
    if (!directive.empty()) execute_command(directive);
  }
}

// "set name value..." and "set name=value" both dispatch to "set name"
void Editor::execute_command(const std::string& cmdline) {
  std::istringstream words(cmdline);
  std::vector<std::string> tokens;
  for (std::string w; words >> w;) tokens.push_back(w);
  if (tokens.empty()) return;

  std::string name = tokens[0];
  std::vector<std::string> args(tokens.begin() + 1, tokens.end());
  if (name == "set" && !args.empty()) {
    std::string option = args.front();
    args.erase(args.begin());
    size_t eq = option.find('=');
    if (eq != std::string::npos) {
      if (eq + 1 < option.size()) args.insert(args.begin(), option.substr(eq + 1));
      option.resize(eq);
    }
    name += " " + option;
  }
  if (!registry.execute(name, args)) message_ = "unknown command: " + name;
}

void Editor::set_tab_width(int width) {
  int w = std::max(1, width);
  tab_width_ = w;
  message_ = std::string("tabwidth=") + std::to_string(w);
}
