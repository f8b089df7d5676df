#pragma once
/*
 * Editor
 *
 * Purpose: modal state machine. Owns the buffer, cursor, mode and cached
 * terminal size; translates events into actions and applies them.
 * Flow: read_event -> handle_event -> apply -> render.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "action.hpp"
#include "cmd_registry.hpp"
#include "event.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

class Editor {
public:
  // rc == nullopt: look up $HOME/TV_RC_NAME; an empty path skips the rc file
  explicit Editor(ITerminal& term, const std::optional<std::filesystem::path>& rc = std::nullopt);
  // registered commands capture this
  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  // false when the loop ended on an unrecoverable terminal error (see message())
  bool run();

  std::optional<Action> handle_event(const Event& ev);
  // false for Exit
  bool apply(const Action& a);
  void render();

  void execute_command(const std::string& cmdline);
  void load_rc(const std::filesystem::path& path);

  const TextBuffer& buffer() const { return buf; }
  const Cursor& cursor() const { return cur; }
  Mode mode() const { return mode_; }
  TermSize size() const { return size_; }
  int tab_width() const { return tab_width_; }
  bool alt_switch() const { return alt_switch_; }
  bool show_debug() const { return show_debug_; }
  const std::string& message() const { return message_; }

private:
  std::optional<Action> translate_normal(const KeyEvent& k) const;
  std::optional<Action> translate_insert(const KeyEvent& k) const;
  void refresh_size();
  void register_commands();
  void set_tab_width(int width);

  void move_up();
  void move_down();
  void move_left();
  void move_right();
  void new_line();
  void backspace();
  void insert_char(char ch);
  void delete_char();

  ITerminal& term;
  TextBuffer buf;
  Cursor cur;
  Mode mode_ = Mode::Normal;
  TermSize size_{0, 0};
  int tab_width_;
  bool alt_switch_ = false;
  bool show_debug_ = false;
  std::string message_;
  Renderer renderer;
  CommandRegistry registry;
};
