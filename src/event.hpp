#pragma once
/*
 * Event
 *
 * Purpose: raw input events produced by a terminal backend.
 * Shape: tagged union of key press (code + modifiers) and resize (cols, rows).
 */
#include <string>
#include <variant>

enum class KeyCode { Char, Up, Down, Left, Right, Enter, Backspace, Delete, Tab, Escape, Other };

enum KeyMod : unsigned { kModNone = 0, kModAlt = 1u << 0, kModCtrl = 1u << 1 };

struct KeyEvent {
  KeyCode code = KeyCode::Other;
  char ch = 0;
  unsigned mods = kModNone;
  bool has(KeyMod m) const { return (mods & m) != 0; }
};

struct ResizeEvent { int cols = 0; int rows = 0; };

using Event = std::variant<KeyEvent, ResizeEvent>;

inline KeyEvent make_char_key(char c, unsigned mods = kModNone) { return KeyEvent{KeyCode::Char, c, mods}; }
inline KeyEvent make_key(KeyCode code) { return KeyEvent{code, 0, kModNone}; }

struct IoError {
  enum class Kind { None, ReadFailed, Interrupted, EndOfInput, SizeQueryFailed };
  Kind kind = Kind::None;
  std::string msg;
};
