#pragma once
/*
 * Action
 *
 * Purpose: closed set of edit/navigation commands; the step between a raw
 * event and a buffer mutation. `ch` is only meaningful for AddChar.
 */
enum class ActionType {
  MoveUp,
  MoveDown,
  MoveLeft,
  MoveRight,
  NewLine,
  Backspace,
  ModeToNormal,
  ModeToInsert,
  AddChar,
  Tab,
  DeleteChar,
  Exit,
};

struct Action {
  ActionType type;
  char ch = 0;
  bool operator==(const Action& o) const { return type == o.type && ch == o.ch; }
};

inline Action make_action(ActionType t) { return Action{t, 0}; }
inline Action add_char(char c) { return Action{ActionType::AddChar, c}; }
