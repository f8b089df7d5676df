#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/TermSize).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

enum class Mode { Normal, Insert };

enum class CursorShape { Block, Default };

struct Cursor { std::size_t row = 0; std::size_t col = 0; };

struct TermSize { int rows; int cols; };

inline const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
  }
  return "";
}
