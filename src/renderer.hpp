#pragma once
/*
 * Renderer
 *
 * Purpose: full clear-and-repaint of the buffer and the status line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <string>
#include "text_buffer.hpp"
#include "types.hpp"
#include "iterminal.hpp"

struct RenderInfo {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  Mode mode = Mode::Normal;
  TermSize size{0, 0};
  int tab_width = 4;
  std::string message;
  bool show_debug = false;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderInfo& info);

  // stored units -> screen text: tabs expanded, empty slots blank
  static std::string expand_line(const std::string& s, int tab_width);
  // stored units with tabs and empty slots made visible (debug readout)
  static std::string debug_line(const std::string& s);
  static std::string status_text(const RenderInfo& info);
};
