#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer with point insert/remove.
 * Policy: insert auto-grows (missing rows appended, short lines padded with
 *         TV_EMPTY_SLOT); remove outside the content is a no-op.
 * Invariant: line_count() >= 1 at all times.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class TextBuffer {
public:
  TextBuffer();

  void insert(std::size_t x, std::size_t y, char ch);
  void remove(std::size_t x, std::size_t y);

  std::size_t line_count() const { return lines_.size(); }
  bool has_line(std::size_t r) const { return r < lines_.size(); }
  std::string line(std::size_t r) const;
  std::size_t line_length(std::size_t r) const;
  std::optional<char> char_at(std::size_t x, std::size_t y) const;

  // screen columns, with each stored tab counted as tab_width
  std::size_t display_width(std::size_t r, int tab_width) const;
  std::size_t display_col(std::size_t r, std::size_t x, int tab_width) const;

  // materialize row r (and any rows before it) as empty lines
  void ensure_line(std::size_t r);

private:
  std::vector<std::string> lines_;
};
