#include "text_buffer.hpp"
#include <algorithm>
#include "config.hpp"

static std::size_t unit_width(char c, int tab_width) {
  return c == '\t' ? static_cast<std::size_t>(std::max(1, tab_width)) : 1u;
}

TextBuffer::TextBuffer() { lines_.emplace_back(); }

void TextBuffer::ensure_line(std::size_t r) {
  if (r >= lines_.size()) lines_.resize(r + 1);
}

void TextBuffer::insert(std::size_t x, std::size_t y, char ch) {
  // line breaks are cursor movement, never stored content
  if (ch == '\n') return;
  ensure_line(y);
  std::string& s = lines_[y];
  if (s.size() < x) s.resize(x, TV_EMPTY_SLOT);
  s.insert(s.begin() + static_cast<std::ptrdiff_t>(x), ch);
}

void TextBuffer::remove(std::size_t x, std::size_t y) {
  if (y >= lines_.size()) return;
  std::string& s = lines_[y];
  if (x >= s.size()) return;
  s.erase(s.begin() + static_cast<std::ptrdiff_t>(x));
}

std::string TextBuffer::line(std::size_t r) const {
  if (r >= lines_.size()) return std::string();
  return lines_[r];
}

std::size_t TextBuffer::line_length(std::size_t r) const {
  if (r >= lines_.size()) return 0;
  return lines_[r].size();
}

std::optional<char> TextBuffer::char_at(std::size_t x, std::size_t y) const {
  if (y >= lines_.size() || x >= lines_[y].size()) return std::nullopt;
  return lines_[y][x];
}

std::size_t TextBuffer::display_width(std::size_t r, int tab_width) const {
  if (r >= lines_.size()) return 0;
  std::size_t w = 0;
  for (char c : lines_[r]) w += unit_width(c, tab_width);
  return w;
}

std::size_t TextBuffer::display_col(std::size_t r, std::size_t x, int tab_width) const {
  if (r >= lines_.size()) return 0;
  const std::string& s = lines_[r];
  std::size_t end = std::min(x, s.size());
  std::size_t col = 0;
  for (std::size_t i = 0; i < end; ++i) col += unit_width(s[i], tab_width);
  // past the end (padding not yet materialized) each position is one column
  if (x > s.size()) col += x - s.size();
  return col;
}
