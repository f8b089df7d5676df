#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal on every way out
 *        of main (return, exception). SIGTERM/SIGHUP only raise a flag; the
 *        interrupted read ends the loop and the destructor runs as usual.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 */
class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  static bool termination_requested();
};
