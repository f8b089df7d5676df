#include "terminal.hpp"
#include <ncurses.h>
#include <csignal>
#include <cstring>
#include <locale.h>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_terminate = 0;

void on_terminate_signal(int) { g_terminate = 1; }

void install_handler(int sig) {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_terminate_signal;
  sigemptyset(&sa.sa_mask);
  // no SA_RESTART: the blocking getch must come back with ERR
  sa.sa_flags = 0;
  (void)sigaction(sig, &sa, nullptr);
}
}

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  install_handler(SIGTERM);
  install_handler(SIGHUP);
}

Terminal::~Terminal() {
  // DECSCUSR 0: back to the user's cursor shape
  static const char reset_shape[] = "\x1b[0 q";
  ssize_t w = ::write(STDOUT_FILENO, reset_shape, sizeof(reset_shape) - 1);
  (void)w;
  endwin();
}

bool Terminal::termination_requested() { return g_terminate != 0; }
