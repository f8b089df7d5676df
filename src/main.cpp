#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include <exception>
#include <iostream>
#include <string>

int main() {
  std::string failure;
  try {
    Terminal session;
    NcursesTerminal term;
    Editor ed(term);
    if (!ed.run()) failure = ed.message();
  } catch (const std::exception& e) {
    // session is already torn down here, so stderr is the real terminal again
    failure = e.what();
  }
  if (!failure.empty()) {
    std::cerr << "tinyvi: " << failure << "\n";
    return 1;
  }
  return 0;
}
