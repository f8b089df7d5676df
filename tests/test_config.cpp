#include "editor.hpp"
#include "headless_terminal.hpp"
#include "file_reader.hpp"
#include "cmd_registry.hpp"
#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::filesystem::path write_rc(const std::string& name, const std::string& content) {
  auto p = std::filesystem::temp_directory_path() / (name + "." + std::to_string(::getpid()));
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
  return p;
}

static void test_registry_dispatch() {
  CommandRegistry reg;
  int hits = 0;
  std::vector<std::string> seen;
  reg.register_command("set x", [&](const std::vector<std::string>& args){ hits++; seen = args; });
  assert(reg.contains("set x"));
  assert(!reg.contains("set y"));
  assert(reg.execute("set x", {"1", "2"}));
  assert(!reg.execute("set y", {}));
  assert(hits == 1 && seen.size() == 2 && seen[1] == "2");
}

static void test_readlines_crlf() {
  auto p = write_rc("tinyvi_lines", "one\r\ntwo\n\nthree");
  std::vector<std::string> lines; std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines.size() == 4);
  assert(lines[0] == "one" && lines[1] == "two" && lines[2].empty() && lines[3] == "three");
  std::filesystem::remove(p);
  assert(!mmap_readlines(p, lines, msg));
  assert(msg.find("can not open file") == 0);
}

static void test_rc_file_applied() {
  auto p = write_rc("tinyvi_rc",
                    "# comment\n"
                    "\" vim style comment\n"
                    "// another\n"
                    "\t  # indented comment\n"
                    "   \t\n"
                    "\n"
                    "  :set tabwidth=8  \n"
                    "set altswitch on\n"
                    "set debug\n");
  HeadlessTerminal term(24, 80);
  Editor ed(term, p);
  assert(ed.tab_width() == 8);
  assert(ed.alt_switch());
  assert(ed.show_debug());
  assert(ed.message() == "debug on");
  std::filesystem::remove(p);
}

static void test_bad_directives_only_set_message() {
  HeadlessTerminal term(24, 80);
  Editor ed(term, std::filesystem::path());
  assert(ed.tab_width() == TV_TAB_WIDTH);
  ed.execute_command("set tabwidth 0");
  assert(ed.tab_width() == TV_TAB_WIDTH);
  assert(ed.message() == "set tabwidth: width must be >= 1");
  ed.execute_command("set tabwidth abc");
  assert(ed.message() == "set tabwidth: width must be a number");
  ed.execute_command("set tabwidth 99999999999999999999");
  assert(ed.message() == "set tabwidth: invalid number");
  ed.execute_command("set tabwidth 2");
  assert(ed.tab_width() == 2 && ed.message() == "tabwidth=2");
  ed.execute_command("set wrap");
  assert(ed.message() == "unknown command: set wrap");
  ed.execute_command("bogus");
  assert(ed.message() == "unknown command: bogus");
  ed.execute_command("set debug maybe");
  assert(!ed.show_debug());
  ed.execute_command("set debug on");
  ed.execute_command("set debug");
  assert(!ed.show_debug());
}

static void test_missing_rc_reports() {
  HeadlessTerminal term(24, 80);
  Editor ed(term, std::filesystem::path("/nonexistent/tinyvi/rc"));
  assert(ed.message().find("can not open file") == 0);
}

static void test_size_query_failure_degrades() {
  HeadlessTerminal term(10, 10);
  term.fail_size_query(true);
  Editor ed(term, std::filesystem::path());
  assert(ed.size().rows == TV_DEFAULT_ROWS && ed.size().cols == TV_DEFAULT_COLS);
  assert(ed.message() == "size query failed");
}

static void test_read_failures_retried_then_fatal() {
  HeadlessTerminal term(10, 40);
  Editor ed(term, std::filesystem::path());
  term.push_error({IoError::Kind::ReadFailed, "glitch"});
  term.push_keys("i");
  for (int i = 0; i < TV_MAX_READ_RETRIES; ++i) term.push_error({IoError::Kind::ReadFailed, "device gone"});
  term.push_keys("q");
  assert(!ed.run());
  assert(ed.mode() == Mode::Insert);
  assert(ed.message() == "device gone");
}

static void test_interrupt_stops_cleanly() {
  HeadlessTerminal term(10, 40);
  Editor ed(term, std::filesystem::path());
  term.push_keys("i");
  term.push_keys("a");
  term.push_error({IoError::Kind::Interrupted, "terminated by signal"});
  term.push_keys("b");
  assert(ed.run());
  assert(ed.buffer().line(0) == "a");
}

static void test_resize_repaints() {
  HeadlessTerminal term(10, 40);
  Editor ed(term, std::filesystem::path());
  term.push_event(ResizeEvent{20, 6});
  term.resize(6, 20);
  int before = term.refresh_count();
  assert(ed.run());
  assert(ed.size().rows == 6 && ed.size().cols == 20);
  assert(term.refresh_count() == before + 2);
  assert(term.is_status_cell(5, 0));
}

int main() {
  test_registry_dispatch();
  test_readlines_crlf();
  test_rc_file_applied();
  test_bad_directives_only_set_message();
  test_missing_rc_reports();
  test_size_query_failure_degrades();
  test_read_failures_retried_then_fatal();
  test_interrupt_stops_cleanly();
  test_resize_repaints();
  return 0;
}
