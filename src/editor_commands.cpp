#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

void Editor::register_commands() {
  registry.register_command("set tabwidth", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "set tabwidth: use :set tabwidth <width>"; return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message_ = "set tabwidth: width must be a number"; return; }
    int w = 0;
    try { w = std::stoi(s); } catch (const std::out_of_range&) { message_ = "set tabwidth: invalid number"; return; }
    if (w < 1) { message_ = "set tabwidth: width must be >= 1"; return; }
    set_tab_width(w);
  });
  registry.register_command("set altswitch", [this](const std::vector<std::string>& args){
    bool v = false;
    if (!parse_switch(args, alt_switch_, v)) { message_ = "set altswitch: use :set altswitch on|off"; return; }
    alt_switch_ = v;
    message_ = alt_switch_ ? "altswitch on" : "altswitch off";
  });
  registry.register_command("set debug", [this](const std::vector<std::string>& args){
    bool v = false;
    if (!parse_switch(args, show_debug_, v)) { message_ = "set debug: use :set debug on|off"; return; }
    show_debug_ = v;
    message_ = show_debug_ ? "debug on" : "debug off";
  });
}
