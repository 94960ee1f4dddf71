#include "terminfo.hpp"
#include <curses.h>
#include <term.h>

namespace {

// ncurses' CANCELLED_STRING: tigetstr() answers it for names that are not string capabilities.
const char* const kNotAString = reinterpret_cast<const char*>(-1);

bool usable(const char* s) {
  return s != nullptr && s != kNotAString && *s != '\0';
}

// tputs() resolves $<n> padding; it can only hand bytes to a plain function.
std::string* sink = nullptr;

int collect(int c) {
  sink->push_back(static_cast<char>(c));
  return c;
}

std::string expand(const char* s) {
  std::string out;
  sink = &out;
  tputs(s, 1, collect);
  sink = nullptr;
  return out;
}

}

Terminfo::~Terminfo() {
  if (handle_) {
    set_curterm(handle_);
    del_curterm(handle_);
    handle_ = nullptr;
  }
}

bool Terminfo::load(const std::string& name, int fd, std::string& msg) {
  int err = 0;
  if (setupterm(name.c_str(), fd, &err) != OK) {
    msg = err == 0 ? "no terminfo entry for " + name : "terminfo database not found";
    return false;
  }
  handle_ = cur_term;
  return true;
}

std::string Terminfo::get(const char* cap, const std::string& fallback) const {
  if (!handle_) return fallback;
  set_curterm(handle_);
  const char* s = tigetstr(cap);
  return usable(s) ? expand(s) : fallback;
}

std::string Terminfo::param(const char* cap, int a, int b, const std::string& fallback) const {
  if (!handle_) return fallback;
  set_curterm(handle_);
  const char* s = tigetstr(cap);
  if (!usable(s)) return fallback;
  const char* out = tiparm(s, a, b);
  return out ? expand(out) : fallback;
}

int Terminfo::number(const char* cap, int fallback) const {
  if (!handle_) return fallback;
  set_curterm(handle_);
  int n = tigetnum(cap);
  return n > 0 ? n : fallback;
}
