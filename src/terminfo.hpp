#pragma once
/*
 * Terminfo
 *
 * Purpose: owns one terminfo entry loaded through ncurses' low-level API and
 *          hands out its strings already formatted.
 * Note: <term.h> defines macros for every capability name, so it is only
 *       included by terminfo.cpp.
 */
#include <string>

struct term;

class Terminfo {
public:
  Terminfo() = default;
  Terminfo(const Terminfo&) = delete;
  Terminfo& operator=(const Terminfo&) = delete;
  ~Terminfo();

  // Loads the entry for `name` as the current terminal; `fd` is the link.
  bool load(const std::string& name, int fd, std::string& msg);
  bool loaded() const { return handle_ != nullptr; }

  // Capability string or `fallback` when absent.
  std::string get(const char* cap, const std::string& fallback) const;
  // Capability with two parameters (already 0-based), or `fallback`.
  std::string param(const char* cap, int a, int b, const std::string& fallback) const;
  int number(const char* cap, int fallback) const;

private:
  term* handle_ = nullptr;
};
