#pragma once
/*
 * Config
 *
 * Purpose: session settings from the run-control file and the command line.
 * Order: defaults, then ~/.vtfeedrc (or --rc FILE), then command-line options.
 * Errors: rc problems are collected as warnings and the line is skipped;
 *         command-line problems fail the whole parse.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

struct Settings {
  std::string port = "-";      // "-" drives the process's own tty
  int baud = 9600;
  bool flow = false;           // XON/XOFF
  bool wide = false;           // 132 columns
  bool utf8 = false;
  std::string term;            // empty: $TERM on the own tty, else vt100
  std::filesystem::path rc;
  std::string log;             // empty: logging off
  std::string loglevel = "info";
  int page_size = 20;
  bool expand_spoilers = false;
  Visibility visibility = Visibility::Public;
  std::string name = "vtfeed";
  std::string handle = "vtfeed@localhost";
  std::filesystem::path feed;
  bool help = false;
};

// Baud rates the link layer can program.
bool supported_baud(int baud);
bool parse_visibility(const std::string& s, Visibility& out);

// Applies every command in `path`. A missing file is not an error unless
// `required`. Returns false only when the file exists but cannot be read.
bool load_rc(const std::filesystem::path& path, bool required, Settings& settings,
             std::vector<std::string>& warnings, std::string& msg);

bool parse_args(const std::vector<std::string>& args, Settings& settings, std::string& msg);

// Full resolution for main(): locates the rc file, loads it, applies args.
bool load_settings(int argc, char** argv, Settings& settings,
                   std::vector<std::string>& warnings, std::string& msg);

std::string usage();
