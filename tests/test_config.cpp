#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>
#include "file_reader.hpp"

static std::filesystem::path scratch(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("vtfeed_" + std::to_string(::getpid()) + "_" + name);
}

static void write(const std::filesystem::path& p, const std::string& text) {
  std::string msg;
  bool ok = write_file_atomic(p, text, msg);
  assert(ok);
}

static void test_rc_file() {
  auto rc = scratch("rc");
  write(rc,
        "# comment\n"
        "\" vim-style comment\n"
        "// another\n"
        "\n"
        "set baud=1200\n"
        ":set flow\n"
        "  set wide  \r\n"
        " \t \n"
        "\tset pagesize=5 \t\n"
        "set visibility=unlisted\n"
        "set spoilers\n"
        "set loglevel=debug\n"
        "account Ada Lovelace ada@example.org\n");
  Settings s;
  std::vector<std::string> warnings;
  std::string msg;
  assert(load_rc(rc, true, s, warnings, msg));
  assert(warnings.empty());
  assert(s.baud == 1200);
  assert(s.flow);
  assert(s.wide);
  assert(!s.utf8);
  assert(s.page_size == 5);
  assert(s.visibility == Visibility::Unlisted);
  assert(s.expand_spoilers);
  assert(s.loglevel == "debug");
  assert(s.name == "Ada Lovelace");
  assert(s.handle == "ada@example.org");
  std::filesystem::remove(rc);
}

static void test_rc_warnings() {
  auto rc = scratch("rc_bad");
  write(rc,
        "set baud=1234\n"
        "set pagesize=99\n"
        "frobnicate\n"
        "set flow=yes\n"
        "set loglevel=chatty\n"
        "set term=vt220\n");
  Settings s;
  std::vector<std::string> warnings;
  std::string msg;
  assert(load_rc(rc, false, s, warnings, msg));
  assert(warnings.size() == 5);
  assert(warnings[0] == rc.string() + ":1: set baud: unsupported rate 1234");
  assert(warnings[1] == rc.string() + ":2: set pagesize: count must be 1..40");
  assert(warnings[2] == rc.string() + ":3: unknown command: frobnicate");
  assert(warnings[3] == rc.string() + ":4: set flow: takes no value");
  // bad lines leave the defaults alone; good lines still apply
  assert(s.baud == 9600);
  assert(s.page_size == 20);
  assert(!s.flow);
  assert(s.loglevel == "info");
  assert(s.term == "vt220");
  std::filesystem::remove(rc);
}

static void test_missing_rc() {
  Settings s;
  std::vector<std::string> warnings;
  std::string msg;
  auto missing = scratch("no_such_rc");
  assert(load_rc(missing, false, s, warnings, msg));
  assert(!load_rc(missing, true, s, warnings, msg));
  assert(msg == "rc file not found: " + missing.string());
}

static void test_args() {
  Settings s;
  std::string msg;
  assert(parse_args({"--port", "/dev/ttyS0", "--baud", "19200", "--flow", "--utf8", "--term", "vt102",
                     "--log", "/tmp/vtfeed.log", "--loglevel", "warn", "feed.txt"},
                    s, msg));
  assert(s.port == "/dev/ttyS0");
  assert(s.baud == 19200);
  assert(s.flow);
  assert(s.utf8);
  assert(!s.wide);
  assert(s.term == "vt102");
  assert(s.log == "/tmp/vtfeed.log");
  assert(s.loglevel == "warn");
  assert(s.feed == "feed.txt");
  assert(!s.help);

  Settings dash;
  assert(parse_args({"--port", "-", "feed.txt"}, dash, msg));
  assert(dash.port == "-");

  Settings h;
  assert(parse_args({"--help"}, h, msg));
  assert(h.help);
}

static void test_bad_args() {
  Settings s;
  std::string msg;
  assert(!parse_args({"--baud", "110", "feed.txt"}, s, msg));
  assert(msg == "--baud: unsupported rate 110");
  assert(!parse_args({"--bogus", "feed.txt"}, s, msg));
  assert(msg == "unknown option: --bogus");
  assert(!parse_args({"--port"}, s, msg));
  assert(msg == "--port: missing value");
  assert(!parse_args({}, s, msg));
  assert(msg == "expected exactly one feed file");
  assert(!parse_args({"a.txt", "b.txt"}, s, msg));
  assert(!parse_args({"--loglevel", "loud", "feed.txt"}, s, msg));
}

static void test_helpers() {
  assert(supported_baud(300));
  assert(supported_baud(115200));
  assert(!supported_baud(0));
  assert(!supported_baud(14400));
  Visibility v = Visibility::Public;
  assert(parse_visibility("direct", v) && v == Visibility::Direct);
  assert(!parse_visibility("Public", v));
  assert(v == Visibility::Direct);
  assert(usage().find("FEED") != std::string::npos);
}

int main() {
  test_rc_file();
  test_rc_warnings();
  test_missing_rc();
  test_args();
  test_bad_args();
  test_helpers();
  return 0;
}
