#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <spdlog/common.h>
#include "cmd_registry.hpp"
#include "file_reader.hpp"

namespace {

bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return false;
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && end == s.data() + s.size();
}

bool valid_loglevel(const std::string& s) {
  return s == "off" || spdlog::level::from_str(s) != spdlog::level::off;
}

bool set_flag(bool& flag, bool value, const char* name,
              const std::vector<std::string>& args, std::string& msg) {
  if (!args.empty()) { msg = std::string("set ") + name + ": takes no value"; return false; }
  flag = value;
  return true;
}

void register_settings(CommandRegistry& registry, Settings& s) {
  registry.register_command("set baud", [&s](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.size() != 1 || !parse_int(args[0], v)) { msg = "set baud: use set baud=<rate>"; return false; }
    if (!supported_baud(v)) { msg = "set baud: unsupported rate " + args[0]; return false; }
    s.baud = v;
    return true;
  });
  registry.register_command("set flow", [&s](const std::vector<std::string>& args, std::string& msg){
    return set_flag(s.flow, true, "flow", args, msg);
  });
  registry.register_command("set noflow", [&s](const std::vector<std::string>& args, std::string& msg){
    return set_flag(s.flow, false, "noflow", args, msg);
  });
  registry.register_command("set wide", [&s](const std::vector<std::string>& args, std::string& msg){
    return set_flag(s.wide, true, "wide", args, msg);
  });
  registry.register_command("set utf8", [&s](const std::vector<std::string>& args, std::string& msg){
    return set_flag(s.utf8, true, "utf8", args, msg);
  });
  registry.register_command("set spoilers", [&s](const std::vector<std::string>& args, std::string& msg){
    return set_flag(s.expand_spoilers, true, "spoilers", args, msg);
  });
  registry.register_command("set term", [&s](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set term: use set term=<name>"; return false; }
    s.term = args[0];
    return true;
  });
  registry.register_command("set pagesize", [&s](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.size() != 1 || !parse_int(args[0], v)) { msg = "set pagesize: use set pagesize=<count>"; return false; }
    if (v < 1 || v > 40) { msg = "set pagesize: count must be 1..40"; return false; }
    s.page_size = v;
    return true;
  });
  registry.register_command("set visibility", [&s](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_visibility(args[0], s.visibility)) {
      msg = "set visibility: use public|unlisted|private|direct";
      return false;
    }
    return true;
  });
  registry.register_command("set log", [&s](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set log: use set log=<file>"; return false; }
    s.log = args[0];
    return true;
  });
  registry.register_command("set loglevel", [&s](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !valid_loglevel(args[0])) {
      msg = "set loglevel: use trace|debug|info|warn|error|critical|off";
      return false;
    }
    s.loglevel = args[0];
    return true;
  });
  registry.register_command("account", [&s](const std::vector<std::string>& args, std::string& msg){
    if (args.size() < 2) { msg = "account: use account <name> <handle>"; return false; }
    // the name may contain spaces; the handle never does
    std::string name = args[0];
    for (size_t i = 1; i + 1 < args.size(); ++i) name += " " + args[i];
    s.name = name;
    s.handle = args.back();
    return true;
  });
}

std::string trim(const std::string& s) {
  auto blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  size_t i = 0;
  while (i < s.size() && blank(s[i])) i++;
  size_t j = s.size();
  while (j > i && blank(s[j - 1])) j--;
  return s.substr(i, j - i);
}

std::filesystem::path default_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / ".vtfeedrc";
}

}

bool supported_baud(int baud) {
  static const int rates[] = {300, 1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200};
  return std::find(std::begin(rates), std::end(rates), baud) != std::end(rates);
}

bool parse_visibility(const std::string& s, Visibility& out) {
  if (s == "public") out = Visibility::Public;
  else if (s == "unlisted") out = Visibility::Unlisted;
  else if (s == "private") out = Visibility::Private;
  else if (s == "direct") out = Visibility::Direct;
  else return false;
  return true;
}

bool load_rc(const std::filesystem::path& path, bool required, Settings& settings,
             std::vector<std::string>& warnings, std::string& msg) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    if (required) { msg = "rc file not found: " + path.string(); return false; }
    return true;
  }
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;

  CommandRegistry registry;
  register_settings(registry, settings);
  int number = 0;
  for (const std::string& raw : lines) {
    number++;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (!registry.run_line(s, err)) {
      warnings.push_back(path.string() + ":" + std::to_string(number) + ": " + err);
    }
  }
  return true;
}

bool parse_args(const std::vector<std::string>& args, Settings& settings, std::string& msg) {
  auto value_of = [&](size_t& i, std::string& out) {
    if (i + 1 >= args.size()) { msg = args[i] + ": missing value"; return false; }
    out = args[++i];
    return true;
  };
  std::vector<std::string> positional;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    std::string v;
    if (a == "-h" || a == "--help") { settings.help = true; return true; }
    else if (a == "--port") { if (!value_of(i, settings.port)) return false; }
    else if (a == "--baud") {
      if (!value_of(i, v)) return false;
      if (!parse_int(v, settings.baud) || !supported_baud(settings.baud)) { msg = "--baud: unsupported rate " + v; return false; }
    }
    else if (a == "--flow") settings.flow = true;
    else if (a == "--wide") settings.wide = true;
    else if (a == "--utf8") settings.utf8 = true;
    else if (a == "--term") { if (!value_of(i, settings.term)) return false; }
    else if (a == "--rc") { if (!value_of(i, v)) return false; settings.rc = v; }
    else if (a == "--log") { if (!value_of(i, settings.log)) return false; }
    else if (a == "--loglevel") {
      if (!value_of(i, v)) return false;
      if (!valid_loglevel(v)) { msg = "--loglevel: unknown level " + v; return false; }
      settings.loglevel = v;
    }
    else if (a.size() > 1 && a[0] == '-' && a != "-") { msg = "unknown option: " + a; return false; }
    else positional.push_back(a);
  }
  if (positional.size() != 1) { msg = "expected exactly one feed file"; return false; }
  settings.feed = positional[0];
  return true;
}

bool load_settings(int argc, char** argv, Settings& settings,
                   std::vector<std::string>& warnings, std::string& msg) {
  std::vector<std::string> args(argv + 1, argv + argc);
  bool explicit_rc = false;
  std::filesystem::path rc = default_rc();
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "--rc") { rc = args[i + 1]; explicit_rc = true; }
  }
  settings.rc = rc;
  if (!load_rc(rc, explicit_rc, settings, warnings, msg)) return false;
  return parse_args(args, settings, msg);
}

std::string usage() {
  return "usage: vtfeed [--port DEV] [--baud N] [--flow] [--wide] [--utf8]\n"
         "              [--term NAME] [--rc FILE] [--log FILE] [--loglevel LEVEL] FEED\n";
}
