#include "terminal.hpp"
#include <fcntl.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <spdlog/spdlog.h>
#include "vt100_codes.hpp"

namespace {

speed_t speed_for(int baud) {
  switch (baud) {
    case 300: return B300;
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    default: return B9600;
  }
}

std::string errno_text(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

}

std::string terminal_type(const Settings& settings) {
  if (!settings.term.empty()) return settings.term;
  if (settings.port == "-") {
    const char* env = std::getenv("TERM");
    if (env && *env) return env;
  }
  return "vt100";
}

Terminal::Terminal(const Settings& settings) {
  std::string device = settings.port == "-" ? "/dev/tty" : settings.port;
  fd_.reset(::open(device.c_str(), O_RDWR | O_NOCTTY));
  if (!fd_.valid()) throw LinkError(errno_text("can not open " + device));
  if (::tcgetattr(fd_.get(), &saved_) != 0) throw LinkError(errno_text("not a terminal: " + device));
  configure(settings);
  try {
    start(settings, device);
  } catch (const LinkError&) {
    if (::tcsetattr(fd_.get(), TCSANOW, &saved_) != 0) {
      spdlog::warn("terminal: {}", errno_text("can not restore line settings"));
    }
    throw;
  }
}

void Terminal::start(const Settings& settings, const std::string& device) {
  std::string type = terminal_type(settings);
  std::string msg;
  if (!info_.load(type, fd_.get(), msg)) spdlog::warn("terminal: {}, using built-in VT-100 sequences", msg);

  TermSize size{24, settings.wide ? 132 : 80};
  struct winsize ws{};
  if (settings.port == "-" && ::ioctl(fd_.get(), TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    size = {ws.ws_row, ws.ws_col};
  }
  vt_ = std::make_unique<VtTerminal>(fd_.get(), size, settings.utf8, info_);

  std::string setup = settings.wide ? vt100::kSet132Columns : vt100::kSet80Columns;
  if (!settings.utf8) setup += info_.get("enacs", vt100::kDesignateAcs);
  setup += info_.get("clear", "\x1b[H\x1b[2J");
  vt_->write(setup);
  spdlog::info("terminal: opened {} as {} ({}x{}, {} baud{})", device, type, size.rows, size.cols,
               settings.baud, settings.flow ? ", xon/xoff" : "");
}

void Terminal::configure(const Settings& settings) {
  struct termios raw = saved_;
  ::cfmakeraw(&raw);
  raw.c_cflag |= CLOCAL | CREAD;
  if (settings.flow) raw.c_iflag |= IXON | IXOFF;
  else raw.c_iflag &= ~static_cast<tcflag_t>(IXON | IXOFF);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (settings.port != "-") {
    speed_t speed = speed_for(settings.baud);
    ::cfsetispeed(&raw, speed);
    ::cfsetospeed(&raw, speed);
  }
  if (::tcsetattr(fd_.get(), TCSAFLUSH, &raw) != 0) throw LinkError(errno_text("can not configure link"));
}

Terminal::~Terminal() {
  if (vt_) {
    try {
      vt_->write(info_.get("rs1", vt100::kReset));
    } catch (const LinkError& e) {
      spdlog::warn("terminal: reset failed: {}", e.what());
    }
  }
  if (fd_.valid() && ::tcsetattr(fd_.get(), TCSADRAIN, &saved_) != 0) {
    spdlog::warn("terminal: {}", errno_text("can not restore line settings"));
  }
}
