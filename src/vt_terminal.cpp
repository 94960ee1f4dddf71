#include "vt_terminal.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <spdlog/spdlog.h>
#include "posix_fd.hpp"
#include "styled_text.hpp"
#include "terminfo.hpp"
#include "vt100_codes.hpp"

namespace {

constexpr int kReportTimeoutMs = 2000;

struct Capability { Op op; const char* name; };

// Ops without an entry here have no terminfo equivalent.
const Capability kCapabilities[] = {
    {Op::SetNormal, "sgr0"},
    {Op::SetBold, "bold"},
    {Op::SetUnderline, "smul"},
    {Op::SetReverse, "rev"},
    {Op::ClearToEol, "el"},
    {Op::SaveCursor, "sc"},
    {Op::RestoreCursor, "rc"},
    {Op::CursorUp, "ri"},
    {Op::CursorDown, "ind"},
};

}

VtTerminal::VtTerminal(int fd, TermSize size, bool utf8, const Terminfo& info)
    : fd_(fd), size_(size), utf8_(utf8), info_(info) {
  for (int i = 0; i < kOpCount; ++i) commands_[i] = vt100::command(static_cast<Op>(i));
  for (const auto& cap : kCapabilities) {
    std::string& slot = commands_[static_cast<int>(cap.op)];
    slot = info_.get(cap.name, slot);
  }
  enter_acs_ = info_.get("smacs", vt100::kEnterAcs);
  exit_acs_ = info_.get("rmacs", vt100::kExitAcs);
  for (int c = 0; c < 128; ++c) acs_map_[c] = static_cast<char>(c);
  std::string acsc = info_.get("acsc", "");
  for (size_t i = 0; i + 1 < acsc.size(); i += 2) {
    unsigned char from = static_cast<unsigned char>(acsc[i]);
    if (from < 128) acs_map_[from] = acsc[i + 1];
  }
}

void VtTerminal::write(const std::string& bytes) {
  if (bytes.empty()) return;
  if (!write_all(fd_, bytes.data(), bytes.size())) {
    throw LinkError(std::string("link write failed: ") + std::strerror(errno));
  }
}

void VtTerminal::move_cursor(int row, int col) {
  write(info_.param("cup", row - 1, col - 1, vt100::cursor_address(row, col)));
}

std::string VtTerminal::encode(const std::u32string& text) {
  std::string out;
  out.reserve(text.size());
  auto leave_acs = [&]() {
    if (acs_) { out += exit_acs_; acs_ = false; }
  };
  for (char32_t c : text) {
    if (c == U'\n') {
      leave_acs();
      out += vt100::kNewline;
      continue;
    }
    if (c < 0x80) {
      leave_acs();
      out += static_cast<char>(c);
      continue;
    }
    if (utf8_) {
      out += utf8_encode(std::u32string(1, c));
      continue;
    }
    char letter = vt100::acs_letter(c);
    if (letter == 0) {
      leave_acs();
      out += '?';
      continue;
    }
    if (!acs_) { out += enter_acs_; acs_ = true; }
    out += acs_map_[static_cast<unsigned char>(letter)];
  }
  leave_acs();
  return out;
}

void VtTerminal::send_text(const std::u32string& text) { write(encode(text)); }

void VtTerminal::send_command(Op op) { write(commands_[static_cast<int>(op)]); }

void VtTerminal::set_scroll_region(int top, int bottom) {
  write(info_.param("csr", top - 1, bottom - 1, vt100::scroll_region(top, bottom)));
}

void VtTerminal::clear_scroll_region() {
  write(info_.param("csr", 0, size_.rows - 1, vt100::reset_scroll_region()));
}

Pos VtTerminal::fetch_cursor() {
  write(vt100::kQueryCursor);
  // Expect ESC [ row ; col R. Keys typed meanwhile are kept for read_byte.
  std::deque<unsigned char> stray;
  std::string report;
  bool in_report = false;
  for (;;) {
    unsigned char b = 0;
    if (!read_byte(b, kReportTimeoutMs)) {
      spdlog::warn("terminal: no cursor position report, assuming home");
      for (unsigned char s : stray) typeahead_.push_back(s);
      move_cursor(1, 1);
      return Pos{1, 1};
    }
    if (!in_report) {
      if (b == 0x1b) { in_report = true; report.clear(); }
      else stray.push_back(b);
      continue;
    }
    report.push_back(static_cast<char>(b));
    if (b == 'R') break;
    bool other_final = b >= 0x40 && b <= 0x7e && !(report.size() == 1 && b == '[');
    if (other_final || report.size() > 16) {
      // some other sequence, most likely a cursor key
      in_report = false;
      stray.push_back(0x1b);
      for (char c : report) stray.push_back(static_cast<unsigned char>(c));
    }
  }
  for (unsigned char s : stray) typeahead_.push_back(s);

  Pos pos;
  if (std::sscanf(report.c_str(), "[%d;%dR", &pos.row, &pos.col) != 2) {
    spdlog::warn("terminal: malformed cursor report, assuming home");
    move_cursor(1, 1);
    return Pos{1, 1};
  }
  spdlog::debug("terminal: cursor at {},{}", pos.row, pos.col);
  return pos;
}

bool VtTerminal::read_byte(unsigned char& out, int timeout_ms) {
  if (!typeahead_.empty()) {
    out = typeahead_.front();
    typeahead_.pop_front();
    return true;
  }
  switch (::read_byte(fd_, out, timeout_ms)) {
    case ReadResult::Byte: return true;
    case ReadResult::Timeout: return false;
    case ReadResult::Closed: throw LinkError("link closed");
    case ReadResult::Error: break;
  }
  throw LinkError(std::string("link read failed: ") + std::strerror(errno));
}
