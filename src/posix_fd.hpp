#pragma once
/*
 * PosixFd
 *
 * Purpose: owning file descriptor plus the blocking I/O helpers the link and
 *          the feed file share.
 * Note: write_all retries on EINTR and short writes; read_byte waits at most
 *       `timeout_ms` (negative = forever).
 */
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstddef>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
  // Gives up ownership without closing.
  int release() { int fd = fd_; fd_ = -1; return fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

inline bool write_all(int fd, const char* data, size_t n) {
  size_t done = 0;
  while (done < n) {
    ssize_t w = ::write(fd, data + done, n - done);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    done += static_cast<size_t>(w);
  }
  return true;
}

enum class ReadResult { Byte, Timeout, Closed, Error };

inline ReadResult read_byte(int fd, unsigned char& out, int timeout_ms) {
  for (;;) {
    struct pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    int r = ::poll(&p, 1, timeout_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      return ReadResult::Error;
    }
    if (r == 0) return ReadResult::Timeout;
    ssize_t n = ::read(fd, &out, 1);
    if (n == 1) return ReadResult::Byte;
    if (n == 0) return ReadResult::Closed;
    if (errno == EINTR || errno == EAGAIN) continue;
    return ReadResult::Error;
  }
}
