#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "posix_fd.hpp"

namespace {

void split_lines(const char* data, size_t n, std::vector<std::string>& out_lines) {
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
    start = i + 1;
  }
  // a trailing newline does not open another line
  if (start < n) {
    size_t end = n;
    if (data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
}

}

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = "opened file: " + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  split_lines(data, n, out_lines);
  ::munmap(mem, n);
  msg = "opened file: " + path.string();
  return true;
}

bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& contents,
                       std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    UniqueFd fd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.valid()) { msg = std::string("write file failed: ") + std::strerror(errno); return false; }
    if (!write_all(fd.get(), contents.data(), contents.size())) {
      msg = std::string("write file failed: ") + std::strerror(errno);
      return false;
    }
#ifdef __APPLE__
    if (::fsync(fd.get()) != 0) {
#else
    if (::fdatasync(fd.get()) != 0) {
#endif
      msg = std::string("write file failed: ") + std::strerror(errno);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = "write file failed: " + ec.message(); return false; }
  msg = "saved file: " + path.string();
  return true;
}
