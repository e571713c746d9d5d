#include "lvl_logger/sinks/file_sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include "lvl_logger/errors.hpp"
#include "lvl_logger/platform.hpp"

namespace lvl_logger
{

std::unique_ptr<FileSink> FileSink::Open(const std::string& path, unsigned mode)
{
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                  static_cast<mode_t>(mode));
  if (fd < 0)
  {
    throw FilesystemError::FromErrno("cannot open log file", path);
  }
  return std::unique_ptr<FileSink>(new FileSink(path, fd));
}

FileSink::FileSink(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

FileSink::~FileSink()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

void FileSink::Write(std::string_view line)
{
  ssize_t written = ::write(fd_, line.data(), line.size());
  if (written == static_cast<ssize_t>(line.size()))
  {
    return;
  }

  int err = errno;
  if (error_count_.fetch_add(1, std::memory_order_relaxed) == 0)
  {
    std::fprintf(stderr, "FileSink: write to '%s' failed: %s\n", path_.c_str(),
                 written < 0 ? std::strerror(err) : "short write");
  }
}

void FileSink::Flush()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
  }
}

}  // namespace lvl_logger
