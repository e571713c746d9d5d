#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "sink_interface.hpp"

namespace lvl_logger
{

class FileSink : public ILogSink
{
 public:
  // Opens (or creates) path for appending. Throws FilesystemError.
  static std::unique_ptr<FileSink> Open(const std::string& path, unsigned mode);

  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void Write(std::string_view line) override;
  void Flush() override;

  const std::string& Path() const { return path_; }

  // Failed or short writes since construction.
  uint64_t ErrorCount() const { return error_count_.load(std::memory_order_relaxed); }

 private:
  FileSink(std::string path, int fd);

  std::string path_;
  int fd_;
  std::atomic<uint64_t> error_count_{0};
};

}  // namespace lvl_logger
