#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace lvl_logger
{

// Base of every error raised while building a logger. Log writes never throw.
class LoggerError : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

// The configuration cannot describe a usable logger (e.g. no filename).
class ConfigError : public LoggerError
{
 public:
  using LoggerError::LoggerError;
};

// Directory creation, file open or working directory lookup failed.
class FilesystemError : public LoggerError
{
 public:
  FilesystemError(const std::string& what, std::string path, std::error_code code);

  const std::string& Path() const { return path_; }
  const std::error_code& Code() const { return code_; }

  // Builds an error from the current errno.
  static FilesystemError FromErrno(const std::string& what, const std::string& path);

 private:
  std::string path_;
  std::error_code code_;
};

}  // namespace lvl_logger
