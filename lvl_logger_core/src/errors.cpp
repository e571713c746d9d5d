#include "lvl_logger/errors.hpp"

#include <cerrno>
#include <utility>

namespace lvl_logger
{

FilesystemError::FilesystemError(const std::string& what, std::string path,
                                 std::error_code code)
    : LoggerError(what + " '" + path + "': " + code.message()),
      path_(std::move(path)),
      code_(code)
{
}

FilesystemError FilesystemError::FromErrno(const std::string& what, const std::string& path)
{
  return FilesystemError(what, path, std::error_code(errno, std::generic_category()));
}

}  // namespace lvl_logger
