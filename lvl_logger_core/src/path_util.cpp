#include "lvl_logger/path_util.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <vector>

#include "lvl_logger/errors.hpp"
#include "lvl_logger/platform.hpp"

namespace lvl_logger
{

std::string CleanPath(std::string_view path)
{
  if (path.empty()) return ".";

  const bool rooted = path.front() == '/';
  std::vector<std::string_view> elems;

  size_t i = 0;
  while (i < path.size())
  {
    size_t next = path.find('/', i);
    if (next == std::string_view::npos) next = path.size();
    std::string_view elem = path.substr(i, next - i);
    i = next + 1;

    if (elem.empty() || elem == ".") continue;
    if (elem == "..")
    {
      if (!elems.empty() && elems.back() != "..")
      {
        elems.pop_back();
      }
      else if (!rooted)
      {
        elems.push_back(elem);
      }
      continue;
    }
    elems.push_back(elem);
  }

  std::string out = rooted ? "/" : "";
  for (size_t k = 0; k < elems.size(); ++k)
  {
    if (k > 0) out += '/';
    out.append(elems[k].data(), elems[k].size());
  }
  if (out.empty()) out = ".";
  return out;
}

std::string JoinPath(std::initializer_list<std::string_view> parts)
{
  std::string joined;
  for (std::string_view part : parts)
  {
    if (part.empty()) continue;
    if (!joined.empty()) joined += '/';
    joined.append(part.data(), part.size());
  }
  if (joined.empty()) return "";
  return CleanPath(joined);
}

std::string DirName(std::string_view path)
{
  size_t slash = path.rfind('/');
  if (slash == std::string_view::npos) return ".";
  if (slash == 0) return "/";
  return CleanPath(path.substr(0, slash));
}

void MakeDirectories(const std::string& path, unsigned mode)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) == 0)
  {
    if (S_ISDIR(st.st_mode)) return;
    throw FilesystemError("not a directory", path, std::make_error_code(std::errc::not_a_directory));
  }

  std::string partial;
  size_t i = 0;
  if (!path.empty() && path.front() == '/')
  {
    partial = "/";
    i = 1;
  }
  while (i <= path.size())
  {
    size_t next = path.find('/', i);
    if (next == std::string::npos) next = path.size();
    if (next > i)
    {
      if (!partial.empty() && partial.back() != '/') partial += '/';
      partial.append(path, i, next - i);

      if (::mkdir(partial.c_str(), static_cast<mode_t>(mode)) != 0)
      {
        int err = errno;
        if (err != EEXIST)
        {
          throw FilesystemError("cannot create directory", partial,
                                std::error_code(err, std::generic_category()));
        }
        if (::stat(partial.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
          throw FilesystemError("not a directory", partial,
                                std::make_error_code(std::errc::not_a_directory));
        }
      }
    }
    i = next + 1;
  }
}

std::string CurrentWorkingDirectory()
{
  char buf[PATH_MAX];
  if (::getcwd(buf, sizeof(buf)) == nullptr)
  {
    throw FilesystemError::FromErrno("cannot read working directory", "");
  }
  return std::string(buf);
}

}  // namespace lvl_logger
