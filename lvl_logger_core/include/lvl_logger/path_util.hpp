#pragma once
#include <initializer_list>
#include <string>
#include <string_view>

namespace lvl_logger
{

// Lexical cleanup: collapses separators, drops ".", resolves ".." where possible.
// An empty result becomes ".".
std::string CleanPath(std::string_view path);

// Joins the non-empty elements with '/' and cleans the result.
std::string JoinPath(std::initializer_list<std::string_view> parts);

// Everything but the last element, cleaned.
std::string DirName(std::string_view path);

// mkdir -p. Throws FilesystemError if an element cannot be created or is not a
// directory.
void MakeDirectories(const std::string& path, unsigned mode);

// Throws FilesystemError if getcwd(3) fails.
std::string CurrentWorkingDirectory();

}  // namespace lvl_logger
