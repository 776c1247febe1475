#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace utils
{

// UTF-8 <-> path conversions that do not depend on the active code page
std::string PathToUtf8(const std::filesystem::path& path);
std::string PathToGenericUtf8(const std::filesystem::path& path);
std::filesystem::path Utf8ToPath(const std::string& text);

// Environment variable as a path; empty when unset. Reads the wide
// environment on Windows so profile names outside the ANSI code page survive.
std::filesystem::path EnvPath(const char* name);

// %USERPROFILE% (or HOMEDRIVE+HOMEPATH) on Windows, $HOME elsewhere
std::filesystem::path HomeDir();

// Copies text plus terminator into a fixed edit buffer. Returns false and
// leaves the buffer untouched when it does not fit.
bool CopyToBuffer(char* buffer, std::size_t size, const std::string& text);

// Expands a leading "~" to the user's home folder
std::filesystem::path ExpandUser(const std::string& text);

} // namespace utils
