#include "PathUtils.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

namespace fs = std::filesystem;

namespace utils
{

namespace
{

std::string fromU8(const std::u8string& s) { return std::string(s.begin(), s.end()); }

} // namespace

std::string PathToUtf8(const fs::path& path) { return fromU8(path.u8string()); }

std::string PathToGenericUtf8(const fs::path& path) { return fromU8(path.generic_u8string()); }

fs::path Utf8ToPath(const std::string& text) { return fs::path(std::u8string(text.begin(), text.end())); }

fs::path EnvPath(const char* name)
{
#ifdef _WIN32
    std::wstring wname(name, name + std::char_traits<char>::length(name));
    const wchar_t* value = _wgetenv(wname.c_str());
#else
    const char* value = std::getenv(name);
#endif
    if (!value || !*value)
        return {};
    return fs::path(value);
}

fs::path HomeDir()
{
#ifdef _WIN32
    fs::path home = EnvPath("USERPROFILE");
    if (home.empty())
    {
        fs::path drive = EnvPath("HOMEDRIVE");
        fs::path rest = EnvPath("HOMEPATH");
        if (!drive.empty() && !rest.empty())
            home = drive / rest.relative_path();
    }
    return home;
#else
    return EnvPath("HOME");
#endif
}

bool CopyToBuffer(char* buffer, std::size_t size, const std::string& text)
{
    if (!buffer || text.size() >= size)
        return false;
    std::memcpy(buffer, text.c_str(), text.size() + 1);
    return true;
}

fs::path ExpandUser(const std::string& text)
{
    if (text.empty() || text[0] != '~')
        return Utf8ToPath(text);
    if (text.size() > 1 && text[1] != '/' && text[1] != '\\')
        return Utf8ToPath(text);

    fs::path result = HomeDir();
    if (result.empty())
        return Utf8ToPath(text);

    if (text.size() > 2)
        result /= Utf8ToPath(text.substr(2));
    return result;
}

} // namespace utils
