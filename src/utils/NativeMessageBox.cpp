#include "NativeMessageBox.hpp"
#include "ui/Localization.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace utils
{

namespace
{

#ifdef _WIN32
std::wstring StringToWString(const std::string& str)
{
    if (str.empty())
        return std::wstring();

    int size = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, NULL, 0);
    std::wstring wstr(size, 0);
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &wstr[0], size);
    return wstr;
}
#else
std::string ShellQuote(const std::string& text)
{
    std::string quoted = "'";
    for (char c : text)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}
#endif

} // namespace

void NativeMessageBox::Show(const std::string& title, const std::string& message, Type type)
{
#ifdef _WIN32
    UINT mb_type = MB_OK;
    switch (type)
    {
    case Type::Error:
        mb_type |= MB_ICONERROR;
        break;
    case Type::Warning:
        mb_type |= MB_ICONWARNING;
        break;
    case Type::Info:
        mb_type |= MB_ICONINFORMATION;
        break;
    }

    std::wstring wtitle = StringToWString(title);
    std::wstring wmessage = StringToWString(message);
    MessageBoxW(NULL, wmessage.c_str(), wtitle.c_str(), mb_type);
#else
    const char* type_flag = "--error";
    switch (type)
    {
    case Type::Error:
        type_flag = "--error";
        break;
    case Type::Warning:
        type_flag = "--warning";
        break;
    case Type::Info:
        type_flag = "--info";
        break;
    }

    std::stringstream cmd;
    cmd << "zenity " << type_flag << " --title=" << ShellQuote(title) << " --text=" << ShellQuote(message)
        << " 2>/dev/null";
    int result = std::system(cmd.str().c_str());

    if (result != 0)
    {
        std::cerr << "\n========================================\n";
        std::cerr << title << "\n";
        std::cerr << "========================================\n";
        std::cerr << message << "\n";
        std::cerr << "========================================\n";
    }
#endif
}

void NativeMessageBox::ShowFatalError(const std::string& message, const std::string& details)
{
    std::stringstream ss;
    ss << message << "\n\n";

    if (!details.empty())
    {
        ss << i18n::get("error.native.technical_details") << "\n" << details << "\n\n";
    }

    ss << i18n::get("error.native.exit_line") << "\n";
    ss << i18n::get("error.native.check_logs");

    Show(i18n::get("error.native.fatal_title"), ss.str(), Type::Error);
}

} // namespace utils
