#pragma once

#include <string>

namespace utils {

/**
 * @brief Native platform message box for errors raised before ImGui is up
 *
 * Uses MessageBoxW on Windows, zenity (falling back to stderr) on Linux.
 */
class NativeMessageBox
{
public:
    enum class Type
    {
        Error,
        Warning,
        Info
    };

    static void Show(const std::string& title, const std::string& message, Type type = Type::Error);

    /**
     * @brief Show a fatal error message before exiting
     * @param message Error message to display
     * @param details Optional technical details
     */
    static void ShowFatalError(const std::string& message, const std::string& details = "");
};

} // namespace utils
