#pragma once

#include <SDL3/SDL.h>

#include <filesystem>

namespace platform
{

class PlatformSetup
{
public:
    /// UTF-8 console output on Windows, no-op elsewhere
    static void InitializeConsole();

    /// Routes SDL log output into plog
    static void SDLCALL SDLLogBridge(void* userdata, int category, SDL_LogPriority priority, const char* message);
    static void SetupSDLLogging();

    /// Opens a folder in the system file manager. False when the folder does
    /// not exist or the shell refused.
    static bool OpenFolder(const std::filesystem::path& folder);
};

} // namespace platform
