#pragma once

#include <string>
#include <vector>

// Executables that lock or rewrite the files we back up
inline const std::vector<std::string> kEliteProcessNames = {
    "EliteDangerous64.exe", "EliteDangerous32.exe", "EliteDangerous.exe", "EDLaunch.exe", "EDMarketConnector.exe",
};

class ProcessDetector
{
public:
    static bool isProcessRunning(const std::string& processName);

    // Subset of processNames currently running, in the given order
    static std::vector<std::string> findRunning(const std::vector<std::string>& processNames);

    // Another process with this name, not counting the current one
    static bool isAnotherInstance(const std::string& processName);

    // Case-insensitive. On Linux the kernel keeps only the first 15 bytes of
    // a process name, so a truncated running name matches the full one.
    static bool namesMatch(const std::string& runningName, const std::string& wantedName);

private:
    static std::vector<std::string> snapshotProcessNames(bool excludeSelf);
};
