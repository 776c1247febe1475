#include "ProcessDetector.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>
#else
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#endif

namespace
{

std::atomic<bool> g_scan_warning_reported{ false };

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void reportScanFailure(const std::string& details)
{
    if (g_scan_warning_reported.exchange(true))
        return;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ProcessDetection, "Process scan failed", details);
}

#ifndef _WIN32
constexpr std::size_t kCommMaxLength = 15;
#endif

} // namespace

bool ProcessDetector::namesMatch(const std::string& runningName, const std::string& wantedName)
{
    if (runningName.empty() || wantedName.empty())
        return false;

    std::string running = toLower(runningName);
    std::string wanted = toLower(wantedName);
    if (running == wanted)
        return true;

#ifndef _WIN32
    if (running.size() == kCommMaxLength && wanted.size() > kCommMaxLength)
        return wanted.compare(0, kCommMaxLength, running) == 0;
#endif
    return false;
}

bool ProcessDetector::isProcessRunning(const std::string& processName)
{
    if (processName.empty())
        return false;
    return !findRunning({ processName }).empty();
}

std::vector<std::string> ProcessDetector::findRunning(const std::vector<std::string>& processNames)
{
    std::vector<std::string> matched;
    if (processNames.empty())
        return matched;

    const auto running = snapshotProcessNames(false);
    for (const auto& wanted : processNames)
    {
        bool found = std::any_of(running.begin(), running.end(),
                                 [&](const std::string& name) { return namesMatch(name, wanted); });
        if (found)
            matched.push_back(wanted);
    }

    if (!matched.empty())
        PLOG_INFO << "Detected " << matched.size() << " running process(es) of interest";
    return matched;
}

bool ProcessDetector::isAnotherInstance(const std::string& processName)
{
    if (processName.empty())
        return false;

    const auto running = snapshotProcessNames(true);
    return std::any_of(running.begin(), running.end(),
                       [&](const std::string& name) { return namesMatch(name, processName); });
}

#ifdef _WIN32
std::vector<std::string> ProcessDetector::snapshotProcessNames(bool excludeSelf)
{
    std::vector<std::string> names;

    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE)
    {
        DWORD err = GetLastError();
        PLOG_WARNING << "CreateToolhelp32Snapshot failed: " << err;
        reportScanFailure("CreateToolhelp32Snapshot error " + std::to_string(err));
        return names;
    }

    PROCESSENTRY32 entry;
    entry.dwSize = sizeof(entry);

    if (!Process32First(snapshot, &entry))
    {
        DWORD err = GetLastError();
        CloseHandle(snapshot);
        PLOG_WARNING << "Process32First failed: " << err;
        reportScanFailure("Process32First error " + std::to_string(err));
        return names;
    }

    const DWORD current_pid = GetCurrentProcessId();
    do
    {
        if (excludeSelf && entry.th32ProcessID == current_pid)
            continue;
        names.emplace_back(entry.szExeFile);
    } while (Process32Next(snapshot, &entry));

    CloseHandle(snapshot);
    return names;
}
#else
std::vector<std::string> ProcessDetector::snapshotProcessNames(bool excludeSelf)
{
    std::vector<std::string> names;

    const std::filesystem::path proc_dir("/proc");
    std::error_code ec;
    std::filesystem::directory_iterator it(proc_dir, ec);
    if (ec)
    {
        PLOG_WARNING << "Cannot list /proc: " << ec.message();
        reportScanFailure("/proc unavailable: " + ec.message());
        return names;
    }

    const pid_t current_pid = getpid();
    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;

        std::string dirname = it->path().filename().string();
        if (dirname.empty() || !std::all_of(dirname.begin(), dirname.end(), ::isdigit))
            continue;

        if (excludeSelf && static_cast<pid_t>(std::strtol(dirname.c_str(), nullptr, 10)) == current_pid)
            continue;

        std::ifstream comm_file(it->path() / "comm");
        std::string name;
        if (comm_file && std::getline(comm_file, name) && !name.empty())
            names.push_back(std::move(name));
    }
    return names;
}
#endif
