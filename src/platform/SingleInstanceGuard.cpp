#include "SingleInstanceGuard.hpp"
#include "ProcessDetector.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <string>
#include <system_error>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace
{

#ifdef _WIN32
constexpr wchar_t kMutexName[] = L"Local\\EDBackupInstance";
#endif

void reportAlreadyRunning()
{
    PLOG_WARNING << "Another ED Backup instance is already running.";
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Application already running",
                                        "Another ED Backup instance is already active.");
}

} // namespace

#ifdef _WIN32
SingleInstanceGuard::SingleInstanceGuard(void* handle)
    : mutex_handle_(handle)
{
}
#endif

SingleInstanceGuard::~SingleInstanceGuard()
{
#ifdef _WIN32
    if (mutex_handle_)
    {
        ReleaseMutex(static_cast<HANDLE>(mutex_handle_));
        CloseHandle(static_cast<HANDLE>(mutex_handle_));
    }
#endif
}

std::unique_ptr<SingleInstanceGuard> SingleInstanceGuard::Acquire()
{
#ifdef _WIN32
    HANDLE mutex = CreateMutexW(nullptr, TRUE, kMutexName);
    if (!mutex)
    {
        DWORD err = GetLastError();
        PLOG_ERROR << "CreateMutexW failed: " << err;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "CreateMutexW failed with error " + std::to_string(err));
        SetLastError(err);
        return nullptr;
    }

    DWORD create_error = GetLastError();
    if (create_error == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(mutex);
        reportAlreadyRunning();
        SetLastError(create_error);
        return nullptr;
    }

    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(mutex));
#else
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec)
    {
        auto exe_name = exe_path.filename().string();
        if (!exe_name.empty() && ProcessDetector::isAnotherInstance(exe_name))
        {
            reportAlreadyRunning();
            return nullptr;
        }
    }
    else
    {
        PLOG_DEBUG << "Cannot resolve /proc/self/exe: " << ec.message();
    }

    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard());
#endif
}
