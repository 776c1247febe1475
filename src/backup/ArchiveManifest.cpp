#include "ArchiveManifest.hpp"
#include "utils/PathUtils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

using json = nlohmann::json;

namespace backup
{

namespace
{

std::string isoTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

std::string HostName()
{
#ifdef _WIN32
    char buffer[MAX_COMPUTERNAME_LENGTH + 1] = {};
    DWORD size = sizeof(buffer);
    if (GetComputerNameA(buffer, &size))
        return std::string(buffer, size);
    return {};
#else
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0)
        return buffer;
    return {};
#endif
}

std::string OsDescription()
{
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info{};
    if (uname(&info) != 0)
        return "Unknown";
    return std::string(info.sysname) + " " + info.release + " " + info.machine;
#endif
}

ArchiveManifest ArchiveManifest::ForCategory(const Category& category, std::size_t files)
{
    ArchiveManifest manifest;
    manifest.created_at = isoTimestamp();
    manifest.machine = HostName();
    manifest.os = OsDescription();
    manifest.backup_type = category.name;
    manifest.source_folder = utils::PathToUtf8(category.source_path);
    manifest.files = files;
    return manifest;
}

std::string ArchiveManifest::toJson() const
{
    json j;
    j["created_at"] = created_at;
    j["machine"] = machine;
    j["os"] = os;
    j["backup_type"] = backup_type;
    j["source_folder"] = source_folder;
    j["files"] = files;
    return j.dump(2);
}

bool ArchiveManifest::FromJson(const std::string& content, ArchiveManifest& outManifest, std::string& outError)
{
    try
    {
        json j = json::parse(content);
        if (!j.contains("backup_type"))
        {
            outError = "Manifest missing 'backup_type' field";
            return false;
        }

        outManifest.backup_type = j["backup_type"].get<std::string>();
        outManifest.created_at = j.value("created_at", "");
        outManifest.machine = j.value("machine", "");
        outManifest.os = j.value("os", "");
        outManifest.source_folder = j.value("source_folder", "");
        outManifest.files = j.value("files", static_cast<std::size_t>(0));
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("Manifest parse error: ") + e.what();
        return false;
    }
}

} // namespace backup
