#pragma once

#include "Category.hpp"

#include <cstddef>
#include <string>

namespace backup
{

inline constexpr const char* kManifestEntryName = "manifest.json";

// Optional manifest.json stored next to the exported files
struct ArchiveManifest
{
    std::string created_at; // ISO 8601, seconds precision
    std::string machine;
    std::string os;
    std::string backup_type;
    std::string source_folder;
    std::size_t files = 0;

    static ArchiveManifest ForCategory(const Category& category, std::size_t files);

    std::string toJson() const;
    static bool FromJson(const std::string& json, ArchiveManifest& outManifest, std::string& outError);
};

std::string HostName();
std::string OsDescription();

} // namespace backup
