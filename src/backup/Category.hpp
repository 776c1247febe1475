#pragma once

#include <filesystem>
#include <string>

namespace backup
{

// One named unit of user data that is exported into its own archive
struct Category
{
    std::string name;                  // e.g. "Journal"
    std::filesystem::path source_path; // directory walked recursively
    std::string archive_basename;      // archive is written as <basename>.zip
};

} // namespace backup
