#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace test_utils {

// Unique scratch folder under the system temp directory, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& relative) const { return path_ / relative; }

    // Creates parent folders as needed
    std::filesystem::path writeFile(const std::string& relative, const std::string& content) const;

private:
    std::filesystem::path path_;
};

struct ZipEntry {
    std::string name;
    std::string data;
    unsigned method = 0; // 0 stored, 8 deflate
};

// Reads every entry of a ZIP archive with miniz
bool ReadZip(const std::filesystem::path& archive, std::vector<ZipEntry>& outEntries, std::string& outError);

std::string ReadFile(const std::filesystem::path& path);

// False when permission bits are not enforced for this process (root)
bool PermissionsEnforced(const std::filesystem::path& scratchDir);

} // namespace test_utils
