#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace backup
{

// Narrow seam over OS/user-profile lookups so tests can pin source folders
class IPathLocator
{
public:
    virtual ~IPathLocator() = default;

    // Returns the source folder for a category name, or an empty path when
    // the environment gives no answer.
    [[nodiscard]] virtual std::filesystem::path locate(const std::string& category) const = 0;
};

// Elite Dangerous folders derived from the user's known folders.
// Windows: %USERPROFILE%\Saved Games and %LOCALAPPDATA%.
// Linux: the same layout inside the Steam Proton prefix of app 359320.
class KnownFolderLocator : public IPathLocator
{
public:
    KnownFolderLocator();
    KnownFolderLocator(std::filesystem::path homeDir, std::filesystem::path localAppData);

    [[nodiscard]] std::filesystem::path locate(const std::string& category) const override;

    const std::filesystem::path& homeDir() const { return home_dir_; }

    // Folder that plays the role of %USERPROFILE% for the game
    [[nodiscard]] std::filesystem::path profileRoot() const;

    static std::filesystem::path DetectHomeDir();

private:
    std::filesystem::path home_dir_;
    std::filesystem::path local_app_data_;
};

class FixedPathLocator : public IPathLocator
{
public:
    FixedPathLocator() = default;
    explicit FixedPathLocator(std::map<std::string, std::filesystem::path> paths);

    void set(const std::string& category, std::filesystem::path path);

    [[nodiscard]] std::filesystem::path locate(const std::string& category) const override;

private:
    std::map<std::string, std::filesystem::path> paths_;
};

} // namespace backup
