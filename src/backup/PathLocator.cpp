#include "PathLocator.hpp"
#include "utils/PathUtils.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace backup
{

namespace
{

constexpr const char* kSteamAppId = "359320";

fs::path frontierDir(const fs::path& base) { return base / "Frontier Developments" / "Elite Dangerous"; }

} // namespace

KnownFolderLocator::KnownFolderLocator()
    : home_dir_(DetectHomeDir())
{
#ifdef _WIN32
    local_app_data_ = utils::EnvPath("LOCALAPPDATA");
    if (local_app_data_.empty() && !home_dir_.empty())
        local_app_data_ = home_dir_ / "AppData" / "Local";
#else
    fs::path root = profileRoot();
    if (!root.empty())
        local_app_data_ = root / "AppData" / "Local";
#endif
    PLOG_DEBUG << "KnownFolderLocator: home='" << utils::PathToUtf8(home_dir_) << "' localAppData='"
               << utils::PathToUtf8(local_app_data_) << "'";
}

KnownFolderLocator::KnownFolderLocator(fs::path homeDir, fs::path localAppData)
    : home_dir_(std::move(homeDir))
    , local_app_data_(std::move(localAppData))
{
}

fs::path KnownFolderLocator::DetectHomeDir() { return utils::HomeDir(); }

fs::path KnownFolderLocator::profileRoot() const
{
    if (home_dir_.empty())
        return {};
#ifdef _WIN32
    return home_dir_;
#else
    return home_dir_ / ".local" / "share" / "Steam" / "steamapps" / "compatdata" / kSteamAppId / "pfx" /
           "drive_c" / "users" / "steamuser";
#endif
}

fs::path KnownFolderLocator::locate(const std::string& category) const
{
    if (category == "Journal")
    {
        fs::path root = profileRoot();
        if (root.empty())
            return {};
        return frontierDir(root / "Saved Games");
    }

    if (local_app_data_.empty())
        return {};

    if (category == "Bindings")
        return frontierDir(local_app_data_) / "Options" / "Bindings";
    if (category == "Graphics")
        return frontierDir(local_app_data_) / "Options" / "Graphics";

    PLOG_WARNING << "No known folder for category: " << category;
    return {};
}

FixedPathLocator::FixedPathLocator(std::map<std::string, fs::path> paths)
    : paths_(std::move(paths))
{
}

void FixedPathLocator::set(const std::string& category, fs::path path) { paths_[category] = std::move(path); }

fs::path FixedPathLocator::locate(const std::string& category) const
{
    auto it = paths_.find(category);
    if (it == paths_.end())
        return {};
    return it->second;
}

} // namespace backup
