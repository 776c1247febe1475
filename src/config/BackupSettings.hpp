#pragma once

#include "backup/ExportTypes.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <toml++/toml.h>

class ConfigManager;

namespace backup
{
class CategoryRegistry;
}

struct CategorySettings
{
    bool enabled = true;
    std::string source_override; // UTF-8; empty means the located default
};

// User choices persisted in the [backup] table of config.toml
class BackupSettings
{
public:
    BackupSettings();

    static std::filesystem::path DefaultDestination();

    void applyDefaults();
    void registerConfigHandler(ConfigManager& config);

    // Both operate on the config root, i.e. the table holding "backup"
    void deserialize(const toml::table& root);
    toml::table serialize() const;

    const std::string& destination() const { return destination_; }
    void setDestination(std::string destination) { destination_ = std::move(destination); }
    std::filesystem::path destinationPath() const;

    bool includeManifest() const { return include_manifest_; }
    void setIncludeManifest(bool v) { include_manifest_ = v; }

    bool timestampedNames() const { return timestamped_names_; }
    void setTimestampedNames(bool v) { timestamped_names_ = v; }

    bool warnIfRunning() const { return warn_if_running_; }
    void setWarnIfRunning(bool v) { warn_if_running_ = v; }

    CategorySettings& category(const std::string& name) { return categories_[name]; }
    CategorySettings categorySettings(const std::string& name) const;

    // Enabled categories in registry order
    std::vector<std::string> selectedCategories(const backup::CategoryRegistry& registry) const;

    // Non-empty source overrides keyed by category name
    std::map<std::string, std::filesystem::path> sourceOverrides() const;

    backup::ExportOptions exportOptions() const;

private:
    std::string destination_;
    bool include_manifest_ = false;
    bool timestamped_names_ = false;
    bool warn_if_running_ = true;
    std::map<std::string, CategorySettings> categories_;
};
