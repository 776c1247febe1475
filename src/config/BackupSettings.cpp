#include "BackupSettings.hpp"
#include "ConfigManager.hpp"
#include "backup/CategoryRegistry.hpp"
#include "backup/PathLocator.hpp"
#include "utils/PathUtils.hpp"

#include <plog/Log.h>

BackupSettings::BackupSettings() { applyDefaults(); }

std::filesystem::path BackupSettings::DefaultDestination()
{
    auto home = backup::KnownFolderLocator::DetectHomeDir();
    if (home.empty())
        return std::filesystem::current_path();
    return home / "Desktop";
}

void BackupSettings::applyDefaults()
{
    destination_ = utils::PathToUtf8(DefaultDestination());
    include_manifest_ = false;
    timestamped_names_ = false;
    warn_if_running_ = true;
    categories_.clear();
}

void BackupSettings::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        deserialize(section);
    };
    cb.save = [this]() -> toml::table {
        return serialize();
    };

    config.registerTable("", std::move(cb), { "backup" });
}

void BackupSettings::deserialize(const toml::table& root)
{
    applyDefaults();

    const toml::table* backup = root["backup"].as_table();
    if (!backup)
        return;

    if (auto v = (*backup)["destination"].value<std::string>(); v && !v->empty())
        destination_ = *v;
    if (auto v = (*backup)["include_manifest"].value<bool>())
        include_manifest_ = *v;
    if (auto v = (*backup)["timestamped_names"].value<bool>())
        timestamped_names_ = *v;
    if (auto v = (*backup)["warn_if_running"].value<bool>())
        warn_if_running_ = *v;

    if (auto* categories = (*backup)["categories"].as_table())
    {
        for (auto&& [key, node] : *categories)
        {
            auto* tbl = node.as_table();
            if (!tbl)
            {
                PLOG_WARNING << "Ignoring non-table entry backup.categories." << key.str();
                continue;
            }

            CategorySettings settings;
            settings.enabled = (*tbl)["enabled"].value_or(true);
            settings.source_override = (*tbl)["source"].value_or(std::string{});
            categories_[std::string(key.str())] = std::move(settings);
        }
    }
}

toml::table BackupSettings::serialize() const
{
    toml::table backup;
    backup.insert("destination", destination_);
    backup.insert("include_manifest", include_manifest_);
    backup.insert("timestamped_names", timestamped_names_);
    backup.insert("warn_if_running", warn_if_running_);

    toml::table categories;
    for (const auto& [name, settings] : categories_)
    {
        toml::table entry;
        entry.insert("enabled", settings.enabled);
        entry.insert("source", settings.source_override);
        categories.insert(name, std::move(entry));
    }
    backup.insert("categories", std::move(categories));

    toml::table root;
    root.insert("backup", std::move(backup));
    return root;
}

std::filesystem::path BackupSettings::destinationPath() const { return utils::ExpandUser(destination_); }

CategorySettings BackupSettings::categorySettings(const std::string& name) const
{
    auto it = categories_.find(name);
    return it == categories_.end() ? CategorySettings{} : it->second;
}

std::vector<std::string> BackupSettings::selectedCategories(const backup::CategoryRegistry& registry) const
{
    std::vector<std::string> names;
    for (const auto& category : registry.categories())
    {
        if (categorySettings(category.name).enabled)
            names.push_back(category.name);
    }
    return names;
}

std::map<std::string, std::filesystem::path> BackupSettings::sourceOverrides() const
{
    std::map<std::string, std::filesystem::path> overrides;
    for (const auto& [name, settings] : categories_)
    {
        if (!settings.source_override.empty())
            overrides[name] = utils::ExpandUser(settings.source_override);
    }
    return overrides;
}

backup::ExportOptions BackupSettings::exportOptions() const
{
    backup::ExportOptions options;
    options.include_manifest = include_manifest_;
    options.timestamped_names = timestamped_names_;
    return options;
}
