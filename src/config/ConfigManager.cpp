#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::dispatchLoad()
{
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        if (section)
        {
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No " << config_path_ << " yet, using defaults";
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        dispatchLoad();
        PLOG_INFO << "Loaded config from " << config_path_;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details =
                "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);

        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return false;
    }
}

bool ConfigManager::save()
{
    last_error_.clear();

    if (!root_)
    {
        root_ = std::make_unique<toml::table>();
    }

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table handlerTable = handler.callbacks.save();

        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
        {
            target = &output;
        }

        for (auto it = handlerTable.begin(); it != handlerTable.end();)
        {
            const auto& key = it->first;
            bool isOwned = std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key.str()) !=
                           handler.ownedKeys.end();
            if (!isOwned)
            {
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key.str()
                             << "' (not in ownedKeys); stripping it";
                it = handlerTable.erase(it);
            }
            else
            {
                ++it;
            }
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (handlerTable.contains(key))
            {
                target->insert_or_assign(key, handlerTable[key]);
            }
            else
            {
                target->erase(key);
            }
        }
    }

    std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output;
        ofs.flush();
        if (!ofs)
        {
            last_error_ = "Failed to write temp file";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Write error on " + tmp);
            std::error_code rm_ec;
            ofs.close();
            fs::remove(tmp, rm_ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }

    *root_ = output;
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
        {
            auto [inserted_it, success] = current->insert(segment, toml::table{});
            if (!success)
            {
                PLOG_WARNING << "Failed to create table at path segment: " << segment;
                return nullptr;
            }
            current = inserted_it->second.as_table();
        }
        else if (auto* tbl = it->second.as_table())
        {
            current = tbl;
        }
        else
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }

    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }

        current = tbl;
    }

    return current;
}
