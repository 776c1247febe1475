#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns config.toml. Subsystems register the table path they own and the keys
// inside it; load() dispatches sections to them and save() merges their
// output back, leaving keys nobody owns untouched.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool save();
    const toml::table& root() const;

    const std::string& configPath() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatchLoad();

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
