#pragma once

#include <string>
#include <unordered_map>

namespace i18n
{
    // Loads assets/i18n/en.toml as the fallback plus the requested language.
    void init(const std::string& lang_code);

    // Loads strings from an explicit directory (tests, portable layouts).
    void init_from(const std::string& directory, const std::string& lang_code);

    const std::string& current_language();

    // Selected language -> en -> the key itself
    const std::string& get_str(const std::string& key);

    // C-string view for ImGui APIs.
    const char* get(const char* key);

    // Replaces {name} placeholders, e.g. format("backup.status.done", {{"count", "3"}})
    std::string format(const std::string& key,
                       const std::unordered_map<std::string, std::string>& args);
}
