#include "Localization.hpp"
#include "utils/PathUtils.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>

#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace i18n
{
    namespace {
        std::unordered_map<std::string, std::string> s_en;
        std::unordered_map<std::string, std::string> s_cur;
        std::unordered_map<std::string, std::string> s_missing;
        std::string s_lang = "en";
        std::mutex s_mutex;

        void flatten_table(const toml::table& tbl, const std::string& prefix,
                           std::unordered_map<std::string, std::string>& out)
        {
            for (auto&& [k, node] : tbl)
            {
                std::string full = prefix.empty() ? std::string(k.str()) : (prefix + "." + std::string(k.str()));
                if (node.is_table())
                    flatten_table(*node.as_table(), full, out);
                else if (auto sval = node.value<std::string>())
                    out[full] = *sval;
            }
        }

        std::unordered_map<std::string, std::string> load_file(const fs::path& p)
        {
            std::unordered_map<std::string, std::string> r;
            std::error_code ec;
            if (!fs::exists(p, ec))
            {
                PLOG_WARNING << "i18n file not found: " << utils::PathToUtf8(p);
                return r;
            }
            try
            {
                toml::table t = toml::parse_file(p.string());
                flatten_table(t, "", r);
            }
            catch (const toml::parse_error& pe)
            {
                PLOG_WARNING << "Failed to parse i18n file '" << utils::PathToUtf8(p) << "': " << pe.description();
            }
            return r;
        }

        std::string replace_named(const std::string& s, const std::unordered_map<std::string, std::string>& args)
        {
            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size(); )
            {
                if (s[i] == '{')
                {
                    size_t j = s.find('}', i + 1);
                    if (j != std::string::npos)
                    {
                        auto it = args.find(s.substr(i + 1, j - (i + 1)));
                        if (it != args.end())
                            out += it->second;
                        else
                            out += s.substr(i, j - i + 1); // keep as-is
                        i = j + 1;
                        continue;
                    }
                }
                out.push_back(s[i]);
                ++i;
            }
            return out;
        }

        void load_language_locked(const fs::path& dir, const std::string& lang)
        {
            s_en = load_file(dir / "en.toml");
            if (s_en.empty())
                PLOG_WARNING << "English fallback " << utils::PathToUtf8(dir / "en.toml") << " is empty or missing.";

            if (lang == "en")
            {
                s_cur = s_en;
                return;
            }

            s_cur = load_file(dir / (lang + ".toml"));
            if (s_cur.empty())
                PLOG_WARNING << "i18n language '" << lang << "' not found; using English fallback.";
        }
    } // namespace

    void init(const std::string& lang_code)
    {
        init_from("assets/i18n", lang_code);
    }

    void init_from(const std::string& directory, const std::string& lang_code)
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_lang = lang_code.empty() ? std::string("en") : lang_code;
        s_missing.clear();
        load_language_locked(directory, s_lang);
        PLOG_INFO << "i18n initialized with language: " << s_lang;
    }

    const std::string& current_language()
    {
        return s_lang;
    }

    const std::string& get_str(const std::string& key)
    {
        // Lookups happen on the UI thread after init
        auto it = s_cur.find(key);
        if (it != s_cur.end()) return it->second;
        auto ie = s_en.find(key);
        if (ie != s_en.end()) return ie->second;

        std::lock_guard<std::mutex> lock(s_mutex);
        auto [missing, inserted] = s_missing.try_emplace(key, key);
        if (inserted)
            PLOG_DEBUG << "Missing i18n key: " << key;
        return missing->second;
    }

    const char* get(const char* key)
    {
        return get_str(std::string(key)).c_str();
    }

    std::string format(const std::string& key, const std::unordered_map<std::string, std::string>& args)
    {
        return replace_named(get_str(key), args);
    }
}
