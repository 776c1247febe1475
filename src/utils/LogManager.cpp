#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& configPath)
{
    if (s_initialized)
        return true;

    ReadConfig(configPath);
    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        std::filesystem::path log_path(config.filepath);
        if (log_path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::Severity level = config.level_override.value_or(s_default_level);
        plog::init(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        PLOG_INFO << "Logger '" << config.name << "' writing to " << config.filepath;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::SetLogLevel(plog::Severity level)
{
    s_default_level = level;
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(level);
    }
}

void LogManager::PrepareLogDirectory(const std::string& directory)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

void LogManager::ReadConfig(const std::string& configPath)
{
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(configPath);
        if (auto global = cfg["global"].as_table())
        {
            if (auto append = (*global)["append_logs"].value<bool>())
            {
                s_append_logs = *append;
            }
        }

        if (auto debug = cfg["app"]["debug"].as_table())
        {
            if (auto level = (*debug)["logging_level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        // Logging is not up yet; ConfigManager reports the same problem later
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Could not read logging settings",
                                     std::string(pe.description()));
    }
}

} // namespace utils
