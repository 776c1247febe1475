#pragma once

#include <memory>
#include <SDL3/SDL.h>

class AppContext;
class BackupSettings;
class BackupWindow;
class ConfigManager;
class ErrorDialog;
class SingleInstanceGuard;

namespace backup
{
class CategoryRegistry;
class ExportService;
class IPathLocator;
} // namespace backup

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    bool initialize();
    bool initializeLogging();
    void setupManagers();
    void initializeConfig();

    void mainLoop();
    void processEvents();
    void renderFrame();
    void handleQuitRequests();
    void cleanup();

    bool checkSingleInstance();

    std::unique_ptr<SingleInstanceGuard> instance_guard_;
    std::unique_ptr<AppContext> context_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<BackupSettings> settings_;
    std::unique_ptr<backup::IPathLocator> locator_;
    std::unique_ptr<backup::CategoryRegistry> categories_;
    std::unique_ptr<backup::ExportService> export_service_;
    std::unique_ptr<BackupWindow> backup_window_;
    std::unique_ptr<ErrorDialog> error_dialog_;

    bool quit_requested_ = false;
    bool running_ = true;
    bool cleaned_up_ = false;

    [[maybe_unused]] int argc_ = 0;
    [[maybe_unused]] char** argv_ = nullptr;
};
