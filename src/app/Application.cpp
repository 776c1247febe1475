#include "Application.hpp"
#include "app/Version.hpp"
#include "backup/CategoryRegistry.hpp"
#include "backup/ExportService.hpp"
#include "backup/PathLocator.hpp"
#include "config/BackupSettings.hpp"
#include "config/ConfigManager.hpp"
#include "platform/PlatformSetup.hpp"
#include "platform/SingleInstanceGuard.hpp"
#include "ui/AppContext.hpp"
#include "ui/BackupWindow.hpp"
#include "ui/ErrorDialog.hpp"
#include "ui/Localization.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/NativeMessageBox.hpp"

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    i18n::init("en");

    if (!checkSingleInstance())
        return false;

    if (!initializeLogging())
        return false;

    platform::PlatformSetup::InitializeConsole();
    PLOG_INFO << "ED Backup " << EDB_VERSION_STRING << " starting";

    context_ = std::make_unique<AppContext>();
    if (!context_->initialize())
        return false;

    platform::PlatformSetup::SetupSDLLogging();
    SDL_SetAppMetadata("ED Backup", EDB_VERSION_STRING, "edbackup");

    setupManagers();
    initializeConfig();
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger({ .name = "main",
                                               .filepath = "logs/run.log",
                                               .append_override = std::nullopt,
                                               .level_override = std::nullopt,
                                               .max_file_size = 10 * 1024 * 1024,
                                               .backup_count = 3,
                                               .add_console_appender = true });
}

void Application::setupManagers()
{
    config_ = std::make_unique<ConfigManager>();
    settings_ = std::make_unique<BackupSettings>();

    locator_ = std::make_unique<backup::KnownFolderLocator>();
    categories_ = std::make_unique<backup::CategoryRegistry>(*locator_);

    export_service_ = std::make_unique<backup::ExportService>();
    error_dialog_ = std::make_unique<ErrorDialog>();
}

void Application::initializeConfig()
{
    settings_->registerConfigHandler(*config_);

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            i18n::get_str("app.init.config_load_failed"), config_->lastError());
    }

    // Rows read their initial state from the loaded settings
    backup_window_ = std::make_unique<BackupWindow>(context_->window(), *categories_, *settings_, *export_service_);
}

int Application::run()
{
    if (!initialize())
    {
        return -1;
    }
    mainLoop();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
}

void Application::mainLoop()
{
    while (running_)
    {
        processEvents();
        renderFrame();
        handleQuitRequests();
    }
}

void Application::renderFrame()
{
    context_->beginFrame();

    backup_window_->render();

    if (utils::ErrorReporter::HasPendingErrors())
        error_dialog_->Show(utils::ErrorReporter::GetPendingErrors());
    if (error_dialog_->Render())
        requestExit();

    context_->endFrame();
}

void Application::handleQuitRequests()
{
    if (!quit_requested_)
        return;

    if (export_service_ && export_service_->isRunning())
        PLOG_INFO << "Waiting for running backup to finish before exit";

    cleanup();
    running_ = false;
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    if (export_service_)
        export_service_->shutdown();

    if (config_ && !config_->save())
        PLOG_WARNING << "Configuration not saved: " << config_->lastError();

    backup_window_.reset();
    error_dialog_.reset();
    context_.reset();
}

bool Application::checkSingleInstance()
{
    instance_guard_ = SingleInstanceGuard::Acquire();
    if (instance_guard_)
        return true;

    utils::NativeMessageBox::ShowFatalError(i18n::get_str("error.native.single_instance_message"),
                                            i18n::get_str("error.native.single_instance_detail"));
    return false;
}

void Application::processEvents()
{
    SDL_Event event;

    if (SDL_WaitEventTimeout(&event, 16))
    {
        if (context_->processEvent(event))
            quit_requested_ = true;

        while (SDL_PollEvent(&event))
        {
            if (context_->processEvent(event))
                quit_requested_ = true;
        }
    }
}
