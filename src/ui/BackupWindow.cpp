#include "BackupWindow.hpp"
#include "UITheme.hpp"
#include "backup/CategoryRegistry.hpp"
#include "backup/ExportReport.hpp"
#include "backup/ExportService.hpp"
#include "config/BackupSettings.hpp"
#include "platform/PlatformSetup.hpp"
#include "platform/ProcessDetector.hpp"
#include "ui/Localization.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/PathUtils.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <cfloat>

namespace
{

template <std::size_t N>
bool CopyToBuffer(std::array<char, N>& buffer, const std::string& text)
{
    if (utils::CopyToBuffer(buffer.data(), buffer.size(), text))
        return true;
    PLOG_WARNING << "Path does not fit the edit field (" << text.size() << " bytes): " << text;
    return false;
}

std::string JoinNames(const std::vector<std::string>& names)
{
    std::string joined;
    for (const auto& name : names)
    {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

std::string PopupId(const char* titleKey, const char* id)
{
    return std::string(i18n::get(titleKey)) + "###" + id;
}

} // namespace

BackupWindow::BackupWindow(SDL_Window* window, const backup::CategoryRegistry& registry, BackupSettings& settings,
                           backup::ExportService& service)
    : window_(window)
    , registry_(registry)
    , settings_(settings)
    , service_(service)
    , pending_picks_(std::make_shared<PendingFolderPicks>())
{
    for (const auto& category : registry_.categories())
    {
        CategoryRow row;
        row.name = category.name;
        row.label_key = "backup.category." + category.name;
        row.located_path = utils::PathToUtf8(category.source_path);

        const CategorySettings stored = settings_.categorySettings(category.name);
        row.enabled = stored.enabled;
        CopyToBuffer(row.source, stored.source_override.empty() ? row.located_path : stored.source_override);
        rows_.push_back(std::move(row));
    }

    CopyToBuffer(destination_, settings_.destination());
    status_ = i18n::get_str("backup.status.ready");
}

BackupWindow::~BackupWindow() = default;

void BackupWindow::render()
{
    applyFolderPicks();
    pollService();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (ImGui::Begin("##backup_main", nullptr, flags))
    {
        renderHeader();
        renderSources();
        renderDestination();
        renderOptions();
        renderActions();
        renderProgress();
        renderStatus();

        renderMessagePopup();
        renderConfirmPopup();
        renderSummaryPopup();
        renderRestorePopup();
    }
    ImGui::End();
}

void BackupWindow::renderHeader()
{
    ImGui::PushStyleColor(ImGuiCol_Text, UITheme::accentColor());
    ImGui::SetWindowFontScale(1.6f);
    ImGui::TextUnformatted(i18n::get("backup.header.title"));
    ImGui::SetWindowFontScale(1.0f);
    ImGui::PopStyleColor();
    ImGui::TextColored(UITheme::mutedTextColor(), "%s", i18n::get("backup.header.subtitle"));
    ImGui::Spacing();
}

void BackupWindow::renderSources()
{
    UITheme::pushSectionStyle();
    ImGui::BeginChild("##sources", ImVec2(0, 0), ImGuiChildFlags_AutoResizeY | ImGuiChildFlags_AlwaysUseWindowPadding);
    ImGui::SeparatorText(i18n::get("backup.sources.title"));

    const bool busy = service_.isRunning();
    ImGui::BeginDisabled(busy);
    for (int i = 0; i < static_cast<int>(rows_.size()); ++i)
    {
        CategoryRow& row = rows_[i];
        ImGui::PushID(i);

        if (ImGui::Checkbox(i18n::get(row.label_key.c_str()), &row.enabled))
            settings_.category(row.name).enabled = row.enabled;

        ImGui::SameLine(230.0f);
        ImGui::SetNextItemWidth(-120.0f);
        if (ImGui::InputText("##source", row.source.data(), row.source.size()))
            storeSourceText(row);

        ImGui::SameLine();
        if (ImGui::Button(i18n::get("backup.sources.browse"), ImVec2(-FLT_MIN, 0)))
            openFolderDialog(i, row.source.data());

        ImGui::PopID();
    }
    ImGui::EndDisabled();

    ImGui::EndChild();
    UITheme::popSectionStyle();
}

void BackupWindow::renderDestination()
{
    UITheme::pushSectionStyle();
    ImGui::BeginChild("##destination", ImVec2(0, 0), ImGuiChildFlags_AutoResizeY | ImGuiChildFlags_AlwaysUseWindowPadding);
    ImGui::SeparatorText(i18n::get("backup.destination.title"));

    ImGui::BeginDisabled(service_.isRunning());
    ImGui::SetNextItemWidth(-170.0f);
    if (ImGui::InputText("##destination_path", destination_.data(), destination_.size()))
        storeDestinationText();
    ImGui::SameLine();
    if (ImGui::Button(i18n::get("backup.destination.choose"), ImVec2(-FLT_MIN, 0)))
        openFolderDialog(kDestinationTarget, destination_.data());
    ImGui::EndDisabled();

    ImGui::EndChild();
    UITheme::popSectionStyle();
}

void BackupWindow::renderOptions()
{
    ImGui::BeginDisabled(service_.isRunning());

    bool include_manifest = settings_.includeManifest();
    if (ImGui::Checkbox(i18n::get("backup.options.include_manifest"), &include_manifest))
        settings_.setIncludeManifest(include_manifest);
    ImGui::SameLine();
    bool timestamped = settings_.timestampedNames();
    if (ImGui::Checkbox(i18n::get("backup.options.timestamped_names"), &timestamped))
        settings_.setTimestampedNames(timestamped);
    ImGui::SameLine();
    bool warn = settings_.warnIfRunning();
    if (ImGui::Checkbox(i18n::get("backup.options.warn_if_running"), &warn))
        settings_.setWarnIfRunning(warn);

    ImGui::EndDisabled();
    ImGui::Spacing();
}

void BackupWindow::renderActions()
{
    const ImVec2 button_size(0.0f, 42.0f);

    ImGui::BeginDisabled(service_.isRunning());
    if (ImGui::Button(i18n::get("backup.actions.create"), button_size))
        requestExport();
    ImGui::EndDisabled();

    ImGui::SameLine();
    if (ImGui::Button(i18n::get("backup.actions.restore_help"), button_size))
        open_restore_ = true;

    ImGui::SameLine();
    if (ImGui::Button(i18n::get("backup.actions.open_destination"), button_size))
    {
        if (!platform::PlatformSetup::OpenFolder(settings_.destinationPath()))
            showMessage(i18n::get_str("backup.message.error_title"), i18n::get_str("backup.error.open_destination"));
    }
    ImGui::Spacing();
}

void BackupWindow::renderProgress()
{
    UITheme::pushSectionStyle();
    ImGui::BeginChild("##progress", ImVec2(0, 0), ImGuiChildFlags_AutoResizeY | ImGuiChildFlags_AlwaysUseWindowPadding);
    ImGui::SeparatorText(i18n::get("backup.progress.title"));

    UITheme::pushProgressBarStyle();
    ImGui::ProgressBar(progress_fraction_, ImVec2(-FLT_MIN, 18.0f), "");
    UITheme::popProgressBarStyle();

    ImGui::PushStyleColor(ImGuiCol_Text, UITheme::accentColor());
    ImGui::TextUnformatted(progress_text_.c_str());
    ImGui::PopStyleColor();

    ImGui::EndChild();
    UITheme::popSectionStyle();
}

void BackupWindow::renderStatus()
{
    ImGui::Separator();

    if (last_results_.empty() || service_.isRunning())
    {
        ImGui::TextUnformatted(status_.c_str());
        return;
    }

    const auto summary = backup::ExportSummary::From(last_results_);
    ImGui::TextColored(UITheme::statusColor(summary.failed == 0, summary.failed > 0), "%s", status_.c_str());
}

void BackupWindow::renderMessagePopup()
{
    const std::string id = message_title_ + "###backup_message";
    if (open_message_)
    {
        ImGui::OpenPopup(id.c_str());
        open_message_ = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal(id.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::PushTextWrapPos(480.0f);
        ImGui::TextUnformatted(message_text_.c_str());
        ImGui::PopTextWrapPos();
        ImGui::Spacing();
        if (ImGui::Button(i18n::get("common.ok"), ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}

void BackupWindow::renderConfirmPopup()
{
    const std::string id = PopupId("backup.confirm.title", "backup_confirm");
    if (open_confirm_)
    {
        ImGui::OpenPopup(id.c_str());
        open_confirm_ = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal(id.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::PushTextWrapPos(520.0f);
        ImGui::TextUnformatted(i18n::format("backup.confirm.message",
                                            { { "processes", JoinNames(running_processes_) } })
                                   .c_str());
        ImGui::PopTextWrapPos();
        ImGui::Spacing();

        if (ImGui::Button(i18n::get("common.yes"), ImVec2(120.0f, 0.0f)))
        {
            ImGui::CloseCurrentPopup();
            startExport();
        }
        ImGui::SameLine();
        if (ImGui::Button(i18n::get("common.no"), ImVec2(120.0f, 0.0f)))
        {
            PLOG_INFO << "Backup cancelled: game still running";
            status_ = i18n::get_str("backup.status.cancelled");
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void BackupWindow::renderSummaryPopup()
{
    const std::string id = PopupId("backup.summary.title", "backup_summary");
    if (open_summary_)
    {
        ImGui::OpenPopup(id.c_str());
        open_summary_ = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal(id.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        for (const auto& result : last_results_)
        {
            const bool ok = result.status == backup::ExportStatus::Success;
            const bool failed = result.status == backup::ExportStatus::Failed;
            ImGui::TextColored(UITheme::statusColor(ok, failed), "%s", backup::FormatResultLine(result).c_str());
        }
        ImGui::Spacing();
        if (ImGui::Button(i18n::get("common.ok"), ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::SameLine();
        if (ImGui::Button(i18n::get("backup.summary.copy")))
        {
            if (!SDL_SetClipboardText(summary_text_.c_str()))
                PLOG_WARNING << "SDL_SetClipboardText failed: " << SDL_GetError();
        }
        ImGui::EndPopup();
    }
}

void BackupWindow::renderRestorePopup()
{
    const std::string id = PopupId("backup.restore.title", "backup_restore");
    if (open_restore_)
    {
        ImGui::OpenPopup(id.c_str());
        open_restore_ = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal(id.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::PushTextWrapPos(640.0f);
        ImGui::TextUnformatted(i18n::get("backup.restore.message"));
        ImGui::PopTextWrapPos();
        ImGui::Spacing();
        if (ImGui::Button(i18n::get("common.ok"), ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}

void SDLCALL BackupWindow::FolderDialogCallback(void* userdata, const char* const* filelist, int /*filter*/)
{
    std::unique_ptr<FolderRequest> request(static_cast<FolderRequest*>(userdata));

    if (!filelist)
    {
        PLOG_WARNING << "Folder dialog failed: " << SDL_GetError();
        return;
    }
    if (!filelist[0])
        return; // cancelled

    std::lock_guard<std::mutex> lock(request->sink->mutex);
    request->sink->picks.emplace_back(request->target, filelist[0]);
}

void BackupWindow::openFolderDialog(int target, const char* defaultLocation)
{
    auto* request = new FolderRequest{ pending_picks_, target };
    const char* location = (defaultLocation && defaultLocation[0] != '\0') ? defaultLocation : nullptr;
    SDL_ShowOpenFolderDialog(&BackupWindow::FolderDialogCallback, request, window_, location, false);
}

void BackupWindow::applyFolderPicks()
{
    std::vector<std::pair<int, std::string>> picks;
    {
        std::lock_guard<std::mutex> lock(pending_picks_->mutex);
        picks.swap(pending_picks_->picks);
    }

    for (const auto& [target, folder] : picks)
    {
        if (target == kDestinationTarget)
        {
            if (!CopyToBuffer(destination_, folder))
            {
                showPathTooLong(folder);
                continue;
            }
            storeDestinationText();
        }
        else if (target >= 0 && target < static_cast<int>(rows_.size()))
        {
            if (!CopyToBuffer(rows_[target].source, folder))
            {
                showPathTooLong(folder);
                continue;
            }
            storeSourceText(rows_[target]);
        }
    }
}

void BackupWindow::showPathTooLong(const std::string& folder)
{
    showMessage(i18n::get_str("backup.message.error_title"),
                i18n::format("backup.error.path_too_long", { { "path", backup::ShortenForDisplay(folder) } }));
}

void BackupWindow::storeSourceText(CategoryRow& row)
{
    std::string text = row.source.data();
    // The located default is not an override
    settings_.category(row.name).source_override = (text == row.located_path) ? std::string{} : text;
}

void BackupWindow::storeDestinationText()
{
    settings_.setDestination(destination_.data());
}

void BackupWindow::requestExport()
{
    if (service_.isRunning())
    {
        showMessage(i18n::get_str("backup.message.busy_title"), i18n::get_str("backup.error.busy"));
        return;
    }

    if (settings_.selectedCategories(registry_).empty())
    {
        showMessage(i18n::get_str("backup.message.error_title"), i18n::get_str("backup.error.no_selection"));
        return;
    }

    if (settings_.destination().empty())
    {
        showMessage(i18n::get_str("backup.message.error_title"), i18n::get_str("backup.error.no_destination"));
        return;
    }

    if (settings_.warnIfRunning())
    {
        running_processes_ = ProcessDetector::findRunning(kEliteProcessNames);
        if (!running_processes_.empty())
        {
            PLOG_WARNING << "Game related processes running: " << JoinNames(running_processes_);
            open_confirm_ = true;
            return;
        }
    }

    startExport();
}

void BackupWindow::startExport()
{
    backup::ExportRequest request;
    request.destination_dir = settings_.destinationPath();
    try
    {
        request.categories = registry_.select(settings_.selectedCategories(registry_), settings_.sourceOverrides());
    }
    catch (const backup::CategoryNotFound& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Export, i18n::get_str("backup.error.unknown_category"),
                                          e.what());
        return;
    }

    PLOG_INFO << "Starting backup of " << request.categories.size() << " categories into "
              << utils::PathToUtf8(request.destination_dir);

    if (!service_.start(std::move(request), settings_.exportOptions()))
    {
        showMessage(i18n::get_str("backup.message.busy_title"), i18n::get_str("backup.error.busy"));
        return;
    }

    last_results_.clear();
    progress_fraction_ = 0.0f;
    progress_text_ = i18n::get_str("backup.progress.scanning");
    status_ = i18n::get_str("backup.status.working");
}

void BackupWindow::pollService()
{
    switch (service_.getState())
    {
    case backup::ExportState::Running:
    {
        const backup::ExportProgress progress = service_.getProgress();
        if (progress.total == 0)
            break;
        progress_fraction_ = progress.fraction();
        progress_text_ = i18n::format("backup.progress.file",
                                      {
                                          { "done",    std::to_string(progress.done)                  },
                                          { "total",   std::to_string(progress.total)                 },
                                          { "current", backup::ShortenForDisplay(progress.current)    }
        });
        break;
    }
    case backup::ExportState::Completed:
        last_results_ = service_.getResults();
        service_.acknowledge();

        progress_fraction_ = 1.0f;
        progress_text_ = i18n::get_str("backup.progress.finished");
        summary_text_ = backup::FormatSummary(last_results_);
        status_ = backup::FormatStatusLine(last_results_);
        open_summary_ = true;
        PLOG_INFO << "Backup finished:\n" << summary_text_;
        break;
    case backup::ExportState::Idle:
        break;
    }
}

void BackupWindow::showMessage(const std::string& title, const std::string& text)
{
    message_title_ = title;
    message_text_ = text;
    open_message_ = true;
}
