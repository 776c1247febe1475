#include "ErrorDialog.hpp"
#include "UITheme.hpp"
#include "app/Version.hpp"
#include "platform/PlatformSetup.hpp"
#include "ui/Localization.hpp"

#include <SDL3/SDL.h>
#include <plog/Log.h>
#include <sstream>

namespace
{

constexpr const char* kPopupId = "###error_report_modal";

struct SeverityText
{
    const char* icon;
    const char* i18n_key;
};

SeverityText severityText(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Info:
        return { "[i]", "error.severity.info" };
    case utils::ErrorSeverity::Warning:
        return { "[!]", "error.severity.warning" };
    case utils::ErrorSeverity::Error:
        return { "[X]", "error.severity.error" };
    case utils::ErrorSeverity::Fatal:
        return { "[!!]", "error.severity.fatal" };
    }
    return { "[?]", "error.severity.unknown" };
}

const char* categoryKey(utils::ErrorCategory category)
{
    switch (category)
    {
    case utils::ErrorCategory::Initialization:
        return "error.category.initialization";
    case utils::ErrorCategory::Configuration:
        return "error.category.configuration";
    case utils::ErrorCategory::Export:
        return "error.category.export";
    case utils::ErrorCategory::ProcessDetection:
        return "error.category.process_detection";
    case utils::ErrorCategory::Unknown:
        break;
    }
    return "error.category.unknown";
}

std::string popupTitle() { return std::string(i18n::get("error.title")) + kPopupId; }

} // namespace

void ErrorDialog::Show(const std::vector<utils::ErrorReport>& errors)
{
    if (errors.empty())
        return;

    if (current_errors_.empty())
        selected_error_ = 0;
    current_errors_.insert(current_errors_.end(), errors.begin(), errors.end());
    open_requested_ = true;
}

bool ErrorDialog::Render()
{
    if (current_errors_.empty())
        return false;

    const std::string title = popupTitle();
    if (open_requested_)
    {
        ImGui::OpenPopup(title.c_str());
        open_requested_ = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(600, 0), ImGuiCond_Appearing);

    bool should_exit = false;
    if (ImGui::BeginPopupModal(title.c_str(), nullptr, ImGuiWindowFlags_NoCollapse))
    {
        const utils::ErrorReport error = current_errors_[selected_error_];
        renderReport(error);
        renderNavigation();
        ImGui::Separator();
        should_exit = renderButtons(error);
        ImGui::EndPopup();
    }
    return should_exit;
}

void ErrorDialog::renderReport(const utils::ErrorReport& error)
{
    const SeverityText text = severityText(error.severity);
    ImGui::PushStyleColor(ImGuiCol_Text, SeverityColor(error.severity));
    ImGui::Text("%s %s - %s", text.icon, i18n::get(text.i18n_key), i18n::get(categoryKey(error.category)));
    ImGui::PopStyleColor();
    ImGui::Separator();

    ImGui::TextDisabled("%s %s", i18n::get("error.time"), error.timestamp.c_str());
    ImGui::Spacing();
    ImGui::TextWrapped("%s", error.user_message.c_str());
    ImGui::Spacing();

    if (!error.technical_details.empty() && ImGui::CollapsingHeader(i18n::get("error.technical_details")))
    {
        ImGui::BeginChild("##technical_details", ImVec2(0, 150), ImGuiChildFlags_Border);
        ImGui::TextWrapped("%s", error.technical_details.c_str());
        ImGui::EndChild();
    }
}

void ErrorDialog::renderNavigation()
{
    if (current_errors_.size() < 2)
        return;

    ImGui::Separator();
    const std::string counter = i18n::format("error.counter", {
                                                                  { "index", std::to_string(selected_error_ + 1)    },
                                                                  { "total", std::to_string(current_errors_.size()) }
    });
    ImGui::TextUnformatted(counter.c_str());

    ImGui::SameLine();
    ImGui::BeginDisabled(selected_error_ == 0);
    if (ImGui::Button(i18n::get("error.prev")))
        --selected_error_;
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::BeginDisabled(selected_error_ + 1 >= static_cast<int>(current_errors_.size()));
    if (ImGui::Button(i18n::get("error.next")))
        ++selected_error_;
    ImGui::EndDisabled();
}

bool ErrorDialog::renderButtons(const utils::ErrorReport& error)
{
    if (ImGui::Button(i18n::get("error.copy_to_clipboard")))
    {
        if (!SDL_SetClipboardText(FormatErrorReport(error).c_str()))
            PLOG_WARNING << "SDL_SetClipboardText failed: " << SDL_GetError();
    }

    ImGui::SameLine();
    if (ImGui::Button(i18n::get("error.open_logs_folder")))
    {
        if (!platform::PlatformSetup::OpenFolder("logs"))
            PLOG_WARNING << "Could not open logs folder";
    }

    ImGui::SameLine();
    if (error.is_fatal)
    {
        if (ImGui::Button(i18n::get("error.exit_application")))
        {
            ImGui::CloseCurrentPopup();
            Close();
            return true;
        }
        return false;
    }

    if (ImGui::Button(i18n::get("error.continue")))
    {
        ImGui::CloseCurrentPopup();
        Close();
    }
    return false;
}

void ErrorDialog::Close()
{
    current_errors_.clear();
    selected_error_ = 0;
    open_requested_ = false;
}

ImVec4 ErrorDialog::SeverityColor(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Info:
        return UITheme::mutedTextColor();
    case utils::ErrorSeverity::Warning:
        return UITheme::warningColor();
    case utils::ErrorSeverity::Error:
        return UITheme::accentColor();
    case utils::ErrorSeverity::Fatal:
        return UITheme::errorColor();
    }
    return UITheme::disabledColor();
}

std::string ErrorDialog::FormatErrorReport(const utils::ErrorReport& error)
{
    std::ostringstream ss;
    ss << "ED Backup " << EDB_VERSION_STRING << " error report\n";
    ss << "Time: " << error.timestamp << "\n";
    ss << "Severity: " << utils::ErrorReporter::SeverityToString(error.severity) << "\n";
    ss << "Category: " << utils::ErrorReporter::CategoryToString(error.category) << "\n\n";
    ss << error.user_message << "\n";

    if (!error.technical_details.empty())
        ss << "\nDetails:\n" << error.technical_details << "\n";

    ss << "\nSee logs/run.log for more information.\n";
    return ss.str();
}
