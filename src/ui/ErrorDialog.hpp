#pragma once

#include "utils/ErrorReporter.hpp"
#include <imgui.h>
#include <string>
#include <vector>

// Modal that drains ErrorReporter reports one at a time. Fatal reports only
// offer to exit the application.
class ErrorDialog
{
public:
    ErrorDialog() = default;

    // Appends reports to the ones still being shown
    void Show(const std::vector<utils::ErrorReport>& errors);

    // Returns true once the user chose to exit after a fatal report
    bool Render();

    bool IsOpen() const { return !current_errors_.empty(); }
    void Close();

    static std::string FormatErrorReport(const utils::ErrorReport& error);

private:
    void renderReport(const utils::ErrorReport& error);
    void renderNavigation();
    bool renderButtons(const utils::ErrorReport& error);

    static ImVec4 SeverityColor(utils::ErrorSeverity severity);

    std::vector<utils::ErrorReport> current_errors_;
    int selected_error_ = 0;
    bool open_requested_ = false;
};
