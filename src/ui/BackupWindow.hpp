#pragma once

#include "backup/ExportTypes.hpp"

#include <SDL3/SDL.h>

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class BackupSettings;

namespace backup
{
class CategoryRegistry;
class ExportService;
} // namespace backup

// The single application window: category rows, destination, actions,
// progress and the result popups.
class BackupWindow
{
public:
    BackupWindow(SDL_Window* window, const backup::CategoryRegistry& registry, BackupSettings& settings,
                 backup::ExportService& service);
    ~BackupWindow();

    BackupWindow(const BackupWindow&) = delete;
    BackupWindow& operator=(const BackupWindow&) = delete;

    void render();

private:
    using PathBuffer = std::array<char, 512>;

    struct CategoryRow
    {
        std::string name;
        std::string label_key;
        std::string located_path; // UTF-8, what the locator found
        PathBuffer source{};
        bool enabled = true;
    };

    // Folder picks arrive on SDL's dialog thread and are applied next frame
    struct PendingFolderPicks
    {
        std::mutex mutex;
        std::vector<std::pair<int, std::string>> picks;
    };

    struct FolderRequest
    {
        std::shared_ptr<PendingFolderPicks> sink;
        int target; // row index, or kDestinationTarget
    };

    static constexpr int kDestinationTarget = -1;

    static void SDLCALL FolderDialogCallback(void* userdata, const char* const* filelist, int filter);

    void renderHeader();
    void renderSources();
    void renderDestination();
    void renderOptions();
    void renderActions();
    void renderProgress();
    void renderStatus();

    void renderMessagePopup();
    void renderConfirmPopup();
    void renderSummaryPopup();
    void renderRestorePopup();

    void openFolderDialog(int target, const char* defaultLocation);
    void applyFolderPicks();
    void storeSourceText(CategoryRow& row);
    void storeDestinationText();

    void requestExport();
    void startExport();
    void pollService();

    void showMessage(const std::string& title, const std::string& text);
    void showPathTooLong(const std::string& folder);

    SDL_Window* window_;
    const backup::CategoryRegistry& registry_;
    BackupSettings& settings_;
    backup::ExportService& service_;

    std::vector<CategoryRow> rows_;
    PathBuffer destination_{};
    std::shared_ptr<PendingFolderPicks> pending_picks_;

    std::string status_;
    std::string progress_text_;
    float progress_fraction_ = 0.0f;

    std::string message_title_;
    std::string message_text_;
    bool open_message_ = false;

    std::vector<std::string> running_processes_;
    bool open_confirm_ = false;

    std::vector<backup::ExportResult> last_results_;
    std::string summary_text_;
    bool open_summary_ = false;
    bool open_restore_ = false;
};
