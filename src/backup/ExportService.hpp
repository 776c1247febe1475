#pragma once

#include "ExportTypes.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace backup
{

enum class ExportState
{
    Idle,      // Nothing running, no unread results
    Running,   // Worker thread is writing archives
    Completed  // Results ready for the UI
};

using ExportCompleteCallback = std::function<void(const std::vector<ExportResult>&)>;

// Runs one export request at a time on a background thread so the window
// keeps rendering. Progress and results are published as snapshots.
class ExportService
{
public:
    ExportService();
    ~ExportService();

    ExportService(const ExportService&) = delete;
    ExportService& operator=(const ExportService&) = delete;

    // Returns false when a request is already running
    bool start(ExportRequest request, ExportOptions options, ExportCompleteCallback onComplete = nullptr);

    // Blocks until the current request (if any) is done
    void wait();
    void shutdown();

    // Thread-safe snapshots
    ExportState getState() const;
    ExportProgress getProgress() const;
    std::vector<ExportResult> getResults() const;

    bool isRunning() const { return getState() == ExportState::Running; }

    // Completed -> Idle once the UI has shown the results
    void acknowledge();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backup
