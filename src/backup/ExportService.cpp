#include "ExportService.hpp"
#include "ArchiveExporter.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <atomic>
#include <mutex>
#include <thread>

namespace backup
{

namespace
{

std::vector<ExportResult> failAll(const ExportRequest& request, const std::string& reason)
{
    std::vector<ExportResult> results;
    results.reserve(request.categories.size());
    for (const auto& category : request.categories)
        results.push_back(ExportResult::Failed(category, ExportErrorKind::IOError, reason));
    return results;
}

} // namespace

struct ExportService::Impl
{
    std::atomic<ExportState> state{ ExportState::Idle };

    mutable std::mutex mutex;
    ExportProgress progress;
    std::vector<ExportResult> results;

    std::thread worker;

    ~Impl()
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
};

ExportService::ExportService()
    : impl_(std::make_unique<Impl>())
{
}

ExportService::~ExportService() { shutdown(); }

bool ExportService::start(ExportRequest request, ExportOptions options, ExportCompleteCallback onComplete)
{
    if (impl_->state == ExportState::Running)
    {
        PLOG_WARNING << "Export already in progress";
        return false;
    }

    if (impl_->worker.joinable())
    {
        impl_->worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->progress = ExportProgress{};
        impl_->results.clear();
    }
    impl_->state = ExportState::Running;

    impl_->worker = std::thread(
        [this, request = std::move(request), options = std::move(options), onComplete = std::move(onComplete)]()
        {
            std::vector<ExportResult> results;
            try
            {
                ArchiveExporter exporter(options);
                results = exporter.exportAll(request,
                                             [this](const ExportProgress& progress)
                                             {
                                                 std::lock_guard<std::mutex> lock(impl_->mutex);
                                                 impl_->progress = progress;
                                             });
            }
            catch (const std::exception& e)
            {
                PLOG_ERROR << "Export worker failed: " << e.what();
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Export, "Backup stopped unexpectedly",
                                                  e.what());
                results = failAll(request, e.what());
            }

            {
                std::lock_guard<std::mutex> lock(impl_->mutex);
                impl_->results = results;
                impl_->progress.done = impl_->progress.total;
            }
            impl_->state = ExportState::Completed;

            if (onComplete)
            {
                try
                {
                    onComplete(results);
                }
                catch (const std::exception& e)
                {
                    PLOG_ERROR << "Export completion handler failed: " << e.what();
                    utils::ErrorReporter::ReportError(utils::ErrorCategory::Export,
                                                      "Backup finished but its results could not be delivered",
                                                      e.what());
                }
            }
        });

    PLOG_INFO << "Export started on background thread";
    return true;
}

void ExportService::wait()
{
    if (impl_->worker.joinable())
    {
        impl_->worker.join();
    }
}

void ExportService::shutdown()
{
    if (!impl_)
        return;
    if (impl_->state == ExportState::Running)
    {
        PLOG_INFO << "Waiting for running export to finish";
    }
    wait();
}

ExportState ExportService::getState() const { return impl_->state; }

ExportProgress ExportService::getProgress() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->progress;
}

std::vector<ExportResult> ExportService::getResults() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->results;
}

void ExportService::acknowledge()
{
    ExportState expected = ExportState::Completed;
    impl_->state.compare_exchange_strong(expected, ExportState::Idle);
}

} // namespace backup
