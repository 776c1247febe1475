#include "ExportTypes.hpp"

#include <algorithm>

namespace backup
{

ExportResult ExportResult::Success(const Category& category, std::size_t entries, std::filesystem::path archive)
{
    ExportResult result;
    result.category = category;
    result.status = ExportStatus::Success;
    result.entries = entries;
    result.archive_path = std::move(archive);
    return result;
}

ExportResult ExportResult::Skipped(const Category& category, std::string reason)
{
    ExportResult result;
    result.category = category;
    result.status = ExportStatus::Skipped;
    result.reason = std::move(reason);
    return result;
}

ExportResult ExportResult::Failed(const Category& category, ExportErrorKind error, std::string reason)
{
    ExportResult result;
    result.category = category;
    result.status = ExportStatus::Failed;
    result.error = error == ExportErrorKind::None ? ExportErrorKind::IOError : error;
    result.reason = std::move(reason);
    return result;
}

float ExportProgress::fraction() const
{
    if (total == 0)
        return 0.0f;
    float frac = static_cast<float>(done) / static_cast<float>(total);
    return std::clamp(frac, 0.0f, 1.0f);
}

const char* ToString(ExportStatus status)
{
    switch (status)
    {
    case ExportStatus::Pending:
        return "Pending";
    case ExportStatus::Success:
        return "Success";
    case ExportStatus::Skipped:
        return "Skipped";
    case ExportStatus::Failed:
        return "Failed";
    default:
        return "Unknown";
    }
}

const char* ToString(ExportErrorKind kind)
{
    switch (kind)
    {
    case ExportErrorKind::None:
        return "None";
    case ExportErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ExportErrorKind::IOError:
        return "IOError";
    default:
        return "Unknown";
    }
}

ExportErrorKind ClassifyError(const std::error_code& ec)
{
    if (!ec)
        return ExportErrorKind::None;

    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system)
    {
        return ExportErrorKind::PermissionDenied;
    }
    return ExportErrorKind::IOError;
}

} // namespace backup
