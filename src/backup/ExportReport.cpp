#include "ExportReport.hpp"
#include "utils/PathUtils.hpp"

#include <sstream>

namespace backup
{

ExportSummary ExportSummary::From(const std::vector<ExportResult>& results)
{
    ExportSummary summary;
    for (const auto& result : results)
    {
        switch (result.status)
        {
        case ExportStatus::Success:
            ++summary.succeeded;
            break;
        case ExportStatus::Skipped:
            ++summary.skipped;
            break;
        case ExportStatus::Failed:
            ++summary.failed;
            break;
        case ExportStatus::Pending:
            break;
        }
    }
    return summary;
}

std::string FormatResultLine(const ExportResult& result)
{
    std::ostringstream ss;
    switch (result.status)
    {
    case ExportStatus::Success:
        ss << "[OK] " << utils::PathToUtf8(result.archive_path.filename()) << " (files: " << result.entries << ")";
        break;
    case ExportStatus::Skipped:
        ss << "[SKIPPED] " << result.category.name << ": " << result.reason;
        break;
    case ExportStatus::Failed:
        ss << "[FAILED] " << result.category.name << ": "
           << (result.error == ExportErrorKind::PermissionDenied ? "permission denied" : "I/O error");
        if (!result.reason.empty())
            ss << " (" << result.reason << ")";
        break;
    case ExportStatus::Pending:
        ss << "[PENDING] " << result.category.name;
        break;
    }
    return ss.str();
}

std::string FormatSummary(const std::vector<ExportResult>& results)
{
    std::string out;
    for (const auto& result : results)
    {
        if (!out.empty())
            out += '\n';
        out += FormatResultLine(result);
    }
    return out;
}

std::string FormatStatusLine(const std::vector<ExportResult>& results)
{
    auto summary = ExportSummary::From(results);
    std::ostringstream ss;
    ss << "Done: created " << summary.succeeded << " ZIP file(s)";
    if (summary.skipped > 0)
        ss << ", " << summary.skipped << " skipped";
    if (summary.failed > 0)
        ss << ", " << summary.failed << " failed";
    ss << ".";
    return ss.str();
}

std::string ShortenForDisplay(const std::string& text, std::size_t maxLength)
{
    static constexpr const char* kEllipsis = "...";
    if (text.size() <= maxLength || maxLength <= 3)
        return text;
    return kEllipsis + text.substr(text.size() - (maxLength - 3));
}

} // namespace backup
