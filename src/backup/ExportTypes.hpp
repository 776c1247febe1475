#pragma once

#include "Category.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace backup
{

// Per-category outcome: Pending -> { Success, Skipped, Failed }
enum class ExportStatus
{
    Pending,
    Success,
    Skipped,
    Failed
};

enum class ExportErrorKind
{
    None,
    PermissionDenied,
    IOError
};

inline constexpr const char* kNoDataReason = "no data found";

struct ExportResult
{
    Category category;
    ExportStatus status = ExportStatus::Pending;
    ExportErrorKind error = ExportErrorKind::None;
    std::string reason;                 // skip reason or error message
    std::size_t entries = 0;            // files written, manifest excluded
    std::filesystem::path archive_path; // set on success

    static ExportResult Success(const Category& category, std::size_t entries, std::filesystem::path archive);
    static ExportResult Skipped(const Category& category, std::string reason = kNoDataReason);
    static ExportResult Failed(const Category& category, ExportErrorKind error, std::string reason);

    bool succeeded() const { return status == ExportStatus::Success; }
};

struct ExportRequest
{
    std::vector<Category> categories; // processed in this order
    std::filesystem::path destination_dir;
};

struct ExportProgress
{
    std::size_t done = 0;
    std::size_t total = 0;
    std::string current;

    float fraction() const;
};

struct ExportOptions
{
    bool include_manifest = false;
    bool timestamped_names = false;
    // Shared by every archive of one request; generated when empty
    std::string timestamp;
};

const char* ToString(ExportStatus status);
const char* ToString(ExportErrorKind kind);

// Maps an OS error onto the export taxonomy. Access errors become
// PermissionDenied, everything else IOError.
ExportErrorKind ClassifyError(const std::error_code& ec);

} // namespace backup
