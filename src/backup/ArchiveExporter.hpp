#pragma once

#include "ExportTypes.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace backup
{

using ProgressCallback = std::function<void(const ExportProgress&)>;

// Writes one ZIP archive per category. Each category is handled on its own:
// a skipped or failed category never stops the rest of a request.
//
// Archives are written to "<target>.tmp" beside the target and renamed into
// place only once complete, so the target name never names a partial file.
class ArchiveExporter
{
public:
    explicit ArchiveExporter(ExportOptions options = {});

    ExportResult exportCategory(const Category& category, const std::filesystem::path& destinationDir,
                                const ProgressCallback& onProgress = nullptr) const;

    // One result per requested category, in request order
    std::vector<ExportResult> exportAll(const ExportRequest& request, const ProgressCallback& onProgress = nullptr) const;

    std::filesystem::path archivePathFor(const Category& category, const std::filesystem::path& destinationDir) const;

    const ExportOptions& options() const { return options_; }

    static std::filesystem::path TemporaryPathFor(const std::filesystem::path& archivePath);

    // Regular files under root, sorted. An absent root yields an empty list
    // without error.
    static std::vector<std::filesystem::path> CollectFiles(const std::filesystem::path& root, std::error_code& ec);

    // Archive entry name: path relative to root with forward slashes
    static std::string EntryNameFor(const std::filesystem::path& root, const std::filesystem::path& file);

    // "YYYY-MM-DD_HH-MM-SS" in local time
    static std::string MakeRunTimestamp();

private:
    struct ScannedCategory
    {
        ExportResult result; // Pending until written
        std::vector<std::filesystem::path> files;
    };

    ScannedCategory scan(const Category& category) const;
    std::filesystem::path archivePathFor(const Category& category, const std::filesystem::path& destinationDir,
                                         const std::string& timestamp) const;
    ExportResult writeArchive(const Category& category, const std::vector<std::filesystem::path>& files,
                              const std::filesystem::path& destinationDir, const std::string& timestamp,
                              ExportProgress& progress, const ProgressCallback& onProgress) const;

    ExportOptions options_;
};

} // namespace backup
