#include "ArchiveExporter.hpp"
#include "ArchiveManifest.hpp"
#include "ZipWriter.hpp"
#include "utils/PathUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace backup
{

namespace
{

std::time_t toTimeT(fs::file_time_type ftime)
{
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(sctp);
}

bool readWholeFile(const fs::path& path, std::string& outData, std::error_code& outEc)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        outEc = std::error_code(errno ? errno : EIO, std::generic_category());
        return false;
    }

    outData.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        outEc = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

std::string describe(const std::string& what, const std::error_code& ec)
{
    return what + ": " + ec.message();
}

} // namespace

ArchiveExporter::ArchiveExporter(ExportOptions options)
    : options_(std::move(options))
{
}

std::string ArchiveExporter::MakeRunTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d_%H-%M-%S");
    return ss.str();
}

fs::path ArchiveExporter::archivePathFor(const Category& category, const fs::path& destinationDir) const
{
    return archivePathFor(category, destinationDir,
                          options_.timestamp.empty() ? MakeRunTimestamp() : options_.timestamp);
}

fs::path ArchiveExporter::archivePathFor(const Category& category, const fs::path& destinationDir,
                                         const std::string& timestamp) const
{
    std::string name = category.archive_basename;
    if (options_.timestamped_names)
        name += "_" + timestamp;
    return destinationDir / utils::Utf8ToPath(name + ".zip");
}

fs::path ArchiveExporter::TemporaryPathFor(const fs::path& archivePath)
{
    fs::path tmp = archivePath;
    tmp += ".tmp";
    return tmp;
}

std::string ArchiveExporter::EntryNameFor(const fs::path& root, const fs::path& file)
{
    return utils::PathToGenericUtf8(file.lexically_relative(root));
}

std::vector<fs::path> ArchiveExporter::CollectFiles(const fs::path& root, std::error_code& ec)
{
    std::vector<fs::path> files;
    ec.clear();

    if (root.empty())
        return files;

    bool is_dir = fs::is_directory(root, ec);
    if (ec)
    {
        // A missing folder (or missing parent) simply means no data
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            ec.clear();
        return files;
    }
    if (!is_dir)
        return files;

    fs::recursive_directory_iterator it(root, ec);
    if (ec)
        return files;

    for (; it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        if (ec)
            return {};

        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
            files.push_back(it->path());
    }
    if (ec)
        return {};

    std::sort(files.begin(), files.end());
    return files;
}

ArchiveExporter::ScannedCategory ArchiveExporter::scan(const Category& category) const
{
    ScannedCategory scanned;
    scanned.result.category = category;

    std::error_code ec;
    scanned.files = CollectFiles(category.source_path, ec);
    if (ec)
    {
        PLOG_ERROR << "Cannot read " << category.name << " source '" << utils::PathToUtf8(category.source_path)
                   << "': " << ec.message();
        scanned.result = ExportResult::Failed(category, ClassifyError(ec),
                                              describe("Cannot read " + utils::PathToUtf8(category.source_path), ec));
        return scanned;
    }

    if (scanned.files.empty())
    {
        PLOG_INFO << "Skipping " << category.name << ": no files under '" << utils::PathToUtf8(category.source_path) << "'";
        scanned.result = ExportResult::Skipped(category);
    }
    return scanned;
}

ExportResult ArchiveExporter::exportCategory(const Category& category, const fs::path& destinationDir,
                                             const ProgressCallback& onProgress) const
{
    ExportRequest request{ { category }, destinationDir };
    return exportAll(request, onProgress).front();
}

std::vector<ExportResult> ArchiveExporter::exportAll(const ExportRequest& request,
                                                     const ProgressCallback& onProgress) const
{
    PLOG_INFO << "Export of " << request.categories.size() << " categories to '"
              << utils::PathToUtf8(request.destination_dir) << "'";

    std::vector<ScannedCategory> scanned;
    scanned.reserve(request.categories.size());
    ExportProgress progress;
    for (const auto& category : request.categories)
    {
        try
        {
            scanned.push_back(scan(category));
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "Error scanning " << category.name << ": " << e.what();
            ScannedCategory failed;
            failed.result = ExportResult::Failed(category, ExportErrorKind::IOError, e.what());
            scanned.push_back(std::move(failed));
            continue;
        }
        if (scanned.back().result.status == ExportStatus::Pending)
            progress.total += scanned.back().files.size();
    }

    std::string timestamp = options_.timestamp;
    if (options_.timestamped_names && timestamp.empty())
        timestamp = MakeRunTimestamp();

    std::vector<ExportResult> results;
    results.reserve(scanned.size());
    for (auto& entry : scanned)
    {
        if (entry.result.status != ExportStatus::Pending)
        {
            results.push_back(std::move(entry.result));
            continue;
        }

        try
        {
            results.push_back(writeArchive(entry.result.category, entry.files, request.destination_dir, timestamp,
                                           progress, onProgress));
        }
        catch (const fs::filesystem_error& e)
        {
            PLOG_ERROR << "Filesystem error exporting " << entry.result.category.name << ": " << e.what();
            results.push_back(ExportResult::Failed(entry.result.category, ClassifyError(e.code()), e.what()));
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "Error exporting " << entry.result.category.name << ": " << e.what();
            results.push_back(ExportResult::Failed(entry.result.category, ExportErrorKind::IOError, e.what()));
        }
    }

    for (const auto& result : results)
    {
        PLOG_INFO << result.category.name << ": " << ToString(result.status)
                  << (result.reason.empty() ? "" : " (" + result.reason + ")");
    }
    return results;
}

ExportResult ArchiveExporter::writeArchive(const Category& category, const std::vector<fs::path>& files,
                                           const fs::path& destinationDir, const std::string& timestamp,
                                           ExportProgress& progress, const ProgressCallback& onProgress) const
{
    std::error_code ec;
    fs::create_directories(destinationDir, ec);
    if (ec)
    {
        PLOG_ERROR << "Cannot create destination '" << utils::PathToUtf8(destinationDir) << "': " << ec.message();
        return ExportResult::Failed(category, ClassifyError(ec),
                                    describe("Cannot create " + utils::PathToUtf8(destinationDir), ec));
    }

    const fs::path archive_path = archivePathFor(category, destinationDir, timestamp);
    const fs::path tmp_path = TemporaryPathFor(archive_path);

    // Stale leftovers from an interrupted run
    fs::remove(tmp_path, ec);
    ec.clear();

    ZipWriter writer;
    std::string error;
    if (!writer.open(tmp_path, error))
        return ExportResult::Failed(category, ClassifyError(writer.lastErrorCode()), error);

    std::string data;
    for (const auto& file : files)
    {
        const std::string entry_name = EntryNameFor(category.source_path, file);

        if (!readWholeFile(file, data, ec))
        {
            PLOG_ERROR << "Cannot read '" << utils::PathToUtf8(file) << "': " << ec.message();
            writer.abort();
            return ExportResult::Failed(category, ClassifyError(ec), describe("Cannot read " + utils::PathToUtf8(file), ec));
        }

        std::error_code time_ec;
        auto mtime = fs::last_write_time(file, time_ec);
        std::time_t modified = time_ec ? std::time(nullptr) : toTimeT(mtime);

        if (!writer.addMemory(entry_name, data.data(), data.size(), modified, error))
        {
            ExportErrorKind kind = ClassifyError(writer.lastErrorCode());
            writer.abort();
            return ExportResult::Failed(category, kind, error);
        }

        ++progress.done;
        if (onProgress)
        {
            progress.current = category.name + ": " + utils::PathToUtf8(file);
            onProgress(progress);
        }
    }

    const std::size_t entries = writer.entryCount();

    if (options_.include_manifest)
    {
        auto manifest = ArchiveManifest::ForCategory(category, entries);
        if (!writer.addString(kManifestEntryName, manifest.toJson(), error))
        {
            ExportErrorKind kind = ClassifyError(writer.lastErrorCode());
            writer.abort();
            return ExportResult::Failed(category, kind, error);
        }
    }

    if (!writer.finalize(error))
        return ExportResult::Failed(category, ClassifyError(writer.lastErrorCode()), error);

    fs::rename(tmp_path, archive_path, ec);
    if (ec)
    {
        PLOG_ERROR << "Cannot move archive into place '" << utils::PathToUtf8(archive_path) << "': " << ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return ExportResult::Failed(category, ClassifyError(ec),
                                    describe("Cannot write " + utils::PathToUtf8(archive_path), ec));
    }

    PLOG_INFO << "Wrote " << utils::PathToUtf8(archive_path) << " (" << entries << " files)";
    return ExportResult::Success(category, entries, archive_path);
}

} // namespace backup
