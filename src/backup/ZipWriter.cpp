#include "ZipWriter.hpp"
#include "utils/PathUtils.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#include <miniz.h>

#include <cerrno>
#include <cstdio>

namespace fs = std::filesystem;

namespace backup
{

struct ZipWriter::Impl
{
    mz_zip_archive zip{};
    std::FILE* file = nullptr;
    bool writer_active = false;

    void close()
    {
        if (writer_active)
        {
            mz_zip_writer_end(&zip);
            writer_active = false;
        }
        if (file)
        {
            std::fclose(file);
            file = nullptr;
        }
    }
};

namespace
{

std::FILE* openForWrite(const fs::path& path)
{
#ifdef _WIN32
    return _wfopen(path.c_str(), L"wb");
#else
    return std::fopen(path.c_str(), "wb");
#endif
}

std::string minizError(mz_zip_archive& zip) { return mz_zip_get_error_string(mz_zip_get_last_error(&zip)); }

} // namespace

ZipWriter::ZipWriter()
    : impl_(std::make_unique<Impl>())
{
}

ZipWriter::~ZipWriter()
{
    if (isOpen())
    {
        PLOG_WARNING << "ZipWriter destroyed before finalize, discarding " << utils::PathToUtf8(path_);
        abort();
    }
}

bool ZipWriter::isOpen() const { return impl_->file != nullptr; }

void ZipWriter::fail(const std::string& what, std::string& outError)
{
    outError = what;
    PLOG_ERROR << outError;
}

bool ZipWriter::open(const fs::path& path, std::string& outError)
{
    if (isOpen())
    {
        fail("ZIP writer already open: " + utils::PathToUtf8(path_), outError);
        return false;
    }

    path_ = path;
    entry_count_ = 0;
    last_error_code_.clear();

    errno = 0;
    impl_->file = openForWrite(path);
    if (!impl_->file)
    {
        last_error_code_ = std::error_code(errno ? errno : EIO, std::generic_category());
        fail("Failed to create ZIP file: " + utils::PathToUtf8(path) + " (" + last_error_code_.message() + ")", outError);
        return false;
    }

    impl_->zip = mz_zip_archive{};
    if (!mz_zip_writer_init_cfile(&impl_->zip, impl_->file, 0))
    {
        fail("Failed to initialize ZIP writer: " + minizError(impl_->zip), outError);
        last_error_code_ = std::make_error_code(std::errc::io_error);
        impl_->close();
        std::error_code ec;
        fs::remove(path, ec);
        return false;
    }
    impl_->writer_active = true;

    PLOG_DEBUG << "Opened ZIP for writing: " << utils::PathToUtf8(path);
    return true;
}

bool ZipWriter::addMemory(const std::string& entryName, const void* data, std::size_t size, std::time_t modified,
                          std::string& outError)
{
    if (!impl_->writer_active)
    {
        fail("ZIP writer is not open", outError);
        return false;
    }

    MZ_TIME_T mtime = modified;
    errno = 0;
    if (!mz_zip_writer_add_mem_ex_v2(&impl_->zip, entryName.c_str(), data, size, nullptr, 0, MZ_DEFAULT_LEVEL, 0, 0,
                                     &mtime, nullptr, 0, nullptr, 0))
    {
        int err = errno;
        last_error_code_ = err ? std::error_code(err, std::generic_category())
                               : std::make_error_code(std::errc::io_error);
        fail("Failed to add '" + entryName + "' to ZIP: " + minizError(impl_->zip), outError);
        return false;
    }

    ++entry_count_;
    return true;
}

bool ZipWriter::addString(const std::string& entryName, const std::string& content, std::string& outError)
{
    return addMemory(entryName, content.data(), content.size(), std::time(nullptr), outError);
}

bool ZipWriter::finalize(std::string& outError)
{
    if (!impl_->writer_active)
    {
        fail("ZIP writer is not open", outError);
        return false;
    }

    errno = 0;
    bool ok = mz_zip_writer_finalize_archive(&impl_->zip) != 0;
    if (!ok)
    {
        int err = errno;
        last_error_code_ = err ? std::error_code(err, std::generic_category())
                               : std::make_error_code(std::errc::io_error);
        fail("Failed to finalize ZIP: " + minizError(impl_->zip), outError);
    }

    mz_zip_writer_end(&impl_->zip);
    impl_->writer_active = false;

    errno = 0;
    if (std::fclose(impl_->file) != 0 && ok)
    {
        int err = errno;
        last_error_code_ = err ? std::error_code(err, std::generic_category())
                               : std::make_error_code(std::errc::io_error);
        fail("Failed to flush ZIP file: " + utils::PathToUtf8(path_) + " (" + last_error_code_.message() + ")", outError);
        ok = false;
    }
    impl_->file = nullptr;

    if (!ok)
    {
        std::error_code ec;
        fs::remove(path_, ec);
        return false;
    }

    PLOG_DEBUG << "Finalized ZIP " << utils::PathToUtf8(path_) << " with " << entry_count_ << " entries";
    return true;
}

void ZipWriter::abort()
{
    impl_->close();
    std::error_code ec;
    if (!path_.empty() && fs::remove(path_, ec))
    {
        PLOG_DEBUG << "Removed partial ZIP: " << utils::PathToUtf8(path_);
    }
    else if (ec)
    {
        PLOG_WARNING << "Could not remove partial ZIP " << utils::PathToUtf8(path_) << ": " << ec.message();
    }
}

} // namespace backup
