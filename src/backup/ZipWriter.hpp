#pragma once

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace backup
{

// Streams entries into a new deflate-compressed ZIP file using miniz.
// The file handle is owned for the writer's lifetime; a writer destroyed
// without finalize() discards what it wrote.
class ZipWriter
{
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Creates (truncates) the file at path
    bool open(const std::filesystem::path& path, std::string& outError);

    bool addMemory(const std::string& entryName, const void* data, std::size_t size, std::time_t modified,
                   std::string& outError);
    bool addString(const std::string& entryName, const std::string& content, std::string& outError);

    // Writes the central directory and closes the file
    bool finalize(std::string& outError);

    // Closes and deletes a partially written file
    void abort();

    bool isOpen() const;
    std::size_t entryCount() const { return entry_count_; }
    const std::filesystem::path& path() const { return path_; }

    // OS error behind the last failure, if one was available
    std::error_code lastErrorCode() const { return last_error_code_; }

private:
    void fail(const std::string& what, std::string& outError);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::filesystem::path path_;
    std::size_t entry_count_ = 0;
    std::error_code last_error_code_;
};

} // namespace backup
