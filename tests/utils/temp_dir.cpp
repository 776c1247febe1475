#include "temp_dir.hpp"
#include "utils/PathUtils.hpp"

#include <miniz.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <random>

namespace fs = std::filesystem;

namespace test_utils {

namespace {

std::string uniqueSuffix() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(ticks) + "_" + std::to_string(rd()) + "_" + std::to_string(counter++);
}

} // namespace

TempDir::TempDir()
    : path_(fs::temp_directory_path() / ("edbackup_test_" + uniqueSuffix())) {
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    // Tests may leave read-only folders behind
    for (auto it = fs::recursive_directory_iterator(path_, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code perm_ec;
        fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
    }
    fs::remove_all(path_, ec);
}

fs::path TempDir::writeFile(const std::string& relative, const std::string& content) const {
    fs::path file = path_ / fs::path(relative);
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
}

bool ReadZip(const fs::path& archive, std::vector<ZipEntry>& outEntries, std::string& outError) {
    outEntries.clear();

    mz_zip_archive zip{};
    if (!mz_zip_reader_init_file(&zip, utils::PathToUtf8(archive).c_str(), 0)) {
        outError = std::string("cannot open archive: ") + mz_zip_get_error_string(mz_zip_get_last_error(&zip));
        return false;
    }

    bool ok = true;
    const mz_uint count = mz_zip_reader_get_num_files(&zip);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat st{};
        if (!mz_zip_reader_file_stat(&zip, i, &st)) {
            outError = "cannot stat entry " + std::to_string(i);
            ok = false;
            break;
        }

        size_t size = 0;
        void* data = mz_zip_reader_extract_to_heap(&zip, i, &size, 0);
        if (!data && st.m_uncomp_size != 0) {
            outError = std::string("cannot extract ") + st.m_filename;
            ok = false;
            break;
        }

        ZipEntry entry;
        entry.name = st.m_filename;
        entry.method = st.m_method;
        if (data) {
            entry.data.assign(static_cast<const char*>(data), size);
            mz_free(data);
        }
        outEntries.push_back(std::move(entry));
    }

    mz_zip_reader_end(&zip);
    return ok;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool PermissionsEnforced(const fs::path& scratchDir) {
    fs::path probe_dir = scratchDir / "perm_probe";
    fs::create_directories(probe_dir);
    fs::permissions(probe_dir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    fs::path probe = probe_dir / "probe.txt";
    bool writable = false; {
        std::ofstream out(probe);
        writable = static_cast<bool>(out);
    }

    std::error_code ec;
    fs::permissions(probe_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    fs::remove_all(probe_dir, ec);
    return !writable;
}

} // namespace test_utils
