#include <catch2/catch_test_macros.hpp>
#include "backup/ArchiveExporter.hpp"
#include "backup/ArchiveManifest.hpp"
#include "utils/PathUtils.hpp"
#include "utils/temp_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace backup;
using test_utils::TempDir;
using test_utils::ZipEntry;

namespace {

Category makeCategory(const std::string& name, const fs::path& source, const std::string& basename) {
    return Category{ name, source, basename };
}

std::map<std::string, std::string> readArchive(const fs::path& archive) {
    std::vector<ZipEntry> entries;
    std::string error;
    REQUIRE(test_utils::ReadZip(archive, entries, error));
    std::map<std::string, std::string> out;
    for (auto& e : entries)
        out[e.name] = e.data;
    return out;
}

bool hasTemporaryFiles(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp")
            return true;
    }
    return false;
}

} // namespace

TEST_CASE("ArchiveExporter - Writes every file with relative names", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("src/Custom.4.1.binds", "<Root PresetName=\"Custom\"/>");
    tmp.writeFile("src/StartPreset.4.start", "Custom\nCustom\nCustom\nCustom");
    tmp.writeFile("src/nested/deeper/notes.txt", std::string(2000, 'x'));
    tmp.writeFile("src/empty.bin", "");
    fs::create_directories(tmp / "src/empty_folder");

    ArchiveExporter exporter;
    auto result = exporter.exportCategory(makeCategory("Bindings", tmp / "src", "bindings"), tmp / "out");

    REQUIRE(result.status == ExportStatus::Success);
    REQUIRE(result.error == ExportErrorKind::None);
    REQUIRE(result.entries == 4);
    REQUIRE(result.archive_path == tmp / "out" / "bindings.zip");
    REQUIRE(fs::exists(result.archive_path));

    auto entries = readArchive(result.archive_path);
    REQUIRE(entries.size() == 4);
    REQUIRE(entries.at("Custom.4.1.binds") == "<Root PresetName=\"Custom\"/>");
    REQUIRE(entries.at("StartPreset.4.start") == "Custom\nCustom\nCustom\nCustom");
    REQUIRE(entries.at("nested/deeper/notes.txt") == std::string(2000, 'x'));
    REQUIRE(entries.at("empty.bin").empty());

    SECTION("Large entries are deflated") {
        std::vector<ZipEntry> raw;
        std::string error;
        REQUIRE(test_utils::ReadZip(result.archive_path, raw, error));
        auto it = std::find_if(raw.begin(), raw.end(), [](const ZipEntry& e) {
            return e.name == "nested/deeper/notes.txt";
        });
        REQUIRE(it != raw.end());
        REQUIRE(it->method == 8);
    }

    REQUIRE_FALSE(hasTemporaryFiles(tmp / "out"));
}

TEST_CASE("ArchiveExporter - Binary content survives byte for byte", "[backup][exporter]") {
    TempDir tmp;
    std::string binary;
    for (int i = 0; i < 4096; ++i)
        binary.push_back(static_cast<char>((i * 31) & 0xFF));
    tmp.writeFile("journal/Journal.2024-01-01T000000.01.log", binary);

    ArchiveExporter exporter;
    auto result = exporter.exportCategory(makeCategory("Journal", tmp / "journal", "journal"), tmp / "out");

    REQUIRE(result.succeeded());
    auto entries = readArchive(result.archive_path);
    REQUIRE(entries.at("Journal.2024-01-01T000000.01.log") == binary);
}

TEST_CASE("ArchiveExporter - Missing or empty sources are skipped", "[backup][exporter]") {
    TempDir tmp;
    ArchiveExporter exporter;

    SECTION("Source folder does not exist") {
        auto result = exporter.exportCategory(makeCategory("Graphics", tmp / "nope", "graphics"), tmp / "out");
        REQUIRE(result.status == ExportStatus::Skipped);
        REQUIRE(result.reason == "no data found");
        REQUIRE(result.entries == 0);
        REQUIRE_FALSE(fs::exists(tmp / "out" / "graphics.zip"));
    }

    SECTION("Source folder holds only empty folders") {
        fs::create_directories(tmp / "src/a/b");
        auto result = exporter.exportCategory(makeCategory("Graphics", tmp / "src", "graphics"), tmp / "out");
        REQUIRE(result.status == ExportStatus::Skipped);
        REQUIRE(result.reason == kNoDataReason);
    }

    SECTION("Source path is a file") {
        auto file = tmp.writeFile("Settings.xml", "<GraphicsConfig/>");
        auto result = exporter.exportCategory(makeCategory("Graphics", file, "graphics"), tmp / "out");
        REQUIRE(result.status == ExportStatus::Skipped);
    }

    SECTION("Existing archive is left untouched") {
        auto previous = tmp.writeFile("out/graphics.zip", "previous archive");
        auto result = exporter.exportCategory(makeCategory("Graphics", tmp / "nope", "graphics"), tmp / "out");
        REQUIRE(result.status == ExportStatus::Skipped);
        REQUIRE(test_utils::ReadFile(previous) == "previous archive");
    }
}

TEST_CASE("ArchiveExporter - Bindings present, Graphics absent", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("bindings/Custom.4.1.binds", "a");
    tmp.writeFile("bindings/Custom.3.0.binds", "b");
    tmp.writeFile("bindings/StartPreset.start", "c");

    ExportRequest request;
    request.categories = { makeCategory("Bindings", tmp / "bindings", "bindings"),
                           makeCategory("Graphics", tmp / "graphics", "graphics") };
    request.destination_dir = tmp / "out";

    ArchiveExporter exporter;
    auto results = exporter.exportAll(request);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].category.name == "Bindings");
    REQUIRE(results[0].status == ExportStatus::Success);
    REQUIRE(results[0].entries == 3);
    REQUIRE(results[1].category.name == "Graphics");
    REQUIRE(results[1].status == ExportStatus::Skipped);
    REQUIRE(results[1].reason == "no data found");

    REQUIRE(fs::exists(tmp / "out" / "bindings.zip"));
    REQUIRE_FALSE(fs::exists(tmp / "out" / "graphics.zip"));
}

TEST_CASE("ArchiveExporter - Categories are independent", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("journal/Journal.01.log", "{\"event\":\"Fileheader\"}");
    tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");

    ExportRequest request;
    request.categories = { makeCategory("Journal", tmp / "journal", "journal"),
                           makeCategory("Graphics", tmp / "graphics", "graphics") };
    request.destination_dir = tmp / "out";

    ArchiveExporter exporter;

    SECTION("Two archives side by side") {
        auto results = exporter.exportAll(request);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].succeeded());
        REQUIRE(results[1].succeeded());

        auto journal = readArchive(tmp / "out" / "journal.zip");
        auto graphics = readArchive(tmp / "out" / "graphics.zip");
        REQUIRE(journal.size() == 1);
        REQUIRE(journal.count("Journal.01.log") == 1);
        REQUIRE(graphics.size() == 1);
        REQUIRE(graphics.at("Settings.xml") == "<GraphicsConfig/>");
    }

    SECTION("A failing category does not stop the next one") {
        // A non-empty folder squatting on the archive name makes the final rename fail
        tmp.writeFile("out/journal.zip/blocker", "x");

        auto results = exporter.exportAll(request);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].category.name == "Journal");
        REQUIRE(results[0].status == ExportStatus::Failed);
        REQUIRE(results[0].error == ExportErrorKind::IOError);
        REQUIRE_FALSE(results[0].reason.empty());

        REQUIRE(results[1].status == ExportStatus::Success);
        REQUIRE(readArchive(tmp / "out" / "graphics.zip").size() == 1);
        REQUIRE_FALSE(fs::exists(tmp / "out" / "journal.zip.tmp"));
    }
}

TEST_CASE("ArchiveExporter - Overwrites atomically", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("src/one.txt", "1");
    tmp.writeFile("src/two.txt", "2");
    tmp.writeFile("src/three.txt", "3");
    const auto category = makeCategory("Bindings", tmp / "src", "bindings");
    const auto target = tmp / "out" / "bindings.zip";
    const auto temporary = ArchiveExporter::TemporaryPathFor(target);

    ArchiveExporter exporter;

    SECTION("Target appears only once complete") {
        bool checked = false;
        auto result = exporter.exportCategory(category, tmp / "out", [&](const ExportProgress&) {
            REQUIRE_FALSE(fs::exists(target));
            REQUIRE(fs::exists(temporary));
            checked = true;
        });
        REQUIRE(checked);
        REQUIRE(result.succeeded());
        REQUIRE(fs::exists(target));
        REQUIRE_FALSE(fs::exists(temporary));
    }

    SECTION("Previous archive stays readable until replaced") {
        REQUIRE(exporter.exportCategory(category, tmp / "out").entries == 3);
        tmp.writeFile("src/four.txt", "4");

        std::size_t previous_entries = 0;
        auto result = exporter.exportCategory(category, tmp / "out", [&](const ExportProgress&) {
            previous_entries = readArchive(target).size();
        });

        REQUIRE(previous_entries == 3);
        REQUIRE(result.entries == 4);
        REQUIRE(readArchive(target).size() == 4);
        REQUIRE_FALSE(fs::exists(temporary));
    }

    SECTION("Stale temporary file from an earlier run is replaced") {
        tmp.writeFile("out/bindings.zip.tmp", "garbage");
        auto result = exporter.exportCategory(category, tmp / "out");
        REQUIRE(result.succeeded());
        REQUIRE(readArchive(target).size() == 3);
        REQUIRE_FALSE(fs::exists(temporary));
    }
}

TEST_CASE("ArchiveExporter - Destination handling", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("src/a.txt", "a");
    const auto category = makeCategory("Journal", tmp / "src", "journal");
    ArchiveExporter exporter;

    SECTION("Missing destination folders are created") {
        auto result = exporter.exportCategory(category, tmp / "deep" / "nested" / "out");
        REQUIRE(result.succeeded());
        REQUIRE(fs::exists(tmp / "deep" / "nested" / "out" / "journal.zip"));
    }

    SECTION("Destination that is a file fails with I/O error") {
        auto file = tmp.writeFile("not_a_folder", "x");
        auto result = exporter.exportCategory(category, file);
        REQUIRE(result.status == ExportStatus::Failed);
        REQUIRE(result.error == ExportErrorKind::IOError);
    }
}

TEST_CASE("ArchiveExporter - Permission denied", "[backup][exporter]") {
    TempDir tmp;
    if (!test_utils::PermissionsEnforced(tmp.path()))
        SKIP("File permissions are not enforced for this user");

    tmp.writeFile("journal/Journal.01.log", "j");
    tmp.writeFile("bindings/Custom.binds", "b");

    SECTION("Read-only destination fails every category") {
        fs::create_directories(tmp / "out");
        fs::permissions(tmp / "out", fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

        ExportRequest request;
        request.categories = { makeCategory("Journal", tmp / "journal", "journal"),
                               makeCategory("Bindings", tmp / "bindings", "bindings") };
        request.destination_dir = tmp / "out";

        auto results = ArchiveExporter{}.exportAll(request);
        REQUIRE(results.size() == 2);
        for (const auto& result : results) {
            REQUIRE(result.status == ExportStatus::Failed);
            REQUIRE(result.error == ExportErrorKind::PermissionDenied);
        }

        fs::permissions(tmp / "out", fs::perms::owner_all, fs::perm_options::replace);
        REQUIRE(fs::is_empty(tmp / "out"));
    }

    SECTION("Unreadable source file") {
        auto locked = tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");
        fs::permissions(locked, fs::perms::none, fs::perm_options::replace);

        auto result = ArchiveExporter{}.exportCategory(makeCategory("Graphics", tmp / "graphics", "graphics"),
                                                       tmp / "out");
        REQUIRE(result.status == ExportStatus::Failed);
        REQUIRE(result.error == ExportErrorKind::PermissionDenied);
        REQUIRE_FALSE(fs::exists(tmp / "out" / "graphics.zip"));
        REQUIRE_FALSE(fs::exists(tmp / "out" / "graphics.zip.tmp"));
    }

    SECTION("Source folder that cannot be listed") {
        tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");
        fs::permissions(tmp / "graphics", fs::perms::none, fs::perm_options::replace);

        auto result = ArchiveExporter{}.exportCategory(makeCategory("Graphics", tmp / "graphics", "graphics"),
                                                       tmp / "out");
        REQUIRE(result.status == ExportStatus::Failed);
        REQUIRE(result.error == ExportErrorKind::PermissionDenied);
        REQUIRE_FALSE(fs::exists(tmp / "out"));
    }

    SECTION("Subfolder that cannot be listed stops the whole category") {
        tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");
        tmp.writeFile("graphics/locked/DisplaySettings.xml", "<DisplayConfig/>");
        fs::permissions(tmp / "graphics" / "locked", fs::perms::none, fs::perm_options::replace);

        ExportRequest request;
        request.categories = { makeCategory("Graphics", tmp / "graphics", "graphics"),
                               makeCategory("Bindings", tmp / "bindings", "bindings") };
        request.destination_dir = tmp / "out";

        auto results = ArchiveExporter{}.exportAll(request);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].status == ExportStatus::Failed);
        REQUIRE(results[0].error == ExportErrorKind::PermissionDenied);
        REQUIRE(results[0].entries == 0);
        REQUIRE(results[1].succeeded());

        REQUIRE_FALSE(fs::exists(tmp / "out" / "graphics.zip"));
        REQUIRE_FALSE(hasTemporaryFiles(tmp / "out"));
    }
}

TEST_CASE("ArchiveExporter - Exceptions during a category become failures", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("journal/a.log", "a");
    tmp.writeFile("bindings/b.binds", "b");

    ExportRequest request;
    request.categories = { makeCategory("Journal", tmp / "journal", "journal"),
                           makeCategory("Bindings", tmp / "bindings", "bindings") };
    request.destination_dir = tmp / "out";

    std::vector<ExportResult> results;
    REQUIRE_NOTHROW(results = ArchiveExporter{}.exportAll(request, [](const ExportProgress& p) {
        if (p.current.rfind("Journal: ", 0) == 0)
            throw std::runtime_error("display went away");
    }));

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].status == ExportStatus::Failed);
    REQUIRE(results[0].error == ExportErrorKind::IOError);
    REQUIRE(results[0].reason == "display went away");
    REQUIRE(results[1].succeeded());

    REQUIRE_FALSE(fs::exists(tmp / "out" / "journal.zip"));
    REQUIRE(fs::exists(tmp / "out" / "bindings.zip"));
    REQUIRE_FALSE(hasTemporaryFiles(tmp / "out"));
}

TEST_CASE("ArchiveExporter - Non-ASCII folder names", "[backup][exporter]") {
    TempDir tmp;
    const std::string user = "\xE6\x9D\x8E\xE9\x9B\xB7"; // 李雷
    const fs::path source = tmp.path() / utils::Utf8ToPath(user) / "Saved Games";
    const fs::path destination = tmp.path() / utils::Utf8ToPath("Sauvegarde \xC3\xA9t\xC3\xA9");
    fs::create_directories(source);
    std::ofstream(source / "Journal.01.log", std::ios::binary) << "{}";

    auto result = ArchiveExporter{}.exportCategory(makeCategory("Journal", source, "journal"), destination);

    REQUIRE(result.status == ExportStatus::Success);
    REQUIRE(result.entries == 1);
    REQUIRE(result.archive_path == destination / "journal.zip");
    REQUIRE(readArchive(result.archive_path).count("Journal.01.log") == 1);
}

TEST_CASE("ArchiveExporter - Progress", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("journal/a.log", "a");
    tmp.writeFile("journal/b.log", "b");
    tmp.writeFile("bindings/c.binds", "c");

    ExportRequest request;
    request.categories = { makeCategory("Journal", tmp / "journal", "journal"),
                           makeCategory("Graphics", tmp / "graphics", "graphics"),
                           makeCategory("Bindings", tmp / "bindings", "bindings") };
    request.destination_dir = tmp / "out";

    std::vector<ExportProgress> seen;
    ArchiveExporter{}.exportAll(request, [&](const ExportProgress& p) { seen.push_back(p); });

    REQUIRE(seen.size() == 3);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        REQUIRE(seen[i].total == 3);
        REQUIRE(seen[i].done == i + 1);
    }
    REQUIRE(seen.front().current.rfind("Journal: ", 0) == 0);
    REQUIRE(seen.back().current.rfind("Bindings: ", 0) == 0);
    REQUIRE(seen.back().fraction() == 1.0f);
}

TEST_CASE("ArchiveExporter - Optional features", "[backup][exporter]") {
    TempDir tmp;
    tmp.writeFile("src/Settings.xml", "<GraphicsConfig/>");
    tmp.writeFile("src/DisplaySettings.xml", "<DisplayConfig/>");
    const auto category = makeCategory("Graphics", tmp / "src", "graphics");

    SECTION("Manifest entry is added but not counted") {
        ExportOptions options;
        options.include_manifest = true;
        auto result = ArchiveExporter(options).exportCategory(category, tmp / "out");

        REQUIRE(result.succeeded());
        REQUIRE(result.entries == 2);

        auto entries = readArchive(result.archive_path);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries.count(kManifestEntryName) == 1);

        ArchiveManifest manifest;
        std::string error;
        REQUIRE(ArchiveManifest::FromJson(entries.at(kManifestEntryName), manifest, error));
        REQUIRE(manifest.backup_type == "Graphics");
        REQUIRE(manifest.files == 2);
        REQUIRE_FALSE(manifest.created_at.empty());
    }

    SECTION("Timestamped names share one timestamp per request") {
        tmp.writeFile("other/x.binds", "x");
        ExportOptions options;
        options.timestamped_names = true;
        options.timestamp = "2024-05-06_07-08-09";

        ExportRequest request;
        request.categories = { category, makeCategory("Bindings", tmp / "other", "bindings") };
        request.destination_dir = tmp / "out";

        auto results = ArchiveExporter(options).exportAll(request);
        REQUIRE(results[0].archive_path == tmp / "out" / "graphics_2024-05-06_07-08-09.zip");
        REQUIRE(results[1].archive_path == tmp / "out" / "bindings_2024-05-06_07-08-09.zip");
        REQUIRE(fs::exists(results[0].archive_path));
        REQUIRE(fs::exists(results[1].archive_path));
    }

    SECTION("Generated timestamp format") {
        auto stamp = ArchiveExporter::MakeRunTimestamp();
        REQUIRE(stamp.size() == 19);
        REQUIRE(stamp[4] == '-');
        REQUIRE(stamp[10] == '_');
        REQUIRE(stamp[13] == '-');
    }
}

TEST_CASE("ArchiveExporter - Helpers", "[backup][exporter]") {
    TempDir tmp;

    SECTION("Entry names use forward slashes") {
        REQUIRE(ArchiveExporter::EntryNameFor(tmp.path(), tmp / "a" / "b" / "c.txt") == "a/b/c.txt");
    }

    SECTION("Collected files are sorted and exclude folders") {
        tmp.writeFile("b.txt", "");
        tmp.writeFile("a/z.txt", "");
        fs::create_directories(tmp / "c");

        std::error_code ec;
        auto files = ArchiveExporter::CollectFiles(tmp.path(), ec);
        REQUIRE_FALSE(ec);
        REQUIRE(files.size() == 2);
        REQUIRE(files[0] == tmp / "a" / "z.txt");
        REQUIRE(files[1] == tmp / "b.txt");
    }

    SECTION("Absent root is not an error") {
        std::error_code ec;
        REQUIRE(ArchiveExporter::CollectFiles(tmp / "missing" / "deeper", ec).empty());
        REQUIRE_FALSE(ec);
    }
}
