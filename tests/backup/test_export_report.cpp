#include <catch2/catch_test_macros.hpp>
#include "backup/ExportReport.hpp"

#include <system_error>

using namespace backup;

namespace {

const Category kBindings{ "Bindings", "/data/bindings", "bindings" };
const Category kGraphics{ "Graphics", "/data/graphics", "graphics" };
const Category kJournal{ "Journal", "/data/journal", "journal" };

} // namespace

TEST_CASE("ExportReport - Result lines", "[backup][report]") {
    SECTION("Success names the archive and file count") {
        auto result = ExportResult::Success(kBindings, 3, "/out/bindings.zip");
        REQUIRE(FormatResultLine(result) == "[OK] bindings.zip (files: 3)");
    }

    SECTION("Skipped carries the reason") {
        REQUIRE(FormatResultLine(ExportResult::Skipped(kGraphics)) == "[SKIPPED] Graphics: no data found");
    }

    SECTION("Failures name the error kind") {
        auto denied = ExportResult::Failed(kJournal, ExportErrorKind::PermissionDenied, "Cannot create /out");
        REQUIRE(FormatResultLine(denied) == "[FAILED] Journal: permission denied (Cannot create /out)");

        auto io = ExportResult::Failed(kJournal, ExportErrorKind::IOError, "");
        REQUIRE(FormatResultLine(io) == "[FAILED] Journal: I/O error");
    }

    SECTION("Failed without a kind becomes an I/O error") {
        REQUIRE(ExportResult::Failed(kJournal, ExportErrorKind::None, "x").error == ExportErrorKind::IOError);
    }
}

TEST_CASE("ExportReport - Summary and status", "[backup][report]") {
    std::vector<ExportResult> results = {
        ExportResult::Success(kBindings, 3, "/out/bindings.zip"),
        ExportResult::Skipped(kGraphics),
        ExportResult::Failed(kJournal, ExportErrorKind::IOError, "disk full"),
    };

    auto summary = ExportSummary::From(results);
    REQUIRE(summary.succeeded == 1);
    REQUIRE(summary.skipped == 1);
    REQUIRE(summary.failed == 1);

    REQUIRE(FormatSummary(results) ==
            "[OK] bindings.zip (files: 3)\n"
            "[SKIPPED] Graphics: no data found\n"
            "[FAILED] Journal: I/O error (disk full)");
    REQUIRE(FormatStatusLine(results) == "Done: created 1 ZIP file(s), 1 skipped, 1 failed.");
    REQUIRE(FormatStatusLine({ results[0] }) == "Done: created 1 ZIP file(s).");
    REQUIRE(FormatSummary({}).empty());
}

TEST_CASE("ExportReport - Shortening long paths", "[backup][report]") {
    const std::string shortText = "Journal: C:/Users/cmdr/Journal.log";
    REQUIRE(ShortenForDisplay(shortText) == shortText);

    const std::string longText = "Journal: " + std::string(200, 'a') + "/Journal.2024-01-01T000000.01.log";
    auto shortened = ShortenForDisplay(longText);
    REQUIRE(shortened.size() == 95);
    REQUIRE(shortened.rfind("...", 0) == 0);
    REQUIRE(shortened.substr(shortened.size() - 10) == longText.substr(longText.size() - 10));
}

TEST_CASE("ExportTypes - Error classification", "[backup][report]") {
    REQUIRE(ClassifyError({}) == ExportErrorKind::None);
    REQUIRE(ClassifyError(std::make_error_code(std::errc::permission_denied)) == ExportErrorKind::PermissionDenied);
    REQUIRE(ClassifyError(std::make_error_code(std::errc::read_only_file_system)) ==
            ExportErrorKind::PermissionDenied);
    REQUIRE(ClassifyError(std::make_error_code(std::errc::no_space_on_device)) == ExportErrorKind::IOError);
    REQUIRE(ClassifyError(std::make_error_code(std::errc::is_a_directory)) == ExportErrorKind::IOError);

    ExportProgress progress;
    REQUIRE(progress.fraction() == 0.0f);
    progress.total = 4;
    progress.done = 1;
    REQUIRE(progress.fraction() == 0.25f);
}
