#include <catch2/catch_test_macros.hpp>
#include "backup/ExportService.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/temp_dir.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace backup;
using test_utils::TempDir;

TEST_CASE("ExportService - Runs a request in the background", "[backup][service]") {
    TempDir tmp;
    tmp.writeFile("bindings/a.binds", "a");
    tmp.writeFile("bindings/b.binds", "b");

    ExportRequest request;
    request.categories = { Category{ "Bindings", tmp / "bindings", "bindings" },
                           Category{ "Graphics", tmp / "graphics", "graphics" } };
    request.destination_dir = tmp / "out";

    ExportService service;
    REQUIRE(service.getState() == ExportState::Idle);

    std::vector<ExportResult> delivered;
    REQUIRE(service.start(request, {}, [&](const std::vector<ExportResult>& results) { delivered = results; }));
    service.wait();

    REQUIRE(service.getState() == ExportState::Completed);
    REQUIRE_FALSE(service.isRunning());

    auto results = service.getResults();
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].status == ExportStatus::Success);
    REQUIRE(results[0].entries == 2);
    REQUIRE(results[1].status == ExportStatus::Skipped);
    REQUIRE(delivered.size() == 2);

    auto progress = service.getProgress();
    REQUIRE(progress.total == 2);
    REQUIRE(progress.done == 2);

    SECTION("Acknowledge returns to idle") {
        service.acknowledge();
        REQUIRE(service.getState() == ExportState::Idle);
        service.acknowledge();
        REQUIRE(service.getState() == ExportState::Idle);
    }

    SECTION("A finished service accepts the next request") {
        tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");
        REQUIRE(service.start(request, {}));
        service.wait();
        auto second = service.getResults();
        REQUIRE(second.size() == 2);
        REQUIRE(second[1].status == ExportStatus::Success);
        REQUIRE(fs::exists(tmp / "out" / "graphics.zip"));
    }
}

TEST_CASE("ExportService - Shutdown without work", "[backup][service]") {
    ExportService service;
    service.shutdown();
    service.wait();
    REQUIRE(service.getState() == ExportState::Idle);
}

TEST_CASE("ExportService - Completion handler that throws", "[backup][service]") {
    TempDir tmp;
    tmp.writeFile("graphics/Settings.xml", "<GraphicsConfig/>");

    ExportRequest request;
    request.categories = { Category{ "Graphics", tmp / "graphics", "graphics" } };
    request.destination_dir = tmp / "out";

    utils::ErrorReporter::ClearErrors();
    ExportService service;
    REQUIRE(service.start(request, {}, [](const std::vector<ExportResult>&) {
        throw std::runtime_error("listener gone");
    }));
    service.wait();

    REQUIRE(service.getState() == ExportState::Completed);
    auto results = service.getResults();
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].succeeded());

    auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Export);
    REQUIRE(reports[0].technical_details == "listener gone");
}
