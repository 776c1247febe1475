#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - Queue", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportWarning(ErrorCategory::ProcessDetection, "Process scan failed", "/proc unreadable");
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "SDL failed");
    REQUIRE(ErrorReporter::HasPendingErrors());

    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].severity == ErrorSeverity::Warning);
    REQUIRE(errors[0].technical_details == "/proc unreadable");
    REQUIRE_FALSE(errors[0].is_fatal);
    REQUIRE(errors[1].is_fatal);
    REQUIRE(errors[1].timestamp.size() == 19);
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    SECTION("Oldest reports are dropped when the queue is full") {
        for (int i = 0; i < 150; ++i)
            ErrorReporter::ReportError(ErrorCategory::Export, "report " + std::to_string(i));

        auto pending = ErrorReporter::GetPendingErrors();
        REQUIRE(pending.size() == 100);
        REQUIRE(pending.front().user_message == "report 50");
        REQUIRE(pending.back().user_message == "report 149");
    }

    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Export) == "Export");
}
