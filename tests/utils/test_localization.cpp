#include <catch2/catch_test_macros.hpp>
#include "ui/Localization.hpp"
#include "temp_dir.hpp"

TEST_CASE("Localization - Lookup and formatting", "[utils][i18n]") {
    test_utils::TempDir tmp;
    tmp.writeFile("i18n/en.toml", "[backup.status]\nready = \"Ready.\"\n\n"
                                  "[backup.progress]\nfile = \"{done}/{total}  {current}\"\n");
    i18n::init_from((tmp / "i18n").string(), "en");

    REQUIRE(i18n::current_language() == "en");
    REQUIRE(i18n::get_str("backup.status.ready") == "Ready.");
    REQUIRE(std::string(i18n::get("backup.status.ready")) == "Ready.");

    SECTION("Unknown keys fall back to the key") {
        REQUIRE(i18n::get_str("backup.nope") == "backup.nope");
    }

    SECTION("Named placeholders") {
        auto text = i18n::format("backup.progress.file", { { "done", "2" }, { "total", "5" }, { "current", "a.log" } });
        REQUIRE(text == "2/5  a.log");

        auto partial = i18n::format("backup.progress.file", { { "done", "2" } });
        REQUIRE(partial == "2/{total}  {current}");
    }

    SECTION("Missing language keeps English") {
        i18n::init_from((tmp / "i18n").string(), "xx");
        REQUIRE(i18n::get_str("backup.status.ready") == "Ready.");
    }
}
