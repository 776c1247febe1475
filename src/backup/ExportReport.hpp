#pragma once

#include "ExportTypes.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace backup
{

struct ExportSummary
{
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;

    static ExportSummary From(const std::vector<ExportResult>& results);
};

// "[OK] bindings.zip (files: 3)", "[SKIPPED] Graphics: no data found", ...
std::string FormatResultLine(const ExportResult& result);

// One line per result, in order
std::string FormatSummary(const std::vector<ExportResult>& results);

// Short status bar text, e.g. "Done: created 2 ZIP file(s), 1 skipped."
std::string FormatStatusLine(const std::vector<ExportResult>& results);

// Keeps the tail of long paths: "..." + last (maxLength - 3) characters
std::string ShortenForDisplay(const std::string& text, std::size_t maxLength = 95);

} // namespace backup
