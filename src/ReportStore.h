#pragma once

#include "ReportErrors.h"
#include "ReportRow.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// In-memory image of the report document. Everything outside the table
// (lines before the header, lines after the data region) is kept verbatim.
struct Report {
    std::vector<std::string> lines; // document as loaded
    std::size_t headerIndex = 0;
    std::vector<std::string> header;
    std::string separator;
    std::size_t tableEnd = 0; // first line after the data region
    bool trailingNewline = true;
    bool crlfRows = false; // table lines end in "\r\n"

    ColumnIndex columns;
    std::vector<ReportRow> rows;
};

class ReportStore {
public:
    explicit ReportStore(std::filesystem::path reportPath);

    ReportStore(ReportStore const&) = delete;
    ReportStore& operator=(ReportStore const&) = delete;

    Report load() const;

    // Replaces the report file in one commit; readers see either the old or
    // the new document, never a partial table.
    void write(Report const& report) const;

    std::filesystem::path const& path() const { return m_path; }

    static Report parse(std::string const& text);
    static std::string serialize(Report const& report);

    static std::vector<std::string> splitRow(std::string_view line);
    static std::string formatRow(std::vector<std::string> const& cells);

private:
    std::filesystem::path m_path;
};
