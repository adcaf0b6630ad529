#pragma once

#include "ReportSchema.h"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Column name -> cell position, resolved once from the header row. Column
// order in the document is free; only the names are fixed.
class ColumnIndex {
public:
    static ColumnIndex resolve(std::vector<std::string> const& header);

    std::size_t position(schema::Column c) const { return m_pos[static_cast<std::size_t>(c)]; }
    std::size_t width() const { return m_width; }

private:
    std::array<std::size_t, schema::kColumnCount> m_pos {};
    std::size_t m_width = 0;
};

// Throws ReportFormatError(MissingColumn) for the first absent name.
void requireColumns(std::vector<std::string> const& header,
    std::span<std::string_view const> names);

// One data row of the report. Cells keep their document order; accessors go
// through the column index so callers never deal with positions.
class ReportRow {
public:
    ReportRow() = default;
    ReportRow(std::vector<std::string> cells, ColumnIndex const& columns);

    std::string const& get(schema::Column c) const;
    void set(schema::Column c, std::string value);

    schema::RowStatus status() const { return schema::statusFromString(get(schema::Column::Status)); }
    void setStatus(schema::RowStatus s) { set(schema::Column::Status, std::string(schema::toString(s))); }

    std::string const& url() const { return get(schema::Column::Url); }
    std::string const& precision() const { return get(schema::Column::Precision); }

    // empties every metric column (counts, delta, max_err, psnr, precision)
    void clearMetrics();

    std::vector<std::string> const& cells() const { return m_cells; }

    bool operator==(ReportRow const& other) const { return m_cells == other.m_cells; }

private:
    std::vector<std::string> m_cells;
    ColumnIndex m_columns;
};
