#include "ReportRow.h"
#include "ReportErrors.h"

#include <algorithm>

void requireColumns(std::vector<std::string> const& header,
    std::span<std::string_view const> names)
{
    for (auto const& name : names) {
        if (std::find(header.begin(), header.end(), name) == header.end()) {
            throw ReportFormatError(ReportFormatError::Kind::MissingColumn,
                "report table is missing column: " + std::string(name),
                std::string(name));
        }
    }
}

ColumnIndex ColumnIndex::resolve(std::vector<std::string> const& header)
{
    requireColumns(header, schema::kColumnNames);

    ColumnIndex idx;
    idx.m_width = header.size();
    for (std::size_t c = 0; c < schema::kColumnCount; ++c) {
        auto it = std::find(header.begin(), header.end(), schema::kColumnNames[c]);
        idx.m_pos[c] = static_cast<std::size_t>(std::distance(header.begin(), it));
    }
    return idx;
}

ReportRow::ReportRow(std::vector<std::string> cells, ColumnIndex const& columns)
    : m_cells(std::move(cells))
    , m_columns(columns)
{
}

std::string const& ReportRow::get(schema::Column c) const
{
    static std::string const empty;
    auto pos = m_columns.position(c);
    return pos < m_cells.size() ? m_cells[pos] : empty;
}

void ReportRow::set(schema::Column c, std::string value)
{
    auto pos = m_columns.position(c);
    if (pos >= m_cells.size())
        m_cells.resize(std::max(pos + 1, m_columns.width()));
    m_cells[pos] = std::move(value);
}

void ReportRow::clearMetrics()
{
    using enum schema::Column;
    for (auto c : { DecoderCount, ReferenceCount, CountDelta, MaxErr, Psnr, Precision })
        set(c, {});
}
