#include "ReportStore.h"
#include "ReportSchema.h"

#include <QSaveFile>
#include <QString>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {

std::string_view trim(std::string_view s)
{
    auto const ws = " \t\r\n\v\f";
    auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos)
        return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitLines(std::string const& text, bool& trailingNewline)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    trailingNewline = text.empty() || text.back() == '\n';
    return lines;
}

} // namespace

ReportStore::ReportStore(std::filesystem::path reportPath)
    : m_path(std::move(reportPath))
{
}

std::vector<std::string> ReportStore::splitRow(std::string_view line)
{
    line = trim(line);

    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        auto bar = line.find('|', start);
        parts.emplace_back(trim(line.substr(start, bar == std::string_view::npos ? std::string_view::npos : bar - start)));
        if (bar == std::string_view::npos)
            break;
        start = bar + 1;
    }

    // "| a | b |" splits into "", a, b, "" - drop the outer empties
    if (parts.size() < 3)
        return {};
    return { std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end() - 1) };
}

std::string ReportStore::formatRow(std::vector<std::string> const& cells)
{
    std::string out = "| ";
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i)
            out += " | ";
        out += cells[i];
    }
    out += " |";
    return out;
}

Report ReportStore::parse(std::string const& text)
{
    Report r;
    r.lines = splitLines(text, r.trailingNewline);

    auto hdr = std::find_if(r.lines.begin(), r.lines.end(), [](std::string const& l) {
        return l.starts_with(schema::kHeaderPrefix);
    });
    if (hdr == r.lines.end()) {
        throw ReportFormatError(ReportFormatError::Kind::MissingHeader,
            "report table header is missing (expected a line starting with '"
                + std::string(schema::kHeaderPrefix) + "')");
    }
    r.headerIndex = static_cast<std::size_t>(std::distance(r.lines.begin(), hdr));

    if (r.headerIndex + 1 >= r.lines.size()
        || !r.lines[r.headerIndex + 1].starts_with(schema::kSeparatorPrefix)) {
        throw ReportFormatError(ReportFormatError::Kind::MissingSeparator,
            "report table separator is missing after the header");
    }

    r.crlfRows = r.lines[r.headerIndex].ends_with('\r');
    r.header = splitRow(r.lines[r.headerIndex]);
    r.separator = r.lines[r.headerIndex + 1];
    r.columns = ColumnIndex::resolve(r.header);

    std::size_t i = r.headerIndex + 2;
    for (; i < r.lines.size(); ++i) {
        if (!r.lines[i].starts_with('|'))
            break;
        auto cells = splitRow(r.lines[i]);
        if (!cells.empty())
            r.rows.emplace_back(std::move(cells), r.columns);
    }
    r.tableEnd = i;
    return r;
}

std::string ReportStore::serialize(Report const& report)
{
    std::vector<std::string_view> out;
    out.reserve(report.lines.size() + report.rows.size());

    std::vector<std::string> formatted;
    formatted.reserve(report.rows.size());
    for (auto const& row : report.rows) {
        formatted.push_back(formatRow(row.cells()));
        if (report.crlfRows)
            formatted.back() += '\r';
    }

    for (std::size_t i = 0; i < report.headerIndex; ++i)
        out.emplace_back(report.lines[i]);
    out.emplace_back(report.lines[report.headerIndex]);
    out.emplace_back(report.separator);
    for (auto const& f : formatted)
        out.emplace_back(f);
    for (std::size_t i = report.tableEnd; i < report.lines.size(); ++i)
        out.emplace_back(report.lines[i]);

    std::string text;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i)
            text += '\n';
        text += out[i];
    }
    if (report.trailingNewline)
        text += '\n';
    return text;
}

Report ReportStore::load() const
{
    std::ifstream in(m_path, std::ios::binary);
    if (!in) {
        throw ReportIoError("cannot open report [" + m_path.string()
            + "], generate the report template first");
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw ReportIoError("failed reading report [" + m_path.string() + "]");

    auto report = parse(ss.str());
    spdlog::debug("[report] loaded {} rows from '{}'", report.rows.size(), m_path.string());
    return report;
}

void ReportStore::write(Report const& report) const
{
    auto const text = serialize(report);

    QSaveFile out(QString::fromStdString(m_path.string()));
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ReportIoError("cannot open report [" + m_path.string()
            + "] for writing: " + out.errorString().toStdString());
    }

    auto const written = out.write(text.data(), static_cast<qint64>(text.size()));
    if (written != static_cast<qint64>(text.size())) {
        out.cancelWriting();
        throw ReportIoError("short write to report [" + m_path.string()
            + "]: " + out.errorString().toStdString());
    }

    if (!out.commit()) {
        throw ReportIoError("failed to commit report [" + m_path.string()
            + "]: " + out.errorString().toStdString());
    }
}
