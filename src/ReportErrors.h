#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Schema problems in the report document. Fatal: the run never starts.
class ReportFormatError : public std::runtime_error {
public:
    enum class Kind { MissingHeader,
        MissingSeparator,
        MissingColumn };

    ReportFormatError(Kind kind, std::string const& what, std::string column = {})
        : std::runtime_error(what)
        , m_kind(kind)
        , m_column(std::move(column))
    {
    }

    Kind kind() const noexcept { return m_kind; }
    std::string const& column() const noexcept { return m_column; }

private:
    Kind m_kind;
    std::string m_column;
};

// Report could not be read or the replacement could not be committed.
class ReportIoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
