#pragma once
#include "CoverageProfile.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Profile file unreadable or malformed. Fatal: the run never starts.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace cfg
{
    std::vector<std::string>           builtinProfileNames();
    std::optional<CoverageProfile>     builtinProfile(std::string const& name);
    CoverageProfile                    loadProfile(std::filesystem::path const& file);
    void                               saveProfile(std::filesystem::path const& file, CoverageProfile const&);
} // namespace cfg
