//
// Created by MWAC-dev on 10/16/2026.
//

#pragma once

#include "rules.hpp"

#include <filesystem>
#include <string>

namespace nls {

    // Loads every *.json template in `dir` (sorted by name) into one immutable table.
    // Throws TemplateLoadError, or UnsupportedScaleFactorError when the default set names
    // an unknown scale.
    RuleTable LoadRuleTable(const std::filesystem::path& dir);

    // Merges a single template file into `table`.
    bool LoadTemplateFile(const std::filesystem::path& file, RuleTable& table, std::string& errorOut);
}
