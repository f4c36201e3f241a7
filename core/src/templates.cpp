// Copyright (c) Created by MWAC-dev on 2026.
// core/src/templates.cpp
#include "nls/templates.hpp"
#include "nls/errors.hpp"
#include "nls/log.hpp"
#include "nls/rule_adapters.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nls {

namespace {

bool load_scales(const json& j, RuleTable& table, std::string& errorOut) {
    if (!table.scales.empty()) { errorOut = "more than one scales template"; return false; }

    auto scales = j.at("scales").get<std::vector<ScaleFactor>>();
    if (scales.empty()) { errorOut = "scales template defines no scale"; return false; }

    for (std::size_t i = 0; i < scales.size(); ++i) {
        for (std::size_t k = 0; k < i; ++k) {
            if (scales[i].tag == scales[k].tag) {
                errorOut = "duplicate scale tag '" + scales[i].tag + "'";
                return false;
            }
            if (scales[i].numerator == scales[k].numerator && scales[i].denominator == scales[k].denominator) {
                errorOut = "scales '" + scales[k].tag + "' and '" + scales[i].tag + "' share a factor";
                return false;
            }
        }
    }
    table.scales = std::move(scales);
    if (j.contains("default_scales")) {
        j.at("default_scales").get_to(table.default_scales);
    }
    return true;
}

bool load_document(const json& j, const std::filesystem::path& file, RuleTable& table, std::string& errorOut) {
    auto rules = j.get<DocumentRules>();
    rules.source = file.string();
    for (const auto& existing : table.documents) {
        if (existing.extension == rules.extension) {
            errorOut = "extension " + rules.extension + " is already claimed by " + existing.source;
            return false;
        }
    }
    SDL_LogDebug(NLS_LOG_TEMPLATES, "%s: %zu rules for %s (%s)", file.string().c_str(), rules.rules.size(),
                 rules.extension.c_str(), to_string(rules.role));
    table.documents.push_back(std::move(rules));
    return true;
}

} // namespace

bool LoadTemplateFile(const std::filesystem::path& file, RuleTable& table, std::string& errorOut) {
    std::ifstream f(file);
    if (!f) { errorOut = "failed to open: " + file.string(); return false; }

    try {
        json j; f >> j;
        const std::string version = j.value("config_version", "1.0.0");
        if (version.rfind("1.", 0) != 0) {
            errorOut = "unsupported config_version " + version;
            return false;
        }
        table.config_version = version;

        const std::string kind = j.value("kind", "");
        if (kind == "scales") return load_scales(j, table, errorOut);
        if (kind == "document") return load_document(j, file, table, errorOut);
        errorOut = "unknown template kind '" + kind + "'";
        return false;
    } catch (const std::exception& e) {
        errorOut = std::string("JSON error: ") + e.what();
        return false;
    }
}

RuleTable LoadRuleTable(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw TemplateLoadError("templates directory not found: " + dir.string());
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".json") files.push_back(it->path());
    }
    if (ec) throw TemplateLoadError("cannot list " + dir.string() + ": " + ec.message());
    std::sort(files.begin(), files.end());

    RuleTable table;
    for (const auto& file : files) {
        std::string err;
        if (!LoadTemplateFile(file, table, err)) {
            throw TemplateLoadError(file.string() + ": " + err);
        }
        SDL_LogInfo(NLS_LOG_TEMPLATES, "loaded template %s", file.string().c_str());
    }

    if (table.scales.empty()) throw TemplateLoadError("no scales template found in " + dir.string());
    if (table.documents.empty()) throw TemplateLoadError("no document template found in " + dir.string());

    const auto defaults = table.default_set();
    SDL_LogInfo(NLS_LOG_TEMPLATES, "%zu document templates, %zu scales (%zu by default)",
                table.documents.size(), table.scales.size(), defaults.size());
    return table;
}

} // namespace nls
